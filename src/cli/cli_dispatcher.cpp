#include "cli/cli_dispatcher.hpp"

#include "util/string_utils.hpp"

#include <cctype>
#include <iostream>
#include <istream>
#include <map>
#include <string>
#include <vector>

CliDispatcher::CliDispatcher(const std::string& programName, const Version& version) : m_programName{ programName }, m_version{ version }, m_isRunning{ false } {
    registerCommand("help", "Prints this help page.", [this]() { return handleHelp(); });
    registerCommand("exit", "Exits the program.", [this]() { return handleExit(); });
}

bool CliDispatcher::isCommandNameValid(const std::string& name) const {
    if (name.empty()) {
        return false;
    }

    for (char c : name) {
        if (!std::isgraph(static_cast<unsigned char>(c))) {
            return false;
        }
    }

    return m_commandDescriptions.find(name) == m_commandDescriptions.end();
}

bool CliDispatcher::registerCommand(const std::string& name, const std::string& description, const HandlerWithoutArgument& handler) {
    if (!isCommandNameValid(name)) {
        return false;
    }

    m_commandOrder.push_back(name);
    m_commandDescriptions.insert({ name, description });
    m_handlersWithoutArguments.insert({ name, handler });
    return true;
}

bool CliDispatcher::registerCommand(const std::string& name, const std::string& argument, const std::string& description, const HandlerWithArgument& handler) {
    if (!isCommandNameValid(name)) {
        return false;
    }

    m_commandOrder.push_back(name);
    m_commandDescriptions.insert({ name, description });
    m_commandArguments.insert({ name, argument });
    m_handlersWithArguments.insert({ name, handler });
    return true;
}

void CliDispatcher::run(std::istream& input) {
    m_isRunning = true;

    std::cout << m_programName << " " << m_version.major << "." << m_version.minor << "." << m_version.patch << "\n";
    std::cout << "Type \"help\" for more information.\n";
    while (m_isRunning) {
        std::cout << "> " << std::flush;

        std::string line;
        if (!std::getline(input, line)) {
            std::cout << "\n";
            m_isRunning = false;
            break;
        }

        runCommand(line);
    }
}

bool CliDispatcher::runCommand(const std::string& line) {
    std::vector<std::string> tokens = parseTokens(line, ' ');
    if (tokens.empty()) {
        return false;
    }

    const std::string& commandName = tokens[0];
    int numArguments = static_cast<int>(tokens.size()) - 1;

    auto handlerWithoutArgument = m_handlersWithoutArguments.find(commandName);
    if (handlerWithoutArgument != m_handlersWithoutArguments.end()) {
        if (numArguments != 0) {
            std::cerr << "Error: Incorrect number of arguments provided for " << commandName << ": Expected 0, got " << numArguments << "\n";
            return false;
        }

        return handlerWithoutArgument->second();
    }

    auto handlerWithArgument = m_handlersWithArguments.find(commandName);
    if (handlerWithArgument != m_handlersWithArguments.end()) {
        if (numArguments != 1) {
            std::cerr << "Error: Incorrect number of arguments provided for " << commandName << ": Expected 1, got " << numArguments << "\n";
            return false;
        }

        return handlerWithArgument->second(tokens[1]);
    }

    std::cerr << "Error: Unknown command: " << commandName << "\n";
    return false;
}

bool CliDispatcher::handleHelp() const {
    std::cout << m_programName << " options:\n";
    for (const std::string& name : m_commandOrder) {
        std::cout << name;

        auto argument = m_commandArguments.find(name);
        if (argument != m_commandArguments.end()) {
            std::cout << " <" << argument->second << ">";
        }

        std::cout << ": " << m_commandDescriptions.at(name) << "\n";
    }
    return true;
}

bool CliDispatcher::handleExit() {
    m_isRunning = false;
    return true;
}
