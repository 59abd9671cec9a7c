#include "util/string_utils.hpp"

#include <cctype>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

std::string trim(const std::string& input) {
    int inputSize = input.size();

    int start = 0;
    while (start < inputSize && std::isspace(static_cast<unsigned char>(input[start]))) {
        ++start;
    }

    int end = inputSize - 1;
    while (end >= 0 && std::isspace(static_cast<unsigned char>(input[end]))) {
        --end;
    }

    if (end < start) {
        return "";
    }

    int outputLength = end - start + 1;
    return input.substr(start, outputLength);
}

std::string join(const std::vector<std::string>& inputs, const std::string& connector) {
    std::string output;
    for (std::size_t i = 0; i < inputs.size(); ++i) {
        if (i > 0) {
            output += connector;
        }
        output += inputs[i];
    }
    return output;
}

std::vector<std::string> parseTokens(const std::string& input, char delimiter) {
    std::vector<std::string> tokens;

    auto insertToken = [&input, &tokens](int start, int end) {
        int tokenSize = end - start + 1;
        if (tokenSize > 0) {
            std::string trimmed = trim(input.substr(start, tokenSize));
            if (!trimmed.empty()) {
                tokens.push_back(trimmed);
            }
        }
    };

    int inputSize = input.size();
    int nextTokenStart = 0;
    for (int i = 0; i < inputSize; ++i) {
        if (input[i] == delimiter) {
            int nextTokenEnd = i - 1;
            insertToken(nextTokenStart, nextTokenEnd);
            nextTokenStart = i + 1;
        }
    }
    insertToken(nextTokenStart, inputSize - 1);

    return tokens;
}

std::optional<int> parseInt(const std::string& input) {
    try {
        std::size_t charactersRead = 0;
        int value = std::stoi(input, &charactersRead);

        // Reject trailing garbage such as "12abc"
        if (charactersRead != input.size()) {
            return std::nullopt;
        }
        return value;
    }
    catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<std::uint64_t> parseUnsigned(const std::string& input) {
    // std::stoull silently wraps negative numbers
    if (input.empty() || !std::isdigit(static_cast<unsigned char>(input[0]))) {
        return std::nullopt;
    }

    try {
        std::size_t charactersRead = 0;
        unsigned long long value = std::stoull(input, &charactersRead);
        if (charactersRead != input.size()) {
            return std::nullopt;
        }
        return static_cast<std::uint64_t>(value);
    }
    catch (const std::exception&) {
        return std::nullopt;
    }
}

std::string formatFixedPoint(double num, int precision) {
    std::stringstream ss;
    ss << std::fixed << std::setprecision(precision) << num;
    return ss.str();
}

std::string formatPercent(int count, int total) {
    if (total <= 0) {
        return formatFixedPoint(0.0, 2) + "%";
    }

    double percent = (static_cast<double>(count) / static_cast<double>(total)) * 100.0;
    return formatFixedPoint(percent, 2) + "%";
}
