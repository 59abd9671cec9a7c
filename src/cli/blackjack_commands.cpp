#include "cli/blackjack_commands.hpp"

#include "cli/cli_dispatcher.hpp"
#include "game/blackjack.hpp"
#include "game/blackjack_parser.hpp"
#include "game/config.hpp"
#include "game/game_types.hpp"
#include "game/game_utils.hpp"
#include "game/hand_evaluator.hpp"
#include "io/config_loader.hpp"
#include "io/output.hpp"
#include "simulation/simulate.hpp"
#include "solver/decision_table.hpp"
#include "solver/search.hpp"
#include "solver/search_agent.hpp"
#include "util/result.hpp"
#include "util/scoped_timer.hpp"
#include "util/string_utils.hpp"

#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace {
constexpr std::uint64_t DefaultSeed = 42;
constexpr int MaxNumThreads = 64;
constexpr int MaxSimulatedGames = 10000000;

bool isContextValid(const BlackjackContext& context) {
    return (context.rules != nullptr) && (context.evaluator != nullptr);
}

void printInvalidContextError() {
    std::cerr << "Error: Game rules not loaded. Please run \"standard\" or \"rules <file>\" first.\n";
}

std::vector<SearchAgent> buildAllAgents(const BlackjackContext& context) {
    std::vector<SearchAgent> agents;
    for (SearchMode mode : { SearchMode::Minimax, SearchMode::AlphaBeta, SearchMode::Expectimax }) {
        agents.emplace_back(*context.rules, *context.evaluator, mode, context.maxDepth);
    }
    return agents;
}

void printRules(const BlackjackConfig& config, int maxDepth) {
    std::vector<std::string> rankValues;
    for (int value : config.rankValues) {
        rankValues.push_back(std::to_string(value));
    }

    std::cout << "Target total: " << config.targetTotal << "\n";
    std::cout << "Dealer stands on: " << config.dealerStandThreshold << (config.dealerHitsSoft17 ? " (hits soft 17)" : "") << "\n";
    std::cout << "Soft aces: " << (config.useSoftAces ? "yes" : "no") << "\n";
    std::cout << "Rank values (A to K): " << join(rankValues, " ") << "\n";
    std::cout << "Initial cards per hand: " << config.initialCardsPerHand << "\n";
    std::cout << "Max search depth: " << maxDepth << "\n";
}

void loadRules(BlackjackContext& context, const BlackjackConfig& config, int maxDepth) {
    auto rules = std::make_unique<Blackjack>(config);
    auto evaluator = std::make_unique<HandEvaluator>(*rules);

    context.rules = std::move(rules);
    context.evaluator = std::move(evaluator);
    context.maxDepth = maxDepth;

    printRules(config, maxDepth);
}

bool handleSetupStandard(BlackjackContext& context) {
    loadRules(context, BlackjackConfig{}, blackjack::DefaultMaxSearchDepth);
    std::cout << "Successfully loaded standard rules.\n";
    return true;
}

bool handleSetupRules(BlackjackContext& context, const std::string& argument) {
    std::cout << "Loading rules from " << argument << ":\n";

    Result<RulesSettings> settingsResult = loadSettingsFromFile(argument);
    if (settingsResult.isError()) {
        std::cerr << "Error: " << settingsResult.getError() << "\n";
        return false;
    }

    const RulesSettings& settings = settingsResult.getValue();
    loadRules(context, settings.rules, settings.maxSearchDepth);
    std::cout << "Successfully loaded rules.\n";
    return true;
}

bool handleSetDepth(BlackjackContext& context, const std::string& argument) {
    std::optional<int> depthOption = parseInt(argument);
    if (!depthOption || (*depthOption < 1) || (*depthOption > blackjack::MaxSearchDepth)) {
        std::cerr << "Error: Search depth must be an integer between 1 and " << blackjack::MaxSearchDepth << ".\n";
        return false;
    }

    context.maxDepth = *depthOption;
    std::cout << "Successfully set search depth to " << context.maxDepth << ".\n";
    return true;
}

bool handleSetNumThreads(BlackjackContext& context, const std::string& argument) {
    #ifdef _OPENMP
    std::optional<int> numThreadsOption = parseInt(argument);
    if (!numThreadsOption || (*numThreadsOption < 1) || (*numThreadsOption > MaxNumThreads)) {
        std::cerr << "Error: Thread count must be an integer between 1 and " << MaxNumThreads << ".\n";
        return false;
    }

    context.numThreads = *numThreadsOption;
    std::cout << "Successfully set number of threads to " << context.numThreads << ".\n";
    return true;
    #else
    static_cast<void>(argument);
    context.numThreads = 1;
    std::cerr << "Error: OpenMP is not enabled, ignoring. Only single-threaded mode is supported.\n";
    return false;
    #endif
}

bool handleSetSeed(BlackjackContext& context, const std::string& argument) {
    std::optional<std::uint64_t> seedOption = parseUnsigned(argument);
    if (!seedOption) {
        std::cerr << "Error: Seed must be a non-negative integer.\n";
        return false;
    }

    context.seed = *seedOption;
    std::cout << "Successfully set seed to " << context.seed << ".\n";
    return true;
}

bool handleDecide(BlackjackContext& context, const std::string& argument) {
    if (!isContextValid(context)) {
        printInvalidContextError();
        return false;
    }

    Result<GameState> stateResult = buildGameStateFromString(argument, *context.rules);
    if (stateResult.isError()) {
        std::cerr << "Error: " << stateResult.getError() << "\n";
        return false;
    }

    const GameState& state = stateResult.getValue();
    std::cout << "Player " << getHandName(state.playerHand) << " vs dealer " << getHandName(state.dealerHand) << ", depth " << context.maxDepth << ":\n";

    for (const SearchAgent& agent : buildAllAgents(context)) {
        SearchResult result = agent.search(state);
        std::cout << agent.getName() << ": " << getActionName(result.bestAction)
            << " (stand " << formatFixedPoint(result.standValue, 4)
            << (result.isHitValueExact ? ", hit " : ", hit at most ") << formatFixedPoint(result.hitValue, 4)
            << ", " << result.nodesVisited << " nodes)\n";
    }

    return true;
}

bool handleSimulate(BlackjackContext& context, const std::string& argument) {
    if (!isContextValid(context)) {
        printInvalidContextError();
        return false;
    }

    std::optional<int> numGamesOption = parseInt(argument);
    if (!numGamesOption || (*numGamesOption < 1) || (*numGamesOption > MaxSimulatedGames)) {
        std::cerr << "Error: Number of games must be an integer between 1 and " << MaxSimulatedGames << ".\n";
        return false;
    }

    int numGames = *numGamesOption;
    std::cout << "Simulating " << numGames << " games per agent with seed " << context.seed << ", depth " << context.maxDepth << " and " << context.numThreads << " thread(s).\n" << std::flush;

    ScopedTimer timer("", "Finished simulation");
    for (const SearchAgent& agent : buildAllAgents(context)) {
        SimulationResult result = simulateGames(*context.rules, agent, numGames, context.seed, context.numThreads);

        double gamesPerSecond = (result.secondsElapsed > 0.0) ? (static_cast<double>(numGames) / result.secondsElapsed) : 0.0;
        std::cout << agent.getName() << ": "
            << result.wins << " wins (" << formatPercent(result.wins, numGames) << "), "
            << result.pushes << " pushes (" << formatPercent(result.pushes, numGames) << "), "
            << result.losses << " losses (" << formatPercent(result.losses, numGames) << "). "
            << "Score " << formatFixedPoint(result.getScore(), 4) << ", "
            << formatFixedPoint(gamesPerSecond, 0) << " games/s\n" << std::flush;
    }

    return true;
}

bool handleCompare(BlackjackContext& context) {
    if (!isContextValid(context)) {
        printInvalidContextError();
        return false;
    }

    SearchModeComparison comparison;
    {
        ScopedTimer timer("Comparing search modes at depth " + std::to_string(context.maxDepth) + "...", "Finished comparison");
        comparison = compareSearchModes(*context.rules, *context.evaluator, context.maxDepth, context.numThreads);
    }

    std::cout << "States compared: " << comparison.numStates << "\n";
    std::cout << "Pruned and unpruned minimax disagree in " << comparison.numPruningDisagreements << " states.\n";
    std::cout << "Nodes visited: " << comparison.minimaxNodes << " unpruned, " << comparison.alphaBetaNodes << " pruned\n";
    std::cout << "Hits chosen: " << comparison.minimaxHits << " by minimax, " << comparison.expectimaxHits << " by expectimax\n";
    return comparison.numPruningDisagreements == 0;
}

bool handleWriteStrategy(BlackjackContext& context, const std::string& argument) {
    if (!isContextValid(context)) {
        printInvalidContextError();
        return false;
    }

    ScopedTimer timer("Writing decision tables to " + argument + "...", "Finished writing decision tables");
    if (!writeStrategyToJSON(*context.rules, buildAllAgents(context), context.numThreads, argument)) {
        std::cerr << "Error: Could not write to " << argument << ".\n";
        return false;
    }

    return true;
}
} // namespace

BlackjackContext getDefaultContext() {
    return {
        .rules = nullptr,
        .evaluator = nullptr,
        .maxDepth = blackjack::DefaultMaxSearchDepth,
        .numThreads = 1,
        .seed = DefaultSeed
    };
}

bool registerAllCommands(CliDispatcher& dispatcher, BlackjackContext& context) {
    bool allSuccess = true;

    allSuccess &= dispatcher.registerCommand(
        "standard",
        "Loads the standard rules: 21, dealer stands on 17, soft aces, two cards per hand.",
        [&context]() { return handleSetupStandard(context); }
    );

    allSuccess &= dispatcher.registerCommand(
        "rules",
        "file",
        "Loads rules from a given .yml configuration file. Missing fields use the standard rules.",
        [&context](const std::string& argument) { return handleSetupRules(context, argument); }
    );

    allSuccess &= dispatcher.registerCommand(
        "depth",
        "n",
        "Sets the number of hits the agents search ahead.",
        [&context](const std::string& argument) { return handleSetDepth(context, argument); }
    );

    allSuccess &= dispatcher.registerCommand(
        "threads",
        "count",
        "Sets the number of threads used by simulate, compare and strategy. Calls to this command will be ignored if OpenMP is not enabled.",
        [&context](const std::string& argument) { return handleSetNumThreads(context, argument); }
    );

    allSuccess &= dispatcher.registerCommand(
        "seed",
        "n",
        "Sets the seed used by simulate.",
        [&context](const std::string& argument) { return handleSetSeed(context, argument); }
    );

    allSuccess &= dispatcher.registerCommand(
        "decide",
        "hands",
        "Prints the decision of every agent for player and dealer cards, e.g. \"T6/T\".",
        [&context](const std::string& argument) { return handleDecide(context, argument); }
    );

    allSuccess &= dispatcher.registerCommand(
        "simulate",
        "games",
        "Plays the given number of games with every agent and prints the results.",
        [&context](const std::string& argument) { return handleSimulate(context, argument); }
    );

    allSuccess &= dispatcher.registerCommand(
        "compare",
        "Checks that pruned and unpruned minimax agree on every table state and compares minimax with expectimax.",
        [&context]() { return handleCompare(context); }
    );

    allSuccess &= dispatcher.registerCommand(
        "strategy",
        "file",
        "Writes the decision table of every agent to a .json file.",
        [&context](const std::string& argument) { return handleWriteStrategy(context, argument); }
    );

    return allSuccess;
}
