#include "solver/search.hpp"

#include "game/blackjack.hpp"
#include "game/game_types.hpp"
#include "game/hand_evaluator.hpp"

#include <algorithm>
#include <array>
#include <cassert>
#include <cstddef>
#include <limits>
#include <string>

namespace {
struct TraversalConstants {
    const Blackjack& rules;
    const HandEvaluator& evaluator;
    SearchMode mode;
};

// alpha: the best value the player can already guarantee
// beta: the best value the deck can already hold the player to
struct Bounds {
    double alpha;
    double beta;
};

struct ChanceValue {
    double value;
    Rank selectedRank;
};

constexpr double Infinity = std::numeric_limits<double>::infinity();
constexpr Bounds FullWindow = { .alpha = -Infinity, .beta = Infinity };

bool isPruningEnabled(const TraversalConstants& constants) {
    return constants.mode == SearchMode::AlphaBeta;
}

ChanceValue traverseChance(
    const GameState& state,
    int remainingHits,
    Bounds bounds,
    const TraversalConstants& constants,
    std::size_t& nodesVisited
);

double getActionValue(
    const GameState& state,
    Action action,
    int remainingHits,
    Bounds bounds,
    const TraversalConstants& constants,
    std::size_t& nodesVisited
) {
    switch (action) {
        case Action::Stand:
            // The dealer plays a fixed policy, so standing has a single successor scored exactly
            ++nodesVisited;
            return constants.evaluator.evaluate(constants.rules.getNewStateAfterStand(state));
        case Action::Hit:
            assert(remainingHits > 0);
            return traverseChance(state, remainingHits - 1, bounds, constants, nodesVisited).value;
        default:
            assert(false);
            return 0.0;
    }
}

double traverseDecision(
    const GameState& state,
    int remainingHits,
    Bounds bounds,
    const TraversalConstants& constants,
    std::size_t& nodesVisited
) {
    ++nodesVisited;

    if (state.turn == Turn::Terminal) {
        return constants.evaluator.evaluate(state);
    }

    assert(state.turn == Turn::Player);

    // Out of depth, the player is assumed to stand
    if (remainingHits == 0) {
        return constants.evaluator.evaluate(state);
    }

    double maxValue = -Infinity;
    for (Action action : constants.rules.getValidActions(state)) {
        double value = getActionValue(state, action, remainingHits, bounds, constants, nodesVisited);
        maxValue = std::max(maxValue, value);

        if (isPruningEnabled(constants)) {
            bounds.alpha = std::max(bounds.alpha, maxValue);
            if (maxValue >= bounds.beta) {
                break;
            }
        }
    }

    return maxValue;
}

ChanceValue reduceMinimum(
    const GameState& state,
    int remainingHits,
    Bounds bounds,
    const TraversalConstants& constants,
    std::size_t& nodesVisited
) {
    const auto& drawDistribution = constants.rules.getDrawDistribution();

    ChanceValue result = { .value = Infinity, .selectedRank = drawDistribution[0].rank };
    for (const DrawOutcome& drawOutcome : drawDistribution) {
        GameState nextState = constants.rules.getNewStateAfterDraw(state, drawOutcome.rank);
        double value = traverseDecision(nextState, remainingHits, bounds, constants, nodesVisited);

        // Strictly less, so the first worst card in rank order is the one reported
        if (value < result.value) {
            result.value = value;
            result.selectedRank = drawOutcome.rank;
        }

        if (isPruningEnabled(constants)) {
            bounds.beta = std::min(bounds.beta, result.value);
            if (result.value <= bounds.alpha) {
                break;
            }
        }
    }

    return result;
}

ChanceValue reduceExpected(
    const GameState& state,
    int remainingHits,
    const TraversalConstants& constants,
    std::size_t& nodesVisited
) {
    const auto& drawDistribution = constants.rules.getDrawDistribution();

    // Weights are summed as integers and divided once at the end
    double weightedSum = 0.0;
    double lowestValue = Infinity;
    Rank lowestRank = drawDistribution[0].rank;

    for (const DrawOutcome& drawOutcome : drawDistribution) {
        GameState nextState = constants.rules.getNewStateAfterDraw(state, drawOutcome.rank);
        double value = traverseDecision(nextState, remainingHits, FullWindow, constants, nodesVisited);
        weightedSum += static_cast<double>(drawOutcome.weight) * value;

        if (value < lowestValue) {
            lowestValue = value;
            lowestRank = drawOutcome.rank;
        }
    }

    return {
        .value = weightedSum / static_cast<double>(constants.rules.getTotalDrawWeight()),
        .selectedRank = lowestRank
    };
}

ChanceValue traverseChance(
    const GameState& state,
    int remainingHits,
    Bounds bounds,
    const TraversalConstants& constants,
    std::size_t& nodesVisited
) {
    ++nodesVisited;

    switch (constants.mode) {
        case SearchMode::Minimax:
        case SearchMode::AlphaBeta:
            return reduceMinimum(state, remainingHits, bounds, constants, nodesVisited);
        case SearchMode::Expectimax:
            // Expected values can't be cut short without bounds on the children, so all branches are searched
            return reduceExpected(state, remainingHits, constants, nodesVisited);
        default:
            assert(false);
            return { .value = 0.0, .selectedRank = Rank::Ace };
    }
}
} // namespace

SearchResult searchBestAction(
    const Blackjack& rules,
    const HandEvaluator& evaluator,
    const GameState& state,
    SearchMode mode,
    int maxDepth
) {
    assert(state.turn == Turn::Player);
    assert(maxDepth >= 1);

    TraversalConstants constants = { .rules = rules, .evaluator = evaluator, .mode = mode };
    std::size_t nodesVisited = 1;
    Bounds bounds = FullWindow;

    std::array<double, NumActions> actionValues;
    actionValues.fill(-Infinity);

    // Valid actions are ordered by tie priority, a later action must be strictly better to be chosen
    Action bestAction = Action::Stand;
    double bestValue = -Infinity;
    for (Action action : rules.getValidActions(state)) {
        double value = getActionValue(state, action, maxDepth, bounds, constants, nodesVisited);
        actionValues[static_cast<int>(action)] = value;

        if (value > bestValue) {
            bestValue = value;
            bestAction = action;
        }

        if (isPruningEnabled(constants)) {
            bounds.alpha = std::max(bounds.alpha, bestValue);
        }
    }

    return {
        .bestAction = bestAction,
        .standValue = actionValues[static_cast<int>(Action::Stand)],
        .hitValue = actionValues[static_cast<int>(Action::Hit)],
        .isHitValueExact = !isPruningEnabled(constants) || (bestAction == Action::Hit),
        .nodesVisited = nodesVisited
    };
}

ChanceNodeResult evaluateChanceNode(
    const Blackjack& rules,
    const HandEvaluator& evaluator,
    const GameState& state,
    SearchMode mode,
    int remainingHits
) {
    assert(state.turn == Turn::Player);
    assert(remainingHits >= 0);

    TraversalConstants constants = { .rules = rules, .evaluator = evaluator, .mode = mode };
    std::size_t nodesVisited = 0;
    ChanceValue chanceValue = traverseChance(state, remainingHits, FullWindow, constants, nodesVisited);

    return {
        .value = chanceValue.value,
        .selectedRank = chanceValue.selectedRank,
        .nodesVisited = nodesVisited
    };
}

std::string getSearchModeName(SearchMode mode) {
    switch (mode) {
        case SearchMode::Minimax:
            return "Minimax";
        case SearchMode::AlphaBeta:
            return "Minimax (alpha-beta)";
        case SearchMode::Expectimax:
            return "Expectimax";
        default:
            assert(false);
            return "???";
    }
}
