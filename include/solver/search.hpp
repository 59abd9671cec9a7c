#ifndef SEARCH_HPP
#define SEARCH_HPP

#include "game/blackjack.hpp"
#include "game/game_types.hpp"
#include "game/hand_evaluator.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

// The three modes share one tree walk and differ only in how a chance node combines its children
enum class SearchMode : std::uint8_t {
    Minimax,    // The deck picks the worst card for the player
    AlphaBeta,  // Minimax with alpha-beta pruning, same decisions
    Expectimax  // Every card is weighted by its draw probability
};

struct SearchResult {
    Action bestAction;
    double standValue;

    // With alpha-beta pruning this is only an upper bound once it falls to or below standValue
    double hitValue;
    bool isHitValueExact;

    std::size_t nodesVisited;
};

struct ChanceNodeResult {
    double value;

    // For Minimax and AlphaBeta, the card the deck chose. For Expectimax, the card with the lowest value.
    Rank selectedRank;

    std::size_t nodesVisited;
};

SearchResult searchBestAction(
    const Blackjack& rules,
    const HandEvaluator& evaluator,
    const GameState& state,
    SearchMode mode,
    int maxDepth
);

ChanceNodeResult evaluateChanceNode(
    const Blackjack& rules,
    const HandEvaluator& evaluator,
    const GameState& state,
    SearchMode mode,
    int remainingHits
);

std::string getSearchModeName(SearchMode mode);

#endif // SEARCH_HPP
