#ifndef DECISION_TABLE_HPP
#define DECISION_TABLE_HPP

#include "game/blackjack.hpp"
#include "game/game_types.hpp"
#include "game/hand_evaluator.hpp"
#include "solver/search.hpp"
#include "solver/search_agent.hpp"

#include <cstddef>
#include <vector>

struct DecisionTableEntry {
    Hand playerHand;
    Hand dealerHand;
    SearchResult result;
};

// Hard totals from 4 and soft totals from the lowest soft hand, up to the target total
std::vector<Hand> getPlayerTableHands(const Blackjack& rules);

// Hard totals from 2 and soft totals from a lone Ace, up to the target total
std::vector<Hand> getDealerTableHands(const Blackjack& rules);

// One entry per (player hand, dealer hand) pair, player hand major
std::vector<DecisionTableEntry> buildDecisionTable(const Blackjack& rules, const SearchAgent& agent, int numThreads);

struct SearchModeComparison {
    int numStates;

    // States where pruned and unpruned minimax pick different actions
    int numPruningDisagreements;
    std::size_t minimaxNodes;
    std::size_t alphaBetaNodes;

    int minimaxHits;
    int expectimaxHits;
};

SearchModeComparison compareSearchModes(const Blackjack& rules, const HandEvaluator& evaluator, int maxDepth, int numThreads);

#endif // DECISION_TABLE_HPP
