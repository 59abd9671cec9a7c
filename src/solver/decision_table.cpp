#include "solver/decision_table.hpp"

#include "game/blackjack.hpp"
#include "game/game_types.hpp"
#include "game/hand_evaluator.hpp"
#include "solver/search.hpp"
#include "solver/search_agent.hpp"

#include <cassert>
#include <cstddef>
#include <vector>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace {
constexpr int FirstHardPlayerTotal = 4;
constexpr int FirstHardDealerTotal = 2;

bool hasSoftHands(const Blackjack& rules) {
    return rules.getConfig().useSoftAces && (rules.getRankValue(Rank::Ace) > 1);
}

void addHands(std::vector<Hand>& hands, int firstTotal, int lastTotal, bool isSoft) {
    for (int total = firstTotal; total <= lastTotal; ++total) {
        hands.push_back({ .total = total, .isSoft = isSoft });
    }
}

int countHits(const std::vector<DecisionTableEntry>& table) {
    int hits = 0;
    for (const DecisionTableEntry& entry : table) {
        if (entry.result.bestAction == Action::Hit) {
            ++hits;
        }
    }
    return hits;
}
} // namespace

std::vector<Hand> getPlayerTableHands(const Blackjack& rules) {
    int targetTotal = rules.getConfig().targetTotal;

    std::vector<Hand> hands;
    addHands(hands, FirstHardPlayerTotal, targetTotal, false);
    if (hasSoftHands(rules)) {
        // An Ace plus the smallest card worth 2
        int aceValue = rules.getRankValue(Rank::Ace);
        addHands(hands, aceValue + 1, targetTotal, true);
    }
    return hands;
}

std::vector<Hand> getDealerTableHands(const Blackjack& rules) {
    int targetTotal = rules.getConfig().targetTotal;

    std::vector<Hand> hands;
    addHands(hands, FirstHardDealerTotal, targetTotal, false);
    if (hasSoftHands(rules)) {
        addHands(hands, rules.getRankValue(Rank::Ace), targetTotal, true);
    }
    return hands;
}

std::vector<DecisionTableEntry> buildDecisionTable(const Blackjack& rules, const SearchAgent& agent, int numThreads) {
    assert(numThreads >= 1);

    std::vector<Hand> playerHands = getPlayerTableHands(rules);
    std::vector<Hand> dealerHands = getDealerTableHands(rules);

    std::vector<DecisionTableEntry> table;
    table.reserve(playerHands.size() * dealerHands.size());
    for (const Hand& playerHand : playerHands) {
        for (const Hand& dealerHand : dealerHands) {
            table.push_back({ .playerHand = playerHand, .dealerHand = dealerHand, .result = {} });
        }
    }

    int tableSize = static_cast<int>(table.size());

    #ifdef _OPENMP
    omp_set_num_threads(numThreads);
    #pragma omp parallel for schedule(dynamic, 1)
    #else
    static_cast<void>(numThreads);
    #endif
    for (int i = 0; i < tableSize; ++i) {
        DecisionTableEntry& entry = table[i];
        GameState state = rules.getGameStateFromHands(entry.playerHand, entry.dealerHand);
        entry.result = agent.search(state);
    }

    return table;
}

SearchModeComparison compareSearchModes(const Blackjack& rules, const HandEvaluator& evaluator, int maxDepth, int numThreads) {
    SearchAgent minimaxAgent(rules, evaluator, SearchMode::Minimax, maxDepth);
    SearchAgent alphaBetaAgent(rules, evaluator, SearchMode::AlphaBeta, maxDepth);
    SearchAgent expectimaxAgent(rules, evaluator, SearchMode::Expectimax, maxDepth);

    std::vector<DecisionTableEntry> minimaxTable = buildDecisionTable(rules, minimaxAgent, numThreads);
    std::vector<DecisionTableEntry> alphaBetaTable = buildDecisionTable(rules, alphaBetaAgent, numThreads);
    std::vector<DecisionTableEntry> expectimaxTable = buildDecisionTable(rules, expectimaxAgent, numThreads);
    assert(minimaxTable.size() == alphaBetaTable.size());
    assert(minimaxTable.size() == expectimaxTable.size());

    SearchModeComparison comparison = {
        .numStates = static_cast<int>(minimaxTable.size()),
        .numPruningDisagreements = 0,
        .minimaxNodes = 0,
        .alphaBetaNodes = 0,
        .minimaxHits = countHits(minimaxTable),
        .expectimaxHits = countHits(expectimaxTable)
    };

    for (std::size_t i = 0; i < minimaxTable.size(); ++i) {
        if (minimaxTable[i].result.bestAction != alphaBetaTable[i].result.bestAction) {
            ++comparison.numPruningDisagreements;
        }
        comparison.minimaxNodes += minimaxTable[i].result.nodesVisited;
        comparison.alphaBetaNodes += alphaBetaTable[i].result.nodesVisited;
    }

    return comparison;
}
