#include <gtest/gtest.h>

#include "game/blackjack.hpp"
#include "game/config.hpp"
#include "game/game_types.hpp"
#include "game/game_utils.hpp"
#include "game/hand_evaluator.hpp"
#include "solver/decision_table.hpp"
#include "solver/search.hpp"
#include "solver/search_agent.hpp"

#include <algorithm>
#include <cstddef>
#include <vector>

static constexpr double Epsilon = 1e-12;

namespace {
Hand hard(int total) {
    return { .total = total, .isSoft = false };
}

class SearchTest : public ::testing::Test {
protected:
    SearchTest() : rules{ BlackjackConfig{} }, evaluator{ rules } {}

    GameState getState(const Hand& playerHand, const Hand& dealerHand) const {
        return rules.getGameStateFromHands(playerHand, dealerHand);
    }

    SearchResult search(const GameState& state, SearchMode mode, int maxDepth) const {
        return searchBestAction(rules, evaluator, state, mode, maxDepth);
    }

    Blackjack rules;
    HandEvaluator evaluator;
};
} // namespace

TEST_F(SearchTest, SixteenAgainstTenExpectimaxHits) {
    GameState state = getState(hard(16), hard(10));

    for (int depth = 1; depth <= 4; ++depth) {
        SearchResult result = search(state, SearchMode::Expectimax, depth);
        EXPECT_EQ(result.bestAction, Action::Hit);
        EXPECT_GT(result.hitValue, result.standValue);
    }
}

TEST_F(SearchTest, SixteenAgainstTenMinimaxStands) {
    GameState state = getState(hard(16), hard(10));

    // Any card worth 6 or more busts, so the worst case hit is a loss
    SearchResult minimaxResult = search(state, SearchMode::Minimax, 4);
    EXPECT_EQ(minimaxResult.bestAction, Action::Stand);
    EXPECT_EQ(minimaxResult.hitValue, 0.0);
    EXPECT_GT(minimaxResult.standValue, 0.0);

    SearchResult alphaBetaResult = search(state, SearchMode::AlphaBeta, 4);
    EXPECT_EQ(alphaBetaResult.bestAction, Action::Stand);
}

TEST_F(SearchTest, TwentyAgainstSixEveryModeStands) {
    GameState state = getState(hard(20), hard(6));

    for (SearchMode mode : { SearchMode::Minimax, SearchMode::AlphaBeta, SearchMode::Expectimax }) {
        for (int depth = 1; depth <= 3; ++depth) {
            EXPECT_EQ(search(state, mode, depth).bestAction, Action::Stand);
        }
    }
}

TEST_F(SearchTest, TwelveAgainstFourWorstCardIsWorthTen) {
    GameState state = getState(hard(12), hard(4));

    for (int remainingHits = 0; remainingHits <= 2; ++remainingHits) {
        ChanceNodeResult result = evaluateChanceNode(rules, evaluator, state, SearchMode::Minimax, remainingHits);
        EXPECT_EQ(rules.getRankValue(result.selectedRank), 10);
        EXPECT_EQ(result.selectedRank, Rank::Ten);
        EXPECT_EQ(result.value, 0.0);
    }
}

TEST_F(SearchTest, ExpectimaxChanceNodeIsTheAverageOfItsChildren) {
    GameState state = getState(hard(12), hard(4));

    double total = 0.0;
    double lowest = 1.0;
    for (Rank rank : getAllRanks()) {
        double value = evaluator.evaluate(rules.getNewStateAfterDraw(state, rank));
        total += value;
        lowest = std::min(lowest, value);
    }

    ChanceNodeResult expectimaxResult = evaluateChanceNode(rules, evaluator, state, SearchMode::Expectimax, 0);
    EXPECT_NEAR(expectimaxResult.value, total / 13.0, Epsilon);
    EXPECT_EQ(expectimaxResult.nodesVisited, 14u);

    ChanceNodeResult minimaxResult = evaluateChanceNode(rules, evaluator, state, SearchMode::Minimax, 0);
    EXPECT_EQ(minimaxResult.value, lowest);

    SearchResult searchResult = search(state, SearchMode::Expectimax, 1);
    EXPECT_NEAR(searchResult.hitValue, total / 13.0, Epsilon);
}

TEST_F(SearchTest, DepthOneVisitsEveryBranch) {
    GameState state = getState(hard(12), hard(4));

    // Root, stand, chance node and 13 draws
    EXPECT_EQ(search(state, SearchMode::Expectimax, 1).nodesVisited, 16u);
    EXPECT_EQ(search(state, SearchMode::Minimax, 1).nodesVisited, 16u);
}

TEST_F(SearchTest, TiesGoToStand) {
    // Nothing the player draws can beat a dealer 20 without busting past it
    GameState state = getState(hard(4), hard(20));

    for (SearchMode mode : { SearchMode::Minimax, SearchMode::AlphaBeta, SearchMode::Expectimax }) {
        SearchResult result = search(state, mode, 1);
        EXPECT_EQ(result.standValue, 0.0);
        EXPECT_EQ(result.bestAction, Action::Stand);
    }
}

TEST_F(SearchTest, StandValueIsTheSameForEveryMode) {
    GameState state = getState(hard(15), hard(9));

    double standValue = evaluator.getStandValue(hard(15), hard(9));
    for (SearchMode mode : { SearchMode::Minimax, SearchMode::AlphaBeta, SearchMode::Expectimax }) {
        EXPECT_EQ(search(state, mode, 2).standValue, standValue);
    }
}

TEST_F(SearchTest, PrunedHitValueIsMarkedAsABound) {
    GameState state = getState(hard(20), hard(6));

    EXPECT_TRUE(search(state, SearchMode::Minimax, 2).isHitValueExact);
    EXPECT_TRUE(search(state, SearchMode::Expectimax, 2).isHitValueExact);

    SearchResult alphaBetaResult = search(state, SearchMode::AlphaBeta, 2);
    EXPECT_EQ(alphaBetaResult.bestAction, Action::Stand);
    EXPECT_FALSE(alphaBetaResult.isHitValueExact);
}

TEST(PrunedSearchTest, PrunedHitValueIsExactWhenHitting) {
    // Every card is worth 1, so a hard 16 against a standing 17 always reaches a push
    BlackjackConfig config;
    config.rankValues.fill(1);
    Blackjack rules{ config };
    HandEvaluator evaluator{ rules };

    GameState state = rules.getGameStateFromHands(hard(16), hard(17));
    SearchResult minimaxResult = searchBestAction(rules, evaluator, state, SearchMode::Minimax, 1);
    SearchResult alphaBetaResult = searchBestAction(rules, evaluator, state, SearchMode::AlphaBeta, 1);

    EXPECT_EQ(alphaBetaResult.bestAction, Action::Hit);
    EXPECT_TRUE(alphaBetaResult.isHitValueExact);
    EXPECT_EQ(alphaBetaResult.hitValue, 0.5);
    EXPECT_EQ(alphaBetaResult.hitValue, minimaxResult.hitValue);
}

#ifndef NDEBUG
TEST(SearchDeathTest, SearchingOutsideThePlayersTurnFails) {
    Blackjack rules{ BlackjackConfig{} };
    HandEvaluator evaluator{ rules };

    GameState bustState = rules.getGameStateFromHands(hard(24), hard(10));
    EXPECT_DEATH(searchBestAction(rules, evaluator, bustState, SearchMode::Minimax, 2), "");

    GameState dealerTurn = rules.getNewStateAfterStand(rules.getGameStateFromHands(hard(15), hard(10)));
    EXPECT_DEATH(searchBestAction(rules, evaluator, dealerTurn, SearchMode::Expectimax, 2), "");
}
#endif

TEST_F(SearchTest, PruningNeverChangesTheDecision) {
    std::vector<Hand> playerHands = getPlayerTableHands(rules);
    std::vector<Hand> dealerHands = getDealerTableHands(rules);

    std::size_t totalMinimaxNodes = 0;
    std::size_t totalAlphaBetaNodes = 0;

    for (int depth = 1; depth <= 3; ++depth) {
        for (const Hand& playerHand : playerHands) {
            for (const Hand& dealerHand : dealerHands) {
                GameState state = getState(playerHand, dealerHand);
                SearchResult minimaxResult = search(state, SearchMode::Minimax, depth);
                SearchResult alphaBetaResult = search(state, SearchMode::AlphaBeta, depth);

                EXPECT_EQ(minimaxResult.bestAction, alphaBetaResult.bestAction)
                    << getHandName(playerHand) << " vs " << getHandName(dealerHand) << " at depth " << depth;
                EXPECT_LE(alphaBetaResult.nodesVisited, minimaxResult.nodesVisited);
                EXPECT_EQ(minimaxResult.standValue, alphaBetaResult.standValue);

                // The pruned hit value is exact whenever hitting wins
                if (alphaBetaResult.isHitValueExact) {
                    EXPECT_EQ(minimaxResult.hitValue, alphaBetaResult.hitValue);
                }
                else {
                    EXPECT_LE(minimaxResult.hitValue, alphaBetaResult.hitValue);
                }

                totalMinimaxNodes += minimaxResult.nodesVisited;
                totalAlphaBetaNodes += alphaBetaResult.nodesVisited;
            }
        }
    }

    EXPECT_LT(totalAlphaBetaNodes, totalMinimaxNodes);
}

TEST_F(SearchTest, MinimaxIsMoreConservativeThanExpectimax) {
    std::vector<Hand> playerHands = getPlayerTableHands(rules);
    std::vector<Hand> dealerHands = getDealerTableHands(rules);

    for (int depth = 1; depth <= 3; ++depth) {
        for (const Hand& playerHand : playerHands) {
            for (const Hand& dealerHand : dealerHands) {
                GameState state = getState(playerHand, dealerHand);
                SearchResult minimaxResult = search(state, SearchMode::Minimax, depth);
                SearchResult expectimaxResult = search(state, SearchMode::Expectimax, depth);

                EXPECT_LE(minimaxResult.hitValue, expectimaxResult.hitValue + Epsilon);
                if (minimaxResult.bestAction == Action::Hit) {
                    EXPECT_EQ(expectimaxResult.bestAction, Action::Hit)
                        << getHandName(playerHand) << " vs " << getHandName(dealerHand) << " at depth " << depth;
                }
            }
        }
    }
}

TEST_F(SearchTest, AgentsReportTheirSearch) {
    SearchAgent minimaxAgent(rules, evaluator, SearchMode::Minimax, 4);
    SearchAgent alphaBetaAgent(rules, evaluator, SearchMode::AlphaBeta, 4);
    SearchAgent expectimaxAgent(rules, evaluator, SearchMode::Expectimax, 4);

    EXPECT_EQ(minimaxAgent.getName(), "Minimax");
    EXPECT_EQ(alphaBetaAgent.getName(), "Minimax (alpha-beta)");
    EXPECT_EQ(expectimaxAgent.getName(), "Expectimax");
    EXPECT_EQ(expectimaxAgent.getMaxDepth(), 4);
    EXPECT_EQ(expectimaxAgent.getMode(), SearchMode::Expectimax);

    GameState state = getState(hard(16), hard(10));
    EXPECT_EQ(minimaxAgent.decide(state), Action::Stand);
    EXPECT_EQ(alphaBetaAgent.decide(state), Action::Stand);
    EXPECT_EQ(expectimaxAgent.decide(state), Action::Hit);
}

TEST_F(SearchTest, DecisionTableCoversHardAndSoftHands) {
    std::vector<Hand> playerHands = getPlayerTableHands(rules);
    std::vector<Hand> dealerHands = getDealerTableHands(rules);

    // Hard 4 to 21 and soft 12 to 21
    EXPECT_EQ(playerHands.size(), 28u);

    // Hard 2 to 21 and soft 11 to 21
    EXPECT_EQ(dealerHands.size(), 31u);

    SearchAgent agent(rules, evaluator, SearchMode::Expectimax, 1);
    std::vector<DecisionTableEntry> table = buildDecisionTable(rules, agent, 2);
    ASSERT_EQ(table.size(), playerHands.size() * dealerHands.size());
    EXPECT_EQ(table[0].playerHand, hard(4));
    EXPECT_EQ(table[0].dealerHand, hard(2));

    for (const DecisionTableEntry& entry : table) {
        SearchResult result = agent.search(getState(entry.playerHand, entry.dealerHand));
        EXPECT_EQ(entry.result.bestAction, result.bestAction);
        EXPECT_EQ(entry.result.hitValue, result.hitValue);
    }
}

TEST_F(SearchTest, CompareSearchModesFindsNoDisagreements) {
    SearchModeComparison comparison = compareSearchModes(rules, evaluator, 2, 1);

    EXPECT_EQ(comparison.numStates, 28 * 31);
    EXPECT_EQ(comparison.numPruningDisagreements, 0);
    EXPECT_LT(comparison.alphaBetaNodes, comparison.minimaxNodes);
    EXPECT_LE(comparison.minimaxHits, comparison.expectimaxHits);
    EXPECT_GT(comparison.expectimaxHits, 0);
}
