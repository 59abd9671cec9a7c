#include <gtest/gtest.h>

#include "game/blackjack.hpp"
#include "game/config.hpp"
#include "game/game_types.hpp"
#include "game/hand_evaluator.hpp"

#include <vector>

static constexpr double Epsilon = 1e-9;

namespace {
Hand hard(int total) {
    return { .total = total, .isSoft = false };
}

Hand soft(int total) {
    return { .total = total, .isSoft = true };
}

std::vector<Hand> getAllDealerHands() {
    std::vector<Hand> hands;
    for (int total = 2; total <= 21; ++total) {
        hands.push_back(hard(total));
    }
    for (int total = 11; total <= 21; ++total) {
        hands.push_back(soft(total));
    }
    return hands;
}
} // namespace

TEST(DealerDistributionTest, ProbabilitiesSumToOne) {
    Blackjack rules{ BlackjackConfig{} };
    HandEvaluator evaluator{ rules };

    for (const Hand& dealerHand : getAllDealerHands()) {
        const HandEvaluator::DealerDistribution& distribution = evaluator.getDealerDistribution(dealerHand);

        double total = distribution.bustProbability;
        for (int dealerTotal = 0; dealerTotal < 17; ++dealerTotal) {
            // The dealer never stands below 17
            EXPECT_EQ(distribution.finalTotalProbabilities[dealerTotal], 0.0);
        }
        for (double probability : distribution.finalTotalProbabilities) {
            EXPECT_GE(probability, 0.0);
            total += probability;
        }
        EXPECT_NEAR(total, 1.0, Epsilon);
    }
}

TEST(DealerDistributionTest, StandingDealerKeepsTheirTotal) {
    Blackjack rules{ BlackjackConfig{} };
    HandEvaluator evaluator{ rules };

    const HandEvaluator::DealerDistribution& distribution = evaluator.getDealerDistribution(hard(18));
    EXPECT_EQ(distribution.finalTotalProbabilities[18], 1.0);
    EXPECT_EQ(distribution.bustProbability, 0.0);

    const HandEvaluator::DealerDistribution& bustDistribution = evaluator.getDealerDistribution(hard(24));
    EXPECT_EQ(bustDistribution.bustProbability, 1.0);
}

TEST(DealerDistributionTest, KnownBustProbabilities) {
    Blackjack rules{ BlackjackConfig{} };
    HandEvaluator evaluator{ rules };

    // Infinite deck, dealer stands on soft 17
    EXPECT_NEAR(evaluator.getDealerDistribution(hard(6)).bustProbability, 0.42315049208499783, 1e-12);
    EXPECT_NEAR(evaluator.getDealerDistribution(soft(11)).bustProbability, 0.1152862703011695, 1e-12);
    EXPECT_NEAR(evaluator.getDealerDistribution(hard(10)).bustProbability, 0.21210907661769923, 1e-12);
}

TEST(DealerDistributionTest, HittingSoftSeventeenChangesTheDistribution) {
    BlackjackConfig config;
    config.dealerHitsSoft17 = true;
    Blackjack rules{ config };
    HandEvaluator evaluator{ rules };

    const HandEvaluator::DealerDistribution& distribution = evaluator.getDealerDistribution(soft(17));
    EXPECT_LT(distribution.finalTotalProbabilities[17], 1.0);
    EXPECT_GT(distribution.finalTotalProbabilities[18], 0.0);
}

TEST(StandValueTest, KnownDealerTotals) {
    Blackjack rules{ BlackjackConfig{} };
    HandEvaluator evaluator{ rules };

    EXPECT_EQ(evaluator.getStandValue(hard(20), hard(18)), 1.0);
    EXPECT_EQ(evaluator.getStandValue(hard(18), hard(18)), 0.5);
    EXPECT_EQ(evaluator.getStandValue(soft(17), hard(18)), 0.0);
    EXPECT_EQ(evaluator.getStandValue(hard(22), hard(18)), 0.0);
    EXPECT_EQ(evaluator.getStandValue(hard(12), hard(23)), 1.0);
}

TEST(StandValueTest, LowTotalsOnlyWinOnADealerBust) {
    Blackjack rules{ BlackjackConfig{} };
    HandEvaluator evaluator{ rules };

    double bustProbability = evaluator.getDealerDistribution(hard(10)).bustProbability;
    for (int total = 4; total <= 16; ++total) {
        EXPECT_NEAR(evaluator.getStandValue(hard(total), hard(10)), bustProbability, Epsilon);
    }
}

TEST(StandValueTest, ValueNeverDecreasesWithThePlayersTotal) {
    Blackjack rules{ BlackjackConfig{} };
    HandEvaluator evaluator{ rules };

    for (const Hand& dealerHand : getAllDealerHands()) {
        double previousValue = 0.0;
        for (int total = 4; total <= 21; ++total) {
            double value = evaluator.getStandValue(hard(total), dealerHand);
            EXPECT_GE(value, 0.0);
            EXPECT_LE(value, 1.0);
            EXPECT_GE(value, previousValue - Epsilon);
            previousValue = value;
        }
    }
}

TEST(EvaluateTest, TerminalStatesScoreTheirOutcome) {
    EXPECT_EQ(HandEvaluator::getOutcomeValue(Outcome::Win), 1.0);
    EXPECT_EQ(HandEvaluator::getOutcomeValue(Outcome::Push), 0.5);
    EXPECT_EQ(HandEvaluator::getOutcomeValue(Outcome::Lose), 0.0);

    Blackjack rules{ BlackjackConfig{} };
    HandEvaluator evaluator{ rules };

    GameState bust = rules.getGameStateFromHands(hard(25), hard(10));
    EXPECT_EQ(evaluator.evaluate(bust), 0.0);

    GameState push = {
        .playerHand = hard(19),
        .dealerHand = hard(19),
        .turn = Turn::Terminal,
        .outcome = Outcome::Push
    };
    EXPECT_EQ(evaluator.evaluate(push), 0.5);
}

TEST(EvaluateTest, NonTerminalStatesScoreStanding) {
    Blackjack rules{ BlackjackConfig{} };
    HandEvaluator evaluator{ rules };

    GameState playerTurn = rules.getGameStateFromHands(hard(19), hard(6));
    GameState dealerTurn = rules.getNewStateAfterStand(playerTurn);

    double standValue = evaluator.getStandValue(hard(19), hard(6));
    EXPECT_EQ(evaluator.evaluate(playerTurn), standValue);
    EXPECT_EQ(evaluator.evaluate(dealerTurn), standValue);
}

TEST(EvaluateTest, CustomTargetTotal) {
    BlackjackConfig config;
    config.targetTotal = 31;
    config.dealerStandThreshold = 27;
    Blackjack rules{ config };
    HandEvaluator evaluator{ rules };

    EXPECT_EQ(evaluator.getStandValue(hard(30), hard(28)), 1.0);
    EXPECT_EQ(evaluator.getStandValue(hard(32), hard(28)), 0.0);

    const HandEvaluator::DealerDistribution& distribution = evaluator.getDealerDistribution(hard(20));
    double total = distribution.bustProbability;
    for (double probability : distribution.finalTotalProbabilities) {
        total += probability;
    }
    EXPECT_NEAR(total, 1.0, Epsilon);
}
