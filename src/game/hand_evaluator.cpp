#include "game/hand_evaluator.hpp"

#include "game/blackjack.hpp"
#include "game/game_types.hpp"

#include <cassert>
#include <cstddef>
#include <initializer_list>
#include <optional>
#include <utility>
#include <vector>

namespace {
using DealerDistribution = HandEvaluator::DealerDistribution;
using DistributionMemo = std::vector<std::optional<DealerDistribution>>;

std::size_t getMemoIndex(const Hand& hand) {
    assert(hand.total >= 0);
    return (static_cast<std::size_t>(hand.total) * 2) + (hand.isSoft ? 1 : 0);
}

DealerDistribution buildBustDistribution(const Blackjack& rules) {
    int targetTotal = rules.getConfig().targetTotal;
    return {
        .finalTotalProbabilities = std::vector<double>(targetTotal + 1, 0.0),
        .bustProbability = 1.0
    };
}

DealerDistribution buildStandingDistribution(const Blackjack& rules, int total) {
    int targetTotal = rules.getConfig().targetTotal;
    assert(total >= 0 && total <= targetTotal);

    DealerDistribution distribution = {
        .finalTotalProbabilities = std::vector<double>(targetTotal + 1, 0.0),
        .bustProbability = 0.0
    };
    distribution.finalTotalProbabilities[total] = 1.0;
    return distribution;
}

// Every draw raises the hand's total or demotes a soft ace, so the recursion always bottoms out
const DealerDistribution& buildDealerDistribution(const Blackjack& rules, const Hand& dealerHand, const DealerDistribution& bustDistribution, DistributionMemo& memo) {
    if (rules.isBust(dealerHand)) {
        return bustDistribution;
    }

    std::size_t memoIndex = getMemoIndex(dealerHand);
    assert(memoIndex < memo.size());
    if (memo[memoIndex]) {
        return *memo[memoIndex];
    }

    if (!rules.doesDealerHit(dealerHand)) {
        memo[memoIndex] = buildStandingDistribution(rules, dealerHand.total);
        return *memo[memoIndex];
    }

    int targetTotal = rules.getConfig().targetTotal;
    DealerDistribution distribution = {
        .finalTotalProbabilities = std::vector<double>(targetTotal + 1, 0.0),
        .bustProbability = 0.0
    };

    for (const DrawOutcome& drawOutcome : rules.getDrawDistribution()) {
        Hand nextHand = rules.addCardToHand(dealerHand, drawOutcome.rank);
        const DealerDistribution& childDistribution = buildDealerDistribution(rules, nextHand, bustDistribution, memo);

        double weight = static_cast<double>(drawOutcome.weight);
        for (int total = 0; total <= targetTotal; ++total) {
            distribution.finalTotalProbabilities[total] += weight * childDistribution.finalTotalProbabilities[total];
        }
        distribution.bustProbability += weight * childDistribution.bustProbability;
    }

    // Divide once so equal weights stay exact
    double totalWeight = static_cast<double>(rules.getTotalDrawWeight());
    for (double& probability : distribution.finalTotalProbabilities) {
        probability /= totalWeight;
    }
    distribution.bustProbability /= totalWeight;

    memo[memoIndex] = std::move(distribution);
    return *memo[memoIndex];
}
} // namespace

HandEvaluator::HandEvaluator(const Blackjack& rules) :
    m_rules{ rules },
    m_bustDistribution{ buildBustDistribution(rules) } {
    int targetTotal = m_rules.getConfig().targetTotal;
    std::size_t tableSize = static_cast<std::size_t>(targetTotal + 1) * 2;

    DistributionMemo memo(tableSize);
    for (int total = 0; total <= targetTotal; ++total) {
        for (bool isSoft : { false, true }) {
            buildDealerDistribution(m_rules, Hand{ .total = total, .isSoft = isSoft }, m_bustDistribution, memo);
        }
    }

    m_dealerTable.reserve(tableSize);
    for (std::optional<DealerDistribution>& distribution : memo) {
        assert(distribution);
        m_dealerTable.push_back(std::move(*distribution));
    }
}

std::size_t HandEvaluator::getTableIndex(const Hand& hand) const {
    std::size_t tableIndex = getMemoIndex(hand);
    assert(tableIndex < m_dealerTable.size());
    return tableIndex;
}

const HandEvaluator::DealerDistribution& HandEvaluator::getDealerDistribution(const Hand& dealerHand) const {
    if (m_rules.isBust(dealerHand)) {
        return m_bustDistribution;
    }
    return m_dealerTable[getTableIndex(dealerHand)];
}

double HandEvaluator::getStandValue(const Hand& playerHand, const Hand& dealerHand) const {
    if (m_rules.isBust(playerHand)) {
        return 0.0;
    }

    const DealerDistribution& dealerDistribution = getDealerDistribution(dealerHand);

    // The player wins every dealer bust
    double value = dealerDistribution.bustProbability;

    int targetTotal = m_rules.getConfig().targetTotal;
    for (int dealerTotal = 0; dealerTotal <= targetTotal; ++dealerTotal) {
        double probability = dealerDistribution.finalTotalProbabilities[dealerTotal];
        if (probability == 0.0) continue;

        if (playerHand.total > dealerTotal) {
            value += probability;
        }
        else if (playerHand.total == dealerTotal) {
            value += 0.5 * probability;
        }
    }

    return value;
}

double HandEvaluator::evaluate(const GameState& state) const {
    if (state.turn == Turn::Terminal) {
        return getOutcomeValue(state.outcome);
    }

    // Both the player's turn and the dealer's turn are scored as if the player stands now
    return getStandValue(state.playerHand, state.dealerHand);
}

double HandEvaluator::getOutcomeValue(Outcome outcome) {
    switch (outcome) {
        case Outcome::Win:
            return 1.0;
        case Outcome::Lose:
            return 0.0;
        case Outcome::Push:
            return 0.5;
        default:
            assert(false);
            return 0.0;
    }
}
