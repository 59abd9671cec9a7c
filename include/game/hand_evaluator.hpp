#ifndef HAND_EVALUATOR_HPP
#define HAND_EVALUATOR_HPP

#include "game/blackjack.hpp"
#include "game/game_types.hpp"

#include <cstddef>
#include <vector>

// Scores states by the player's chance of beating the dealer if they stand now.
// Wins count 1, pushes 0.5, losses 0.
class HandEvaluator {
public:
    struct DealerDistribution {
        // finalTotalProbabilities[t] is the chance that the dealer stands on exactly t
        std::vector<double> finalTotalProbabilities;
        double bustProbability;
    };

    explicit HandEvaluator(const Blackjack& rules);

    const DealerDistribution& getDealerDistribution(const Hand& dealerHand) const;
    double getStandValue(const Hand& playerHand, const Hand& dealerHand) const;
    double evaluate(const GameState& state) const;

    static double getOutcomeValue(Outcome outcome);

private:
    std::size_t getTableIndex(const Hand& hand) const;

    Blackjack m_rules;
    DealerDistribution m_bustDistribution;

    // Indexed by (total, isSoft) for every total that isn't bust
    std::vector<DealerDistribution> m_dealerTable;
};

#endif // HAND_EVALUATOR_HPP
