#ifndef CONFIG_HPP
#define CONFIG_HPP

#include "game/game_types.hpp"

#include <array>

namespace blackjack {
constexpr int DefaultTargetTotal = 21;
constexpr int DefaultDealerStandThreshold = 17;
constexpr int DefaultInitialCardsPerHand = 2;
constexpr int DefaultMaxSearchDepth = 4;

// Upper bounds accepted from a rules file
constexpr int MaxTargetTotal = 100;
constexpr int MaxRankValue = 11;
constexpr int MaxInitialCardsPerHand = 5;
constexpr int MaxSearchDepth = 8;

// Indexed by Rank: A, 2, 3, ..., 10, J, Q, K
constexpr std::array<int, NumRanks> StandardRankValues = { 11, 2, 3, 4, 5, 6, 7, 8, 9, 10, 10, 10, 10 };
} // namespace blackjack

struct BlackjackConfig {
    // A hand above this total is bust
    int targetTotal = blackjack::DefaultTargetTotal;

    // The dealer hits while below this total
    int dealerStandThreshold = blackjack::DefaultDealerStandThreshold;
    bool dealerHitsSoft17 = false;

    // With soft aces an Ace counts as its table value and drops to 1 when the hand would bust
    bool useSoftAces = true;
    std::array<int, NumRanks> rankValues = blackjack::StandardRankValues;

    int initialCardsPerHand = blackjack::DefaultInitialCardsPerHand;

    bool operator==(const BlackjackConfig&) const = default;
};

#endif // CONFIG_HPP
