#ifndef GAME_TYPES_HPP
#define GAME_TYPES_HPP

#include <cstdint>

constexpr int NumRanks = 13;
constexpr int NumActions = 2;

enum class Rank : std::uint8_t {
    Ace,
    Two,
    Three,
    Four,
    Five,
    Six,
    Seven,
    Eight,
    Nine,
    Ten,
    Jack,
    Queen,
    King
};

enum class Action : std::uint8_t {
    Stand,
    Hit
};

enum class Turn : std::uint8_t {
    Player,
    Dealer,
    Terminal
};

enum class Outcome : std::uint8_t {
    Undecided,
    Win,
    Lose,
    Push
};

struct Hand {
    int total;

    // True if an Ace is currently counted high and can still be demoted
    bool isSoft;

    bool operator==(const Hand&) const = default;
};

// outcome is Undecided iff turn != Terminal
struct GameState {
    Hand playerHand;
    Hand dealerHand;
    Turn turn;
    Outcome outcome;

    bool operator==(const GameState&) const = default;
};

// One branch of a chance node. All weights are equal under the infinite deck model.
struct DrawOutcome {
    Rank rank;
    int weight;
    double probability;
};

#endif // GAME_TYPES_HPP
