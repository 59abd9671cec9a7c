#include "game/game_utils.hpp"

#include "game/game_types.hpp"
#include "util/result.hpp"

#include <array>
#include <cassert>
#include <cctype>
#include <string>

namespace {
const std::string RankNames = "A23456789TJQK";
} // namespace

const std::array<Rank, NumRanks>& getAllRanks() {
    static const std::array<Rank, NumRanks> AllRanks = {
        Rank::Ace, Rank::Two, Rank::Three, Rank::Four, Rank::Five, Rank::Six, Rank::Seven,
        Rank::Eight, Rank::Nine, Rank::Ten, Rank::Jack, Rank::Queen, Rank::King
    };
    return AllRanks;
}

int getRankIndex(Rank rank) {
    int rankIndex = static_cast<int>(rank);
    assert(rankIndex >= 0 && rankIndex < NumRanks);
    return rankIndex;
}

char getRankName(Rank rank) {
    return RankNames[getRankIndex(rank)];
}

Result<Rank> getRankFromName(char rankName) {
    char upper = static_cast<char>(std::toupper(static_cast<unsigned char>(rankName)));

    // "1" is accepted as an Ace
    if (upper == '1') {
        return Rank::Ace;
    }

    std::size_t rankIndex = RankNames.find(upper);
    if (rankIndex == std::string::npos) {
        return "Error parsing rank: \"" + std::string(1, rankName) + "\" is not a valid rank. Valid ranks are " + RankNames + ".";
    }

    return static_cast<Rank>(rankIndex);
}

std::string getActionName(Action action) {
    switch (action) {
        case Action::Stand:
            return "Stand";
        case Action::Hit:
            return "Hit";
        default:
            assert(false);
            return "???";
    }
}

std::string getTurnName(Turn turn) {
    switch (turn) {
        case Turn::Player:
            return "Player";
        case Turn::Dealer:
            return "Dealer";
        case Turn::Terminal:
            return "Terminal";
        default:
            assert(false);
            return "???";
    }
}

std::string getOutcomeName(Outcome outcome) {
    switch (outcome) {
        case Outcome::Undecided:
            return "Undecided";
        case Outcome::Win:
            return "Win";
        case Outcome::Lose:
            return "Lose";
        case Outcome::Push:
            return "Push";
        default:
            assert(false);
            return "???";
    }
}

std::string getHandName(const Hand& hand) {
    return (hand.isSoft ? "Soft " : "Hard ") + std::to_string(hand.total);
}
