#include "game/blackjack.hpp"

#include "game/config.hpp"
#include "game/deck.hpp"
#include "game/game_types.hpp"
#include "game/game_utils.hpp"

#include <algorithm>
#include <array>
#include <cassert>
#include <span>
#include <vector>

namespace {
std::array<DrawOutcome, NumRanks> buildDrawDistribution() {
    // Infinite deck: every rank is drawn with the same weight regardless of history
    static constexpr int RankWeight = 1;
    static constexpr double RankProbability = static_cast<double>(RankWeight) / static_cast<double>(RankWeight * NumRanks);

    std::array<DrawOutcome, NumRanks> drawDistribution;
    for (Rank rank : getAllRanks()) {
        drawDistribution[getRankIndex(rank)] = {
            .rank = rank,
            .weight = RankWeight,
            .probability = RankProbability
        };
    }
    return drawDistribution;
}
} // namespace

Blackjack::Blackjack(const BlackjackConfig& config) :
    m_config{ config },
    m_drawDistribution{ buildDrawDistribution() },
    m_totalDrawWeight{ 0 } {
    for (const DrawOutcome& drawOutcome : m_drawDistribution) {
        m_totalDrawWeight += drawOutcome.weight;
    }

    // Every card must move the hand forward or dealer play could loop forever
    assert(std::all_of(m_config.rankValues.begin(), m_config.rankValues.end(), [](int value) { return value >= 1; }));
    assert(m_config.initialCardsPerHand >= 1);
}

const BlackjackConfig& Blackjack::getConfig() const {
    return m_config;
}

int Blackjack::getRankValue(Rank rank) const {
    return m_config.rankValues[getRankIndex(rank)];
}

Hand Blackjack::getEmptyHand() const {
    return { .total = 0, .isSoft = false };
}

Hand Blackjack::addCardToHand(const Hand& hand, Rank rank) const {
    int aceValue = getRankValue(Rank::Ace);
    int aceReduction = aceValue - 1;

    int total = hand.total + getRankValue(rank);
    int numSoftAces = hand.isSoft ? 1 : 0;
    if (rank == Rank::Ace && m_config.useSoftAces && aceReduction > 0) {
        ++numSoftAces;
    }

    // Demote high aces one at a time until the hand no longer busts
    while (total > m_config.targetTotal && numSoftAces > 0) {
        total -= aceReduction;
        --numSoftAces;
    }

    return { .total = total, .isSoft = (numSoftAces > 0) };
}

Hand Blackjack::buildHand(std::span<const Rank> cards) const {
    Hand hand = getEmptyHand();
    for (Rank rank : cards) {
        hand = addCardToHand(hand, rank);
    }
    return hand;
}

bool Blackjack::isBust(const Hand& hand) const {
    return hand.total > m_config.targetTotal;
}

bool Blackjack::doesDealerHit(const Hand& dealerHand) const {
    if (isBust(dealerHand)) {
        return false;
    }

    if (dealerHand.total < m_config.dealerStandThreshold) {
        return true;
    }

    return m_config.dealerHitsSoft17 && dealerHand.isSoft && (dealerHand.total == m_config.dealerStandThreshold);
}

GameState Blackjack::getInitialGameState(ICardSource& deck) const {
    Hand playerHand = getEmptyHand();
    Hand dealerHand = getEmptyHand();

    // Cards are dealt alternately, player first
    for (int i = 0; i < m_config.initialCardsPerHand; ++i) {
        playerHand = addCardToHand(playerHand, deck.drawCard());
        dealerHand = addCardToHand(dealerHand, deck.drawCard());
    }

    // A natural 21 is played as a normal hand
    return getGameStateFromHands(playerHand, dealerHand);
}

GameState Blackjack::getGameStateFromHands(const Hand& playerHand, const Hand& dealerHand) const {
    if (isBust(playerHand)) {
        return {
            .playerHand = playerHand,
            .dealerHand = dealerHand,
            .turn = Turn::Terminal,
            .outcome = Outcome::Lose
        };
    }

    return {
        .playerHand = playerHand,
        .dealerHand = dealerHand,
        .turn = Turn::Player,
        .outcome = Outcome::Undecided
    };
}

std::vector<Action> Blackjack::getValidActions(const GameState& state) const {
    if (state.turn != Turn::Player) {
        return {};
    }

    // Stand is listed first so that searches settle ties in its favor
    return { Action::Stand, Action::Hit };
}

bool Blackjack::isActionValid(const GameState& state, Action action) const {
    for (Action validAction : getValidActions(state)) {
        if (validAction == action) {
            return true;
        }
    }
    return false;
}

const std::array<DrawOutcome, NumRanks>& Blackjack::getDrawDistribution() const {
    return m_drawDistribution;
}

int Blackjack::getTotalDrawWeight() const {
    return m_totalDrawWeight;
}

GameState Blackjack::getNewStateAfterStand(const GameState& state) const {
    assert(isActionValid(state, Action::Stand));

    return {
        .playerHand = state.playerHand,
        .dealerHand = state.dealerHand,
        .turn = Turn::Dealer,
        .outcome = Outcome::Undecided
    };
}

GameState Blackjack::getNewStateAfterDraw(const GameState& state, Rank rank) const {
    assert(isActionValid(state, Action::Hit));

    // A bust ends the game immediately, the dealer never plays
    return getGameStateFromHands(addCardToHand(state.playerHand, rank), state.dealerHand);
}

GameState Blackjack::applyPlayerAction(const GameState& state, Action action, ICardSource& deck) const {
    assert(isActionValid(state, action));

    switch (action) {
        case Action::Stand:
            return getNewStateAfterStand(state);
        case Action::Hit:
            return getNewStateAfterDraw(state, deck.drawCard());
        default:
            assert(false);
            return state;
    }
}

GameState Blackjack::resolveDealer(const GameState& state, ICardSource& deck) const {
    assert(state.turn == Turn::Dealer);

    Hand dealerHand = state.dealerHand;
    while (doesDealerHit(dealerHand)) {
        dealerHand = addCardToHand(dealerHand, deck.drawCard());
    }

    return {
        .playerHand = state.playerHand,
        .dealerHand = dealerHand,
        .turn = Turn::Terminal,
        .outcome = getShowdownOutcome(state.playerHand, dealerHand)
    };
}

Outcome Blackjack::getShowdownOutcome(const Hand& playerHand, const Hand& dealerHand) const {
    // The player busting is checked first, a dealer bust can't save them
    if (isBust(playerHand)) {
        return Outcome::Lose;
    }

    if (isBust(dealerHand)) {
        return Outcome::Win;
    }

    if (playerHand.total > dealerHand.total) {
        return Outcome::Win;
    }
    else if (playerHand.total < dealerHand.total) {
        return Outcome::Lose;
    }
    else {
        return Outcome::Push;
    }
}
