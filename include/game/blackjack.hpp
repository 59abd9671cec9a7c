#ifndef BLACKJACK_HPP
#define BLACKJACK_HPP

#include "game/config.hpp"
#include "game/deck.hpp"
#include "game/game_types.hpp"

#include <array>
#include <span>
#include <vector>

class Blackjack {
public:
    explicit Blackjack(const BlackjackConfig& config);

    const BlackjackConfig& getConfig() const;

    // Hand arithmetic
    int getRankValue(Rank rank) const;
    Hand getEmptyHand() const;
    Hand addCardToHand(const Hand& hand, Rank rank) const;
    Hand buildHand(std::span<const Rank> cards) const;
    bool isBust(const Hand& hand) const;
    bool doesDealerHit(const Hand& dealerHand) const;

    // Functions for building the game tree
    GameState getInitialGameState(ICardSource& deck) const;
    GameState getGameStateFromHands(const Hand& playerHand, const Hand& dealerHand) const;
    std::vector<Action> getValidActions(const GameState& state) const;
    bool isActionValid(const GameState& state, Action action) const;
    const std::array<DrawOutcome, NumRanks>& getDrawDistribution() const;
    int getTotalDrawWeight() const;
    GameState getNewStateAfterStand(const GameState& state) const;
    GameState getNewStateAfterDraw(const GameState& state, Rank rank) const;

    // Functions for playing out a game
    GameState applyPlayerAction(const GameState& state, Action action, ICardSource& deck) const;
    GameState resolveDealer(const GameState& state, ICardSource& deck) const;
    Outcome getShowdownOutcome(const Hand& playerHand, const Hand& dealerHand) const;

private:
    BlackjackConfig m_config;
    std::array<DrawOutcome, NumRanks> m_drawDistribution;
    int m_totalDrawWeight;
};

#endif // BLACKJACK_HPP
