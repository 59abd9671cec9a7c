#ifndef SEARCH_AGENT_HPP
#define SEARCH_AGENT_HPP

#include "game/blackjack.hpp"
#include "game/game_types.hpp"
#include "game/hand_evaluator.hpp"
#include "solver/search.hpp"

#include <string>

// Plays hit or stand by searching the game tree from the current state.
// The agent borrows the rules and evaluator, both must outlive it.
class SearchAgent {
public:
    SearchAgent(const Blackjack& rules, const HandEvaluator& evaluator, SearchMode mode, int maxDepth);

    Action decide(const GameState& state) const;
    SearchResult search(const GameState& state) const;

    SearchMode getMode() const;
    int getMaxDepth() const;
    std::string getName() const;

private:
    const Blackjack& m_rules;
    const HandEvaluator& m_evaluator;
    SearchMode m_mode;
    int m_maxDepth;
};

#endif // SEARCH_AGENT_HPP
