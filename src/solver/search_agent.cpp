#include "solver/search_agent.hpp"

#include "game/blackjack.hpp"
#include "game/game_types.hpp"
#include "game/hand_evaluator.hpp"
#include "solver/search.hpp"

#include <cassert>
#include <string>

SearchAgent::SearchAgent(const Blackjack& rules, const HandEvaluator& evaluator, SearchMode mode, int maxDepth) :
    m_rules{ rules },
    m_evaluator{ evaluator },
    m_mode{ mode },
    m_maxDepth{ maxDepth } {
    assert(m_maxDepth >= 1);
}

Action SearchAgent::decide(const GameState& state) const {
    return search(state).bestAction;
}

SearchResult SearchAgent::search(const GameState& state) const {
    return searchBestAction(m_rules, m_evaluator, state, m_mode, m_maxDepth);
}

SearchMode SearchAgent::getMode() const {
    return m_mode;
}

int SearchAgent::getMaxDepth() const {
    return m_maxDepth;
}

std::string SearchAgent::getName() const {
    return getSearchModeName(m_mode);
}
