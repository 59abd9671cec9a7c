#include "game/deck.hpp"

#include "game/game_types.hpp"

#include <cstddef>
#include <cstdint>
#include <random>

InfiniteDeck::InfiniteDeck(std::uint64_t seed) :
    m_rng{ seed },
    m_rankDistribution{ 0, NumRanks - 1 },
    m_numCardsDrawn{ 0 } {
}

Rank InfiniteDeck::drawCard() {
    ++m_numCardsDrawn;
    return static_cast<Rank>(m_rankDistribution(m_rng));
}

std::size_t InfiniteDeck::getNumCardsDrawn() const {
    return m_numCardsDrawn;
}
