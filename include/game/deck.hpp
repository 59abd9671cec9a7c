#ifndef DECK_HPP
#define DECK_HPP

#include "game/game_types.hpp"

#include <cstddef>
#include <cstdint>
#include <random>

class ICardSource {
public:
    virtual ~ICardSource() = default;

    virtual Rank drawCard() = 0;
};

// Every draw is independent and uniform over the 13 ranks
class InfiniteDeck final : public ICardSource {
public:
    explicit InfiniteDeck(std::uint64_t seed);

    Rank drawCard() override;
    std::size_t getNumCardsDrawn() const;

private:
    std::mt19937_64 m_rng;
    std::uniform_int_distribution<int> m_rankDistribution;
    std::size_t m_numCardsDrawn;
};

#endif // DECK_HPP
