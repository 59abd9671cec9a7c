#ifndef SIMULATE_HPP
#define SIMULATE_HPP

#include "game/blackjack.hpp"
#include "game/deck.hpp"
#include "game/game_types.hpp"
#include "solver/search_agent.hpp"

#include <cstdint>

struct SimulationResult {
    int wins;
    int pushes;
    int losses;
    double secondsElapsed;

    int getNumGames() const;

    // Average value per game on the evaluator's scale: win 1, push 0.5, loss 0
    double getScore() const;
};

Outcome playGame(const Blackjack& rules, const SearchAgent& agent, ICardSource& deck);

// Game i is played with a deck seeded by seed + i, so the tallies don't depend on the thread count
SimulationResult simulateGames(const Blackjack& rules, const SearchAgent& agent, int numGames, std::uint64_t seed, int numThreads);

#endif // SIMULATE_HPP
