#include "simulation/simulate.hpp"

#include "game/blackjack.hpp"
#include "game/deck.hpp"
#include "game/game_types.hpp"
#include "solver/search_agent.hpp"
#include "util/scoped_timer.hpp"

#include <cassert>
#include <cstdint>

#ifdef _OPENMP
#include <omp.h>
#endif

int SimulationResult::getNumGames() const {
    return wins + pushes + losses;
}

double SimulationResult::getScore() const {
    int numGames = getNumGames();
    if (numGames == 0) {
        return 0.0;
    }
    return (static_cast<double>(wins) + (0.5 * static_cast<double>(pushes))) / static_cast<double>(numGames);
}

Outcome playGame(const Blackjack& rules, const SearchAgent& agent, ICardSource& deck) {
    GameState state = rules.getInitialGameState(deck);

    // Each hit raises the player's total, so the player eventually stands or busts
    while (state.turn == Turn::Player) {
        state = rules.applyPlayerAction(state, agent.decide(state), deck);
    }

    if (state.turn == Turn::Dealer) {
        state = rules.resolveDealer(state, deck);
    }

    assert(state.turn == Turn::Terminal);
    assert(state.outcome != Outcome::Undecided);
    return state.outcome;
}

SimulationResult simulateGames(const Blackjack& rules, const SearchAgent& agent, int numGames, std::uint64_t seed, int numThreads) {
    assert(numGames >= 0);
    assert(numThreads >= 1);

    ScopedTimer timer("", "");

    int wins = 0;
    int pushes = 0;
    int losses = 0;

    #ifdef _OPENMP
    omp_set_num_threads(numThreads);
    #pragma omp parallel for schedule(dynamic, 64) reduction(+:wins, pushes, losses)
    #else
    static_cast<void>(numThreads);
    #endif
    for (int game = 0; game < numGames; ++game) {
        InfiniteDeck deck(seed + static_cast<std::uint64_t>(game));

        switch (playGame(rules, agent, deck)) {
            case Outcome::Win:
                ++wins;
                break;
            case Outcome::Push:
                ++pushes;
                break;
            case Outcome::Lose:
                ++losses;
                break;
            default:
                assert(false);
                break;
        }
    }

    return {
        .wins = wins,
        .pushes = pushes,
        .losses = losses,
        .secondsElapsed = timer.getSecondsElapsed()
    };
}
