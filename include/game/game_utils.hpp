#ifndef GAME_UTILS_HPP
#define GAME_UTILS_HPP

#include "game/game_types.hpp"
#include "util/result.hpp"

#include <array>
#include <string>

// Rank functions
const std::array<Rank, NumRanks>& getAllRanks();
int getRankIndex(Rank rank);
char getRankName(Rank rank);
Result<Rank> getRankFromName(char rankName);

// Enum names used for output
std::string getActionName(Action action);
std::string getTurnName(Turn turn);
std::string getOutcomeName(Outcome outcome);

// Hand functions
std::string getHandName(const Hand& hand);

#endif // GAME_UTILS_HPP
