#ifndef BLACKJACK_PARSER_HPP
#define BLACKJACK_PARSER_HPP

#include "game/blackjack.hpp"
#include "game/game_types.hpp"
#include "util/result.hpp"

#include <string>
#include <vector>

// Cards are rank characters such as "A7" or "T,6". "10" is read as a Ten.
Result<std::vector<Rank>> buildCardsFromString(const std::string& cardString);

// Player and dealer cards separated by a slash, e.g. "T6/T7"
Result<GameState> buildGameStateFromString(const std::string& handsString, const Blackjack& rules);

#endif // BLACKJACK_PARSER_HPP
