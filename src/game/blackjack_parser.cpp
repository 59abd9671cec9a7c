#include "game/blackjack_parser.hpp"

#include "game/blackjack.hpp"
#include "game/game_types.hpp"
#include "game/game_utils.hpp"
#include "util/result.hpp"
#include "util/string_utils.hpp"

#include <cctype>
#include <cstddef>
#include <string>
#include <vector>

Result<std::vector<Rank>> buildCardsFromString(const std::string& cardString) {
    std::vector<Rank> cards;

    std::size_t index = 0;
    while (index < cardString.size()) {
        char rankName = cardString[index];

        if (std::isspace(static_cast<unsigned char>(rankName)) || rankName == ',') {
            ++index;
            continue;
        }

        if (rankName == '1' && (index + 1 < cardString.size()) && cardString[index + 1] == '0') {
            cards.push_back(Rank::Ten);
            index += 2;
            continue;
        }

        Result<Rank> rankResult = getRankFromName(rankName);
        if (rankResult.isError()) {
            return rankResult.getError();
        }

        cards.push_back(rankResult.getValue());
        ++index;
    }

    if (cards.empty()) {
        return "Error building cards: No cards given.";
    }

    return cards;
}

Result<GameState> buildGameStateFromString(const std::string& handsString, const Blackjack& rules) {
    std::vector<std::string> handStrings = parseTokens(handsString, '/');
    if (handStrings.size() != 2) {
        return "Error building hands: Expected player cards and dealer cards separated by '/', e.g. \"T6/T7\".";
    }

    Result<std::vector<Rank>> playerCardsResult = buildCardsFromString(handStrings[0]);
    if (playerCardsResult.isError()) {
        return "Error building player hand: " + playerCardsResult.getError();
    }

    Result<std::vector<Rank>> dealerCardsResult = buildCardsFromString(handStrings[1]);
    if (dealerCardsResult.isError()) {
        return "Error building dealer hand: " + dealerCardsResult.getError();
    }

    Hand playerHand = rules.buildHand(playerCardsResult.getValue());
    Hand dealerHand = rules.buildHand(dealerCardsResult.getValue());

    if (rules.isBust(playerHand)) {
        return "Error building hands: Player hand " + getHandName(playerHand) + " is already bust.";
    }

    if (rules.isBust(dealerHand)) {
        return "Error building hands: Dealer hand " + getHandName(dealerHand) + " is already bust.";
    }

    return rules.getGameStateFromHands(playerHand, dealerHand);
}
