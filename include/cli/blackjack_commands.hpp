#ifndef BLACKJACK_COMMANDS_HPP
#define BLACKJACK_COMMANDS_HPP

#include "cli/cli_dispatcher.hpp"
#include "game/blackjack.hpp"
#include "game/hand_evaluator.hpp"

#include <cstdint>
#include <memory>

struct BlackjackContext {
    std::unique_ptr<Blackjack> rules;
    std::unique_ptr<HandEvaluator> evaluator;
    int maxDepth;
    int numThreads;
    std::uint64_t seed;
};

BlackjackContext getDefaultContext();
bool registerAllCommands(CliDispatcher& dispatcher, BlackjackContext& context);

#endif // BLACKJACK_COMMANDS_HPP
