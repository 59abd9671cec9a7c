#include "cli/blackjack_commands.hpp"
#include "cli/cli_dispatcher.hpp"

#include <iostream>

int main(int argc, char** argv) {
    CliDispatcher dispatcher("BlackjackSearch", Version{ .major = 1, .minor = 0, .patch = 0 });
    BlackjackContext context = getDefaultContext();
    if (!registerAllCommands(dispatcher, context)) {
        std::cerr << "Error: Could not register commands.\n";
        return 1;
    }

    // Commands given as arguments run in order without the prompt, e.g. BlackjackSearch standard "simulate 10000"
    if (argc > 1) {
        for (int i = 1; i < argc; ++i) {
            if (!dispatcher.runCommand(argv[i])) {
                return 1;
            }
        }
        return 0;
    }

    dispatcher.run(std::cin);
    return 0;
}
