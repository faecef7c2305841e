#include <csignal>
#include <iostream>
#include <string>
#include <vector>

#include "gatenet/cli.hpp"

extern "C" void handle_interrupt(int)
{
    request_interrupt();
    // a second Ctrl-C terminates immediately
    std::signal(SIGINT, SIG_DFL);
}

int main(int argc, char** argv)
{
    std::signal(SIGINT, handle_interrupt);

    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }

    return run_cli(args, std::cout, std::cerr);
}
