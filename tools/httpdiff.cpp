// httpdiff: compare captured HTTP request/response pairs
// Loads two capture files (JSON arrays of exchanges), lets the user pick one
// record from each and prints what changed in every part of the exchange,
// including header and body key reordering.
#include <httpdiff/cli.hpp>

#include <signal.h>
#include <csignal>
#include <iostream>

static volatile bool g_running = true;

void signal_handler(int) {
    g_running = false;
}

int main(int argc, char* argv[]) {
    // No SA_RESTART: Ctrl+C interrupts a pending prompt read
    struct sigaction sa {};
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    httpdiff::Options opts = httpdiff::parse_args(argc, argv, std::cerr);
    return httpdiff::run_cli(opts, std::cin, std::cout, std::cerr, &g_running);
}
