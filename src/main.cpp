#include "lru/store_shell.h"
#include "lru/time_utils.h"

#include <iostream>
#include <memory>
#include <sstream>
#include <string>

namespace {

void print_usage(std::ostream& out){
    out << "usage: lru_shell [--capacity N] [--quiet] [--help]\n"
        << "  reads one command per line from stdin, writes one JSON response per line\n"
        << "  commands: put get peek del has resize lru mru pop clear keys dump stats quit\n";
}

} // namespace

int main(int argc, char* argv[]) {
    long long capacity = 100;   // default capacity
    bool quiet = false;

    // --- Parse args ---
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--capacity" && i + 1 < argc) {
            try {
                capacity = lru::parse_capacity(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "invalid value for --capacity: " << argv[i] << "\n";
                print_usage(std::cerr);
                return 2;
            }
        }
        else if (arg == "--quiet") quiet = true;
        else if (arg == "--help") {
            print_usage(std::cout);
            return 0;
        }
        else {
            std::cerr << "unknown option: " << arg << "\n";
            print_usage(std::cerr);
            return 2;
        }
    }

    // --- Core components ---
    std::shared_ptr<lru::StoreShell::Store> store;
    try {
        store = std::make_shared<lru::StoreShell::Store>(capacity);
    } catch (const lru::InvalidCapacity& e) {
        lru::log_line(std::cerr, e.what());
        return 1;
    }
    lru::StoreShell::LogHook log;
    if (!quiet) {
        log = [](const std::string& line) { lru::log_line(std::cerr, line); };
    }
    lru::StoreShell shell(store, log);

    lru::log_line(std::cerr, "Starting lru_shell with capacity " + std::to_string(capacity));

    // --- Command loop ---
    std::string line;
    while (std::getline(std::cin, line)) {
        std::istringstream words(line);
        std::string command;
        if (!(words >> command) || command[0] == '#') continue;
        if (lru::is_quit_command(line)) break;

        std::cout << shell.execute(line).dump() << std::endl;
    }

    lru::log_line(std::cerr, "Stopping lru_shell: " + std::to_string(store->filled()) + " entries, "
                  + std::to_string(shell.hits()) + " hits, " + std::to_string(shell.misses()) + " misses");
    return 0;
}
