#include "tether/cli.hpp"

#include <exception>
#include <iostream>

int main(int argc, char** argv) {
    try {
        tether::cli::invocation inv{};
        if (auto cli_result = tether::cli::parse_cli(argc, argv, inv)) {
            return *cli_result;
        }

        if (inv.list_tools || inv.call_tool) {
            return tether::cli::run_action(inv);
        }
        return tether::cli::run_repl(inv.client);
    } catch (std::exception& e) {
        std::cerr << "fatal: " << e.what() << '\n';
        return 1;
    } catch (...) {
        std::cerr << "fatal: unknown exception\n";
        return 1;
    }
}
