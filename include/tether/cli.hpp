#pragma once

#include "config.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace tether::cli {

    // what the command line asked for beyond the client settings
    struct invocation {
        client_config client{};
        std::optional<std::filesystem::path> config_file{};
        bool list_tools{false};
        std::optional<std::string> call_tool{};
        std::string arguments{"{}"};
    };

    // an exit code when the process should end here, nullopt to continue with run()
    std::optional<int> parse_cli(int argc, char** argv, invocation& inv);

    // --list-tools / --call against a fresh session; returns the exit code
    int run_action(const invocation& inv);

    // interactive session; returns the exit code
    int run_repl(const client_config& cfg);

}  // namespace tether::cli
