#pragma once

#include "mirror/core/config.hpp"

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace mirror::app {

enum class Action {
    Run,
    Count,
    Forget,
    Help
};

/**
 * @brief Parsed command line; every option is unset unless given explicitly
 *
 * Unset options leave the value from the config file or the environment alone.
 */
struct CommandLine {
    Action action = Action::Run;
    std::string forget_location;

    std::optional<std::string> config_file;
    std::optional<std::string> root_url;
    std::optional<std::string> destination_root;
    std::optional<std::size_t> worker_count;
    std::optional<std::size_t> timeout_seconds;
    std::optional<std::string> ledger_path;
    std::optional<std::string> user_agent;
    std::optional<std::vector<std::string>> regions;
    std::optional<std::string> summary_json;
    bool verbose = false;
};

/// ERRORS: InvalidArgument for unknown options, missing values or bad numbers
Result<CommandLine> parse_command_line(int argc, const char* const argv[]);

/**
 * @brief Build the effective configuration
 *
 * Precedence: defaults < config file (--config or MIRROR_CONFIG) < environment
 * < command line. Runs validate_config() for Run and Count.
 */
Result<MirrorConfig> resolve_config(const CommandLine& command_line, const EnvLookup& lookup);

MirrorConfig apply_overrides(MirrorConfig base, const CommandLine& command_line);

void print_usage(std::ostream& out, const char* program_name);

} // namespace mirror::app
