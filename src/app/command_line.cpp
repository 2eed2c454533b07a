#include "mirror/app/command_line.hpp"

namespace mirror::app {
namespace {

bool looks_like_option(const std::string& arg) {
    return arg.size() > 1 && arg[0] == '-';
}

Result<std::string> take_value(int argc, const char* const argv[], int& i, const std::string& option) {
    if (i + 1 >= argc) {
        return Err<std::string>(ErrorKind::InvalidArgument, option + " requires a value");
    }
    return Ok(std::string(argv[++i]));
}

Result<std::size_t> take_count(int argc, const char* const argv[], int& i, const std::string& option) {
    auto value = take_value(argc, argv, i, option);
    if (value.is_error()) {
        return Err<std::size_t>(value.error());
    }
    auto parsed = parse_count(option, value.value());
    if (parsed.is_error()) {
        return Err<std::size_t>(ErrorKind::InvalidArgument, parsed.error().message);
    }
    return parsed;
}

} // namespace

Result<CommandLine> parse_command_line(int argc, const char* const argv[]) {
    CommandLine result;
    bool action_given = false;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            result.action = Action::Help;
            return Ok(std::move(result));
        } else if (arg == "-u" || arg == "--url") {
            auto value = take_value(argc, argv, i, arg);
            if (value.is_error()) return Err<CommandLine>(value.error());
            result.root_url = value.value();
        } else if (arg == "-d" || arg == "--download-dir") {
            auto value = take_value(argc, argv, i, arg);
            if (value.is_error()) return Err<CommandLine>(value.error());
            result.destination_root = value.value();
        } else if (arg == "-t" || arg == "--threads") {
            auto value = take_count(argc, argv, i, arg);
            if (value.is_error()) return Err<CommandLine>(value.error());
            result.worker_count = value.value();
        } else if (arg == "--timeout") {
            auto value = take_count(argc, argv, i, arg);
            if (value.is_error()) return Err<CommandLine>(value.error());
            result.timeout_seconds = value.value();
        } else if (arg == "--db-file") {
            auto value = take_value(argc, argv, i, arg);
            if (value.is_error()) return Err<CommandLine>(value.error());
            result.ledger_path = value.value();
        } else if (arg == "--user-agent") {
            auto value = take_value(argc, argv, i, arg);
            if (value.is_error()) return Err<CommandLine>(value.error());
            result.user_agent = value.value();
        } else if (arg == "-r" || arg == "--region") {
            // One or more values, up to the next option
            std::vector<std::string> regions;
            while (i + 1 < argc && !looks_like_option(argv[i + 1])) {
                for (auto& region : split_list(argv[++i], ',')) {
                    regions.push_back(std::move(region));
                }
            }
            if (regions.empty()) {
                return Err<CommandLine>(ErrorKind::InvalidArgument, arg + " requires at least one region");
            }
            result.regions = std::move(regions);
        } else if (arg == "-c" || arg == "--count") {
            result.action = Action::Count;
            action_given = true;
        } else if (arg == "--verbose" || arg == "-v") {
            result.verbose = true;
        } else if (arg == "--summary-json") {
            auto value = take_value(argc, argv, i, arg);
            if (value.is_error()) return Err<CommandLine>(value.error());
            result.summary_json = value.value();
        } else if (arg == "--config") {
            auto value = take_value(argc, argv, i, arg);
            if (value.is_error()) return Err<CommandLine>(value.error());
            result.config_file = value.value();
        } else if (looks_like_option(arg)) {
            return Err<CommandLine>(ErrorKind::InvalidArgument, "unknown option: " + arg);
        } else if (!action_given && arg == "run") {
            result.action = Action::Run;
            action_given = true;
        } else if (!action_given && arg == "count") {
            result.action = Action::Count;
            action_given = true;
        } else if (!action_given && arg == "forget") {
            auto value = take_value(argc, argv, i, arg);
            if (value.is_error()) return Err<CommandLine>(value.error());
            result.action = Action::Forget;
            result.forget_location = value.value();
            action_given = true;
        } else {
            return Err<CommandLine>(ErrorKind::InvalidArgument, "unexpected argument: " + arg);
        }
    }

    return Ok(std::move(result));
}

MirrorConfig apply_overrides(MirrorConfig base, const CommandLine& command_line) {
    MirrorConfig config = std::move(base);
    if (command_line.root_url) {
        config.root_url = *command_line.root_url;
    }
    if (command_line.destination_root) {
        config.destination_root = *command_line.destination_root;
    }
    if (command_line.worker_count) {
        config.worker_count = *command_line.worker_count;
    }
    if (command_line.timeout_seconds) {
        config.transfer_timeout = std::chrono::seconds(*command_line.timeout_seconds);
    }
    if (command_line.ledger_path) {
        config.ledger_path = *command_line.ledger_path;
    }
    if (command_line.user_agent) {
        config.user_agent = *command_line.user_agent;
    }
    if (command_line.regions) {
        config.regions = *command_line.regions;
    }
    return config;
}

Result<MirrorConfig> resolve_config(const CommandLine& command_line, const EnvLookup& lookup) {
    MirrorConfig config;

    std::optional<std::string> config_file = command_line.config_file;
    if (!config_file) {
        config_file = lookup("MIRROR_CONFIG");
    }
    if (config_file && !config_file->empty()) {
        auto loaded = load_config_file(*config_file, std::move(config));
        if (loaded.is_error()) {
            return loaded;
        }
        config = std::move(loaded.value());
    }

    auto with_env = apply_environment(std::move(config), lookup);
    if (with_env.is_error()) {
        return with_env;
    }
    config = apply_overrides(std::move(with_env.value()), command_line);

    if (command_line.action == Action::Forget) {
        if (config.ledger_path.empty()) {
            return Err<MirrorConfig>(ErrorKind::Config, "ledger path must not be empty");
        }
        return Ok(std::move(config));
    }
    return validate_config(std::move(config));
}

void print_usage(std::ostream& out, const char* program_name) {
    out << "Usage: " << program_name << " [run|count|forget URL] [OPTIONS]\n\n";
    out << "Mirror a remote directory-listing tree to local disk.\n\n";
    out << "Actions:\n";
    out << "  run                     Crawl and download everything not yet mirrored (default)\n";
    out << "  count                   Crawl only and print the number of files\n";
    out << "  forget URL              Delete the ledger record for URL\n\n";
    out << "Options:\n";
    out << "  -u, --url URL           Root listing URL (env BASE_URL)\n";
    out << "  -d, --download-dir DIR  Mirror root on disk (env DOWNLOAD_DIR)\n";
    out << "  -t, --threads N         Concurrent transfers (env MAX_THREADS, default 8)\n";
    out << "      --timeout SECONDS   Connect and stall timeout per transfer (env TIMEOUT, default 20)\n";
    out << "      --db-file PATH      Ledger database (env DB_FILE, default downloads.db)\n";
    out << "      --user-agent TEXT   HTTP User-Agent (env USER_AGENT)\n";
    out << "  -r, --region R [R...]   Only files tagged with these regions, e.g. -r USA EU JP (env REGION)\n";
    out << "  -c, --count             Same as the count action\n";
    out << "      --summary-json PATH Write the run summary as JSON\n";
    out << "      --config PATH       JSON config file (env MIRROR_CONFIG)\n";
    out << "  -v, --verbose           Debug logging\n";
    out << "  -h, --help              Show this help message\n\n";
    out << "Exit status: 0 success, 1 failures, 2 usage or configuration error,\n";
    out << "             3 ledger error, 130 interrupted\n";
}

} // namespace mirror::app
