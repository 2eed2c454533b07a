#pragma once

#include "mirror/core/result.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace mirror {

inline constexpr const char* kDefaultUserAgent =
    "treemirror/1.0 (+directory mirror; set --user-agent to identify yourself)";

/**
 * @brief Everything one mirror run needs, passed by value into the orchestrator
 */
struct MirrorConfig {
    std::string root_url;                            ///< Listing page to mirror, always ends in '/'
    std::filesystem::path destination_root;          ///< Mirror root on local disk
    std::size_t worker_count = 8;
    std::chrono::seconds transfer_timeout{20};       ///< Connect and stall timeout per transfer
    std::filesystem::path ledger_path{"downloads.db"};
    std::string user_agent = kDefaultUserAgent;
    std::vector<std::string> regions;                ///< Empty means no region filtering
    std::size_t crawl_error_tolerance = 0;           ///< Crawl errors allowed before the run fails
    std::size_t io_error_threshold = 25;             ///< 0 disables the I/O circuit breaker
    std::size_t queue_capacity = 0;                  ///< 0 means an unbounded task queue
    std::size_t progress_interval = 50;
    bool fail_on_corrupt_archive = true;
};

/// Environment lookup seam; returns nullopt for unset variables.
using EnvLookup = std::function<std::optional<std::string>(const std::string& name)>;

EnvLookup process_environment();

/**
 * @brief Overlay a JSON config file on top of @p base
 *
 * Unknown keys are ignored; keys with the wrong type are reported as Config errors.
 */
Result<MirrorConfig> load_config_file(const std::filesystem::path& path, MirrorConfig base);

/**
 * @brief Overlay BASE_URL, DOWNLOAD_DIR, MAX_THREADS, TIMEOUT, DB_FILE, USER_AGENT and REGION
 */
Result<MirrorConfig> apply_environment(MirrorConfig base, const EnvLookup& lookup);

/**
 * @brief Check required options and normalize the root URL
 */
Result<MirrorConfig> validate_config(MirrorConfig config);

std::vector<std::string> split_list(const std::string& text, char separator);

/// Parse a non-negative decimal count; @p name labels the Config error.
Result<std::size_t> parse_count(const std::string& name, const std::string& text);

} // namespace mirror
