#include "mirror/core/config.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace mirror {
namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

template<typename T>
Result<T> read_json_value(const json& document, const char* key, T fallback) {
    const auto it = document.find(key);
    if (it == document.end() || it->is_null()) {
        return Ok(std::move(fallback));
    }
    try {
        return Ok(it->template get<T>());
    } catch (const json::exception& e) {
        return Err<T>(ErrorKind::Config, std::string("invalid value for '") + key + "': " + e.what());
    }
}

} // namespace

Result<std::size_t> parse_count(const std::string& name, const std::string& text) {
    const auto value = trim(text);
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
        return Err<std::size_t>(ErrorKind::Config, name + " must be a non-negative integer, got '" + text + "'");
    }
    try {
        return Ok(static_cast<std::size_t>(std::stoull(value)));
    } catch (const std::out_of_range&) {
        return Err<std::size_t>(ErrorKind::Config, name + " is out of range: " + text);
    }
}

EnvLookup process_environment() {
    return [](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (value == nullptr) {
            return std::nullopt;
        }
        return std::string(value);
    };
}

std::vector<std::string> split_list(const std::string& text, char separator) {
    std::vector<std::string> items;
    std::size_t start = 0;
    while (start <= text.size()) {
        const auto end = text.find(separator, start);
        const auto piece = trim(text.substr(start, end == std::string::npos ? std::string::npos : end - start));
        if (!piece.empty()) {
            items.push_back(piece);
        }
        if (end == std::string::npos) {
            break;
        }
        start = end + 1;
    }
    return items;
}

Result<MirrorConfig> load_config_file(const fs::path& path, MirrorConfig base) {
    std::ifstream input(path);
    if (!input) {
        return Err<MirrorConfig>(ErrorKind::Config, "cannot open config file: " + path.string());
    }

    const json document = json::parse(input, nullptr, false);
    if (document.is_discarded() || !document.is_object()) {
        return Err<MirrorConfig>(ErrorKind::Config, "config file is not a JSON object: " + path.string());
    }

    MirrorConfig config = std::move(base);

    auto root_url = read_json_value<std::string>(document, "root_url", config.root_url);
    if (root_url.is_error()) return Err<MirrorConfig>(root_url.error());
    config.root_url = root_url.value();

    auto destination = read_json_value<std::string>(document, "destination_root", config.destination_root.string());
    if (destination.is_error()) return Err<MirrorConfig>(destination.error());
    config.destination_root = destination.value();

    auto workers = read_json_value<std::size_t>(document, "worker_count", config.worker_count);
    if (workers.is_error()) return Err<MirrorConfig>(workers.error());
    config.worker_count = workers.value();

    auto timeout = read_json_value<long long>(document, "transfer_timeout_seconds", config.transfer_timeout.count());
    if (timeout.is_error()) return Err<MirrorConfig>(timeout.error());
    config.transfer_timeout = std::chrono::seconds(timeout.value());

    auto ledger = read_json_value<std::string>(document, "ledger_path", config.ledger_path.string());
    if (ledger.is_error()) return Err<MirrorConfig>(ledger.error());
    config.ledger_path = ledger.value();

    auto agent = read_json_value<std::string>(document, "user_agent", config.user_agent);
    if (agent.is_error()) return Err<MirrorConfig>(agent.error());
    config.user_agent = agent.value();

    auto regions = read_json_value<std::vector<std::string>>(document, "regions", config.regions);
    if (regions.is_error()) return Err<MirrorConfig>(regions.error());
    config.regions = regions.value();

    auto tolerance = read_json_value<std::size_t>(document, "crawl_error_tolerance", config.crawl_error_tolerance);
    if (tolerance.is_error()) return Err<MirrorConfig>(tolerance.error());
    config.crawl_error_tolerance = tolerance.value();

    auto threshold = read_json_value<std::size_t>(document, "io_error_threshold", config.io_error_threshold);
    if (threshold.is_error()) return Err<MirrorConfig>(threshold.error());
    config.io_error_threshold = threshold.value();

    auto capacity = read_json_value<std::size_t>(document, "queue_capacity", config.queue_capacity);
    if (capacity.is_error()) return Err<MirrorConfig>(capacity.error());
    config.queue_capacity = capacity.value();

    auto interval = read_json_value<std::size_t>(document, "progress_interval", config.progress_interval);
    if (interval.is_error()) return Err<MirrorConfig>(interval.error());
    config.progress_interval = interval.value();

    auto corrupt = read_json_value<bool>(document, "fail_on_corrupt_archive", config.fail_on_corrupt_archive);
    if (corrupt.is_error()) return Err<MirrorConfig>(corrupt.error());
    config.fail_on_corrupt_archive = corrupt.value();

    return Ok(std::move(config));
}

Result<MirrorConfig> apply_environment(MirrorConfig base, const EnvLookup& lookup) {
    MirrorConfig config = std::move(base);

    if (auto value = lookup("BASE_URL")) {
        config.root_url = trim(*value);
    }
    if (auto value = lookup("DOWNLOAD_DIR")) {
        config.destination_root = trim(*value);
    }
    if (auto value = lookup("MAX_THREADS")) {
        auto parsed = parse_count("MAX_THREADS", *value);
        if (parsed.is_error()) return Err<MirrorConfig>(parsed.error());
        config.worker_count = parsed.value();
    }
    if (auto value = lookup("TIMEOUT")) {
        auto parsed = parse_count("TIMEOUT", *value);
        if (parsed.is_error()) return Err<MirrorConfig>(parsed.error());
        config.transfer_timeout = std::chrono::seconds(parsed.value());
    }
    if (auto value = lookup("DB_FILE")) {
        config.ledger_path = trim(*value);
    }
    if (auto value = lookup("USER_AGENT")) {
        config.user_agent = *value;
    }
    if (auto value = lookup("REGION")) {
        config.regions = split_list(*value, ',');
    }

    return Ok(std::move(config));
}

Result<MirrorConfig> validate_config(MirrorConfig config) {
    config.root_url = trim(config.root_url);
    if (config.root_url.empty()) {
        return Err<MirrorConfig>(ErrorKind::Config, "no root URL given (use -u/--url or BASE_URL)");
    }
    if (config.destination_root.empty()) {
        return Err<MirrorConfig>(ErrorKind::Config, "no download directory given (use -d/--download-dir or DOWNLOAD_DIR)");
    }
    if (config.worker_count == 0) {
        return Err<MirrorConfig>(ErrorKind::Config, "worker count must be at least 1");
    }
    if (config.transfer_timeout.count() < 1) {
        return Err<MirrorConfig>(ErrorKind::Config, "timeout must be at least 1 second");
    }
    if (config.ledger_path.empty()) {
        return Err<MirrorConfig>(ErrorKind::Config, "ledger path must not be empty");
    }
    if (config.root_url.back() != '/') {
        config.root_url += '/';
    }
    return Ok(std::move(config));
}

} // namespace mirror
