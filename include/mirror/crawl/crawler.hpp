#pragma once

#include "mirror/crawl/listing_parser.hpp"
#include "mirror/crawl/types.hpp"
#include "mirror/net/remote_source.hpp"

#include <atomic>
#include <cstddef>
#include <deque>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace mirror::events {
class EventBus;
}

namespace mirror::crawl {

/**
 * @brief Lazily walks a tree of listing pages breadth-first
 *
 * Each call to next() returns the next leaf file, fetching listing pages only
 * when the already-parsed entries run out. The walk keeps an explicit frontier
 * of directories plus a visited set, so cross-linked or self-referencing
 * directories are expanded once and call-stack depth stays constant.
 *
 * Single pass: once next() returns nullopt the crawler is exhausted.
 */
class TreeCrawler {
public:
    TreeCrawler(net::RemoteSource& remote,
                std::string root_url,
                events::EventBus* bus = nullptr,
                const std::atomic<bool>* stop_flag = nullptr);

    std::optional<FileEntry> next();

    /// Drain the crawler into a vector.
    std::vector<FileEntry> discover_all();

    [[nodiscard]] const std::vector<CrawlFailure>& failures() const noexcept { return failures_; }
    [[nodiscard]] std::size_t directories_visited() const noexcept { return directories_visited_; }
    [[nodiscard]] const std::string& root_url() const noexcept { return root_url_; }

private:
    void expand(const std::string& directory_url);
    void record_failure(const std::string& location, Error error);
    bool stop_requested() const;

    net::RemoteSource& remote_;
    std::string root_url_;
    events::EventBus* bus_ = nullptr;
    const std::atomic<bool>* stop_flag_ = nullptr;
    ListingParser parser_;

    std::deque<std::string> frontier_;
    std::unordered_set<std::string> visited_directories_;
    std::unordered_map<std::string, std::string> claimed_paths_; // relative_path -> location
    std::deque<FileEntry> ready_;
    std::vector<CrawlFailure> failures_;
    std::size_t directories_visited_ = 0;
};

} // namespace mirror::crawl
