#include "mirror/crawl/crawler.hpp"

#include "mirror/crawl/url.hpp"
#include "mirror/events/event_bus.hpp"
#include "mirror/events/events.hpp"

#include <spdlog/spdlog.h>

namespace mirror::crawl {

TreeCrawler::TreeCrawler(net::RemoteSource& remote,
                         std::string root_url,
                         events::EventBus* bus,
                         const std::atomic<bool>* stop_flag)
    : remote_(remote),
      root_url_(std::move(root_url)),
      bus_(bus),
      stop_flag_(stop_flag) {
    if (root_url_.empty() || root_url_.back() != '/') {
        root_url_ += '/';
    }
    frontier_.push_back(root_url_);
    visited_directories_.insert(root_url_);
}

std::optional<FileEntry> TreeCrawler::next() {
    while (ready_.empty() && !frontier_.empty()) {
        if (stop_requested()) {
            frontier_.clear();
            break;
        }
        const std::string directory = std::move(frontier_.front());
        frontier_.pop_front();
        expand(directory);
    }

    if (ready_.empty()) {
        return std::nullopt;
    }
    FileEntry entry = std::move(ready_.front());
    ready_.pop_front();
    return entry;
}

std::vector<FileEntry> TreeCrawler::discover_all() {
    std::vector<FileEntry> entries;
    while (auto entry = next()) {
        entries.push_back(std::move(*entry));
    }
    return entries;
}

void TreeCrawler::expand(const std::string& directory_url) {
    ++directories_visited_;
    spdlog::debug("Scanning directory: {}", directory_url);

    auto page = remote_.fetch_text(directory_url);
    if (page.is_error()) {
        record_failure(directory_url, Error{ErrorKind::Crawl, "listing failed: " + page.error().message});
        return;
    }

    std::size_t files = 0;
    std::size_t subdirectories = 0;

    for (const auto& link : parser_.parse(page.value())) {
        if (ListingParser::is_navigation_link(link.href)) {
            continue;
        }

        const std::string location = resolve_url(directory_url, link.href);
        // Only stay below the mirror root
        auto relative = relative_to_root(root_url_, location);
        if (!relative || relative->empty()) {
            continue;
        }

        if (has_encoded_separator(location.substr(root_url_.size()))) {
            record_failure(location, Error{ErrorKind::Crawl, "encoded path separator in '" + *relative + "'"});
            continue;
        }
        if (is_unsafe_relative_path(*relative)) {
            record_failure(location, Error{ErrorKind::Crawl, "unsafe relative path '" + *relative + "'"});
            continue;
        }

        if (link.is_directory) {
            std::string child = location;
            if (child.back() != '/') {
                child += '/';
            }
            if (visited_directories_.insert(child).second) {
                frontier_.push_back(std::move(child));
                ++subdirectories;
            }
            continue;
        }

        // One destination per file: a second location decoding to a claimed path is an error
        const auto [claimed, inserted] = claimed_paths_.emplace(*relative, location);
        if (!inserted) {
            if (claimed->second != location) {
                record_failure(location, Error{ErrorKind::Crawl,
                    "local path '" + *relative + "' already taken by " + claimed->second});
            }
            continue;
        }
        FileEntry entry;
        entry.location = location;
        entry.relative_path = std::move(*relative);
        entry.is_directory = false;
        ready_.push_back(std::move(entry));
        ++files;
    }

    if (bus_ != nullptr) {
        bus_->emit(events::DirectoryScannedEvent{directory_url, files, subdirectories});
    }
}

void TreeCrawler::record_failure(const std::string& location, Error error) {
    if (bus_ != nullptr) {
        bus_->emit(events::CrawlFailedEvent{location, error.message});
    } else {
        spdlog::warn("Crawl error at {}: {}", location, error.message);
    }
    failures_.push_back(CrawlFailure{location, std::move(error)});
}

bool TreeCrawler::stop_requested() const {
    return stop_flag_ != nullptr && stop_flag_->load();
}

} // namespace mirror::crawl
