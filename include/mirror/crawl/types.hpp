#pragma once

#include "mirror/core/error.hpp"

#include <string>
#include <vector>

namespace mirror::crawl {

/**
 * @brief A remote object found while walking the listing pages
 */
struct FileEntry {
    std::string location;       ///< Absolute source URL, unique within one crawl
    std::string relative_path;  ///< Decoded path below the mirror root (POSIX separators)
    bool is_directory = false;  ///< Directories are recursion points, never transfer tasks
};

/**
 * @brief Listing failure for one subtree
 */
struct CrawlFailure {
    std::string location;
    Error error;
};

} // namespace mirror::crawl
