#pragma once

#include <string>
#include <vector>

namespace mirror::crawl {

/**
 * @brief One anchor found on a directory listing page
 */
struct ListingLink {
    std::string href;           ///< Attribute text with HTML entities decoded
    bool is_directory = false;  ///< Heuristic: href ends with '/'
};

/**
 * @brief Extracts anchors from statically rendered index pages (Apache/nginx autoindex style)
 *
 * Links are returned in document order; no filtering happens here.
 */
class ListingParser {
public:
    std::vector<ListingLink> parse(const std::string& html) const;

    /// True for parent, self, index-page, absolute-root and sorting/query links.
    static bool is_navigation_link(const std::string& href);

    static std::string decode_entities(const std::string& text);
};

} // namespace mirror::crawl
