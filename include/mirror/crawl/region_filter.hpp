#pragma once

#include "mirror/crawl/types.hpp"

#include <string>
#include <vector>

namespace mirror::crawl {

/**
 * @brief Keeps only entries whose region tag mentions one of the requested regions
 *
 * The region tag is the first parenthesized group of the file name, as in
 * "Game (Europe, Australia) (Rev 1).zip". Matching is a case-insensitive
 * substring test. Short aliases (EU, JP, AUS, ...) expand to the full names.
 *
 * An empty filter accepts everything.
 */
class RegionFilter {
public:
    RegionFilter() = default;
    explicit RegionFilter(const std::vector<std::string>& regions);

    /// Expand a known alias ("jp" -> "Japan"); unknown names are returned unchanged.
    static std::string resolve_alias(const std::string& region);

    /// First "(...)" group of @p file_name, empty when there is none.
    static std::string region_tag(const std::string& file_name);

    [[nodiscard]] bool accepts(const FileEntry& entry) const;
    [[nodiscard]] bool matches(const std::string& file_name) const;

    [[nodiscard]] bool empty() const noexcept { return regions_.empty(); }
    [[nodiscard]] const std::vector<std::string>& regions() const noexcept { return regions_; }

private:
    std::vector<std::string> regions_;
    std::vector<std::string> lowered_;
};

} // namespace mirror::crawl
