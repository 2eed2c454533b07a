#include "mirror/crawl/region_filter.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace mirror::crawl {
namespace {

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string to_upper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

std::string file_name_of(const std::string& relative_path) {
    const auto slash = relative_path.find_last_of('/');
    return slash == std::string::npos ? relative_path : relative_path.substr(slash + 1);
}

} // namespace

RegionFilter::RegionFilter(const std::vector<std::string>& regions) {
    for (const auto& region : regions) {
        if (region.empty()) {
            continue;
        }
        regions_.push_back(resolve_alias(region));
        lowered_.push_back(to_lower(regions_.back()));
    }
}

std::string RegionFilter::resolve_alias(const std::string& region) {
    static const std::unordered_map<std::string, std::string> aliases {
        {"EU", "Europe"}, {"JP", "Japan"}, {"JPN", "Japan"},
        {"AUS", "Australia"}, {"KR", "Korea"}, {"BR", "Brazil"},
        {"CN", "China"}, {"FR", "France"}, {"DE", "Germany"},
        {"HK", "Hong Kong"}, {"IT", "Italy"}, {"NL", "Netherlands"},
        {"ES", "Spain"}, {"SE", "Sweden"}, {"CA", "Canada"},
    };

    const auto it = aliases.find(to_upper(region));
    return it != aliases.end() ? it->second : region;
}

std::string RegionFilter::region_tag(const std::string& file_name) {
    auto open = file_name.find('(');
    while (open != std::string::npos) {
        const auto close = file_name.find(')', open + 1);
        if (close == std::string::npos) {
            return {};
        }
        // "()" is not a tag
        if (close > open + 1) {
            return file_name.substr(open + 1, close - open - 1);
        }
        open = file_name.find('(', close + 1);
    }
    return {};
}

bool RegionFilter::accepts(const FileEntry& entry) const {
    if (regions_.empty()) {
        return true;
    }
    return matches(file_name_of(entry.relative_path));
}

bool RegionFilter::matches(const std::string& file_name) const {
    if (regions_.empty()) {
        return true;
    }

    const std::string tag = to_lower(region_tag(file_name));
    if (tag.empty()) {
        return false;
    }
    return std::any_of(lowered_.begin(), lowered_.end(), [&tag](const std::string& region) {
        return tag.find(region) != std::string::npos;
    });
}

} // namespace mirror::crawl
