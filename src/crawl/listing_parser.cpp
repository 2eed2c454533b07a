#include "mirror/crawl/listing_parser.hpp"

#include <regex>

namespace mirror::crawl {
namespace {

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

} // namespace

std::vector<ListingLink> ListingParser::parse(const std::string& html) const {
    static const std::regex anchor_re(
        R"re(<a\s[^>]*?href\s*=\s*(?:"([^"]*)"|'([^']*)'|([^\s>]+)))re",
        std::regex::icase | std::regex::optimize);

    std::vector<ListingLink> links;
    for (std::sregex_iterator it(html.begin(), html.end(), anchor_re), end; it != end; ++it) {
        const auto& match = *it;
        std::string raw;
        for (std::size_t group = 1; group <= 3; ++group) {
            if (match[group].matched) {
                raw = match[group].str();
                break;
            }
        }

        const std::string href = decode_entities(trim(raw));
        if (href.empty()) {
            continue;
        }

        ListingLink link;
        link.href = href;
        link.is_directory = href.back() == '/';
        links.push_back(std::move(link));
    }
    return links;
}

bool ListingParser::is_navigation_link(const std::string& href) {
    if (href == "../" || href == ".." || href == "./" || href == "." || href == "/" ||
        href == "index.html" || href == "index.htm") {
        return true;
    }
    if (href.front() == '#') {
        return true;
    }
    // Column-sorting links like "?C=N;O=D"
    return href.find('?') != std::string::npos;
}

std::string ListingParser::decode_entities(const std::string& text) {
    if (text.find('&') == std::string::npos) {
        return text;
    }

    static const std::pair<const char*, char> named[] = {
        {"&amp;", '&'}, {"&lt;", '<'}, {"&gt;", '>'}, {"&quot;", '"'}, {"&#39;", '\''}, {"&apos;", '\''},
    };

    std::string decoded;
    decoded.reserve(text.size());
    for (std::size_t i = 0; i < text.size();) {
        bool replaced = false;
        if (text[i] == '&') {
            for (const auto& [entity, value] : named) {
                const std::string needle(entity);
                if (text.compare(i, needle.size(), needle) == 0) {
                    decoded.push_back(value);
                    i += needle.size();
                    replaced = true;
                    break;
                }
            }
        }
        if (!replaced) {
            decoded.push_back(text[i]);
            ++i;
        }
    }
    return decoded;
}

} // namespace mirror::crawl
