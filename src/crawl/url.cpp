#include "mirror/crawl/url.hpp"

#include <cctype>
#include <vector>

namespace mirror::crawl {
namespace {

bool has_scheme(const std::string& text) {
    if (text.empty() || !std::isalpha(static_cast<unsigned char>(text[0]))) {
        return false;
    }
    for (std::size_t i = 1; i < text.size(); ++i) {
        const auto c = static_cast<unsigned char>(text[i]);
        if (c == ':') {
            return true;
        }
        if (!std::isalnum(c) && c != '+' && c != '-' && c != '.') {
            return false;
        }
    }
    return false;
}

std::string strip_fragment(const std::string& text) {
    const auto hash = text.find('#');
    return hash == std::string::npos ? text : text.substr(0, hash);
}

std::string remove_dot_segments(const std::string& path) {
    std::vector<std::string> output;
    std::size_t start = 0;
    const bool trailing_slash = !path.empty() && path.back() == '/';

    while (start < path.size()) {
        auto end = path.find('/', start);
        if (end == std::string::npos) {
            end = path.size();
        }
        const std::string segment = path.substr(start, end - start);
        if (segment == "..") {
            if (!output.empty()) {
                output.pop_back();
            }
        } else if (segment != "." && !segment.empty()) {
            output.push_back(segment);
        }
        start = end + 1;
    }

    std::string result = "/";
    for (std::size_t i = 0; i < output.size(); ++i) {
        result += output[i];
        if (i + 1 < output.size()) {
            result += '/';
        }
    }
    const auto last = path.empty() ? std::string() : path.substr(path.rfind('/') + 1);
    if (!output.empty() && (trailing_slash || last == "." || last == "..")) {
        result += '/';
    }
    return result;
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::string url_origin(const std::string& url) {
    const auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        return {};
    }
    const auto path_start = url.find('/', scheme_end + 3);
    return path_start == std::string::npos ? url : url.substr(0, path_start);
}

std::string resolve_url(const std::string& base, const std::string& href) {
    const std::string reference = strip_fragment(href);

    if (has_scheme(reference)) {
        return reference;
    }

    const std::string origin = url_origin(base);
    if (reference.rfind("//", 0) == 0) {
        const auto scheme_end = base.find("://");
        return base.substr(0, scheme_end + 1) + reference;
    }

    std::string path;
    std::string query;
    const auto query_pos = reference.find('?');
    const std::string reference_path = query_pos == std::string::npos ? reference : reference.substr(0, query_pos);
    if (query_pos != std::string::npos) {
        query = reference.substr(query_pos);
    }

    if (!reference_path.empty() && reference_path.front() == '/') {
        path = reference_path;
    } else {
        std::string base_path = strip_fragment(base.substr(origin.size()));
        const auto base_query = base_path.find('?');
        if (base_query != std::string::npos) {
            base_path.erase(base_query);
        }
        if (base_path.empty()) {
            base_path = "/";
        }
        if (reference_path.empty()) {
            path = base_path;
            if (query.empty() && base_query != std::string::npos) {
                query = base.substr(origin.size() + base_query);
            }
        } else {
            path = base_path.substr(0, base_path.rfind('/') + 1) + reference_path;
        }
    }

    return origin + remove_dot_segments(path) + query;
}

std::string percent_decode(const std::string& text) {
    std::string decoded;
    decoded.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '%' && i + 2 < text.size()) {
            const int high = hex_value(text[i + 1]);
            const int low = hex_value(text[i + 2]);
            if (high >= 0 && low >= 0) {
                decoded.push_back(static_cast<char>(high * 16 + low));
                i += 2;
                continue;
            }
        }
        decoded.push_back(text[i]);
    }
    return decoded;
}

std::optional<std::string> relative_to_root(const std::string& root, const std::string& url) {
    if (url.compare(0, root.size(), root) != 0) {
        return std::nullopt;
    }
    std::string relative = percent_decode(url.substr(root.size()));
    const auto first = relative.find_first_not_of('/');
    if (first == std::string::npos) {
        return std::string();
    }
    const auto last = relative.find_last_not_of('/');
    return relative.substr(first, last - first + 1);
}

bool has_encoded_separator(const std::string& text) {
    for (std::size_t pos = text.find('%'); pos != std::string::npos; pos = text.find('%', pos + 1)) {
        if (pos + 2 < text.size() && text[pos + 1] == '2' && (text[pos + 2] == 'F' || text[pos + 2] == 'f')) {
            return true;
        }
    }
    return false;
}

bool is_unsafe_relative_path(const std::string& relative_path) {
    if (relative_path.empty() || relative_path.front() == '/' || relative_path.find('\\') != std::string::npos) {
        return true;
    }
    std::size_t start = 0;
    while (start <= relative_path.size()) {
        auto end = relative_path.find('/', start);
        if (end == std::string::npos) {
            end = relative_path.size();
        }
        const std::string segment = relative_path.substr(start, end - start);
        if (segment.empty() || segment == "." || segment == "..") {
            return true;
        }
        start = end + 1;
    }
    return false;
}

} // namespace mirror::crawl
