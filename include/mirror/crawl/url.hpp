#pragma once

#include <optional>
#include <string>

namespace mirror::crawl {

/// "scheme://authority" part of an absolute URL, empty if @p url is not absolute.
std::string url_origin(const std::string& url);

/// Resolve a link found on the listing page at @p base (RFC 3986 reference resolution subset).
std::string resolve_url(const std::string& base, const std::string& href);

/// Decode %XX escapes; malformed escapes are kept verbatim.
std::string percent_decode(const std::string& text);

/**
 * @brief Path of @p url below @p root, percent-decoded, without leading/trailing '/'
 *
 * Returns nullopt when @p url does not live under @p root.
 */
std::optional<std::string> relative_to_root(const std::string& root, const std::string& url);

/// True when @p text contains a percent-encoded '/' that decoding would turn into a separator.
bool has_encoded_separator(const std::string& text);

/// True when a decoded relative path contains an empty, "." or ".." segment or is absolute.
bool is_unsafe_relative_path(const std::string& relative_path);

} // namespace mirror::crawl
