#pragma once

#include <string>
#include <utility>
#include <vector>

namespace url_utils {

using field_list = std::vector<std::pair<std::string, std::string>>;

// Percent-encodes everything except RFC 3986 unreserved characters.
std::string percent_encode(const std::string& text);

// Decodes %XX escapes. Malformed escapes are kept verbatim.
std::string percent_decode(const std::string& text);

// application/x-www-form-urlencoded body or query string.
std::string form_encode(const field_list& fields);

// Appends `fields` as a query string to `url`.
std::string with_query(const std::string& url, const field_list& fields);

// Resolves `reference` (absolute, scheme-relative, absolute-path, query-only or
// relative) against the absolute URL `base` and normalizes dot segments. The
// fragment is dropped. Throws std::invalid_argument when libcurl rejects
// either URL.
std::string resolve(const std::string& base, const std::string& reference);

bool starts_with(const std::string& text, const std::string& prefix);
bool ends_with(const std::string& text, const std::string& suffix);

} // namespace url_utils
