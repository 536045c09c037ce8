#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace httpdiff::detail {

// Components of a URI reference (RFC 3986 section 3).
// A component that does not appear in the input is empty.
struct Url {
    std::optional<std::string> scheme;     // lower-cased
    std::optional<std::string> userinfo;
    std::optional<std::string> host;       // port and userinfo stripped
    std::optional<uint16_t> port;
    std::optional<std::string> path;       // empty path reported as absent
    std::optional<std::string> query;      // without the leading '?'
    std::optional<std::string> fragment;   // without the leading '#'
};

Url parse_url(std::string_view text);

// Decode %XX escapes; optionally turn '+' into a space (form encoding).
// Malformed escapes are copied through unchanged.
std::string percent_decode(std::string_view text, bool plus_as_space = false);

// Split a query string into decoded (key, value) pairs in source order.
// Empty segments are skipped, a segment without '=' has an empty value.
std::vector<std::pair<std::string, std::string>> split_query(std::string_view query);

} // namespace httpdiff::detail
