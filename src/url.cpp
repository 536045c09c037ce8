#include "httpdiff/detail/url.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <system_error>
#include <cstdint>

namespace httpdiff::detail {

namespace {

bool is_scheme_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '-' || c == '.';
}

bool is_valid_scheme(std::string_view s) {
    if (s.empty() || !std::isalpha(static_cast<unsigned char>(s[0]))) {
        return false;
    }
    return std::all_of(s.begin(), s.end(), is_scheme_char);
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string to_lower(std::string_view s) {
    std::string result(s);
    for (char& c : result) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return result;
}

// Split "host:port" (or "[v6]:port") into its parts
void split_host_port(std::string_view hostport, Url& url) {
    std::string_view host = hostport;
    std::string_view port;

    if (!hostport.empty() && hostport.front() == '[') {
        size_t close = hostport.find(']');
        if (close != std::string_view::npos) {
            host = hostport.substr(0, close + 1);
            std::string_view rest = hostport.substr(close + 1);
            if (!rest.empty() && rest.front() == ':') {
                port = rest.substr(1);
            }
        }
    } else {
        size_t colon = hostport.rfind(':');
        if (colon != std::string_view::npos) {
            host = hostport.substr(0, colon);
            port = hostport.substr(colon + 1);
        }
    }

    url.host = std::string(host);

    if (!port.empty()) {
        uint16_t value = 0;
        auto [ptr, ec] = std::from_chars(port.data(), port.data() + port.size(), value);
        if (ec == std::errc() && ptr == port.data() + port.size()) {
            url.port = value;
        }
    }
}

} // anonymous namespace

Url parse_url(std::string_view text) {
    Url url;
    std::string_view rest = text;

    // scheme ":"
    size_t delim = rest.find_first_of(":/?#");
    if (delim != std::string_view::npos && rest[delim] == ':' &&
        is_valid_scheme(rest.substr(0, delim))) {
        url.scheme = to_lower(rest.substr(0, delim));
        rest.remove_prefix(delim + 1);
    }

    // "//" authority
    if (rest.size() >= 2 && rest[0] == '/' && rest[1] == '/') {
        rest.remove_prefix(2);
        size_t end = rest.find_first_of("/?#");
        std::string_view authority = rest.substr(0, end);
        rest = (end == std::string_view::npos) ? std::string_view{} : rest.substr(end);

        size_t at = authority.rfind('@');
        if (at != std::string_view::npos) {
            url.userinfo = std::string(authority.substr(0, at));
            authority.remove_prefix(at + 1);
        }
        split_host_port(authority, url);
    }

    // path
    size_t path_end = rest.find_first_of("?#");
    std::string_view path = rest.substr(0, path_end);
    if (!path.empty()) {
        url.path = std::string(path);
    }
    rest = (path_end == std::string_view::npos) ? std::string_view{} : rest.substr(path_end);

    // "?" query
    if (!rest.empty() && rest.front() == '?') {
        std::string_view query = rest.substr(1);
        size_t hash = query.find('#');
        url.query = std::string(query.substr(0, hash));
        rest = (hash == std::string_view::npos) ? std::string_view{} : query.substr(hash);
    }

    // "#" fragment
    if (!rest.empty() && rest.front() == '#') {
        url.fragment = std::string(rest.substr(1));
    }

    return url;
}

std::string percent_decode(std::string_view text, bool plus_as_space) {
    std::string result;
    result.reserve(text.size());

    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '%' && i + 2 < text.size()) {
            int hi = hex_value(text[i + 1]);
            int lo = hex_value(text[i + 2]);
            if (hi >= 0 && lo >= 0) {
                result += static_cast<char>((hi << 4) | lo);
                i += 2;
                continue;
            }
        }
        if (c == '+' && plus_as_space) {
            result += ' ';
        } else {
            result += c;
        }
    }

    return result;
}

std::vector<std::pair<std::string, std::string>> split_query(std::string_view query) {
    std::vector<std::pair<std::string, std::string>> pairs;

    while (!query.empty()) {
        size_t amp = query.find('&');
        std::string_view segment = query.substr(0, amp);
        query = (amp == std::string_view::npos) ? std::string_view{} : query.substr(amp + 1);

        if (segment.empty()) {
            continue;
        }

        size_t eq = segment.find('=');
        std::string_view key = segment.substr(0, eq);
        std::string_view value = (eq == std::string_view::npos) ? std::string_view{} : segment.substr(eq + 1);
        pairs.emplace_back(percent_decode(key, true), percent_decode(value, true));
    }

    return pairs;
}

} // namespace httpdiff::detail
