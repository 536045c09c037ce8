#include "httpdiff/record.hpp"
#include "httpdiff/detail/url.hpp"
#include "httpdiff/diff.hpp"
#include "httpdiff/json.hpp"

#include <fmt/format.h>

#include <map>
#include <optional>
#include <utility>

namespace httpdiff {

namespace {

Value optional_string(const std::optional<std::string>& s) {
    return s ? Value(*s) : Value{};
}

detail::Url request_url(const Value& record) {
    Value url = get_in(record, {"request", "url"});
    if (!url.is_string()) {
        return detail::Url{};
    }
    return detail::parse_url(url.as_string());
}

std::string header_text(const Value& value) {
    if (value.is_string()) {
        return value.as_string();
    }
    return to_display_string(value);
}

} // anonymous namespace

std::string_view to_string(Direction direction) {
    switch (direction) {
        case Direction::Request: return "request";
        case Direction::Response: return "response";
    }
    return "request";
}

Value get_in(const Value& value, std::initializer_list<std::string_view> keys) {
    const Value* current = &value;
    for (std::string_view key : keys) {
        const Tree* tree = current->tree_if();
        if (!tree) {
            return Value{};
        }
        current = tree->get(key);
        if (!current) {
            return Value{};
        }
    }
    return *current;
}

Value extract_version(const Value& record) {
    return get_in(record, {"version"});
}

Value extract_method(const Value& record) {
    return get_in(record, {"request", "method"});
}

Value extract_base_url(const Value& record) {
    detail::Url url = request_url(record);
    return Tree::unordered({
        {"scheme", optional_string(url.scheme)},
        {"host", optional_string(url.host)},
        {"path", optional_string(url.path)},
    });
}

Value extract_query_params(const Value& record) {
    detail::Url url = request_url(record);
    if (!url.query) {
        return Tree::unordered({});
    }

    // Repeated keys: the last occurrence wins
    std::map<std::string, std::string> params;
    for (auto& [key, value] : detail::split_query(*url.query)) {
        params[std::move(key)] = std::move(value);
    }

    std::vector<Tree::Entry> entries;
    entries.reserve(params.size());
    for (auto& [key, value] : params) {
        entries.emplace_back(key, Value(value));
    }
    return Tree::unordered(std::move(entries));
}

Value extract_headers(const Value& record, Direction direction) {
    Value headers = get_in(record, {to_string(direction), "headers"});
    if (!headers.is_array()) {
        return Tree{};
    }

    // Header order is kept; a repeated name is folded into its first slot.
    // Values stay as captured unless folding joins them into text.
    std::vector<Tree::Entry> entries;
    std::map<std::string, size_t> slot;
    for (const auto& header : headers.as_array()) {
        Value name = get_in(header, {"name"});
        if (!name.is_string()) {
            continue;
        }
        Value value = get_in(header, {"value"});

        auto it = slot.find(name.as_string());
        if (it == slot.end()) {
            slot.emplace(name.as_string(), entries.size());
            entries.emplace_back(name.as_string(), std::move(value));
        } else {
            Value& folded = entries[it->second].second;
            folded = Value(header_text(folded) + ", " + header_text(value));
        }
    }

    return Tree(std::move(entries));
}

Value extract_body(const Value& record, Direction direction) {
    Value body = get_in(record, {to_string(direction), "body"});
    if (body.is_null()) {
        return Value(NULL_BODY);
    }
    if (!body.is_string()) {
        return body;
    }

    auto decoded = parse_json(body.as_string());
    if (!decoded) {
        return body;
    }
    if (decoded->is_null()) {
        return Value(NULL_BODY);
    }
    return *decoded;
}

Value extract_status(const Value& record) {
    return get_in(record, {"response", "status_code"});
}

const std::vector<Facet>& facets() {
    static const std::vector<Facet> all = {
        {"HTTP VERSION", extract_version},
        {"METHOD", extract_method},
        {"BASE URL", extract_base_url},
        {"QUERY PARAMETERS", extract_query_params},
        {"REQUEST HEADERS", [](const Value& r) { return extract_headers(r, Direction::Request); }},
        {"REQUEST BODY", [](const Value& r) { return extract_body(r, Direction::Request); }},
        {"RESPONSE STATUS", extract_status},
        {"RESPONSE HEADERS", [](const Value& r) { return extract_headers(r, Direction::Response); }},
        {"RESPONSE BODY", [](const Value& r) { return extract_body(r, Direction::Response); }},
    };
    return all;
}

PatchSet diff_with_extraction(const Value& a, const Value& b, const Extractor& extract) {
    return diff(extract(a), extract(b));
}

std::vector<Section> diff_records(const Value& a, const Value& b) {
    std::vector<Section> sections;
    sections.reserve(facets().size());
    for (const auto& facet : facets()) {
        sections.push_back(Section{facet.title, diff_with_extraction(a, b, facet.extract)});
    }
    return sections;
}

std::string describe_record(const Value& record) {
    Value method = extract_method(record);
    detail::Url url = request_url(record);
    return fmt::format("{} {}://{}{}",
                       method.is_string() ? method.as_string() : std::string(),
                       url.scheme.value_or(""),
                       url.host.value_or(""),
                       url.path.value_or(""));
}

bool load_records(const std::string& path, std::vector<Value>& records, std::string& error) {
    Value document;
    if (!load_json_file(path, document, error)) {
        return false;
    }

    if (!document.is_array()) {
        error = fmt::format("'{}' does not contain an array of records", path);
        return false;
    }

    const Array& entries = document.as_array();
    for (size_t i = 0; i < entries.size(); ++i) {
        if (!entries[i].is_tree()) {
            error = fmt::format("'{}': record {} is not an object", path, i);
            return false;
        }
    }

    records.assign(entries.begin(), entries.end());
    return true;
}

} // namespace httpdiff
