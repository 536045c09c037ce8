#pragma once

#include "patch.hpp"
#include "tree.hpp"
#include "value.hpp"

#include <functional>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

namespace httpdiff {

// Which half of a captured exchange a facet is read from
enum class Direction : uint8_t {
    Request = 0,
    Response = 1
};

// "request" or "response"
std::string_view to_string(Direction direction);

// Walk nested trees by key; any missing step yields Null
Value get_in(const Value& value, std::initializer_list<std::string_view> keys);

// Facet extractors. Each maps one captured record to the value that is
// diffed for that facet.
Value extract_version(const Value& record);
Value extract_method(const Value& record);
Value extract_base_url(const Value& record);       // unordered {scheme, host, path}
Value extract_query_params(const Value& record);   // unordered, possibly empty
Value extract_headers(const Value& record, Direction direction);
Value extract_body(const Value& record, Direction direction);
Value extract_status(const Value& record);

using Extractor = std::function<Value(const Value&)>;

// A titled facet of an HTTP exchange
struct Facet {
    std::string title;
    Extractor extract;
};

// All facets in display order
const std::vector<Facet>& facets();

// Patches of one facet
struct Section {
    std::string title;
    PatchSet patches;
};

PatchSet diff_with_extraction(const Value& a, const Value& b, const Extractor& extract);

// Diff every facet of two records, in display order
std::vector<Section> diff_records(const Value& a, const Value& b);

// "<METHOD> <scheme>://<host><path>", used when listing records
std::string describe_record(const Value& record);

// Load a capture file: a JSON array of record objects.
// On failure returns false and sets error.
bool load_records(const std::string& path, std::vector<Value>& records, std::string& error);

} // namespace httpdiff
