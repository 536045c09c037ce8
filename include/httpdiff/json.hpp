#pragma once

#include "tree.hpp"
#include "value.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace httpdiff {

// Key order of decoded objects is kept, so ordered_json throughout
using Json = nlohmann::ordered_json;

// nlohmann conversion hooks: objects <-> ordered Trees, arrays <-> Array
void to_json(Json& j, const Value& value);
void from_json(const Json& j, Value& value);

// Decode JSON text, empty on malformed input
std::optional<Value> parse_json(std::string_view text);

// Read and decode a JSON file. On failure returns false and sets error.
bool load_json_file(const std::string& path, Value& out, std::string& error);

// Text used when printing a value: strings unquoted, null as "null",
// arrays and trees as indented JSON
std::string to_display_string(const Value& value);

} // namespace httpdiff
