#pragma once

#include <cstdint>
#include <string_view>

namespace httpdiff {

// Display constants
constexpr int JSON_INDENT = 2;
constexpr std::string_view NULL_BODY = "null";
constexpr std::string_view END_MARKER = "------  END ------";

// ANSI escape sequences used by the text printer
constexpr std::string_view ANSI_RED = "\033[31m";
constexpr std::string_view ANSI_GREEN = "\033[32m";
constexpr std::string_view ANSI_RESET = "\033[0m";

// Shape of a Value
enum class ValueKind : uint8_t {
    Null = 0,
    Bool = 1,
    Integer = 2,
    Float = 3,
    String = 4,
    Array = 5,
    Tree = 6
};

// Whether a tree's key order is meaningful
enum class Ordering : uint8_t {
    Ordered = 0,     // JSON objects, header lists
    Unordered = 1    // Derived maps (URL parts, query strings)
};

// Patch kinds
enum class PatchKind : uint8_t {
    Insert = 0,
    Delete = 1,
    Update = 2,
    Reorder = 3
};

// Output formats for a comparison
enum class OutputFormat : uint8_t {
    Text = 0,        // Colored, human-readable
    Json = 1,        // One compact JSON document per comparison
    JsonPretty = 2   // Indented JSON
};

// Configuration
struct Config {
    OutputFormat format = OutputFormat::Text;
    bool color = true;
    bool verbose = false;
};

} // namespace httpdiff
