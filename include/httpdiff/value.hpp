#pragma once

#include "types.hpp"

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace httpdiff {

class Tree;
class Value;

using Array = std::vector<Value>;

// Sequence of keys from the diff root to a changed key
using Path = std::vector<std::string>;

// Immutable JSON-like value: a scalar, an opaque array, or a nested tree.
// Arrays and trees are shared, so copying a Value never copies a subtree.
class Value {
public:
    using Storage = std::variant<std::monostate,
                                 bool,
                                 int64_t,
                                 double,
                                 std::string,
                                 std::shared_ptr<const Array>,
                                 std::shared_ptr<const Tree>>;

    Value() = default;
    Value(std::nullptr_t) {}
    Value(bool b) : data_(b) {}
    Value(double d) : data_(d) {}
    Value(const char* s) : data_(std::string(s)) {}
    Value(std::string s) : data_(std::move(s)) {}
    Value(std::string_view s) : data_(std::string(s)) {}
    Value(Array array);
    Value(Tree tree);
    Value(std::shared_ptr<const Tree> tree);

    // Integers; unsigned values past the int64 range are kept as Float
    template<std::integral T>
        requires (!std::same_as<T, bool>)
    Value(T i) {
        if constexpr (std::is_unsigned_v<T> && sizeof(T) >= sizeof(int64_t)) {
            if (i > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                data_ = static_cast<double>(i);
                return;
            }
        }
        data_ = static_cast<int64_t>(i);
    }

    ValueKind kind() const { return static_cast<ValueKind>(data_.index()); }

    bool is_null() const { return kind() == ValueKind::Null; }
    bool is_bool() const { return kind() == ValueKind::Bool; }
    bool is_integer() const { return kind() == ValueKind::Integer; }
    bool is_float() const { return kind() == ValueKind::Float; }
    bool is_number() const { return is_integer() || is_float(); }
    bool is_string() const { return kind() == ValueKind::String; }
    bool is_array() const { return kind() == ValueKind::Array; }
    bool is_tree() const { return kind() == ValueKind::Tree; }

    // Typed access (throws std::bad_variant_access on a kind mismatch)
    bool as_bool() const { return std::get<bool>(data_); }
    int64_t as_integer() const { return std::get<int64_t>(data_); }
    double as_float() const { return std::get<double>(data_); }
    const std::string& as_string() const { return std::get<std::string>(data_); }
    const Array& as_array() const { return *std::get<std::shared_ptr<const Array>>(data_); }
    const Tree& as_tree() const { return *std::get<std::shared_ptr<const Tree>>(data_); }

    // Numeric value of an Integer or Float
    double as_number() const;

    // Non-throwing tree access, nullptr for every other kind
    const Tree* tree_if() const;

    const Storage& storage() const { return data_; }

    // Total order consistent with equality: kind rank, then content.
    // Integers and floats share a rank and compare numerically.
    int compare(const Value& other) const;

    bool operator==(const Value& other) const { return compare(other) == 0; }
    bool operator!=(const Value& other) const { return compare(other) != 0; }
    bool operator<(const Value& other) const { return compare(other) < 0; }

private:
    Storage data_;
};

} // namespace httpdiff
