#include "httpdiff/value.hpp"
#include "httpdiff/tree.hpp"

#include <algorithm>
#include <type_traits>

namespace httpdiff {

namespace {

// Integers and floats share a rank so that 1 == 1.0
int kind_rank(ValueKind kind) {
    switch (kind) {
        case ValueKind::Null: return 0;
        case ValueKind::Bool: return 1;
        case ValueKind::Integer:
        case ValueKind::Float: return 2;
        case ValueKind::String: return 3;
        case ValueKind::Array: return 4;
        case ValueKind::Tree: return 5;
    }
    return 6;
}

template<typename T>
int three_way(const T& a, const T& b) {
    if (a < b) return -1;
    if (b < a) return 1;
    return 0;
}

int compare_numbers(const Value& a, const Value& b) {
    if (a.is_integer() && b.is_integer()) {
        return three_way(a.as_integer(), b.as_integer());
    }
    // long double holds every int64 exactly on the supported targets
    long double x = a.is_integer() ? static_cast<long double>(a.as_integer()) : a.as_float();
    long double y = b.is_integer() ? static_cast<long double>(b.as_integer()) : b.as_float();
    return three_way(x, y);
}

int compare_arrays(const Array& a, const Array& b) {
    size_t n = std::min(a.size(), b.size());
    for (size_t i = 0; i < n; ++i) {
        int c = a[i].compare(b[i]);
        if (c != 0) return c;
    }
    return three_way(a.size(), b.size());
}

} // anonymous namespace

Value::Value(Array array)
    : data_(std::make_shared<const Array>(std::move(array)))
{
}

Value::Value(Tree tree)
    : data_(std::make_shared<const Tree>(std::move(tree)))
{
}

Value::Value(std::shared_ptr<const Tree> tree) {
    if (tree) {
        data_ = std::move(tree);
    }
}

double Value::as_number() const {
    if (is_integer()) return static_cast<double>(as_integer());
    return as_float();
}

const Tree* Value::tree_if() const {
    auto* tree = std::get_if<std::shared_ptr<const Tree>>(&data_);
    return tree ? tree->get() : nullptr;
}

int Value::compare(const Value& other) const {
    int rank = kind_rank(kind());
    int other_rank = kind_rank(other.kind());
    if (rank != other_rank) {
        return rank < other_rank ? -1 : 1;
    }
    if (is_number()) {
        return compare_numbers(*this, other);
    }

    return std::visit([&other](const auto& lhs) -> int {
        using T = std::decay_t<decltype(lhs)>;
        const auto& rhs = std::get<T>(other.data_);

        if constexpr (std::is_same_v<T, std::monostate>) {
            return 0;
        } else if constexpr (std::is_same_v<T, std::shared_ptr<const Array>>) {
            if (lhs == rhs) return 0;
            return compare_arrays(*lhs, *rhs);
        } else if constexpr (std::is_same_v<T, std::shared_ptr<const Tree>>) {
            if (lhs == rhs) return 0;
            return lhs->compare(*rhs);
        } else {
            // bool, std::string (numbers were handled above)
            return three_way(lhs, rhs);
        }
    }, data_);
}

} // namespace httpdiff
