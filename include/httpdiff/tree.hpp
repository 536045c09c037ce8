#pragma once

#include "types.hpp"
#include "value.hpp"

#include <cstddef>
#include <functional>
#include <initializer_list>
#include <map>
#include <optional>
#include <ranges>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace httpdiff {

// Thrown when a tree is built with the same key twice
class DuplicateKeyError : public std::invalid_argument {
public:
    explicit DuplicateKeyError(const std::string& key);

    const std::string& key() const { return key_; }

private:
    std::string key_;
};

// Key-value container with unique string keys.
//
// An Ordered tree keeps insertion order and exposes it through index_of().
// An Unordered tree has no meaningful order: its entries are stored sorted
// by key and index_of() never returns a position. Trees are immutable once
// built.
class Tree {
public:
    using Entry = std::pair<std::string, Value>;

    Tree() = default;
    Tree(std::initializer_list<Entry> entries, Ordering ordering = Ordering::Ordered);
    explicit Tree(std::vector<Entry> entries, Ordering ordering = Ordering::Ordered);

    static Tree unordered(std::vector<Entry> entries) {
        return Tree(std::move(entries), Ordering::Unordered);
    }

    // Value stored under key, nullptr if the key is absent
    const Value* get(std::string_view key) const;

    // Zero-based insertion position of key. Empty if the key is absent or
    // the tree is unordered.
    std::optional<size_t> index_of(std::string_view key) const;

    bool contains(std::string_view key) const { return index_.find(key) != index_.end(); }

    // Lazy view over the keys in traversal order
    auto keys() const { return std::views::keys(entries_); }

    const std::vector<Entry>& entries() const { return entries_; }
    auto begin() const { return entries_.begin(); }
    auto end() const { return entries_.end(); }

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    Ordering ordering() const { return ordering_; }
    bool is_ordered() const { return ordering_ == Ordering::Ordered; }

    // Ordering variant first, then entries lexicographically
    int compare(const Tree& other) const;

    bool operator==(const Tree& other) const { return compare(other) == 0; }

private:
    void build_index();

    std::vector<Entry> entries_;
    std::map<std::string, size_t, std::less<>> index_;  // key -> position in entries_
    Ordering ordering_ = Ordering::Ordered;
};

} // namespace httpdiff
