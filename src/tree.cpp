#include "httpdiff/tree.hpp"

#include <algorithm>

namespace httpdiff {

DuplicateKeyError::DuplicateKeyError(const std::string& key)
    : std::invalid_argument("duplicate key '" + key + "'")
    , key_(key)
{
}

Tree::Tree(std::initializer_list<Entry> entries, Ordering ordering)
    : entries_(entries)
    , ordering_(ordering)
{
    build_index();
}

Tree::Tree(std::vector<Entry> entries, Ordering ordering)
    : entries_(std::move(entries))
    , ordering_(ordering)
{
    build_index();
}

void Tree::build_index() {
    if (ordering_ == Ordering::Unordered) {
        std::stable_sort(entries_.begin(), entries_.end(),
                         [](const Entry& a, const Entry& b) { return a.first < b.first; });
    }

    for (size_t i = 0; i < entries_.size(); ++i) {
        auto [it, inserted] = index_.emplace(entries_[i].first, i);
        if (!inserted) {
            throw DuplicateKeyError(entries_[i].first);
        }
    }
}

const Value* Tree::get(std::string_view key) const {
    auto it = index_.find(key);
    if (it == index_.end()) {
        return nullptr;
    }
    return &entries_[it->second].second;
}

std::optional<size_t> Tree::index_of(std::string_view key) const {
    if (ordering_ != Ordering::Ordered) {
        return std::nullopt;
    }
    auto it = index_.find(key);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

int Tree::compare(const Tree& other) const {
    if (ordering_ != other.ordering_) {
        return ordering_ < other.ordering_ ? -1 : 1;
    }

    size_t n = std::min(entries_.size(), other.entries_.size());
    for (size_t i = 0; i < n; ++i) {
        const auto& [key, value] = entries_[i];
        const auto& [other_key, other_value] = other.entries_[i];

        int c = key.compare(other_key);
        if (c != 0) return c < 0 ? -1 : 1;

        c = value.compare(other_value);
        if (c != 0) return c;
    }

    if (entries_.size() == other.entries_.size()) return 0;
    return entries_.size() < other.entries_.size() ? -1 : 1;
}

} // namespace httpdiff
