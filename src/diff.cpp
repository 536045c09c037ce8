#include "httpdiff/diff.hpp"

#include <optional>
#include <string_view>
#include <vector>

namespace httpdiff {

namespace {

Path child_path(const Path& path, std::string_view key) {
    Path child = path;
    child.emplace_back(key);
    return child;
}

// Keys of a in a's order, then keys of b not present in a, in b's order
std::vector<std::string_view> key_union(const Tree& a, const Tree& b) {
    std::vector<std::string_view> keys;
    keys.reserve(a.size() + b.size());

    for (const auto& key : a.keys()) {
        keys.emplace_back(key);
    }
    for (const auto& key : b.keys()) {
        if (!a.contains(key)) {
            keys.emplace_back(key);
        }
    }
    return keys;
}

// A pair of trees is never updated as a whole, only its leaves are
void check_update(PatchSet& patches, const Path& path, const Value& va, const Value& vb) {
    if (va.is_tree() && vb.is_tree()) {
        return;
    }
    if (va != vb) {
        patches.add(PatchKind::Update, path, va, vb);
    }
}

void check_reorder(PatchSet& patches, const Path& path,
                   std::optional<size_t> index_in_a, std::optional<size_t> index_in_b) {
    if (!index_in_a || !index_in_b) {
        return;
    }
    if (*index_in_a != *index_in_b) {
        patches.add(PatchKind::Reorder, path, *index_in_a, *index_in_b);
    }
}

void check_recursion(PatchSet& patches, const Path& path, const Value& va, const Value& vb) {
    const Tree* ta = va.tree_if();
    const Tree* tb = vb.tree_if();
    if (ta && tb) {
        diff_trees(patches, path, *ta, *tb);
    }
}

} // anonymous namespace

PatchSet diff(const Value& a, const Value& b) {
    PatchSet patches;
    diff_into(patches, {}, a, b);
    return patches;
}

PatchSet& diff_into(PatchSet& patches, const Path& path, const Value& a, const Value& b) {
    const Tree* ta = a.tree_if();
    const Tree* tb = b.tree_if();
    if (ta && tb) {
        return diff_trees(patches, path, *ta, *tb);
    }

    if (a != b) {
        patches.add(PatchKind::Update, path, a, b);
    }
    return patches;
}

PatchSet& diff_trees(PatchSet& patches, const Path& path, const Tree& a, const Tree& b) {
    // Positions are only comparable when both sides keep their order
    const bool track_order = a.is_ordered() && b.is_ordered();

    for (std::string_view key : key_union(a, b)) {
        const Value* va = a.get(key);
        const Value* vb = b.get(key);
        Path key_path = child_path(path, key);

        if (!va) {
            patches.add(PatchKind::Insert, std::move(key_path), Value{}, *vb);
            continue;
        }
        if (!vb) {
            patches.add(PatchKind::Delete, std::move(key_path), *va, Value{});
            continue;
        }

        check_update(patches, key_path, *va, *vb);
        if (track_order) {
            check_reorder(patches, key_path, a.index_of(key), b.index_of(key));
        }
        check_recursion(patches, key_path, *va, *vb);
    }

    return patches;
}

} // namespace httpdiff
