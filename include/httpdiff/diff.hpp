#pragma once

#include "patch.hpp"
#include "tree.hpp"
#include "value.hpp"

namespace httpdiff {

// Compute the patches that turn a into b.
//
// Two trees (of either ordering, mixed allowed) are diffed structurally.
// Any other pair yields a single Update at the root when the values differ
// and nothing when they are equal.
PatchSet diff(const Value& a, const Value& b);

// Same dispatch as diff(), rooted at path and recorded into a caller-owned
// accumulator. Returns patches.
PatchSet& diff_into(PatchSet& patches, const Path& path, const Value& a, const Value& b);

// Structural diff of two trees, visiting the keys of a in order followed by
// the keys found only in b. For each key: Insert/Delete when it is missing
// on one side, otherwise an Update check, a Reorder check (only when both
// trees are ordered) and recursion when both values are trees.
PatchSet& diff_trees(PatchSet& patches, const Path& path, const Tree& a, const Tree& b);

} // namespace httpdiff
