#pragma once

#include "types.hpp"
#include "value.hpp"

#include <cstddef>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>

namespace httpdiff {

// Thrown when a patch is recorded with a kind outside PatchKind.
// Signals a programming error, never bad input.
class InvalidPatchKind : public std::logic_error {
public:
    explicit InvalidPatchKind(int kind);

    int kind() const { return kind_; }

private:
    int kind_;
};

// "insert", "delete", "update" or "reorder"
std::string_view to_string(PatchKind kind);

// One observed change.
// Insert has a Null old_value, Delete a Null new_value. For Reorder the
// values are the key's zero-based positions in the first and second tree.
struct Patch {
    PatchKind kind;
    Path path;
    Value old_value;
    Value new_value;

    bool operator==(const Patch& other) const;
    bool operator<(const Patch& other) const;
};

// Patches of a diff run, one deduplicating set per kind
struct PatchSet {
    std::set<Patch> inserts;
    std::set<Patch> deletes;
    std::set<Patch> updates;
    std::set<Patch> reorders;

    // Record a patch; adding an identical patch again is a no-op
    PatchSet& add(PatchKind kind, Path path, Value old_value, Value new_value);

    const std::set<Patch>& of(PatchKind kind) const;

    // Union with the patches of another run
    PatchSet& merge(const PatchSet& other);

    bool empty() const;
    size_t size() const;

    bool operator==(const PatchSet& other) const = default;
};

// Dotted display form of a path: ["info", "age"] -> "info.age:", [] -> ""
std::string format_path(const Path& path);

} // namespace httpdiff
