#include "httpdiff/patch.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <utility>

namespace httpdiff {

InvalidPatchKind::InvalidPatchKind(int kind)
    : std::logic_error(fmt::format("unknown patch kind: {}", kind))
    , kind_(kind)
{
}

std::string_view to_string(PatchKind kind) {
    switch (kind) {
        case PatchKind::Insert: return "insert";
        case PatchKind::Delete: return "delete";
        case PatchKind::Update: return "update";
        case PatchKind::Reorder: return "reorder";
    }
    throw InvalidPatchKind(static_cast<int>(kind));
}

bool Patch::operator==(const Patch& other) const {
    return kind == other.kind &&
           path == other.path &&
           old_value == other.old_value &&
           new_value == other.new_value;
}

bool Patch::operator<(const Patch& other) const {
    if (kind != other.kind) return kind < other.kind;
    if (path != other.path) return path < other.path;
    int c = old_value.compare(other.old_value);
    if (c != 0) return c < 0;
    return new_value.compare(other.new_value) < 0;
}

PatchSet& PatchSet::add(PatchKind kind, Path path, Value old_value, Value new_value) {
    Patch patch{kind, std::move(path), std::move(old_value), std::move(new_value)};

    switch (kind) {
        case PatchKind::Insert:
            inserts.insert(std::move(patch));
            break;
        case PatchKind::Delete:
            deletes.insert(std::move(patch));
            break;
        case PatchKind::Update:
            updates.insert(std::move(patch));
            break;
        case PatchKind::Reorder:
            reorders.insert(std::move(patch));
            break;
        default:
            throw InvalidPatchKind(static_cast<int>(kind));
    }
    return *this;
}

const std::set<Patch>& PatchSet::of(PatchKind kind) const {
    switch (kind) {
        case PatchKind::Insert: return inserts;
        case PatchKind::Delete: return deletes;
        case PatchKind::Update: return updates;
        case PatchKind::Reorder: return reorders;
    }
    throw InvalidPatchKind(static_cast<int>(kind));
}

PatchSet& PatchSet::merge(const PatchSet& other) {
    inserts.insert(other.inserts.begin(), other.inserts.end());
    deletes.insert(other.deletes.begin(), other.deletes.end());
    updates.insert(other.updates.begin(), other.updates.end());
    reorders.insert(other.reorders.begin(), other.reorders.end());
    return *this;
}

bool PatchSet::empty() const {
    return inserts.empty() && deletes.empty() && updates.empty() && reorders.empty();
}

size_t PatchSet::size() const {
    return inserts.size() + deletes.size() + updates.size() + reorders.size();
}

std::string format_path(const Path& path) {
    if (path.empty()) {
        return "";
    }
    return fmt::format("{}:", fmt::join(path, "."));
}

} // namespace httpdiff
