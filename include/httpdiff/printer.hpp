#pragma once

#include "json.hpp"
#include "patch.hpp"
#include "record.hpp"
#include "types.hpp"

#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace httpdiff {

// Machine-readable forms of patches and comparisons
Json patch_to_json(const Patch& patch);
Json patch_set_to_json(const PatchSet& patches);
Json sections_to_json(const std::vector<Section>& sections);

// Renders patches to a terminal (or any stream) using the configured format
class Printer {
public:
    Printer(std::ostream& out, const Config& config);

    // One patch in text form, followed by a blank line
    void print_patch(const Patch& patch);

    // A titled block of patches; prints nothing if the set is empty
    void print_patches(const PatchSet& patches, std::string_view section_header);

    // A whole comparison: text sections and the end marker, or one JSON document
    void print_sections(const std::vector<Section>& sections);

private:
    std::string paint(std::string_view color, std::string_view text) const;

    std::ostream& out_;
    Config config_;
};

} // namespace httpdiff
