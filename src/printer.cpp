#include "httpdiff/printer.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <cctype>

namespace httpdiff {

namespace {

// Section order of the text output
constexpr std::array<PatchKind, 4> PRINT_ORDER = {
    PatchKind::Delete,
    PatchKind::Insert,
    PatchKind::Reorder,
    PatchKind::Update,
};

std::string collection_name(PatchKind kind) {
    return std::string(to_string(kind)) + "s";
}

std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

} // anonymous namespace

Json patch_to_json(const Patch& patch) {
    Json j = Json::object();
    j["type"] = std::string(to_string(patch.kind));
    j["path"] = patch.path;
    j["old_value"] = Json(patch.old_value);
    j["new_value"] = Json(patch.new_value);
    return j;
}

Json patch_set_to_json(const PatchSet& patches) {
    Json j = Json::object();
    for (PatchKind kind : PRINT_ORDER) {
        Json list = Json::array();
        for (const auto& patch : patches.of(kind)) {
            list.push_back(patch_to_json(patch));
        }
        j[collection_name(kind)] = std::move(list);
    }
    return j;
}

Json sections_to_json(const std::vector<Section>& sections) {
    Json list = Json::array();
    for (const auto& section : sections) {
        if (section.patches.empty()) {
            continue;
        }
        Json j = Json::object();
        j["title"] = section.title;
        Json collections = patch_set_to_json(section.patches);
        for (auto& [key, value] : collections.items()) {
            j[key] = std::move(value);
        }
        list.push_back(std::move(j));
    }

    Json document = Json::object();
    document["sections"] = std::move(list);
    return document;
}

Printer::Printer(std::ostream& out, const Config& config)
    : out_(out)
    , config_(config)
{
}

std::string Printer::paint(std::string_view color, std::string_view text) const {
    if (!config_.color) {
        return std::string(text);
    }
    return fmt::format("{}{}{}", color, text, ANSI_RESET);
}

void Printer::print_patch(const Patch& patch) {
    std::string path = format_path(patch.path);

    switch (patch.kind) {
        case PatchKind::Insert:
            out_ << paint(ANSI_GREEN, fmt::format("+ {} {}", path, to_display_string(patch.new_value))) << "\n";
            break;
        case PatchKind::Delete:
            out_ << paint(ANSI_RED, fmt::format("- {} {}", path, to_display_string(patch.old_value))) << "\n";
            break;
        case PatchKind::Update:
            out_ << path << "\n";
            out_ << paint(ANSI_RED, fmt::format("- {}", to_display_string(patch.old_value))) << "\n";
            out_ << paint(ANSI_GREEN, fmt::format("+ {}", to_display_string(patch.new_value))) << "\n";
            break;
        case PatchKind::Reorder:
            out_ << paint(ANSI_RED, fmt::format("[{}]", to_display_string(patch.old_value)))
                 << " -> "
                 << paint(ANSI_GREEN, fmt::format("[{}] ", to_display_string(patch.new_value)))
                 << path << " ...\n";
            break;
    }
    out_ << "\n";
}

void Printer::print_patches(const PatchSet& patches, std::string_view section_header) {
    if (patches.empty()) {
        return;
    }

    out_ << fmt::format("----- {} -----", section_header) << "\n";
    for (PatchKind kind : PRINT_ORDER) {
        const auto& collection = patches.of(kind);
        if (collection.empty()) {
            continue;
        }
        out_ << to_upper(collection_name(kind)) << "\n";
        for (const auto& patch : collection) {
            print_patch(patch);
        }
    }
}

void Printer::print_sections(const std::vector<Section>& sections) {
    switch (config_.format) {
        case OutputFormat::Text:
            for (const auto& section : sections) {
                print_patches(section.patches, section.title);
            }
            out_ << END_MARKER << "\n";
            break;
        case OutputFormat::Json:
            out_ << sections_to_json(sections).dump() << "\n";
            break;
        case OutputFormat::JsonPretty:
            out_ << sections_to_json(sections).dump(JSON_INDENT) << "\n";
            break;
    }
    out_.flush();
}

} // namespace httpdiff
