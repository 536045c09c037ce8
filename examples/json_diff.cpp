// Example: structural diff of two arbitrary JSON documents
// Usage: json-diff [--no-color] [-f text|json|json-pretty] <a.json> <b.json>
// Exits 0 when the documents are equivalent, 1 when they differ, 2 on error.
#include <httpdiff/diff.hpp>
#include <httpdiff/json.hpp>
#include <httpdiff/printer.hpp>

#include <fmt/format.h>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
    httpdiff::Config config;
    if (std::getenv("NO_COLOR")) {
        config.color = false;
    }

    std::vector<std::string> files;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--no-color") {
            config.color = false;
        } else if ((arg == "-f" || arg == "--format") && i + 1 < argc) {
            std::string fmt = argv[++i];
            if (fmt == "json") config.format = httpdiff::OutputFormat::Json;
            else if (fmt == "json-pretty") config.format = httpdiff::OutputFormat::JsonPretty;
            else config.format = httpdiff::OutputFormat::Text;
        } else {
            files.push_back(arg);
        }
    }

    if (files.size() != 2) {
        std::cerr << "Usage: " << argv[0] << " [--no-color] [-f text|json|json-pretty] <a.json> <b.json>\n";
        return 2;
    }

    httpdiff::Value a;
    httpdiff::Value b;
    std::string error;
    if (!httpdiff::load_json_file(files[0], a, error) ||
        !httpdiff::load_json_file(files[1], b, error)) {
        std::cerr << "Error: " << error << "\n";
        return 2;
    }

    httpdiff::PatchSet patches = httpdiff::diff(a, b);

    if (config.format == httpdiff::OutputFormat::Text) {
        httpdiff::Printer printer(std::cout, config);
        printer.print_patches(patches, fmt::format("{} -> {}", files[0], files[1]));
        std::cerr << fmt::format("{} changes\n", patches.size());
    } else {
        httpdiff::Json doc = httpdiff::patch_set_to_json(patches);
        std::cout << (config.format == httpdiff::OutputFormat::Json ? doc.dump() : doc.dump(httpdiff::JSON_INDENT))
                  << "\n";
    }

    return patches.empty() ? 0 : 1;
}
