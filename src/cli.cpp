#include "httpdiff/cli.hpp"
#include "httpdiff/record.hpp"
#include "httpdiff/session.hpp"

#include <fmt/format.h>

#include <charconv>
#include <cstdlib>
#include <system_error>
#include <utility>
#include <vector>

namespace httpdiff {

namespace {

bool load(const std::string& path, std::vector<Value>& records, bool verbose, std::ostream& err) {
    std::string error;
    if (!load_records(path, records, error)) {
        err << "Error: " << error << "\n";
        return false;
    }
    if (verbose) {
        err << fmt::format("Loaded {} records from '{}'\n", records.size(), path);
    }
    return true;
}

} // anonymous namespace

void print_usage(std::ostream& out, std::string_view program) {
    out << "Usage: " << program << " [OPTIONS] <file1> <file2>\n"
        << "\n"
        << "Compare HTTP request/response pairs from two capture files.\n"
        << "Each file holds a JSON array of exchanges with 'version', 'request'\n"
        << "and 'response' members.\n"
        << "\n"
        << "Options:\n"
        << "  -h, --help              Show this help message\n"
        << "  -v, --verbose           Report progress on stderr\n"
        << "  -f, --format <fmt>      Output format: text, json, json-pretty\n"
        << "  --no-color              Disable ANSI colors (also set by NO_COLOR)\n"
        << "  -1, --first <n>         Record to take from file1\n"
        << "  -2, --second <n>        Record to take from file2\n"
        << "  -l, --list              List the records of both files and exit\n"
        << "\n"
        << "Without --first/--second the records are chosen interactively.\n"
        << "\n"
        << "Examples:\n"
        << "  " << program << " before.json after.json\n"
        << "  " << program << " -1 0 -2 3 -f json before.json after.json\n";
}

bool parse_index(std::string_view text, std::optional<size_t>& out) {
    size_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || ec != std::errc() || ptr != text.data() + text.size()) {
        return false;
    }
    out = value;
    return true;
}

Options parse_args(int argc, const char* const argv[], std::ostream& err) {
    Options opts;
    std::vector<std::string> files;

    if (argc > 0 && argv[0]) {
        opts.program = argv[0];
    }
    if (std::getenv("NO_COLOR")) {
        opts.config.color = false;
    }

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            opts.help = true;
            return opts;
        }
        else if (arg == "-v" || arg == "--verbose") {
            opts.config.verbose = true;
        }
        else if (arg == "-f" || arg == "--format") {
            if (i + 1 >= argc) {
                err << "Error: " << arg << " requires a format\n";
                opts.help = true;
                return opts;
            }
            std::string fmt = argv[++i];
            if (fmt == "text") opts.config.format = OutputFormat::Text;
            else if (fmt == "json") opts.config.format = OutputFormat::Json;
            else if (fmt == "json-pretty") opts.config.format = OutputFormat::JsonPretty;
            else {
                err << "Error: unknown format '" << fmt << "'\n";
                opts.help = true;
                return opts;
            }
        }
        else if (arg == "--no-color") {
            opts.config.color = false;
        }
        else if (arg == "-1" || arg == "--first" || arg == "-2" || arg == "--second") {
            bool first = (arg == "-1" || arg == "--first");
            if (i + 1 >= argc) {
                err << "Error: " << arg << " requires a record index\n";
                opts.help = true;
                return opts;
            }
            std::string value = argv[++i];
            if (!parse_index(value, first ? opts.first_index : opts.second_index)) {
                err << "Error: invalid record index '" << value << "'\n";
                opts.help = true;
                return opts;
            }
        }
        else if (arg == "-l" || arg == "--list") {
            opts.list_only = true;
        }
        else if (arg.size() > 1 && arg[0] == '-') {
            err << "Error: unknown option '" << arg << "'\n";
            opts.help = true;
            return opts;
        }
        else {
            files.push_back(arg);
        }
    }

    if (files.size() != 2) {
        err << "Error: exactly two capture files are required\n\n";
        opts.help = true;
        return opts;
    }
    if (opts.first_index.has_value() != opts.second_index.has_value()) {
        err << "Error: --first and --second must be given together\n\n";
        opts.help = true;
        return opts;
    }

    opts.first_file = files[0];
    opts.second_file = files[1];
    return opts;
}

int run_cli(const Options& opts, std::istream& in, std::ostream& out, std::ostream& err,
            const volatile bool* running) {
    if (opts.help) {
        print_usage(err, opts.program);
        return 1;
    }

    std::vector<Value> first;
    std::vector<Value> second;
    if (!load(opts.first_file, first, opts.config.verbose, err) ||
        !load(opts.second_file, second, opts.config.verbose, err)) {
        return 1;
    }

    Session session(std::move(first), std::move(second), opts.config);

    if (opts.list_only) {
        session.list(out);
        return 0;
    }

    if (opts.first_index && opts.second_index) {
        if (!session.compare(*opts.first_index, *opts.second_index, out)) {
            err << fmt::format("Error: no such record pair [{}] / [{}] ({} and {} records available)\n",
                               *opts.first_index, *opts.second_index,
                               session.first().size(), session.second().size());
            return 1;
        }
        return 0;
    }

    size_t comparisons = session.run(in, out, running);

    if (opts.config.verbose) {
        bool interrupted = running && !*running;
        err << fmt::format("{} after {} comparisons\n",
                           interrupted ? "Interrupted" : "End of input", comparisons);
    }

    return 0;
}

} // namespace httpdiff
