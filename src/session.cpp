#include "httpdiff/session.hpp"

#include <fmt/format.h>

#include <cctype>
#include <charconv>
#include <string>
#include <system_error>
#include <utility>

namespace httpdiff {

SelectionError parse_selection(std::string_view input, size_t record_count, size_t& index) {
    while (!input.empty() && std::isspace(static_cast<unsigned char>(input.front()))) {
        input.remove_prefix(1);
    }

    bool negative = false;
    if (!input.empty() && (input.front() == '-' || input.front() == '+')) {
        negative = input.front() == '-';
        input.remove_prefix(1);
    }

    size_t value = 0;
    auto [ptr, ec] = std::from_chars(input.data(), input.data() + input.size(), value);
    if (ec == std::errc::invalid_argument) {
        return SelectionError::NotAnInteger;
    }
    if (ec == std::errc::result_out_of_range) {
        return SelectionError::OutOfRange;
    }

    // -1 is the last record, -count the first
    if (negative && value != 0) {
        if (value > record_count) {
            return SelectionError::OutOfRange;
        }
        index = record_count - value;
        return SelectionError::None;
    }

    if (value >= record_count) {
        return SelectionError::OutOfRange;
    }
    index = value;
    return SelectionError::None;
}

Session::Session(std::vector<Value> first, std::vector<Value> second, const Config& config)
    : first_(std::move(first))
    , second_(std::move(second))
    , config_(config)
{
}

void Session::list_records(std::ostream& out, const std::vector<Value>& records) {
    for (size_t i = 0; i < records.size(); ++i) {
        out << fmt::format("[{}] {}", i, describe_record(records[i])) << "\n";
    }
    out << "\n";
}

void Session::list(std::ostream& out) const {
    list_records(out, first_);
    list_records(out, second_);
    out.flush();
}

std::optional<size_t> Session::select(std::istream& in, std::ostream& out,
                                      const std::vector<Value>& records,
                                      std::string_view prompt) const {
    std::string line;
    while (true) {
        out << prompt;
        out.flush();

        if (!std::getline(in, line)) {
            return std::nullopt;
        }

        size_t index = 0;
        switch (parse_selection(line, records.size(), index)) {
            case SelectionError::None:
                return index;
            case SelectionError::NotAnInteger:
                out << "Input must be an integer\n";
                break;
            case SelectionError::OutOfRange:
                out << "Not a valid selection\n";
                break;
        }
    }
}

bool Session::compare(size_t i, size_t j, std::ostream& out) const {
    if (i >= first_.size() || j >= second_.size()) {
        return false;
    }

    Printer printer(out, config_);
    printer.print_sections(diff_records(first_[i], second_[j]));
    return true;
}

size_t Session::run(std::istream& in, std::ostream& out, const volatile bool* running) const {
    auto stopped = [running]() { return running && !*running; };
    size_t comparisons = 0;

    while (!stopped()) {
        list(out);

        auto i = select(in, out, first_, "First Choice => ");
        if (!i || stopped()) break;
        auto j = select(in, out, second_, "Second Choice => ");
        if (!j || stopped()) break;

        if (compare(*i, *j, out)) {
            comparisons++;
        }
    }

    out << "\n";
    out.flush();
    return comparisons;
}

} // namespace httpdiff
