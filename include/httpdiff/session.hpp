#pragma once

#include "printer.hpp"
#include "record.hpp"
#include "types.hpp"
#include "value.hpp"

#include <cstddef>
#include <istream>
#include <optional>
#include <ostream>
#include <string_view>
#include <vector>

namespace httpdiff {

// Result of reading one selection from the user
enum class SelectionError : uint8_t {
    None = 0,
    NotAnInteger = 1,
    OutOfRange = 2
};

// Parse a record index typed by the user. Leading whitespace and trailing
// text after the digits are ignored. Negative indexes count back from the
// end of the list.
SelectionError parse_selection(std::string_view input, size_t record_count, size_t& index);

// Two loaded capture files and the comparison loop over them
class Session {
public:
    Session(std::vector<Value> first, std::vector<Value> second, const Config& config = {});

    const std::vector<Value>& first() const { return first_; }
    const std::vector<Value>& second() const { return second_; }
    const Config& config() const { return config_; }

    // "[i] <description>" for each record, then a blank line
    static void list_records(std::ostream& out, const std::vector<Value>& records);

    // Both listings
    void list(std::ostream& out) const;

    // Prompt until a valid index is read. Empty at end of input.
    std::optional<size_t> select(std::istream& in, std::ostream& out,
                                 const std::vector<Value>& records, std::string_view prompt) const;

    // Print every facet diff of first()[i] against second()[j].
    // Returns false if either index is out of range.
    bool compare(size_t i, size_t j, std::ostream& out) const;

    // Interactive loop: list, select two records, compare, repeat.
    // Ends at end of input, or once *running turns false (checked before
    // every listing and prompt). Returns the number of comparisons made.
    size_t run(std::istream& in, std::ostream& out, const volatile bool* running = nullptr) const;

private:
    std::vector<Value> first_;
    std::vector<Value> second_;
    Config config_;
};

} // namespace httpdiff
