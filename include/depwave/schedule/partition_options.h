// schedule/partition_options.h - Tunables for wave partitioning
// Part of the depwave deployment-wave library (C++20)
//
// One aggregate carries every knob the partitioner reads.  Defaults are
// the values migration teams start from; override with designated
// initialisers:
//
//   partition_options opts{.min_size = 10, .max_size = 50};
//
// read_pattern_list() loads prioritisation patterns from a text stream
// (one per line, '#' comments).

#ifndef DEPWAVE_SCHEDULE_PARTITION_OPTIONS_H
#define DEPWAVE_SCHEDULE_PARTITION_OPTIONS_H

#include <cstddef>
#include <istream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace depwave::schedule {

struct partition_options {
    /// Waves below this size are topped up during packing and become
    /// merge candidates afterwards.
    std::size_t min_size = 40;

    /// Upper bound on packed and merged waves.  A single unit larger than
    /// this still gets a wave of its own.
    std::size_t max_size = 80;

    /// Exact names or glob patterns (*, ?, [...]) of objects to deploy
    /// early.  Order is preserved; any match puts a unit in tier 0.
    std::vector<std::string> prioritize_patterns{};

    /// Run category levelling before priority packing.
    bool category_waves = true;

    /// Categories levelled in phase 1, in deployment order.
    std::vector<std::string> simple_categories{"TABLE", "VIEW", "FUNCTION"};

    /// Category of ETL objects (tier 2 when every member has it).
    std::string etl_category = "ETL";

    /// Enforce 0 < min_size <= max_size.
    void validate() const {
        if (min_size == 0) {
            throw std::invalid_argument("partition_options: min_size must be positive");
        }
        if (max_size == 0) {
            throw std::invalid_argument("partition_options: max_size must be positive");
        }
        if (min_size > max_size) {
            throw std::invalid_argument("partition_options: min_size exceeds max_size");
        }
    }
};

/// Read prioritisation patterns, one per line.
///
/// Leading and trailing whitespace is trimmed; blank lines and lines
/// starting with '#' are skipped.  Validation of the patterns themselves
/// happens when they are compiled (pattern_match.h).
[[nodiscard]] inline std::vector<std::string>
read_pattern_list(std::istream& is) {
    std::vector<std::string> patterns;
    std::string line;
    constexpr std::string_view whitespace = " \t\r\n\f\v";

    while (std::getline(is, line)) {
        std::string_view sv(line);
        auto const first = sv.find_first_not_of(whitespace);
        if (first == std::string_view::npos) continue;
        auto const last = sv.find_last_not_of(whitespace);
        sv = sv.substr(first, last - first + 1);
        if (sv.front() == '#') continue;
        patterns.emplace_back(sv);
    }
    return patterns;
}

} // namespace depwave::schedule

#endif // DEPWAVE_SCHEDULE_PARTITION_OPTIONS_H
