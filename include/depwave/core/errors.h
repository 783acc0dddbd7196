// core/errors.h - Exception types raised by the scheduling core
// Part of the depwave deployment-wave library (C++20)
//
// Two structural failures have their own types so callers can react to
// them specifically.  Everything else uses the standard hierarchy
// directly (std::invalid_argument for bad tunables, std::out_of_range for
// bad indices).
//
// Neither condition is retried anywhere: both are deterministic
// properties of the input.

#ifndef DEPWAVE_CORE_ERRORS_H
#define DEPWAVE_CORE_ERRORS_H

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace depwave {

/// A prioritisation pattern could not be compiled.
///
/// Raised immediately when the pattern list is compiled, before any
/// partitioning work starts.
class malformed_pattern_error : public std::invalid_argument {
public:
    malformed_pattern_error(std::string pattern, std::string const& reason)
        : std::invalid_argument("malformed prioritisation pattern '" + pattern
                                + "': " + reason),
          pattern_(std::move(pattern)) {}

    [[nodiscard]] std::string const& pattern() const noexcept { return pattern_; }

private:
    std::string pattern_;
};

/// No condensation unit is ready although some remain unassigned.
///
/// This means the unit graph handed to the partitioner was not acyclic.
/// stuck_units() lists the unassigned unit ids in ascending order.
/// Partitions appended before the failure remain valid.
class graph_inconsistency_error : public std::logic_error {
public:
    explicit graph_inconsistency_error(std::vector<std::size_t> stuck)
        : std::logic_error(make_message(stuck)),
          stuck_(std::move(stuck)) {}

    [[nodiscard]] std::vector<std::size_t> const& stuck_units() const noexcept {
        return stuck_;
    }

private:
    static std::string make_message(std::vector<std::size_t> const& stuck) {
        std::string msg = "pack_priority_waves: no ready unit but "
                          + std::to_string(stuck.size())
                          + " unit(s) unassigned:";
        std::size_t shown = 0;
        for (auto id : stuck) {
            if (shown == 20) {
                msg += " ...";
                break;
            }
            msg += ' ';
            msg += std::to_string(id);
            ++shown;
        }
        return msg;
    }

    std::vector<std::size_t> stuck_;
};

} // namespace depwave

#endif // DEPWAVE_CORE_ERRORS_H
