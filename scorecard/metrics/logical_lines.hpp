#ifndef SCORECARD_METRICS_LOGICAL_LINES_HPP
#define SCORECARD_METRICS_LOGICAL_LINES_HPP

#pragma once

#include <cstddef>
#include <string_view>
#include <vector>

namespace scorecard::metrics {

// Marks which physical lines open a logical Python line. Blank lines,
// comment-only lines and continuation lines of a bracketed, backslash-joined
// or triple-quoted statement are not counted.
class LogicalLineIndex {
public:
    static LogicalLineIndex from_source(std::string_view source);

    // Logical lines starting within [first_line, last_line], 1-based and inclusive
    std::size_t count(std::size_t first_line, std::size_t last_line) const;

    std::size_t total() const { return prefix_.empty() ? 0 : prefix_.back(); }
    std::size_t physical_lines() const { return prefix_.empty() ? 0 : prefix_.size() - 1; }
    bool starts_logical_line(std::size_t line) const;

private:
    // prefix_[n] = number of logical lines starting in lines 1..n
    std::vector<std::size_t> prefix_;
};

} // namespace scorecard::metrics

#endif // SCORECARD_METRICS_LOGICAL_LINES_HPP
