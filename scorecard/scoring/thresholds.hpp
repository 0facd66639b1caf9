#ifndef SCORECARD_SCORING_THRESHOLDS_HPP
#define SCORECARD_SCORING_THRESHOLDS_HPP

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace scorecard::scoring {

struct Thresholds {
    double acl_yellow{10.0};
    double acl_red{15.0};
    // Percent of typed functions a file needs
    double type_safety_minimum{90.0};
    std::size_t bloat_line_limit{200};
    std::size_t god_module_inbound_limit{50};
    std::size_t directory_entropy_limit{50};
    // Ordered, without duplicates (compared case-insensitively)
    std::vector<std::string> required_context_files{"AGENTS.md", "README.md"};
    std::size_t top_offenders{10};
};

// Built-in presets; "generic" equals a default-constructed Thresholds
std::optional<Thresholds> profile_thresholds(const std::string& profile);
std::vector<std::string> profile_names();

// Keeps the first occurrence of each file name, ignoring case
std::vector<std::string> unique_context_files(const std::vector<std::string>& files);

// Empty when the values are consistent, otherwise a description of the first problem
std::string validate(const Thresholds& thresholds);

} // namespace scorecard::scoring

#endif // SCORECARD_SCORING_THRESHOLDS_HPP
