#ifndef SCORECARD_CONFIG_CONFIG_LOADER_HPP
#define SCORECARD_CONFIG_CONFIG_LOADER_HPP

#pragma once

#include "scoring/thresholds.hpp"
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace scorecard::config {

enum class Verbosity {
    Summary,
    Detailed
};

std::string_view verbosity_name(Verbosity verbosity);

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct ScorecardConfig {
    scoring::Thresholds thresholds;
    std::string profile{"generic"};
    Verbosity verbosity{Verbosity::Summary};
    // Set when a configuration was present but unusable; the rest then holds defaults
    std::optional<std::string> issue;
    // pyproject.toml carries [tool.ruff]
    bool declares_linter{false};
};

// Reads [tool.agent-scorecard] from a pyproject.toml. A profile given here
// overrides the file's profile key; threshold values in the file override the
// profile. A missing file yields the defaults without an issue.
ScorecardConfig load_config_file(const std::string& path,
                                 const std::optional<std::string>& profile_override = std::nullopt);
ScorecardConfig load_config_string(const std::string& content,
                                   const std::optional<std::string>& profile_override = std::nullopt);

// Throws ConfigError for an unknown profile
ScorecardConfig default_config(const std::optional<std::string>& profile = std::nullopt);

} // namespace scorecard::config

#endif // SCORECARD_CONFIG_CONFIG_LOADER_HPP
