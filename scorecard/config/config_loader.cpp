#include "config/config_loader.hpp"
#include "utils/filesystem.hpp"
#include <filesystem>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <toml++/toml.h>

namespace scorecard::config {

namespace {

constexpr const char* kSection = "agent-scorecard";

double read_number(const toml::node& node, const std::string& key) {
    if (const auto* integer = node.as_integer()) {
        return static_cast<double>(integer->get());
    }
    if (const auto* floating = node.as_floating_point()) {
        return floating->get();
    }
    throw ConfigError(fmt::format("thresholds.{} must be a number", key));
}

std::size_t read_count(const toml::node& node, const std::string& key) {
    const auto* integer = node.as_integer();
    if (!integer) {
        throw ConfigError(fmt::format("thresholds.{} must be an integer", key));
    }
    if (integer->get() < 0) {
        throw ConfigError(fmt::format("thresholds.{} must not be negative", key));
    }
    return static_cast<std::size_t>(integer->get());
}

std::vector<std::string> read_strings(const toml::node& node, const std::string& key) {
    const auto* array = node.as_array();
    if (!array) {
        throw ConfigError(fmt::format("thresholds.{} must be an array of strings", key));
    }

    std::vector<std::string> values;
    for (const auto& element : *array) {
        const auto* text = element.as_string();
        if (!text) {
            throw ConfigError(fmt::format("thresholds.{} must be an array of strings", key));
        }
        values.push_back(text->get());
    }
    return values;
}

std::string read_string(const toml::node& node, const std::string& key) {
    const auto* text = node.as_string();
    if (!text) {
        throw ConfigError(fmt::format("{} must be a string", key));
    }
    return text->get();
}

void apply_threshold(scoring::Thresholds& thresholds, const std::string& key, const toml::node& value) {
    if (key == "acl_yellow") {
        thresholds.acl_yellow = read_number(value, key);
    } else if (key == "acl_red") {
        thresholds.acl_red = read_number(value, key);
    } else if (key == "type_safety_minimum") {
        thresholds.type_safety_minimum = read_number(value, key);
    } else if (key == "bloat_line_limit") {
        thresholds.bloat_line_limit = read_count(value, key);
    } else if (key == "god_module_inbound_limit") {
        thresholds.god_module_inbound_limit = read_count(value, key);
    } else if (key == "directory_entropy_limit") {
        thresholds.directory_entropy_limit = read_count(value, key);
    } else if (key == "top_offenders") {
        thresholds.top_offenders = read_count(value, key);
    } else if (key == "required_context_files") {
        thresholds.required_context_files = scoring::unique_context_files(read_strings(value, key));
    } else {
        spdlog::warn("Ignoring unknown threshold '{}'", key);
    }
}

Verbosity parse_verbosity(const std::string& text) {
    if (text == "summary") {
        return Verbosity::Summary;
    }
    if (text == "detailed") {
        return Verbosity::Detailed;
    }
    throw ConfigError("verbosity must be 'summary' or 'detailed', got '" + text + "'");
}

ScorecardConfig parse_section(toml::table& section, const std::optional<std::string>& profile_override) {
    ScorecardConfig config;

    if (profile_override) {
        config.profile = *profile_override;
    } else if (const auto* node = section.get("profile")) {
        config.profile = read_string(*node, "profile");
    }

    auto thresholds = scoring::profile_thresholds(config.profile);
    if (!thresholds) {
        throw ConfigError("unknown profile '" + config.profile + "'");
    }
    config.thresholds = std::move(*thresholds);

    if (const auto* node = section.get("verbosity")) {
        config.verbosity = parse_verbosity(read_string(*node, "verbosity"));
    }

    if (auto* node = section.get("thresholds")) {
        auto* table = node->as_table();
        if (!table) {
            throw ConfigError("thresholds must be a table");
        }
        for (auto&& entry : *table) {
            apply_threshold(config.thresholds, std::string(entry.first.str()), entry.second);
        }
    }

    const std::string problem = scoring::validate(config.thresholds);
    if (!problem.empty()) {
        throw ConfigError(problem);
    }
    return config;
}

ScorecardConfig with_issue(const std::optional<std::string>& profile_override, std::string issue) {
    spdlog::warn("Invalid configuration, using defaults: {}", issue);

    ScorecardConfig config;
    if (profile_override) {
        if (auto thresholds = scoring::profile_thresholds(*profile_override)) {
            config.profile = *profile_override;
            config.thresholds = std::move(*thresholds);
        }
    }
    config.issue = std::move(issue);
    return config;
}

} // namespace

std::string_view verbosity_name(Verbosity verbosity) {
    switch (verbosity) {
    case Verbosity::Summary:
        return "summary";
    case Verbosity::Detailed:
        return "detailed";
    }
    return "summary";
}

ScorecardConfig default_config(const std::optional<std::string>& profile) {
    ScorecardConfig config;
    if (profile) {
        auto thresholds = scoring::profile_thresholds(*profile);
        if (!thresholds) {
            throw ConfigError("unknown profile '" + *profile + "'");
        }
        config.profile = *profile;
        config.thresholds = std::move(*thresholds);
    }
    return config;
}

ScorecardConfig load_config_string(const std::string& content,
                                   const std::optional<std::string>& profile_override) {
    bool declares_linter = false;
    try {
        toml::table root = toml::parse(content);
        declares_linter = root["tool"]["ruff"].is_table();

        auto section = root["tool"][kSection];
        if (!section) {
            auto config = default_config(profile_override);
            config.declares_linter = declares_linter;
            return config;
        }
        if (!section.is_table()) {
            throw ConfigError(std::string("[tool.") + kSection + "] must be a table");
        }

        auto config = parse_section(*section.as_table(), profile_override);
        config.declares_linter = declares_linter;
        spdlog::debug("Loaded configuration: profile {}, verbosity {}", config.profile,
                      verbosity_name(config.verbosity));
        return config;
    } catch (const toml::parse_error& err) {
        auto config = with_issue(profile_override,
                                 fmt::format("failed to parse TOML at line {}: {}",
                                             err.source().begin.line, err.description()));
        return config;
    } catch (const ConfigError& err) {
        auto config = with_issue(profile_override, err.what());
        config.declares_linter = declares_linter;
        return config;
    }
}

ScorecardConfig load_config_file(const std::string& path,
                                 const std::optional<std::string>& profile_override) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        spdlog::debug("No configuration at {}", path);
        return default_config(profile_override);
    }

    std::string content;
    try {
        content = utils::read_file_content(path);
    } catch (const std::runtime_error& err) {
        return with_issue(profile_override, err.what());
    }
    return load_config_string(content, profile_override);
}

} // namespace scorecard::config
