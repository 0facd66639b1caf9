#include "scoring/thresholds.hpp"
#include "utils/strings.hpp"
#include <set>

namespace scorecard::scoring {

std::optional<Thresholds> profile_thresholds(const std::string& profile) {
    Thresholds thresholds;

    if (profile == "generic") {
        return thresholds;
    }
    if (profile == "relaxed") {
        thresholds.type_safety_minimum = 50.0;
        thresholds.required_context_files = {"README.md"};
        return thresholds;
    }
    if (profile == "jules") {
        thresholds.bloat_line_limit = 150;
        thresholds.type_safety_minimum = 80.0;
        thresholds.required_context_files = {"AGENTS.md", "instructions.md"};
        return thresholds;
    }
    if (profile == "copilot") {
        thresholds.bloat_line_limit = 100;
        thresholds.type_safety_minimum = 40.0;
        thresholds.required_context_files.clear();
        return thresholds;
    }

    return std::nullopt;
}

std::vector<std::string> profile_names() {
    return {"copilot", "generic", "jules", "relaxed"};
}

std::vector<std::string> unique_context_files(const std::vector<std::string>& files) {
    std::vector<std::string> unique;
    std::set<std::string> seen;
    for (const auto& file : files) {
        if (!file.empty() && seen.insert(utils::to_lower(file)).second) {
            unique.push_back(file);
        }
    }
    return unique;
}

std::string validate(const Thresholds& thresholds) {
    if (thresholds.acl_yellow < 0.0 || thresholds.acl_red < 0.0) {
        return "ACL thresholds must not be negative";
    }
    if (thresholds.acl_yellow > thresholds.acl_red) {
        return "acl_yellow must not exceed acl_red";
    }
    if (thresholds.type_safety_minimum < 0.0 || thresholds.type_safety_minimum > 100.0) {
        return "type_safety_minimum must be a percentage between 0 and 100";
    }
    return "";
}

} // namespace scorecard::scoring
