#ifndef SCORECARD_UTILS_GIT_HPP
#define SCORECARD_UTILS_GIT_HPP

#pragma once

#include <string>
#include <vector>

namespace scorecard::utils {

bool is_git_repo(const std::string &path);

// Files changed against base plus untracked files, relative to path and
// '/'-separated. Throws std::runtime_error when git fails.
std::vector<std::string> list_changed_files(const std::string &path, const std::string &base);

} // namespace scorecard::utils

#endif // SCORECARD_UTILS_GIT_HPP
