#ifndef SCORECARD_UTILS_FILESYSTEM_HPP
#define SCORECARD_UTILS_FILESYSTEM_HPP

#pragma once

#include <string>
#include <vector>

namespace scorecard::utils {

// File reading operations
std::string read_file_content(const std::string &file_path);

// Directory operations
// Regular files below root as sorted, '/'-separated relative paths. Hidden
// directories and __pycache__ are not entered; unreadable entries are skipped.
std::vector<std::string> list_project_files(const std::string &root,
                                            const std::vector<std::string> &ignore_patterns = {});
std::vector<std::string> list_root_entries(const std::string &root);

// Pattern matching
bool matches_pattern(const std::string &text, const std::string &pattern);
bool matches_any(const std::string &text, const std::vector<std::string> &patterns);

// Path operations
std::string normalize_path(const std::string &path);
std::string get_relative_path(const std::string &base, const std::string &path);

} // namespace scorecard::utils

#endif // SCORECARD_UTILS_FILESYSTEM_HPP
