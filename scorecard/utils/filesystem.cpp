#include "filesystem.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <spdlog/spdlog.h>

namespace scorecard::utils {

namespace fs = std::filesystem;

namespace {

bool is_skipped_directory(const fs::path &path) {
    const std::string name = path.filename().string();
    return (!name.empty() && name[0] == '.') || name == "__pycache__";
}

} // namespace

std::string read_file_content(const std::string &file_path) {
    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file: " + file_path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        throw std::runtime_error("Failed to read file: " + file_path);
    }
    return buffer.str();
}

std::vector<std::string> list_project_files(const std::string &root,
                                            const std::vector<std::string> &ignore_patterns) {
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        throw std::runtime_error("Not a directory: " + root);
    }

    std::vector<std::string> files;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        throw std::runtime_error("Failed to list files in directory: " + root + ": " + ec.message());
    }

    for (const fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            spdlog::warn("Skipping unreadable entry under {}: {}", root, ec.message());
            ec.clear();
            continue;
        }

        const fs::path &path = it->path();
        if (it->is_directory(ec)) {
            if (is_skipped_directory(path)) {
                it.disable_recursion_pending();
            }
            continue;
        }
        if (!it->is_regular_file(ec)) {
            continue;
        }

        std::string relative = fs::path(path).lexically_relative(root).generic_string();
        if (matches_any(relative, ignore_patterns)) {
            spdlog::debug("Ignoring {}", relative);
            continue;
        }
        files.push_back(std::move(relative));
    }

    std::sort(files.begin(), files.end());
    return files;
}

std::vector<std::string> list_root_entries(const std::string &root) {
    std::vector<std::string> entries;
    std::error_code ec;
    for (fs::directory_iterator it(root, ec), end; !ec && it != end; it.increment(ec)) {
        entries.push_back(it->path().filename().string());
    }
    if (ec) {
        spdlog::warn("Failed to list {}: {}", root, ec.message());
    }

    std::sort(entries.begin(), entries.end());
    return entries;
}

bool matches_pattern(const std::string &text, const std::string &pattern) {
    try {
        std::regex regex(pattern);
        return std::regex_search(text, regex);
    } catch (const std::regex_error &) {
        // Invalid regex: plain substring match
        return text.find(pattern) != std::string::npos;
    }
}

bool matches_any(const std::string &text, const std::vector<std::string> &patterns) {
    return std::any_of(patterns.begin(), patterns.end(),
                       [&text](const std::string &pattern) { return matches_pattern(text, pattern); });
}

std::string normalize_path(const std::string &path) {
    return fs::path(path).lexically_normal().generic_string();
}

std::string get_relative_path(const std::string &base, const std::string &path) {
    const fs::path absolute = fs::absolute(path);
    return absolute.lexically_normal().lexically_relative(fs::absolute(base).lexically_normal()).generic_string();
}

} // namespace scorecard::utils
