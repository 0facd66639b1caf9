#include "git.hpp"
#include <array>
#include <cstdio>
#include <memory>
#include <set>
#include <sstream>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace scorecard::utils {
namespace {

std::string shell_quote(const std::string &value) {
    std::string quoted = "'";
    for (char c : value) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

std::string exec(const std::string &cmd) {
    std::array<char, 128> buffer;
    std::string result;

    std::unique_ptr<FILE, decltype(&pclose)> pipe(popen(cmd.c_str(), "r"), pclose);
    if (!pipe) {
        throw std::runtime_error("popen() failed for: " + cmd);
    }

    while (fgets(buffer.data(), static_cast<int>(buffer.size()), pipe.get()) != nullptr) {
        result += buffer.data();
    }

    // Exit status is only available from pclose itself
    if (pclose(pipe.release()) != 0) {
        throw std::runtime_error("Command failed: " + cmd);
    }
    return result;
}

std::vector<std::string> split_lines(const std::string &output) {
    std::vector<std::string> lines;
    std::istringstream iss(output);
    std::string line;
    while (std::getline(iss, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!line.empty()) {
            lines.push_back(line);
        }
    }
    return lines;
}

} // namespace

bool is_git_repo(const std::string &path) {
    try {
        return exec("git -C " + shell_quote(path) + " rev-parse --is-inside-work-tree 2>/dev/null") == "true\n";
    } catch (const std::runtime_error &) {
        return false;
    }
}

std::vector<std::string> list_changed_files(const std::string &path, const std::string &base) {
    if (!is_git_repo(path)) {
        throw std::runtime_error("Not a git repository: " + path);
    }

    const std::string repo = "git -C " + shell_quote(path);
    std::set<std::string> files;
    for (auto &file : split_lines(exec(repo + " diff --name-only --relative " + shell_quote(base) + " --"))) {
        files.insert(std::move(file));
    }
    for (auto &file : split_lines(exec(repo + " ls-files --others --exclude-standard"))) {
        files.insert(std::move(file));
    }

    spdlog::info("{} files changed against {}", files.size(), base);
    return {files.begin(), files.end()};
}

} // namespace scorecard::utils
