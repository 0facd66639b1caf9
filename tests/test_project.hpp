#ifndef SCORECARD_TESTS_TEST_PROJECT_HPP
#define SCORECARD_TESTS_TEST_PROJECT_HPP

#pragma once

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>

namespace scorecard::testing {

namespace fs = std::filesystem;

// Scratch project directory under the system temp dir, removed on destruction
class TestProject {
public:
    TestProject() {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        root_ = fs::temp_directory_path() /
                (std::string("scorecard_") + info->test_suite_name() + "_" + info->name());
        fs::remove_all(root_);
        fs::create_directories(root_);
    }

    ~TestProject() {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    TestProject(const TestProject&) = delete;
    TestProject& operator=(const TestProject&) = delete;

    std::string write(const std::string& relative_path, const std::string& content) const {
        const fs::path path = root_ / relative_path;
        fs::create_directories(path.parent_path());
        std::ofstream file(path, std::ios::binary);
        file << content;
        return path.string();
    }

    std::string root() const { return root_.string(); }

private:
    fs::path root_;
};

} // namespace scorecard::testing

#endif // SCORECARD_TESTS_TEST_PROJECT_HPP
