#include <gtest/gtest.h>
#include "utils/git.hpp"
#include "test_project.hpp"
#include <stdexcept>

using namespace scorecard;
using scorecard::testing::TestProject;

TEST(GitTest, PlainDirectoryIsNotARepository) {
    TestProject project;
    project.write("main.py", "print('hi')\n");

    EXPECT_FALSE(utils::is_git_repo(project.root()));
    EXPECT_THROW(utils::list_changed_files(project.root(), "HEAD"), std::runtime_error);
}
