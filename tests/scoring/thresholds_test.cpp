#include <gtest/gtest.h>
#include "scoring/thresholds.hpp"

using namespace scorecard::scoring;

TEST(ThresholdsTest, DefaultsMatchGenericProfile) {
    Thresholds defaults;
    EXPECT_DOUBLE_EQ(defaults.acl_yellow, 10.0);
    EXPECT_DOUBLE_EQ(defaults.acl_red, 15.0);
    EXPECT_DOUBLE_EQ(defaults.type_safety_minimum, 90.0);
    EXPECT_EQ(defaults.bloat_line_limit, 200u);
    EXPECT_EQ(defaults.god_module_inbound_limit, 50u);
    EXPECT_EQ(defaults.directory_entropy_limit, 50u);
    EXPECT_EQ(defaults.top_offenders, 10u);
    EXPECT_EQ(defaults.required_context_files, (std::vector<std::string>{"AGENTS.md", "README.md"}));

    auto generic = profile_thresholds("generic");
    ASSERT_TRUE(generic.has_value());
    EXPECT_EQ(generic->bloat_line_limit, defaults.bloat_line_limit);
    EXPECT_EQ(generic->required_context_files, defaults.required_context_files);
}

TEST(ThresholdsTest, ProfilesAdjustLimits) {
    auto relaxed = profile_thresholds("relaxed");
    ASSERT_TRUE(relaxed.has_value());
    EXPECT_DOUBLE_EQ(relaxed->type_safety_minimum, 50.0);
    EXPECT_EQ(relaxed->required_context_files, std::vector<std::string>{"README.md"});

    auto jules = profile_thresholds("jules");
    ASSERT_TRUE(jules.has_value());
    EXPECT_EQ(jules->bloat_line_limit, 150u);
    EXPECT_DOUBLE_EQ(jules->type_safety_minimum, 80.0);

    auto copilot = profile_thresholds("copilot");
    ASSERT_TRUE(copilot.has_value());
    EXPECT_EQ(copilot->bloat_line_limit, 100u);
    EXPECT_TRUE(copilot->required_context_files.empty());
    EXPECT_DOUBLE_EQ(copilot->acl_red, 15.0);

    EXPECT_FALSE(profile_thresholds("unknown").has_value());
    EXPECT_EQ(profile_names().size(), 4u);
}

TEST(ThresholdsTest, ContextFilesAreDeduplicatedIgnoringCase) {
    EXPECT_EQ(unique_context_files({"AGENTS.md", "README.md", "agents.md", "", "README.md", "CONTRIBUTING.md"}),
              (std::vector<std::string>{"AGENTS.md", "README.md", "CONTRIBUTING.md"}));
}

TEST(ThresholdsTest, ValidatesConsistency) {
    Thresholds thresholds;
    EXPECT_EQ(validate(thresholds), "");

    thresholds.acl_yellow = 20.0;
    EXPECT_NE(validate(thresholds), "");

    thresholds = Thresholds{};
    thresholds.acl_red = -1.0;
    EXPECT_NE(validate(thresholds), "");

    thresholds = Thresholds{};
    thresholds.type_safety_minimum = 120.0;
    EXPECT_NE(validate(thresholds), "");
}
