#include <gtest/gtest.h>
#include "graph/import_resolver.hpp"

using namespace scorecard;
using graph::ImportResolver;

namespace {

parser::ImportPayload plain_import(std::vector<std::string> names) {
    parser::ImportPayload import;
    import.names = std::move(names);
    return import;
}

parser::ImportPayload from_import(std::size_t level, std::string module, std::vector<std::string> names) {
    parser::ImportPayload import;
    import.from_import = true;
    import.level = level;
    import.module = std::move(module);
    import.names = std::move(names);
    return import;
}

} // namespace

TEST(ModuleNameTest, DerivesIdsFromPaths) {
    EXPECT_EQ(graph::module_name_for_path("pkg/mod.py"), "pkg.mod");
    EXPECT_EQ(graph::module_name_for_path("pkg/sub/__init__.py"), "pkg.sub");
    EXPECT_EQ(graph::module_name_for_path("__init__.py"), "__init__");
    EXPECT_EQ(graph::module_name_for_path("main.py"), "main");
    EXPECT_EQ(graph::module_name_for_path("./pkg/../tool.py"), "tool");
}

class ImportResolverTest : public ::testing::Test {
protected:
    ImportResolver resolver{{
        "app.py",
        "pkg/__init__.py",
        "pkg/core.py",
        "pkg/util/__init__.py",
        "pkg/util/text.py",
        "src/lib/__init__.py",
        "src/lib/api.py",
    }};
};

TEST_F(ImportResolverTest, ResolvesAbsoluteImportsByLongestPrefix) {
    EXPECT_EQ(resolver.resolve("app.py", plain_import({"pkg.util.text"})),
              std::vector<std::string>{"pkg.util.text"});
    EXPECT_EQ(resolver.resolve("app.py", plain_import({"pkg.core.Thing"})),
              std::vector<std::string>{"pkg.core"});
    EXPECT_EQ(resolver.resolve("app.py", plain_import({"pkg.missing"})),
              std::vector<std::string>{"pkg"});
    EXPECT_TRUE(resolver.resolve("app.py", plain_import({"os.path", "requests"})).empty());
}

TEST_F(ImportResolverTest, FromImportPrefersSubmodules) {
    EXPECT_EQ(resolver.resolve("app.py", from_import(0, "pkg", {"core", "helper"})),
              (std::vector<std::string>{"pkg", "pkg.core"}));
    EXPECT_EQ(resolver.resolve("app.py", from_import(0, "pkg.core", {"Thing"})),
              std::vector<std::string>{"pkg.core"});
    EXPECT_EQ(resolver.resolve("app.py", from_import(0, "pkg.util", {"*"})),
              std::vector<std::string>{"pkg.util"});
}

TEST_F(ImportResolverTest, SourceRootMakesSrcPackagesImportable) {
    EXPECT_EQ(resolver.resolve("app.py", plain_import({"lib.api"})),
              std::vector<std::string>{"src.lib.api"});
    EXPECT_EQ(resolver.resolve("app.py", from_import(0, "lib", {"api"})),
              std::vector<std::string>{"src.lib.api"});
}

TEST_F(ImportResolverTest, ResolvesRelativeImports) {
    EXPECT_EQ(resolver.resolve("pkg/util/__init__.py", from_import(1, "", {"text"})),
              std::vector<std::string>{"pkg.util.text"});
    EXPECT_EQ(resolver.resolve("pkg/core.py", from_import(1, "util", {"text"})),
              std::vector<std::string>{"pkg.util.text"});
    EXPECT_EQ(resolver.resolve("pkg/util/text.py", from_import(2, "", {"core"})),
              std::vector<std::string>{"pkg.core"});
    EXPECT_EQ(resolver.resolve("pkg/util/text.py", from_import(2, "core", {"Thing"})),
              std::vector<std::string>{"pkg.core"});
    EXPECT_EQ(resolver.resolve("src/lib/api.py", from_import(1, "", {"missing"})),
              std::vector<std::string>{"src.lib"});
}

TEST_F(ImportResolverTest, RelativeImportAboveRootIsDropped) {
    EXPECT_TRUE(resolver.resolve("app.py", from_import(2, "", {"anything"})).empty());
    EXPECT_TRUE(resolver.resolve("pkg/core.py", from_import(3, "x", {"y"})).empty());
}

TEST_F(ImportResolverTest, RelativeImportOfMissingSubmoduleIsExternal) {
    EXPECT_TRUE(resolver.resolve("pkg/__init__.py", from_import(1, "_native", {"speedup"})).empty());
    EXPECT_TRUE(resolver.resolve("pkg/core.py", from_import(1, "util.missing", {"x"})).empty());
    EXPECT_TRUE(resolver.resolve("pkg/__init__.py", from_import(1, "", {"_version"})).empty());
    EXPECT_EQ(resolver.resolve("pkg/core.py", from_import(1, "", {"helper"})),
              std::vector<std::string>{"pkg"});
}

TEST_F(ImportResolverTest, AbsoluteImportOfOwnMissingSubmoduleIsExternal) {
    EXPECT_TRUE(resolver.resolve("pkg/__init__.py", plain_import({"pkg._native"})).empty());
    EXPECT_TRUE(resolver.resolve("pkg/__init__.py", from_import(0, "pkg._native", {"speedup"})).empty());
    EXPECT_EQ(resolver.resolve("pkg/core.py", plain_import({"pkg._native"})),
              std::vector<std::string>{"pkg"});
}
