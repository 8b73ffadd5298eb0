#include <gtest/gtest.h>
#include "important_files.hpp"

using namespace repomap;

TEST(ImportantFilesTest, RootManifests) {
    EXPECT_TRUE(is_important("README.md"));
    EXPECT_TRUE(is_important("CMakeLists.txt"));
    EXPECT_TRUE(is_important("package.json"));
    EXPECT_TRUE(is_important("pyproject.toml"));
    EXPECT_TRUE(is_important("Dockerfile"));
}

TEST(ImportantFilesTest, OnlyAtTheRoot) {
    EXPECT_FALSE(is_important("docs/README.md"));
    EXPECT_FALSE(is_important("vendor/lib/package.json"));
    EXPECT_FALSE(is_important("src/main.py"));
}

TEST(ImportantFilesTest, CiWorkflows) {
    EXPECT_TRUE(is_important(".github/workflows/ci.yml"));
    EXPECT_TRUE(is_important(".github/workflows/release.YAML"));
    EXPECT_FALSE(is_important(".github/workflows/notes.md"));
    EXPECT_FALSE(is_important(".github/CODEOWNERS"));
}

TEST(ImportantFilesTest, FilterKeepsOrder) {
    std::vector<std::string> paths = {"src/a.py", "setup.py", "README", "lib/b.py", "go.mod"};
    std::vector<std::string> expected = {"setup.py", "README", "go.mod"};
    EXPECT_EQ(filter_important_files(paths), expected);
}

TEST(ImportantFilesTest, NonAsciiNamesAreSafe) {
    EXPECT_FALSE(is_important("R\xc3\x89" "ADME.md"));
    EXPECT_FALSE(is_important("\xff\xfe"));
    EXPECT_TRUE(is_important("ReadMe.MD"));
}
