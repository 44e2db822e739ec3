#include <gtest/gtest.h>
#include "workspace_path.hpp"

using namespace bridge;

TEST(WorkspacePathTest, EmptyStaysEmpty) {
    EXPECT_EQ(NormalizeWorkspacePath(""), "");
}

TEST(WorkspacePathTest, TrailingSeparatorIsDropped) {
    EXPECT_EQ(NormalizeWorkspacePath("/work/app/"), "/work/app");
    EXPECT_EQ(NormalizeWorkspacePath("/work/app//"), "/work/app");
}

TEST(WorkspacePathTest, RepeatedSeparatorsCollapse) {
    EXPECT_EQ(NormalizeWorkspacePath("/work//app///src"), "/work/app/src");
}

TEST(WorkspacePathTest, DotSegmentsResolve) {
    EXPECT_EQ(NormalizeWorkspacePath("/work/./app/../lib"), "/work/lib");
    EXPECT_EQ(NormalizeWorkspacePath("/work/app/.."), "/work");
}

TEST(WorkspacePathTest, CannotClimbAboveRoot) {
    EXPECT_EQ(NormalizeWorkspacePath("/../../work"), "/work");
    EXPECT_EQ(NormalizeWorkspacePath("/.."), "/");
    EXPECT_EQ(NormalizeWorkspacePath("/"), "/");
}

TEST(WorkspacePathTest, BackslashesBecomeForwardSlashes) {
    EXPECT_EQ(NormalizeWorkspacePath("C:\\work\\app\\"), "C:/work/app");
    EXPECT_EQ(NormalizeWorkspacePath("C:\\"), "C:/");
    EXPECT_EQ(NormalizeWorkspacePath("C:"), "C:/");
}

TEST(WorkspacePathTest, RelativePathsKeepLeadingParents) {
    EXPECT_EQ(NormalizeWorkspacePath("../app"), "../app");
    EXPECT_EQ(NormalizeWorkspacePath("a/.."), ".");
    EXPECT_EQ(NormalizeWorkspacePath("./a/b/"), "a/b");
}

TEST(WorkspacePathTest, EquivalentSpellingsShareOneForm) {
    const std::string canonical = NormalizeWorkspacePath("/work/app");
    EXPECT_EQ(NormalizeWorkspacePath("/work/app/"), canonical);
    EXPECT_EQ(NormalizeWorkspacePath("/work/./app"), canonical);
    EXPECT_EQ(NormalizeWorkspacePath("/work/lib/../app"), canonical);
    EXPECT_EQ(NormalizeWorkspacePath("\\work\\app"), canonical);
}

TEST(WorkspacePathTest, NormalizationIsIdempotent) {
    for (const char* p : {"/a/b/../c/", "C:\\x\\.\\y", "../../z", "rel/./dir//", "/"}) {
        const std::string once = NormalizeWorkspacePath(p);
        EXPECT_EQ(NormalizeWorkspacePath(once), once) << p;
    }
}

TEST(WorkspacePathTest, AbsoluteDetection) {
    EXPECT_TRUE(IsAbsoluteWorkspacePath("/work/app"));
    EXPECT_TRUE(IsAbsoluteWorkspacePath("D:\\work"));
    EXPECT_TRUE(IsAbsoluteWorkspacePath("D:"));
    EXPECT_FALSE(IsAbsoluteWorkspacePath("work/app"));
    EXPECT_FALSE(IsAbsoluteWorkspacePath("./app"));
    EXPECT_FALSE(IsAbsoluteWorkspacePath(""));
}
