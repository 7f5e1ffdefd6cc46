#include <gtest/gtest.h>

#include "docsync/store/exclusion_list.hpp"
#include "temp_directory.hpp"
#include "test_helpers.hpp"

using namespace docsync::store;
using namespace docsync::test;

TEST(ExclusionListCoversTest, MatchesEntryNameAndDirectory) {
  const std::string entry = ".github/copilot-instructions.md";
  EXPECT_TRUE(ExclusionList::covers(".github/copilot-instructions.md\n", entry));
  EXPECT_TRUE(ExclusionList::covers("node_modules\ncopilot-instructions.md\n", entry));
  EXPECT_TRUE(ExclusionList::covers(".github/\n", entry));
  EXPECT_TRUE(ExclusionList::covers(".github/*", entry));
  EXPECT_TRUE(ExclusionList::covers("  .github/copilot-instructions.md  \r\n", entry));
}

TEST(ExclusionListCoversTest, RejectsNearMisses) {
  const std::string entry = ".github/copilot-instructions.md";
  EXPECT_FALSE(ExclusionList::covers("", entry));
  EXPECT_FALSE(ExclusionList::covers("# .github/copilot-instructions.md\n", entry));
  EXPECT_FALSE(ExclusionList::covers(".github/copilot-instructions.md.bak\n", entry));
  EXPECT_FALSE(ExclusionList::covers(".gitlab/\n", entry));
}

class ExclusionListTest : public ::testing::Test {
 protected:
  TempDirectory temp_;
  ExclusionList list_{temp_.path() / ".gitignore"};
};

TEST_F(ExclusionListTest, CreatesMissingFile) {
  auto changed = list_.ensureEntry(".github/copilot-instructions.md");
  ASSERT_OK(changed);
  EXPECT_TRUE(*changed);
  EXPECT_EQ(temp_.readFile(".gitignore"), ".github/copilot-instructions.md\n");
}

TEST_F(ExclusionListTest, AppendsWithSeparatorWhenNeeded) {
  temp_.createFile(".gitignore", "build");
  ASSERT_OK(list_.ensureEntry(".github/copilot-instructions.md"));
  EXPECT_EQ(temp_.readFile(".gitignore"), "build\n.github/copilot-instructions.md\n");
}

TEST_F(ExclusionListTest, EmptyFileGetsNoLeadingNewline) {
  temp_.createFile(".gitignore", "");
  ASSERT_OK(list_.ensureEntry("copilot-instructions.md"));
  EXPECT_EQ(temp_.readFile(".gitignore"), "copilot-instructions.md\n");
}

TEST_F(ExclusionListTest, IsIdempotent) {
  ASSERT_OK(list_.ensureEntry(".github/copilot-instructions.md"));
  auto again = list_.ensureEntry(".github/copilot-instructions.md");
  ASSERT_OK(again);
  EXPECT_FALSE(*again);
  EXPECT_EQ(temp_.readFile(".gitignore"), ".github/copilot-instructions.md\n");
}

TEST_F(ExclusionListTest, ExistingDirectoryRuleCounts) {
  temp_.createFile(".gitignore", ".github/\n");
  auto changed = list_.ensureEntry(".github/copilot-instructions.md");
  ASSERT_OK(changed);
  EXPECT_FALSE(*changed);
  EXPECT_EQ(temp_.readFile(".gitignore"), ".github/\n");
}
