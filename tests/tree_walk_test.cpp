#include <showlink/logging.h>
#include <showlink/tree_walk.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <unistd.h>

#include <filesystem>
#include <set>
#include <sstream>
#include <vector>

#include "test_support/temporary_tree.h"

namespace showlink {
namespace {

using ::testing::HasSubstr;
using ::testing::IsEmpty;
using ::testing::UnorderedElementsAre;

std::set<std::filesystem::path>
Relative(const std::vector<std::filesystem::directory_entry> &entries,
         const std::filesystem::path &root) {
  std::set<std::filesystem::path> paths;
  for (const auto &entry : entries) {
    paths.insert(entry.path().lexically_relative(root));
  }
  return paths;
}

TEST(TreeWalkTest, ListsNestedEntries) {
  test::TemporaryTree tree;
  tree.AddFile("destination/Show/Season 01/Show.S01E01.mkv");
  tree.AddDirectory("destination/Other");
  NullLogger logger;

  const auto entries = ListTree(tree.destination(), logger);

  EXPECT_THAT(Relative(entries, tree.destination()),
              UnorderedElementsAre("Show", "Show/Season 01",
                                   "Show/Season 01/Show.S01E01.mkv",
                                   "Other"));
}

TEST(TreeWalkTest, DoesNotDescendIntoDirectorySymlinks) {
  test::TemporaryTree tree;
  tree.AddFile("source/Show/Show.S01E01.mkv");
  std::filesystem::create_directory_symlink(tree.source() / "Show",
                                            tree.destination() / "Alias");
  NullLogger logger;

  const auto entries = ListTree(tree.destination(), logger);

  EXPECT_THAT(Relative(entries, tree.destination()),
              UnorderedElementsAre("Alias"));
}

TEST(TreeWalkTest, KeepsWalkingPastUnreadableDirectory) {
  if (geteuid() == 0) {
    GTEST_SKIP() << "root ignores directory permissions";
  }
  test::TemporaryTree tree;
  tree.AddFile("destination/A Locked/hidden.mkv");
  tree.AddFile("destination/B Show/Season 01/Show.S01E01.mkv");
  const auto locked = tree.destination() / "A Locked";
  std::filesystem::permissions(locked, std::filesystem::perms::none);
  NullLogger logger;

  const auto entries = ListTree(tree.destination(), logger);

  std::filesystem::permissions(locked, std::filesystem::perms::owner_all);
  EXPECT_THAT(Relative(entries, tree.destination()),
              UnorderedElementsAre("A Locked", "B Show", "B Show/Season 01",
                                   "B Show/Season 01/Show.S01E01.mkv"));
}

TEST(TreeWalkTest, LogsDirectoryThatCannotBeOpened) {
  test::TemporaryTree tree;
  const auto file = tree.AddFile("destination/not-a-directory.mkv");
  std::stringstream stream;
  StructuredLogger logger(stream, {LogLevel::kWarn});

  const auto entries = ListTree(file, logger);

  EXPECT_THAT(entries, IsEmpty());
  EXPECT_THAT(stream.str(), HasSubstr("tree.walk_error"));
  EXPECT_THAT(stream.str(), HasSubstr("not-a-directory.mkv"));
}

} // namespace
} // namespace showlink
