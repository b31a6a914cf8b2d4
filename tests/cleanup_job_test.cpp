#include <showlink/cleanup_job.h>
#include <showlink/logging.h>
#include <showlink/models.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <unistd.h>

#include <filesystem>
#include <memory>
#include <sstream>

#include "test_support/temporary_tree.h"

namespace showlink {
namespace {

TEST(CleanupJobTest, RemovesArchivesAndEmptyDirectories) {
  test::TemporaryTree tree;
  const auto episode = tree.AddFile("source/Show.S01.720p/Show.S01E01.mkv");
  tree.AddDirectory("destination/Show/Season 01");
  std::filesystem::create_symlink(
      episode, tree.destination() / "Show/Season 01/Show.S01E01.mkv");
  tree.AddFile("destination/Leftover/Season 02/leftover.r00");
  tree.AddFile("destination/Leftover/leftover.rar");
  tree.AddDirectory("destination/Empty/Season 01/Extras");

  const auto summary = CleanupJob(tree.destination()).Run();

  EXPECT_EQ(2u, summary.archives_removed);
  EXPECT_EQ(0u, summary.broken_links_removed);
  EXPECT_EQ(5u, summary.directories_removed);
  EXPECT_TRUE(std::filesystem::is_symlink(tree.destination() /
                                          "Show/Season 01/Show.S01E01.mkv"));
  EXPECT_FALSE(std::filesystem::exists(tree.destination() / "Leftover"));
  EXPECT_FALSE(std::filesystem::exists(tree.destination() / "Empty"));
  EXPECT_TRUE(std::filesystem::is_directory(tree.destination()));
}

TEST(CleanupJobTest, SecondRunRemovesNothing) {
  test::TemporaryTree tree;
  tree.AddFile("destination/A/B/C/part.r01");
  tree.AddDirectory("destination/D/E");

  CleanupJob job(tree.destination());
  job.Run();
  const auto second = job.Run();

  EXPECT_EQ(0u, second.archives_removed);
  EXPECT_EQ(0u, second.broken_links_removed);
  EXPECT_EQ(0u, second.directories_removed);
  EXPECT_TRUE(std::filesystem::is_empty(tree.destination()));
}

TEST(CleanupJobTest, KeepsBrokenLinksUnlessPruningIsEnabled) {
  test::TemporaryTree tree;
  tree.AddDirectory("destination/Show/Season 01");
  const auto link = tree.destination() / "Show/Season 01/gone.mkv";
  std::filesystem::create_symlink(tree.source() / "gone.mkv", link);

  CleanupJob(tree.destination()).Run();
  EXPECT_TRUE(std::filesystem::is_symlink(link));

  CleanupOptions options;
  options.prune_broken_links = true;
  const auto summary = CleanupJob(tree.destination(), options).Run();

  EXPECT_EQ(1u, summary.broken_links_removed);
  EXPECT_FALSE(std::filesystem::is_symlink(link));
  EXPECT_FALSE(std::filesystem::exists(tree.destination() / "Show"));
}

TEST(CleanupJobTest, KeepsLinkWhoseTargetCannotBeChecked) {
  if (geteuid() == 0) {
    GTEST_SKIP() << "root ignores directory permissions";
  }
  test::TemporaryTree tree;
  const auto episode = tree.AddFile("source/Locked/Inner/Show.S01E01.mkv");
  tree.AddDirectory("destination/Show/Season 01");
  const auto link = tree.destination() / "Show/Season 01/Show.S01E01.mkv";
  std::filesystem::create_symlink(episode, link);
  const auto locked = tree.source() / "Locked";
  std::filesystem::permissions(locked, std::filesystem::perms::none);

  std::stringstream stream;
  auto logger = std::make_shared<StructuredLogger>(
      stream, LoggingConfig{LogLevel::kWarn});
  CleanupOptions options;
  options.prune_broken_links = true;
  const auto summary = CleanupJob(tree.destination(), options, logger).Run();

  std::filesystem::permissions(locked, std::filesystem::perms::owner_all);
  EXPECT_EQ(0u, summary.broken_links_removed);
  EXPECT_TRUE(std::filesystem::is_symlink(link));
  EXPECT_TRUE(std::filesystem::exists(link));
  EXPECT_THAT(stream.str(), ::testing::HasSubstr("cleanup.link_unverifiable"));
}

TEST(CleanupJobTest, MissingDestinationIsConfigurationError) {
  test::TemporaryTree tree;
  EXPECT_THROW(CleanupJob(tree.root() / "missing").Run(), ConfigurationError);
}

} // namespace
} // namespace showlink
