#include <showlink/destination_resolver.h>
#include <showlink/index_store.h>
#include <showlink/name_classifier.h>
#include <showlink/symlink_reconciler.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <string>
#include <vector>

#include "test_support/temporary_tree.h"

namespace showlink {
namespace {

using ::testing::Contains;
using ::testing::Each;
using ::testing::Field;
using ::testing::SizeIs;

// Store, classifier and resolver wired the way a run wires them.
class ReconcilerFixture {
public:
  explicit ReconcilerFixture(const test::TemporaryTree &tree,
                             ReconcilerOptions options = {})
      : store_(tree.logs(), nullptr),
        resolver_(tree.destination(), store_),
        reconciler_(tree.destination(), store_, classifier_, resolver_,
                    options) {
    store_.RebuildLinkIndex(tree.destination());
    store_.RebuildFolderIndex(tree.destination());
  }

  SymlinkReconciler &reconciler() { return reconciler_; }
  LogBackedIndexStore &store() { return store_; }

private:
  LogBackedIndexStore store_;
  NameClassifier classifier_;
  DestinationResolver resolver_;
  SymlinkReconciler reconciler_;
};

SourceEntry FolderEntry(const std::filesystem::path &path) {
  return SourceEntry{path, EntryKind::kFolder, {}};
}

TEST(SymlinkReconcilerTest, LinksEveryEpisodeOfAFolder) {
  test::TemporaryTree tree;
  const auto folder = tree.AddDirectory("source/Some.Show.S01.1080p");
  tree.AddFile("source/Some.Show.S01.1080p/Some.Show.S01E01.mkv");
  tree.AddFile("source/Some.Show.S01.1080p/Some.Show.S01E02.mkv");
  ReconcilerFixture fixture(tree);

  const auto report = fixture.reconciler().ProcessEntry(FolderEntry(folder));

  EXPECT_EQ(EntryState::kLinked, report.state);
  EXPECT_EQ(tree.destination() / "Some Show", report.series_folder);
  EXPECT_THAT(report.links, SizeIs(2));
  EXPECT_THAT(report.links,
              Each(Field(&LinkOutcome::state, EntryState::kLinked)));
  const auto link =
      tree.destination() / "Some Show/Season 01/Some.Show.S01E01.mkv";
  ASSERT_TRUE(std::filesystem::is_symlink(link));
  EXPECT_EQ(folder / "Some.Show.S01E01.mkv", std::filesystem::read_symlink(link));
}

TEST(SymlinkReconcilerTest, SortsFilesIntoTheirOwnSeasonFolders) {
  test::TemporaryTree tree;
  const auto folder = tree.AddDirectory("source/Show.S01-S02.720p");
  tree.AddFile("source/Show.S01-S02.720p/Show.S01E09.mkv");
  tree.AddFile("source/Show.S01-S02.720p/Show.S02E01.mkv");
  ReconcilerFixture fixture(tree);

  fixture.reconciler().ProcessEntry(FolderEntry(folder));

  EXPECT_TRUE(std::filesystem::is_symlink(tree.destination() /
                                          "Show/Season 01/Show.S01E09.mkv"));
  EXPECT_TRUE(std::filesystem::is_symlink(tree.destination() /
                                          "Show/Season 02/Show.S02E01.mkv"));
}

TEST(SymlinkReconcilerTest, SecondPassFindsEverythingAlreadyLinked) {
  test::TemporaryTree tree;
  const auto folder = tree.AddDirectory("source/Some.Show.S01.1080p");
  tree.AddFile("source/Some.Show.S01.1080p/Some.Show.S01E01.mkv");
  {
    ReconcilerFixture first(tree);
    first.reconciler().ProcessEntry(FolderEntry(folder));
  }

  ReconcilerFixture second(tree);
  const auto report = second.reconciler().ProcessEntry(FolderEntry(folder));

  EXPECT_EQ(EntryState::kSkipped, report.state);
  ASSERT_THAT(report.links, SizeIs(1));
  EXPECT_EQ(SkipReason::kAlreadyLinked, report.links.front().skip);
}

TEST(SymlinkReconcilerTest, DuplicateSourceIsLinkedOnlyOnce) {
  test::TemporaryTree tree;
  const auto folder = tree.AddDirectory("source/Some.Show.S01.1080p");
  tree.AddFile("source/Some.Show.S01.1080p/Some.Show.S01E01.mkv");
  ReconcilerFixture fixture(tree);

  const auto file_entry = SourceEntry{folder, EntryKind::kFile,
                                      "Some.Show.S01E01.mkv"};
  const auto first = fixture.reconciler().ProcessEntry(file_entry);
  const auto second = fixture.reconciler().ProcessEntry(FolderEntry(folder));

  EXPECT_EQ(EntryState::kLinked, first.state);
  EXPECT_EQ(EntryState::kSkipped, second.state);
  std::size_t links = 0;
  for (const auto &entry : std::filesystem::recursive_directory_iterator(
           tree.destination())) {
    links += entry.is_symlink() ? 1 : 0;
  }
  EXPECT_EQ(1u, links);
}

TEST(SymlinkReconcilerTest, SkipsArchivesAndRemembersThem) {
  test::TemporaryTree tree;
  const auto folder = tree.AddDirectory("source/Show.S01.720p");
  const auto archive = tree.AddFile("source/Show.S01.720p/show.s01.r00");
  tree.AddFile("source/Show.S01.720p/show.s01.rar");
  ReconcilerFixture fixture(tree);

  const auto report = fixture.reconciler().ProcessEntry(FolderEntry(folder));

  EXPECT_EQ(EntryState::kSkipped, report.state);
  EXPECT_THAT(report.links,
              Each(Field(&LinkOutcome::skip, SkipReason::kArchive)));
  EXPECT_TRUE(fixture.store().IsArchiveSkipped(archive));
  EXPECT_FALSE(std::filesystem::exists(tree.destination() / "Show"));

  fixture.reconciler().ProcessEntry(FolderEntry(folder));
  const auto log = test::ReadFile(fixture.store().SkippedArchiveLogPath());
  EXPECT_EQ(2, std::count(log.begin(), log.end(), '\n'));
}

TEST(SymlinkReconcilerTest, FilesWithoutSeasonMarkerAreSkipped) {
  test::TemporaryTree tree;
  const auto folder = tree.AddDirectory("source/Show.S01.720p");
  tree.AddFile("source/Show.S01.720p/Show.S01E01.mkv");
  tree.AddFile("source/Show.S01.720p/sample.mkv");
  ReconcilerFixture fixture(tree);

  const auto report = fixture.reconciler().ProcessEntry(FolderEntry(folder));

  EXPECT_EQ(EntryState::kLinked, report.state);
  EXPECT_THAT(report.links,
              Contains(Field(&LinkOutcome::skip, SkipReason::kNoSeasonMarker)));
}

TEST(SymlinkReconcilerTest, UnclassifiableFolderIsErrored) {
  test::TemporaryTree tree;
  const auto folder = tree.AddDirectory("source/Holiday Photos");
  tree.AddFile("source/Holiday Photos/S01.jpg");
  ReconcilerFixture fixture(tree);

  const auto report = fixture.reconciler().ProcessEntry(FolderEntry(folder));

  EXPECT_EQ(EntryState::kErrored, report.state);
  EXPECT_EQ("unable to determine series name", report.reason);
  EXPECT_TRUE(std::filesystem::is_empty(tree.destination()));
}

TEST(SymlinkReconcilerTest, FileModeRequiresEpisodeMarker) {
  test::TemporaryTree tree;
  const auto folder = tree.AddDirectory("source/Show.S01.720p");
  tree.AddFile("source/Show.S01.720p/Show.S01.extras.mkv");
  ReconcilerFixture fixture(tree);

  const auto report = fixture.reconciler().ProcessEntry(
      SourceEntry{folder, EntryKind::kFile, "Show.S01.extras.mkv"});

  EXPECT_EQ(EntryState::kErrored, report.state);
  EXPECT_TRUE(std::filesystem::is_empty(tree.destination()));
}

TEST(SymlinkReconcilerTest, LooseFilesLinkIntoDestinationRoot) {
  test::TemporaryTree tree;
  const auto file = tree.AddFile("source/Documentary.2020.mkv");
  ReconcilerFixture fixture(tree);

  const auto report = fixture.reconciler().ProcessEntry(
      SourceEntry{file, EntryKind::kLooseFile, {}});

  EXPECT_EQ(EntryState::kLinked, report.state);
  EXPECT_TRUE(
      std::filesystem::is_symlink(tree.destination() / "Documentary.2020.mkv"));
}

TEST(SymlinkReconcilerTest, ForeignFileAtDestinationIsReportedNotReplaced) {
  test::TemporaryTree tree;
  const auto folder = tree.AddDirectory("source/Show.S01.720p");
  tree.AddFile("source/Show.S01.720p/Show.S01E01.mkv");
  tree.AddFile("destination/Show/Season 01/Show.S01E01.mkv", "mine");
  ReconcilerFixture fixture(tree);

  const auto report = fixture.reconciler().ProcessEntry(FolderEntry(folder));

  EXPECT_EQ(EntryState::kErrored, report.state);
  EXPECT_EQ("mine", test::ReadFile(tree.destination() /
                                   "Show/Season 01/Show.S01E01.mkv"));
  EXPECT_FALSE(fixture.store().IsLinkTarget(folder / "Show.S01E01.mkv"));
}

TEST(SymlinkReconcilerTest, WorkerPoolProcessesEveryEntryInInputOrder) {
  test::TemporaryTree tree;
  std::vector<SourceEntry> entries;
  for (int show = 0; show < 12; ++show) {
    const auto name =
        std::string("Show") + static_cast<char>('A' + show) + ".S01.720p";
    entries.push_back(FolderEntry(tree.AddDirectory("source/" + name)));
    tree.AddFile("source/" + name + "/Show.S01E01.mkv");
    tree.AddFile("source/" + name + "/Show.S01E02.mkv");
  }
  // Two folders naming the same series race for one destination folder.
  entries.push_back(FolderEntry(tree.AddDirectory("source/Shared.S01.720p")));
  tree.AddFile("source/Shared.S01.720p/Shared.S01E01.mkv");
  entries.push_back(
      FolderEntry(tree.AddDirectory("source/Shared.S01.1080p")));
  tree.AddFile("source/Shared.S01.1080p/Shared.S01E02.mkv");

  ReconcilerFixture fixture(tree, ReconcilerOptions{4});
  const auto reports = fixture.reconciler().Run(entries);

  ASSERT_THAT(reports, SizeIs(entries.size()));
  for (std::size_t i = 0; i < entries.size(); ++i) {
    EXPECT_EQ(entries[i].path, reports[i].entry.path);
    EXPECT_EQ(EntryState::kLinked, reports[i].state) << entries[i].path;
  }
  EXPECT_TRUE(std::filesystem::is_symlink(
      tree.destination() / "Shared/Season 01/Shared.S01E01.mkv"));
  EXPECT_TRUE(std::filesystem::is_symlink(
      tree.destination() / "Shared/Season 01/Shared.S01E02.mkv"));
}

TEST(SymlinkReconcilerTest, StopRequestLeavesEntriesPending) {
  test::TemporaryTree tree;
  const auto folder = tree.AddDirectory("source/Show.S01.720p");
  tree.AddFile("source/Show.S01.720p/Show.S01E01.mkv");
  ReconcilerFixture fixture(tree);

  fixture.reconciler().RequestStop();
  const auto reports = fixture.reconciler().Run({FolderEntry(folder)});

  EXPECT_TRUE(fixture.reconciler().StopRequested());
  ASSERT_THAT(reports, SizeIs(1));
  EXPECT_EQ(EntryState::kPending, reports.front().state);
  EXPECT_TRUE(std::filesystem::is_empty(tree.destination()));
}

} // namespace
} // namespace showlink
