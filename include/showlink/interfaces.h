#pragma once

#include <filesystem>
#include <set>
#include <vector>

namespace showlink {

class IndexStore {
public:
  virtual ~IndexStore() = default;

  virtual std::set<std::filesystem::path>
  RebuildFolderIndex(const std::filesystem::path &destination_root) = 0;
  virtual std::set<std::filesystem::path>
  RebuildLinkIndex(const std::filesystem::path &destination_root) = 0;

  virtual bool IsKnownFolder(const std::filesystem::path &folder) const = 0;
  virtual std::vector<std::filesystem::path> KnownFolders() const = 0;
  // Compare-and-insert; true when `folder` was not known before.
  virtual bool RecordNewFolder(const std::filesystem::path &folder) = 0;

  virtual bool IsLinkTarget(const std::filesystem::path &target) const = 0;
  // Compare-and-insert; false means another link already owns `target`.
  virtual bool ClaimLinkTarget(const std::filesystem::path &target) = 0;
  virtual void CommitLinkTarget(const std::filesystem::path &target) = 0;
  virtual void ReleaseLinkTarget(const std::filesystem::path &target) = 0;

  virtual bool IsArchiveSkipped(const std::filesystem::path &archive) const = 0;
  virtual bool RecordSkippedArchive(const std::filesystem::path &archive) = 0;
};

} // namespace showlink
