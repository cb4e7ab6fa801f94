#pragma once

#include "PathGuard.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

struct TrashEntry {
  std::string trashPath;     // root-relative, inside .tandem-trash/files
  std::string originalPath;  // empty when the metadata is missing
  std::string deletedAt;
};

struct DeleteOutcome {
  bool permanent{false};
  std::string trashPath{};  // soft deletes only
};

struct DeleteImpact {
  std::string targetName;
  bool isDirectory{false};
  std::uint64_t fileCount{0};
  std::uint64_t directoryCount{0};
  std::uint64_t totalBytes{0};

  std::uint64_t TotalItems() const { return fileCount + directoryCount; }
};

// Soft-delete store under <root>/.tandem-trash. Trashed entries live in
// files/, one .trashinfo per entry in meta/ records where it came from.
class Trash final {
public:
  static constexpr const char* kRootDir = ".tandem-trash";
  static constexpr const char* kFilesDir = ".tandem-trash/files";
  static constexpr const char* kMetaDir = ".tandem-trash/meta";

  explicit Trash(PathGuard guard);

  static bool IsInsideTrash(const std::string& relativePath);
  static bool IsInsideTrashFiles(const std::string& relativePath);

  OpResult EnsureDirectories() const;

  // Outside the trash the entry is moved into files/; inside it is removed
  // for good.
  OpResult Delete(const std::string& path, const std::string& name, DeleteOutcome& out) const;
  OpResult Restore(const std::string& trashPath, std::string& restoredPath) const;
  OpResult Empty() const;
  OpResult List(std::vector<TrashEntry>& out) const;
  OpResult ReadEntry(const std::string& trashPath, std::optional<TrashEntry>& out) const;

  OpResult MeasureDeleteImpact(const std::string& path,
                               const std::string& name,
                               DeleteImpact& out) const;

private:
  std::filesystem::path MetadataPath(const std::string& trashPath) const;
  OpResult AvailableTrashPath(const std::string& name, std::string& out) const;
  OpResult WriteMetadata(const std::string& trashPath, const std::string& originalPath) const;
  OpResult RemoveMetadata(const std::string& trashPath) const;

  PathGuard guard_;
};
