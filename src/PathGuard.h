#pragma once

#include "util.h"

#include <filesystem>
#include <string>

// Maps root-relative paths onto the filesystem and refuses anything that would
// resolve outside the root.
class PathGuard final {
public:
  explicit PathGuard(const std::filesystem::path& root);

  const std::filesystem::path& Root() const { return root_; }

  // Leading separators are ignored, so "/Documents" and "Documents" name the
  // same entry. Resolution is lexical; symlinks are not followed.
  OpResult Resolve(const std::string& relative, std::filesystem::path& out) const;

  // Inverse of Resolve for paths already inside the root ("" for the root itself).
  std::string Relative(const std::filesystem::path& absolute) const;

private:
  std::filesystem::path root_;
};

// Forward slashes only, no leading/trailing/duplicate separators.
std::string NormalizeRelativePath(const std::string& value);
std::string JoinRelativePath(const std::string& base, const std::string& name);

// A single directory entry name: non-empty, not "." or "..", no separators.
OpResult ValidateEntryName(const std::string& name);

// True when candidate lies strictly below parent.
bool IsSubPath(const std::filesystem::path& parent, const std::filesystem::path& candidate);

// lstat-style existence check: a dangling symlink exists.
bool PathExists(const std::filesystem::path& p);
