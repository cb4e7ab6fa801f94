#include "Trash.h"

#include "Transfer.h"

#include <wx/fileconf.h>
#include <wx/log.h>

#include <algorithm>
#include <cstdio>

namespace fs = std::filesystem;

namespace {
constexpr const char* kInfoPathKey = "/TrashInfo/Path";
constexpr const char* kInfoDateKey = "/TrashInfo/DeletionDate";
constexpr const char* kInfoTrashPathKey = "/TrashInfo/TrashPath";

bool IsUnder(const std::string& normalized, const std::string& dir) {
  return normalized == dir || normalized.rfind(dir + "/", 0) == 0;
}

// 64-bit FNV-1a in hex. Fixed length, so any entry name that fits in files/
// also gets a metadata file. The trash path is stored inside to catch
// collisions.
std::string MetadataName(const std::string& trashPath) {
  std::uint64_t hash = 14695981039346656037ull;
  for (unsigned char c : trashPath) {
    hash ^= c;
    hash *= 1099511628211ull;
  }
  char buf[17];
  std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(hash));
  return buf;
}

void SplitExtension(const std::string& name, std::string& base, std::string& ext) {
  const auto dot = name.rfind('.');
  if (dot == std::string::npos || dot == 0) {
    base = name;
    ext.clear();
    return;
  }
  base = name.substr(0, dot);
  ext = name.substr(dot);
}

OpResult WalkImpact(const fs::path& dir, DeleteImpact& out) {
  std::error_code ec;
  for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
    std::error_code stEc;
    const auto st = it->symlink_status(stEc);
    if (stEc) return FailResult(FromPath(it->path()), stEc);

    if (fs::is_directory(st)) {
      out.directoryCount += 1;
      const auto res = WalkImpact(it->path(), out);
      if (!res.ok) return res;
      continue;
    }

    out.fileCount += 1;
    if (fs::is_regular_file(st)) {
      const auto size = fs::file_size(it->path(), stEc);
      if (!stEc) out.totalBytes += size;
    }
  }
  if (ec) return FailResult(FromPath(dir), ec);
  return OkResult();
}
}  // namespace

Trash::Trash(PathGuard guard) : guard_(std::move(guard)) {}

bool Trash::IsInsideTrash(const std::string& relativePath) {
  return IsUnder(NormalizeRelativePath(relativePath), kRootDir);
}

bool Trash::IsInsideTrashFiles(const std::string& relativePath) {
  return IsUnder(NormalizeRelativePath(relativePath), kFilesDir);
}

OpResult Trash::EnsureDirectories() const {
  for (const char* dir : {kFilesDir, kMetaDir}) {
    fs::path abs;
    auto res = guard_.Resolve(dir, abs);
    if (!res.ok) return res;
    std::error_code ec;
    fs::create_directories(abs, ec);
    if (ec) return FailResult("Cannot create trash directory", ec);
  }
  return OkResult();
}

fs::path Trash::MetadataPath(const std::string& trashPath) const {
  const auto name = MetadataName(NormalizeRelativePath(trashPath)) + ".trashinfo";
  return guard_.Root() / kMetaDir / name;
}

OpResult Trash::AvailableTrashPath(const std::string& name, std::string& out) const {
  std::string base;
  std::string ext;
  SplitExtension(name, base, ext);

  for (std::uint64_t attempt = 0;; ++attempt) {
    const auto candidate =
        attempt == 0 ? name : base + " (" + std::to_string(attempt) + ")" + ext;
    const auto rel = JoinRelativePath(kFilesDir, candidate);
    fs::path abs;
    auto res = guard_.Resolve(rel, abs);
    if (!res.ok) return res;
    if (!PathExists(abs)) {
      out = rel;
      return OkResult();
    }
  }
}

OpResult Trash::WriteMetadata(const std::string& trashPath, const std::string& originalPath) const {
  const auto file = MetadataPath(trashPath);
  wxFileConfig info(wxEmptyString, wxEmptyString, FromPath(file), wxEmptyString,
                    wxCONFIG_USE_LOCAL_FILE);
  info.SetExpandEnvVars(false);

  const auto normalized = NormalizeRelativePath(trashPath);
  wxString owner;
  if (info.Read(kInfoTrashPathKey, &owner) && ToUtf8(owner) != normalized) {
    return FailResult("Trash metadata name collision for " + wxString::FromUTF8(normalized));
  }

  info.Write(kInfoTrashPathKey, wxString::FromUTF8(normalized));
  info.Write(kInfoPathKey, wxString::FromUTF8(NormalizeRelativePath(originalPath)));
  info.Write(kInfoDateKey, wxString::FromUTF8(NowTimestamp()));
  if (!info.Flush()) return FailResult("Cannot write trash metadata for " + wxString::FromUTF8(trashPath));
  return OkResult();
}

OpResult Trash::RemoveMetadata(const std::string& trashPath) const {
  std::error_code ec;
  fs::remove(MetadataPath(trashPath), ec);
  if (ec) return FailResult("Cannot remove trash metadata", ec);
  return OkResult();
}

OpResult Trash::ReadEntry(const std::string& trashPath, std::optional<TrashEntry>& out) const {
  out.reset();
  const auto normalized = NormalizeRelativePath(trashPath);
  const auto file = MetadataPath(normalized);
  if (!PathExists(file)) return OkResult();

  wxFileConfig info(wxEmptyString, wxEmptyString, FromPath(file), wxEmptyString,
                    wxCONFIG_USE_LOCAL_FILE);
  info.SetExpandEnvVars(false);

  wxString owner;
  if (info.Read(kInfoTrashPathKey, &owner) && ToUtf8(owner) != normalized) return OkResult();

  wxString original;
  wxString deletedAt;
  info.Read(kInfoPathKey, &original);
  info.Read(kInfoDateKey, &deletedAt);

  TrashEntry entry;
  entry.trashPath = normalized;
  entry.originalPath = NormalizeRelativePath(ToUtf8(original));
  entry.deletedAt = ToUtf8(deletedAt);
  out = std::move(entry);
  return OkResult();
}

OpResult Trash::Delete(const std::string& path, const std::string& name, DeleteOutcome& out) const {
  out = {};
  auto res = ValidateEntryName(name);
  if (!res.ok) return res;

  fs::path target;
  res = guard_.Resolve(JoinRelativePath(path, name), target);
  if (!res.ok) return res;
  // Classify by the resolved location so "x/../.tandem-trash" is the trash too.
  const auto rel = guard_.Relative(target);
  if (rel == kRootDir || rel == kFilesDir || rel == kMetaDir) {
    return FailResult("Cannot delete the trash directory");
  }
  if (!PathExists(target)) {
    return FailResult(wxString::Format("\"%s\" does not exist", wxString::FromUTF8(name)));
  }

  if (IsInsideTrash(rel)) {
    res = RemoveNode(target);
    if (!res.ok) return res;
    if (IsInsideTrashFiles(rel)) {
      res = RemoveMetadata(rel);
      if (!res.ok) wxLogWarning("%s", res.message);
    }
    out.permanent = true;
    wxLogMessage("Permanently deleted %s", wxString::FromUTF8(rel));
    return OkResult();
  }

  res = EnsureDirectories();
  if (!res.ok) return res;

  std::string trashRel;
  res = AvailableTrashPath(name, trashRel);
  if (!res.ok) return res;
  const auto trashAbs = guard_.Root() / trashRel;

  std::error_code ec;
  fs::rename(target, trashAbs, ec);
  if (ec) return FailResult(wxString::Format("Cannot move \"%s\" to trash", wxString::FromUTF8(name)), ec);

  res = WriteMetadata(trashRel, rel);
  if (!res.ok) {
    std::error_code undo;
    fs::rename(trashAbs, target, undo);
    if (undo) {
      wxLogError("Could not put %s back from trash: %s", wxString::FromUTF8(rel),
                 wxString::FromUTF8(undo.message()));
    }
    return res;
  }

  out.trashPath = trashRel;
  wxLogMessage("Moved %s to trash as %s", wxString::FromUTF8(rel), wxString::FromUTF8(trashRel));
  return OkResult();
}

OpResult Trash::Restore(const std::string& trashPath, std::string& restoredPath) const {
  restoredPath.clear();
  if (trashPath.empty()) return FailResult("trashPath is required");

  fs::path source;
  auto res = guard_.Resolve(trashPath, source);
  if (!res.ok) return res;
  const auto normalized = guard_.Relative(source);
  if (!IsInsideTrashFiles(normalized) || normalized == kFilesDir) {
    return FailResult("trashPath must be inside trash files");
  }

  std::optional<TrashEntry> entry;
  res = ReadEntry(normalized, entry);
  if (!res.ok) return res;
  if (!entry) return FailResult("Trash metadata not found");
  if (entry->originalPath.empty()) return FailResult("Invalid trash metadata");

  fs::path target;
  res = guard_.Resolve(entry->originalPath, target);
  if (!res.ok) return res;
  if (IsInsideTrash(guard_.Relative(target))) {
    return FailResult("Cannot restore item to trash path");
  }

  if (!PathExists(source)) return FailResult("Trash item no longer exists");
  if (PathExists(target)) {
    return FailResult(
        wxString::Format("\"%s\" already exists", FromPath(target.filename())));
  }

  std::error_code ec;
  fs::create_directories(target.parent_path(), ec);
  if (ec) return FailResult("Cannot recreate parent directory", ec);
  fs::rename(source, target, ec);
  if (ec) return FailResult("Cannot restore item", ec);

  res = RemoveMetadata(normalized);
  if (!res.ok) wxLogWarning("%s", res.message);

  restoredPath = guard_.Relative(target);
  wxLogMessage("Restored %s from trash", wxString::FromUTF8(restoredPath));
  return OkResult();
}

OpResult Trash::Empty() const {
  for (const char* dir : {kFilesDir, kMetaDir}) {
    fs::path abs;
    auto res = guard_.Resolve(dir, abs);
    if (!res.ok) return res;
    std::error_code ec;
    fs::remove_all(abs, ec);
    if (ec) return FailResult("Cannot empty trash", ec);
  }
  auto res = EnsureDirectories();
  if (!res.ok) return res;
  wxLogMessage("Trash emptied");
  return OkResult();
}

OpResult Trash::List(std::vector<TrashEntry>& out) const {
  out.clear();
  auto res = EnsureDirectories();
  if (!res.ok) return res;

  const auto filesDir = guard_.Root() / kFilesDir;
  std::error_code ec;
  for (fs::directory_iterator it(filesDir, ec), end; !ec && it != end; it.increment(ec)) {
    const auto rel = JoinRelativePath(kFilesDir, it->path().filename().string());
    std::optional<TrashEntry> entry;
    res = ReadEntry(rel, entry);
    if (!res.ok) return res;
    out.push_back(entry ? *entry : TrashEntry{.trashPath = rel});
  }
  if (ec) return FailResult("Cannot list trash", ec);

  std::sort(out.begin(), out.end(),
            [](const TrashEntry& a, const TrashEntry& b) { return a.trashPath < b.trashPath; });
  return OkResult();
}

OpResult Trash::MeasureDeleteImpact(const std::string& path,
                                    const std::string& name,
                                    DeleteImpact& out) const {
  out = {};
  auto res = ValidateEntryName(name);
  if (!res.ok) return res;

  fs::path target;
  res = guard_.Resolve(JoinRelativePath(path, name), target);
  if (!res.ok) return res;

  std::error_code ec;
  const auto st = fs::symlink_status(target, ec);
  if (st.type() == fs::file_type::not_found) {
    return FailResult(wxString::Format("\"%s\" does not exist", wxString::FromUTF8(name)));
  }
  if (ec) return FailResult(FromPath(target), ec);

  out.targetName = name;
  if (!fs::is_directory(st)) {
    out.fileCount = 1;
    if (fs::is_regular_file(st)) {
      const auto size = fs::file_size(target, ec);
      if (!ec) out.totalBytes = size;
    }
    return OkResult();
  }

  out.isDirectory = true;
  out.directoryCount = 1;
  return WalkImpact(target, out);
}
