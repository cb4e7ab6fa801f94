#include "Overwrite.h"

#include "PathGuard.h"

#include <wx/log.h>

namespace fs = std::filesystem;

namespace {
constexpr int kMaxBackupAttempts = 1000;
}  // namespace

std::vector<std::string> FindExistingNames(const fs::path& targetDir,
                                           const std::vector<std::string>& names) {
  std::vector<std::string> existing;
  for (const auto& name : names) {
    if (PathExists(targetDir / name)) existing.push_back(name);
  }
  return existing;
}

OpResult MakeBackupPath(const fs::path& target, fs::path& backup) {
  const auto stamp = ToBase36(NowMillis());
  for (int attempt = 0; attempt < kMaxBackupAttempts; ++attempt) {
    const auto candidate =
        target.parent_path() / (".tandem-backup-" + stamp + "-" + ToBase36(attempt));
    if (!PathExists(candidate)) {
      backup = candidate;
      return OkResult();
    }
  }
  return FailResult("Could not reserve a backup name for \"" + FromPath(target.filename()) + "\"");
}

OpResult TransferWithOverwrite(TransferEngine& engine,
                               const fs::path& src,
                               const fs::path& dst,
                               NodeKind kind,
                               const std::string& name,
                               std::uint64_t units) {
  fs::path backup;
  auto res = MakeBackupPath(dst, backup);
  if (!res.ok) return res;

  std::error_code ec;
  fs::rename(dst, backup, ec);
  if (ec) return FailResult("Cannot back up \"" + wxString::FromUTF8(name) + "\"", ec);

  const auto result = engine.Transfer(src, dst, kind, name, units);

  switch (result.failure) {
    case OpFailure::None: {
      const auto cleanup = RemoveNode(backup);
      if (!cleanup.ok) {
        wxLogWarning("Could not remove overwrite backup %s: %s", FromPath(backup), cleanup.message);
      }
      return result;
    }

    case OpFailure::SourceCleanupFailed:
      if (engine.Operation() == TransferOp::Move && PathExists(dst)) {
        const auto cleanup = RemoveNode(backup);
        if (!cleanup.ok) {
          wxLogWarning("Could not remove overwrite backup %s: %s", FromPath(backup), cleanup.message);
        }
        return FailResult(result.message + ". Destination data was kept to avoid data loss.");
      }
      break;

    case OpFailure::Failed:
    case OpFailure::Canceled:
      break;
  }

  if (PathExists(dst)) {
    const auto partial = RemoveNode(dst);
    if (!partial.ok) {
      wxLogError("Could not remove partial %s; backup left at %s", FromPath(dst), FromPath(backup));
      return result;
    }
  }
  fs::rename(backup, dst, ec);
  if (ec) {
    wxLogError("Could not restore %s from backup %s: %s", FromPath(dst), FromPath(backup),
               wxString::FromUTF8(ec.message()));
  }
  return result;
}
