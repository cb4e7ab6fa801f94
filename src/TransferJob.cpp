#include "TransferJob.h"

#include "Overwrite.h"

#include <algorithm>
#include <unordered_set>

namespace fs = std::filesystem;

namespace {
bool IsDirectory(const fs::path& p) {
  std::error_code ec;
  return fs::is_directory(p, ec);
}

std::vector<std::string> Dedupe(const std::vector<std::string>& names) {
  std::unordered_set<std::string> seen;
  std::vector<std::string> out;
  for (const auto& name : names) {
    if (seen.insert(name).second) out.push_back(name);
  }
  return out;
}
}  // namespace

OpResult NormalizeRequest(TransferRequest& request) {
  for (const auto& name : request.names) {
    const auto res = ValidateEntryName(name);
    if (!res.ok) return res;
  }
  for (const auto& name : request.overwriteNames) {
    const auto res = ValidateEntryName(name);
    if (!res.ok) return res;
  }

  request.names = Dedupe(request.names);
  if (request.names.empty()) return FailResult("No files selected");

  std::vector<std::string> approved;
  for (const auto& name : Dedupe(request.overwriteNames)) {
    if (std::find(request.names.begin(), request.names.end(), name) != request.names.end()) {
      approved.push_back(name);
    }
  }
  request.overwriteNames = std::move(approved);
  return OkResult();
}

OpResult PrepareTransfer(const PathGuard& guard,
                         const TransferRequest& request,
                         bool countUnits,
                         PreparedTransfer& out) {
  out = {};

  fs::path sourceDir;
  auto res = guard.Resolve(request.sourcePath, sourceDir);
  if (!res.ok) return res;
  fs::path targetDir;
  res = guard.Resolve(request.targetPath, targetDir);
  if (!res.ok) return res;

  if (!IsDirectory(sourceDir)) return FailResult("Source path must be a directory");
  if (!IsDirectory(targetDir)) return FailResult("Target path must be a directory");
  if (request.names.empty()) return FailResult("No files selected");
  if (sourceDir == targetDir) return FailResult("Source and target directories cannot be the same");

  const std::unordered_set<std::string> overwrite(request.overwriteNames.begin(),
                                                  request.overwriteNames.end());

  for (const auto& name : request.names) {
    res = ValidateEntryName(name);
    if (!res.ok) return res;

    PreparedItem item;
    item.name = name;
    item.source = sourceDir / name;
    item.target = targetDir / name;

    if (!PathExists(item.source)) {
      return FailResult(wxString::Format("\"%s\" does not exist", wxString::FromUTF8(name)));
    }
    res = NodeKindOf(item.source, item.kind);
    if (!res.ok) return res;

    if (item.kind == NodeKind::Directory && IsSubPath(item.source, item.target)) {
      return FailResult(wxString::Format("Cannot %s \"%s\" into its own subdirectory",
                                         TransferOpName(request.operation),
                                         wxString::FromUTF8(name)));
    }

    item.targetExists = PathExists(item.target);
    if (item.targetExists && !overwrite.count(name)) {
      return FailResult(
          wxString::Format("\"%s\" already exists in target directory", wxString::FromUTF8(name)));
    }

    if (countUnits) {
      res = CountTransferUnits(item.source, item.kind, item.units);
      if (!res.ok) return res;
      out.totalUnits += item.units;
    }
    out.items.push_back(std::move(item));
  }
  return OkResult();
}

OpResult RunTransfer(const PathGuard& guard,
                     const TransferRequest& request,
                     ProgressSink& sink,
                     FsPrimitives primitives) {
  PreparedTransfer prepared;
  auto res = PrepareTransfer(guard, request, true, prepared);
  if (!res.ok) return res;

  TransferEngine engine(request.operation, sink, prepared.totalUnits, std::move(primitives));
  res = engine.Begin();
  if (!res.ok) return res;

  for (const auto& item : prepared.items) {
    if (sink.ShouldCancel()) return CanceledResult();

    if (item.targetExists) {
      res = TransferWithOverwrite(engine, item.source, item.target, item.kind, item.name, item.units);
    } else {
      res = engine.Transfer(item.source, item.target, item.kind, item.name, item.units);
    }
    if (!res.ok) return res;
  }
  return engine.Finish();
}
