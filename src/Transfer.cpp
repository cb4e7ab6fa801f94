#include "Transfer.h"

#include "PathGuard.h"

#include <algorithm>

namespace fs = std::filesystem;

namespace {
wxString Quoted(const std::string& s) { return "\"" + wxString::FromUTF8(s) + "\""; }

OpResult KindFromStatus(const fs::file_status& st, const fs::path& p, NodeKind& kind) {
  if (fs::is_symlink(st)) {
    kind = NodeKind::Symlink;
    return OkResult();
  }
  if (fs::is_directory(st)) {
    kind = NodeKind::Directory;
    return OkResult();
  }
  if (fs::is_regular_file(st)) {
    kind = NodeKind::File;
    return OkResult();
  }
  return FailResult("Unsupported file type: " + Quoted(p.filename().string()));
}

OpResult CountDirectoryUnits(const fs::path& dir, std::uint64_t& units) {
  units += 1;
  std::error_code ec;
  for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
    std::error_code stEc;
    const auto st = it->symlink_status(stEc);
    if (stEc) return FailResult(FromPath(it->path()), stEc);

    NodeKind kind{NodeKind::File};
    const auto res = KindFromStatus(st, it->path(), kind);
    if (!res.ok) return res;

    if (kind == NodeKind::Directory) {
      const auto sub = CountDirectoryUnits(it->path(), units);
      if (!sub.ok) return sub;
      continue;
    }
    units += 1;
  }
  if (ec) return FailResult(FromPath(dir), ec);
  return OkResult();
}

OpResult CopySymlink(const fs::path& src, const fs::path& dst, const std::string& rel) {
  std::error_code ec;
  const auto target = fs::read_symlink(src, ec);
  if (ec) return FailResult("Cannot read link " + Quoted(rel), ec);
  fs::create_symlink(target, dst, ec);
  if (ec) return FailResult("Cannot create link " + Quoted(rel), ec);
  return OkResult();
}
}  // namespace

const char* TransferOpName(TransferOp op) {
  switch (op) {
    case TransferOp::Copy: return "copy";
    case TransferOp::Move: return "move";
  }
  return "copy";
}

FsPrimitives FsPrimitives::Native() {
  FsPrimitives p;
  p.rename = [](const fs::path& from, const fs::path& to, std::error_code& ec) {
    fs::rename(from, to, ec);
  };
  p.removeAll = [](const fs::path& target, std::error_code& ec) { fs::remove_all(target, ec); };
  return p;
}

OpResult NodeKindOf(const fs::path& p, NodeKind& kind) {
  std::error_code ec;
  const auto st = fs::symlink_status(p, ec);
  if (st.type() == fs::file_type::not_found) {
    return FailResult(Quoted(p.filename().string()) + " does not exist");
  }
  if (ec) return FailResult(FromPath(p), ec);
  return KindFromStatus(st, p, kind);
}

OpResult CountTransferUnits(const fs::path& src, NodeKind kind, std::uint64_t& units) {
  if (kind != NodeKind::Directory) {
    units = 1;
    return OkResult();
  }
  units = 0;
  return CountDirectoryUnits(src, units);
}

OpResult RemoveNode(const fs::path& p) {
  std::error_code ec;
  const auto st = fs::symlink_status(p, ec);
  if (ec) return FailResult(FromPath(p), ec);
  if (fs::is_directory(st)) {
    fs::remove_all(p, ec);
  } else {
    fs::remove(p, ec);
  }
  if (ec) return FailResult(FromPath(p), ec);
  return OkResult();
}

TransferEngine::TransferEngine(TransferOp op,
                               ProgressSink& sink,
                               std::uint64_t totalUnits,
                               FsPrimitives primitives)
    : op_(op), sink_(sink), total_(totalUnits), fs_(std::move(primitives)) {}

OpResult TransferEngine::Begin() { return sink_.OnProgress(processed_, total_, {}); }

OpResult TransferEngine::Finish() { return sink_.OnProgress(processed_, total_, {}); }

OpResult TransferEngine::Transfer(const fs::path& src,
                                  const fs::path& dst,
                                  NodeKind kind,
                                  const std::string& relativePath,
                                  std::uint64_t subtreeUnits) {
  // Avoid pathological case: copying a directory into itself/subdirectory.
  if (kind == NodeKind::Directory && IsSubPath(src, dst)) {
    return FailResult(wxString::Format("Cannot %s %s into its own subdirectory",
                                       TransferOpName(op_), Quoted(relativePath)));
  }

  switch (op_) {
    case TransferOp::Copy: return CopyNode(src, dst, kind, relativePath);
    case TransferOp::Move: return MoveNode(src, dst, kind, relativePath, subtreeUnits);
  }
  return FailResult("Unknown operation");
}

OpResult TransferEngine::MarkProgress(const std::string& currentItem, std::uint64_t increment) {
  processed_ = std::min(total_, processed_ + std::max<std::uint64_t>(1, increment));
  return sink_.OnProgress(processed_, total_, currentItem);
}

OpResult TransferEngine::CopyNode(const fs::path& src,
                                  const fs::path& dst,
                                  NodeKind kind,
                                  const std::string& relativePath) {
  if (IsCanceled()) return CanceledResult();

  std::error_code ec;
  switch (kind) {
    case NodeKind::File:
      // copy_options::none refuses an existing destination.
      fs::copy_file(src, dst, fs::copy_options::none, ec);
      if (ec) return FailResult("Cannot copy " + Quoted(relativePath), ec);
      return MarkProgress(relativePath);

    case NodeKind::Symlink: {
      const auto res = CopySymlink(src, dst, relativePath);
      if (!res.ok) return res;
      return MarkProgress(relativePath);
    }

    case NodeKind::Directory:
      break;
  }

  if (!fs::create_directory(dst, ec)) {
    if (ec) return FailResult("Cannot create directory " + Quoted(relativePath), ec);
    return FailResult(Quoted(relativePath) + " already exists in target directory");
  }
  auto res = MarkProgress(relativePath);
  if (!res.ok) return res;

  for (fs::directory_iterator it(src, ec), end; !ec && it != end; it.increment(ec)) {
    const auto name = it->path().filename().string();
    const auto childRel = JoinRelativePath(relativePath, name);

    std::error_code stEc;
    const auto st = it->symlink_status(stEc);
    if (stEc) return FailResult(Quoted(childRel), stEc);

    NodeKind childKind{NodeKind::File};
    res = KindFromStatus(st, it->path(), childKind);
    if (!res.ok) return res;

    res = CopyNode(it->path(), dst / name, childKind, childRel);
    if (!res.ok) return res;
  }
  if (ec) return FailResult("Cannot read directory " + Quoted(relativePath), ec);
  return OkResult();
}

OpResult TransferEngine::MoveNode(const fs::path& src,
                                  const fs::path& dst,
                                  NodeKind kind,
                                  const std::string& relativePath,
                                  std::uint64_t subtreeUnits) {
  if (IsCanceled()) return CanceledResult();

  std::error_code ec;
  fs_.rename(src, dst, ec);
  if (!ec) return MarkProgress(relativePath, subtreeUnits);
  if (ec != std::errc::cross_device_link) return FailResult("Cannot move " + Quoted(relativePath), ec);

  // Cross-device moves can fail; fall back to copy+delete.
  switch (kind) {
    case NodeKind::File:
      ec.clear();
      fs::copy_file(src, dst, fs::copy_options::none, ec);
      if (ec) return FailResult("Cannot copy " + Quoted(relativePath), ec);
      break;

    case NodeKind::Symlink: {
      const auto res = CopySymlink(src, dst, relativePath);
      if (!res.ok) return res;
      break;
    }

    case NodeKind::Directory: {
      const auto res = CopyNode(src, dst, kind, relativePath);
      if (!res.ok) return res;
      break;
    }
  }

  ec.clear();
  fs_.removeAll(src, ec);
  if (ec) return SourceCleanupFailedResult(src, ec);

  if (kind == NodeKind::Directory) return OkResult();
  return MarkProgress(relativePath);
}
