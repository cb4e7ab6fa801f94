#pragma once

#include "util.h"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <system_error>

enum class TransferOp { Copy, Move };
enum class NodeKind { File, Directory, Symlink };

const char* TransferOpName(TransferOp op);

// The two primitives whose failure modes cannot be produced on a single volume.
// Everything else goes straight to std::filesystem.
struct FsPrimitives {
  std::function<void(const std::filesystem::path& from, const std::filesystem::path& to,
                     std::error_code& ec)>
      rename{};
  std::function<void(const std::filesystem::path& p, std::error_code& ec)> removeAll{};

  static FsPrimitives Native();
};

// Receives progress from a running transfer. OnProgress is called after the
// unit exists at the destination and must persist before it returns; the
// engine does not touch the next unit until then.
class ProgressSink {
public:
  virtual ~ProgressSink() = default;

  virtual bool ShouldCancel() = 0;
  // currentItem is the source-relative path of the unit, empty when idle.
  virtual OpResult OnProgress(std::uint64_t processed,
                              std::uint64_t total,
                              const std::string& currentItem) = 0;
};

OpResult NodeKindOf(const std::filesystem::path& p, NodeKind& kind);

// One unit per file, symlink and directory node in the subtree.
OpResult CountTransferUnits(const std::filesystem::path& src, NodeKind kind, std::uint64_t& units);

OpResult RemoveNode(const std::filesystem::path& p);

// Copies or moves entries for one task. Counts units across every Transfer()
// call so progress is reported against the task total.
class TransferEngine final {
public:
  TransferEngine(TransferOp op,
                 ProgressSink& sink,
                 std::uint64_t totalUnits,
                 FsPrimitives primitives = FsPrimitives::Native());

  OpResult Begin();
  OpResult Transfer(const std::filesystem::path& src,
                    const std::filesystem::path& dst,
                    NodeKind kind,
                    const std::string& relativePath,
                    std::uint64_t subtreeUnits);
  OpResult Finish();

  TransferOp Operation() const { return op_; }
  std::uint64_t Processed() const { return processed_; }
  std::uint64_t Total() const { return total_; }

private:
  OpResult CopyNode(const std::filesystem::path& src,
                    const std::filesystem::path& dst,
                    NodeKind kind,
                    const std::string& relativePath);
  OpResult MoveNode(const std::filesystem::path& src,
                    const std::filesystem::path& dst,
                    NodeKind kind,
                    const std::string& relativePath,
                    std::uint64_t subtreeUnits);
  OpResult MarkProgress(const std::string& currentItem, std::uint64_t increment = 1);
  bool IsCanceled() { return sink_.ShouldCancel(); }

  TransferOp op_;
  ProgressSink& sink_;
  std::uint64_t total_{0};
  std::uint64_t processed_{0};
  FsPrimitives fs_;
};
