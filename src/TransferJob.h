#pragma once

#include "PathGuard.h"
#include "Transfer.h"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

struct TransferRequest {
  TransferOp operation{TransferOp::Copy};
  std::string sourcePath;
  std::string targetPath;
  std::vector<std::string> names;
  std::vector<std::string> overwriteNames;
};

struct PreparedItem {
  std::string name;
  std::filesystem::path source;
  std::filesystem::path target;
  NodeKind kind{NodeKind::File};
  bool targetExists{false};
  std::uint64_t units{0};
};

struct PreparedTransfer {
  std::vector<PreparedItem> items;
  std::uint64_t totalUnits{0};
};

// Validates every name, collapses duplicates (first occurrence wins) and
// drops overwrite names that are not selected.
OpResult NormalizeRequest(TransferRequest& request);

// Resolves paths and checks every item against the filesystem: existence,
// node kind, self-subtree and unapproved conflicts. Unit counting walks the
// source trees and can be skipped when only validating.
OpResult PrepareTransfer(const PathGuard& guard,
                         const TransferRequest& request,
                         bool countUnits,
                         PreparedTransfer& out);

// Prepares and executes one task. Progress and cancellation go through sink.
OpResult RunTransfer(const PathGuard& guard,
                     const TransferRequest& request,
                     ProgressSink& sink,
                     FsPrimitives primitives = FsPrimitives::Native());
