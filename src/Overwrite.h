#pragma once

#include "Transfer.h"

#include <filesystem>
#include <string>
#include <vector>

// Names from `names` that already exist (lstat) directly inside targetDir,
// in request order.
std::vector<std::string> FindExistingNames(const std::filesystem::path& targetDir,
                                           const std::vector<std::string>& names);

// A free sibling of `target` named .tandem-backup-<ms>-<attempt>.
OpResult MakeBackupPath(const std::filesystem::path& target, std::filesystem::path& backup);

// Replaces an existing `dst` with `src`. The existing entry is renamed aside
// first and put back if the transfer fails, unless a move already removed
// part of the source and only the destination holds the data.
OpResult TransferWithOverwrite(TransferEngine& engine,
                               const std::filesystem::path& src,
                               const std::filesystem::path& dst,
                               NodeKind kind,
                               const std::string& name,
                               std::uint64_t units);
