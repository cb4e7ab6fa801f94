#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <system_error>

#include <wx/string.h>

// Why an operation did not complete. Callers switch on this instead of
// inspecting messages.
enum class OpFailure { None, Failed, Canceled, SourceCleanupFailed };

struct OpResult {
  bool ok{false};
  OpFailure failure{OpFailure::None};
  wxString message;
  // SourceCleanupFailed: the source entry that could not be removed after its copy.
  std::filesystem::path path{};
};

OpResult OkResult();
OpResult FailResult(const wxString& message);
OpResult FailResult(const wxString& context, const std::error_code& ec);
OpResult CanceledResult();
OpResult SourceCleanupFailedResult(const std::filesystem::path& leftover, const std::error_code& ec);

std::string ToUtf8(const wxString& s);
wxString FromPath(const std::filesystem::path& p);

std::string HumanSize(std::uintmax_t bytes);

// ISO 8601 UTC with milliseconds, e.g. 2026-10-19T08:30:12.123Z.
std::string NowTimestamp();

std::string ToBase36(std::uint64_t value);
std::uint64_t NowMillis();
