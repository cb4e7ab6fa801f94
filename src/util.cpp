#include "util.h"

#include <chrono>
#include <ctime>
#include <cstdio>

namespace fs = std::filesystem;

OpResult OkResult() { return {.ok = true}; }

OpResult FailResult(const wxString& message) {
  return {.ok = false, .failure = OpFailure::Failed, .message = message};
}

OpResult FailResult(const wxString& context, const std::error_code& ec) {
  const wxString reason = wxString::FromUTF8(ec.message());
  if (context.empty()) return FailResult(reason);
  return FailResult(context + ": " + reason);
}

OpResult CanceledResult() {
  return {.ok = false, .failure = OpFailure::Canceled, .message = "Task cancelled"};
}

OpResult SourceCleanupFailedResult(const fs::path& leftover, const std::error_code& ec) {
  return {.ok = false,
          .failure = OpFailure::SourceCleanupFailed,
          .message = "Failed to clean up source after move: " + wxString::FromUTF8(ec.message()),
          .path = leftover};
}

std::string ToUtf8(const wxString& s) {
  const auto buf = s.utf8_str();
  return std::string(buf.data(), buf.length());
}

wxString FromPath(const fs::path& p) { return wxString::FromUTF8(p.string()); }

std::string HumanSize(std::uintmax_t bytes) {
  static constexpr const char* units[] = {"B", "KB", "MB", "GB", "TB", "PB"};
  double value = static_cast<double>(bytes);
  int unit = 0;
  while (value >= 1024.0 && unit < 5) {
    value /= 1024.0;
    unit++;
  }
  char buf[64];
  if (unit == 0) {
    std::snprintf(buf, sizeof(buf), "%llu %s",
                  static_cast<unsigned long long>(bytes), units[unit]);
  } else {
    std::snprintf(buf, sizeof(buf), "%.1f %s", value, units[unit]);
  }
  return std::string(buf);
}

std::uint64_t NowMillis() {
  using namespace std::chrono;
  return static_cast<std::uint64_t>(
      duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

std::string NowTimestamp() {
  const auto ms = NowMillis();
  const std::time_t tt = static_cast<std::time_t>(ms / 1000);
  std::tm tm{};
  gmtime_r(&tt, &tm);

  char buf[64];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec,
                static_cast<int>(ms % 1000));
  return std::string(buf);
}

std::string ToBase36(std::uint64_t value) {
  static constexpr const char* digits = "0123456789abcdefghijklmnopqrstuvwxyz";
  if (value == 0) return "0";
  std::string out;
  while (value > 0) {
    out.insert(out.begin(), digits[value % 36]);
    value /= 36;
  }
  return out;
}
