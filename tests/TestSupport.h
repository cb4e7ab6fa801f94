#pragma once

#include "Transfer.h"
#include "util.h"

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

#include <unistd.h>

#include <wx/init.h>
#include <wx/log.h>

static int tests_passed = 0;
static int tests_failed = 0;

#define TEST(name) void test_##name()
#define RUN_TEST(name)                                                                             \
  do {                                                                                             \
    printf("  %-48s", #name);                                                                      \
    fflush(stdout);                                                                                \
    try {                                                                                          \
      test_##name();                                                                               \
      printf(" OK\n");                                                                             \
      tests_passed++;                                                                              \
    } catch (const std::exception& e) {                                                            \
      printf(" FAIL: %s\n", e.what());                                                             \
      tests_failed++;                                                                              \
    }                                                                                              \
  } while (0)

#define ASSERT(cond)                                                                               \
  do {                                                                                             \
    if (!(cond)) {                                                                                 \
      throw std::runtime_error("Assertion failed: " #cond);                                        \
    }                                                                                              \
  } while (0)

#define ASSERT_EQ(a, b)                                                                            \
  do {                                                                                             \
    if ((a) != (b)) {                                                                              \
      throw std::runtime_error("Assertion failed: " #a " == " #b);                                 \
    }                                                                                              \
  } while (0)

#define ASSERT_NE(a, b)                                                                            \
  do {                                                                                             \
    if ((a) == (b)) {                                                                              \
      throw std::runtime_error("Assertion failed: " #a " != " #b);                                 \
    }                                                                                              \
  } while (0)

#define ASSERT_GE(a, b)                                                                            \
  do {                                                                                             \
    if (!((a) >= (b))) {                                                                           \
      throw std::runtime_error("Assertion failed: " #a " >= " #b);                                 \
    }                                                                                              \
  } while (0)

// Passes when the result succeeded; otherwise reports its message.
#define ASSERT_OK(expr)                                                                            \
  do {                                                                                             \
    const OpResult res_ = (expr);                                                                  \
    if (!res_.ok) {                                                                                \
      throw std::runtime_error("Expected success: " #expr ": " + ToUtf8(res_.message));            \
    }                                                                                              \
  } while (0)

// Passes when the result failed with exactly `msg`.
#define ASSERT_FAIL_MSG(expr, msg)                                                                 \
  do {                                                                                             \
    const OpResult res_ = (expr);                                                                  \
    if (res_.ok) throw std::runtime_error("Expected failure: " #expr);                            \
    if (ToUtf8(res_.message) != std::string(msg)) {                                                \
      throw std::runtime_error("Unexpected message: " + ToUtf8(res_.message));                     \
    }                                                                                              \
  } while (0)

// Fresh directory under the system temp dir, removed on destruction.
class TempRoot final {
public:
  TempRoot() {
    static std::atomic<unsigned> counter{0};
    std::ostringstream name;
    name << "tandem-test-" << getpid() << "-" << NowMillis() << "-" << counter++;
    path_ = std::filesystem::temp_directory_path() / name.str();
    std::filesystem::create_directories(path_);
  }
  ~TempRoot() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  TempRoot(const TempRoot&) = delete;
  TempRoot& operator=(const TempRoot&) = delete;

  const std::filesystem::path& Path() const { return path_; }
  std::filesystem::path operator/(const std::string& rel) const { return path_ / rel; }

private:
  std::filesystem::path path_;
};

inline void WriteFile(const std::filesystem::path& p, const std::string& content) {
  std::filesystem::create_directories(p.parent_path());
  std::ofstream out(p, std::ios::binary | std::ios::trunc);
  if (!out) throw std::runtime_error("Cannot write " + p.string());
  out << content;
}

inline std::string ReadFile(const std::filesystem::path& p) {
  std::ifstream in(p, std::ios::binary);
  if (!in) throw std::runtime_error("Cannot read " + p.string());
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

inline bool Exists(const std::filesystem::path& p) {
  std::error_code ec;
  return std::filesystem::exists(std::filesystem::symlink_status(p, ec));
}

inline std::vector<std::string> ChildNames(const std::filesystem::path& dir) {
  std::vector<std::string> names;
  for (const auto& e : std::filesystem::directory_iterator(dir)) {
    names.push_back(e.path().filename().string());
  }
  std::sort(names.begin(), names.end());
  return names;
}

// Records every progress call. Cancels once `cancelAfter` units are done and
// fails the progress call that reaches `failAt`.
class RecordingSink final : public ProgressSink {
public:
  std::uint64_t cancelAfter{std::numeric_limits<std::uint64_t>::max()};
  std::uint64_t failAt{std::numeric_limits<std::uint64_t>::max()};
  std::vector<std::uint64_t> processed;
  std::vector<std::string> items;
  std::uint64_t total{0};

  bool ShouldCancel() override { return Last() >= cancelAfter; }

  OpResult OnProgress(std::uint64_t p, std::uint64_t t, const std::string& item) override {
    processed.push_back(p);
    items.push_back(item);
    total = t;
    if (p > 0 && p >= failAt) return FailResult("Injected failure");
    return OkResult();
  }

  std::uint64_t Last() const { return processed.empty() ? 0 : processed.back(); }
};

// Initializes wxWidgets for a console test binary and logs to stderr.
class TestEnvironment final {
public:
  TestEnvironment() { delete wxLog::SetActiveTarget(new wxLogStderr); }
  bool IsOk() const { return init_.IsOk(); }

private:
  wxInitializer init_;
};

inline int Summarize() {
  if (tests_failed > 0) {
    printf("\n%d tests passed, %d FAILED\n", tests_passed, tests_failed);
  } else {
    printf("\n%d tests passed\n", tests_passed);
  }
  return tests_failed > 0 ? 1 : 0;
}
