#include "PathGuard.h"

#include "TestSupport.h"

namespace fs = std::filesystem;

TEST(resolve_joins_under_root) {
  TempRoot root;
  PathGuard guard(root.Path());
  fs::path out;
  ASSERT_OK(guard.Resolve("Documents/report.pdf", out));
  ASSERT_EQ(out, guard.Root() / "Documents" / "report.pdf");
}

TEST(resolve_ignores_leading_and_duplicate_separators) {
  TempRoot root;
  PathGuard guard(root.Path());
  fs::path a;
  fs::path b;
  ASSERT_OK(guard.Resolve("/Documents//inner/", a));
  ASSERT_OK(guard.Resolve("Documents\\inner", b));
  ASSERT_EQ(a, guard.Root() / "Documents" / "inner");
  ASSERT_EQ(a, b);
}

TEST(resolve_empty_is_root) {
  TempRoot root;
  PathGuard guard(root.Path());
  fs::path out;
  ASSERT_OK(guard.Resolve("", out));
  ASSERT_EQ(out, guard.Root());
  ASSERT_OK(guard.Resolve("/", out));
  ASSERT_EQ(out, guard.Root());
}

TEST(resolve_rejects_escape) {
  TempRoot root;
  PathGuard guard(root.Path());
  fs::path out;
  ASSERT_FAIL_MSG(guard.Resolve("..", out), "Path escapes root directory");
  ASSERT_FAIL_MSG(guard.Resolve("../sibling", out), "Path escapes root directory");
  ASSERT_FAIL_MSG(guard.Resolve("a/../../etc/passwd", out), "Path escapes root directory");
  ASSERT_FAIL_MSG(guard.Resolve("/../x", out), "Path escapes root directory");
}

TEST(resolve_allows_dotdot_that_stays_inside) {
  TempRoot root;
  PathGuard guard(root.Path());
  fs::path out;
  ASSERT_OK(guard.Resolve("a/../b", out));
  ASSERT_EQ(out, guard.Root() / "b");
}

TEST(relative_inverts_resolve) {
  TempRoot root;
  PathGuard guard(root.Path());
  fs::path out;
  ASSERT_OK(guard.Resolve("a/b/c.txt", out));
  ASSERT_EQ(guard.Relative(out), std::string("a/b/c.txt"));
  ASSERT_EQ(guard.Relative(guard.Root()), std::string());
}

TEST(normalize_and_join_relative_paths) {
  ASSERT_EQ(NormalizeRelativePath("//a\\b//c/"), std::string("a/b/c"));
  ASSERT_EQ(NormalizeRelativePath(""), std::string());
  ASSERT_EQ(JoinRelativePath("", "x"), std::string("x"));
  ASSERT_EQ(JoinRelativePath("/Documents/", "report.pdf"), std::string("Documents/report.pdf"));
  ASSERT_EQ(JoinRelativePath("a", ""), std::string("a"));
}

TEST(validate_entry_name) {
  ASSERT_OK(ValidateEntryName("report.pdf"));
  ASSERT_OK(ValidateEntryName(".hidden"));
  ASSERT_FAIL_MSG(ValidateEntryName(""), "Name is required");
  ASSERT_FAIL_MSG(ValidateEntryName("."), "Invalid name: \".\"");
  ASSERT_FAIL_MSG(ValidateEntryName(".."), "Invalid name: \"..\"");
  ASSERT_FAIL_MSG(ValidateEntryName("a/b"), "Invalid name: \"a/b\"");
  ASSERT_FAIL_MSG(ValidateEntryName("a\\b"), "Invalid name: \"a\\b\"");
}

TEST(is_sub_path_is_strict) {
  ASSERT(IsSubPath("/r/a", "/r/a/b"));
  ASSERT(IsSubPath("/r/a", "/r/a/b/c"));
  ASSERT(!IsSubPath("/r/a", "/r/a"));
  ASSERT(!IsSubPath("/r/a", "/r/ab"));
  ASSERT(!IsSubPath("/r/a", "/r"));
}

TEST(path_exists_counts_dangling_symlink) {
  TempRoot root;
  fs::create_symlink("nowhere", root / "link");
  ASSERT(PathExists(root / "link"));
  ASSERT(!PathExists(root / "missing"));
}

int main() {
  TestEnvironment env;
  if (!env.IsOk()) return 1;
  printf("Running path guard tests...\n");

  RUN_TEST(resolve_joins_under_root);
  RUN_TEST(resolve_ignores_leading_and_duplicate_separators);
  RUN_TEST(resolve_empty_is_root);
  RUN_TEST(resolve_rejects_escape);
  RUN_TEST(resolve_allows_dotdot_that_stays_inside);
  RUN_TEST(relative_inverts_resolve);
  RUN_TEST(normalize_and_join_relative_paths);
  RUN_TEST(validate_entry_name);
  RUN_TEST(is_sub_path_is_strict);
  RUN_TEST(path_exists_counts_dangling_symlink);

  return Summarize();
}
