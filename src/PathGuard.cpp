#include "PathGuard.h"

#include <system_error>

namespace fs = std::filesystem;

namespace {
bool EscapesParent(const fs::path& rel) {
  return rel.empty() || *rel.begin() == "..";
}
}  // namespace

PathGuard::PathGuard(const fs::path& root) {
  std::error_code ec;
  auto abs = fs::absolute(root, ec);
  if (ec) abs = root;
  ec.clear();
  auto canon = fs::weakly_canonical(abs, ec);
  root_ = ec ? abs.lexically_normal() : canon;
  if (!root_.has_filename() && root_.has_relative_path()) root_ = root_.parent_path();
}

OpResult PathGuard::Resolve(const std::string& relative, fs::path& out) const {
  const auto normalized = NormalizeRelativePath(relative);
  if (normalized.empty()) {
    out = root_;
    return OkResult();
  }

  const auto joined = (root_ / fs::path(normalized)).lexically_normal();
  const auto rel = joined.lexically_relative(root_);
  if (EscapesParent(rel)) return FailResult("Path escapes root directory");

  out = rel == "." ? root_ : root_ / rel;
  return OkResult();
}

std::string PathGuard::Relative(const fs::path& absolute) const {
  const auto rel = absolute.lexically_normal().lexically_relative(root_);
  if (rel.empty() || rel == ".") return {};
  return rel.generic_string();
}

std::string NormalizeRelativePath(const std::string& value) {
  std::string out;
  out.reserve(value.size());
  for (char c : value) {
    if (c == '\\') c = '/';
    if (c == '/' && (out.empty() || out.back() == '/')) continue;
    out.push_back(c);
  }
  while (!out.empty() && out.back() == '/') out.pop_back();
  return out;
}

std::string JoinRelativePath(const std::string& base, const std::string& name) {
  const auto b = NormalizeRelativePath(base);
  const auto n = NormalizeRelativePath(name);
  if (b.empty()) return n;
  if (n.empty()) return b;
  return b + "/" + n;
}

OpResult ValidateEntryName(const std::string& name) {
  if (name.empty()) return FailResult("Name is required");
  if (name == "." || name == ".." || name.find('/') != std::string::npos ||
      name.find('\\') != std::string::npos) {
    return FailResult(wxString::Format("Invalid name: \"%s\"", wxString::FromUTF8(name)));
  }
  return OkResult();
}

bool IsSubPath(const fs::path& parent, const fs::path& candidate) {
  const auto rel = candidate.lexically_normal().lexically_relative(parent.lexically_normal());
  return !EscapesParent(rel) && rel != ".";
}

bool PathExists(const fs::path& p) {
  std::error_code ec;
  const auto st = fs::symlink_status(p, ec);
  return !ec && st.type() != fs::file_type::not_found;
}
