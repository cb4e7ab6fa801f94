#pragma once

#include <filesystem>
#include <memory>

#include <wx/confbase.h>
#include <wx/string.h>

namespace settings {

constexpr int kDefaultListLimit = 50;
constexpr int kMaxListLimit = 200;

struct Settings {
  std::filesystem::path root;
  // Empty means <root>/.tandem/tasks.db.
  std::filesystem::path database;
  int listLimit{kDefaultListLimit};
  bool verbose{false};

  std::filesystem::path DatabasePath() const;
};

// An explicit file gets a wxFileConfig; otherwise the per-user "Tandem" config.
std::unique_ptr<wxConfigBase> OpenConfig(const wxString& file);

Settings Load(wxConfigBase& cfg);
bool Save(wxConfigBase& cfg, const Settings& s);

// 1..kMaxListLimit; anything non-positive falls back to the default.
int ClampListLimit(int limit);

}  // namespace settings
