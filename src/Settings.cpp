#include "Settings.h"

#include "util.h"

#include <algorithm>
#include <system_error>

#include <wx/config.h>
#include <wx/fileconf.h>

namespace settings {

namespace {
constexpr const char* kRootKey = "/paths/root";
constexpr const char* kDatabaseKey = "/paths/database";
constexpr const char* kListLimitKey = "/tasks/listLimit";
constexpr const char* kVerboseKey = "/log/verbose";

std::filesystem::path CurrentDir() {
  std::error_code ec;
  auto cwd = std::filesystem::current_path(ec);
  if (ec) return ".";
  return cwd;
}
}  // namespace

std::filesystem::path Settings::DatabasePath() const {
  if (!database.empty()) return database;
  return root / ".tandem" / "tasks.db";
}

std::unique_ptr<wxConfigBase> OpenConfig(const wxString& file) {
  std::unique_ptr<wxConfigBase> cfg;
  if (file.empty()) {
    cfg = std::make_unique<wxConfig>("Tandem");
  } else {
    cfg = std::make_unique<wxFileConfig>(wxEmptyString, wxEmptyString, file, wxEmptyString,
                                         wxCONFIG_USE_LOCAL_FILE);
  }
  // Paths may legitimately contain '$'.
  cfg->SetExpandEnvVars(false);
  return cfg;
}

Settings Load(wxConfigBase& cfg) {
  Settings s;

  wxString root;
  if (cfg.Read(kRootKey, &root) && !root.empty()) {
    s.root = std::filesystem::path(ToUtf8(root));
  } else {
    s.root = CurrentDir();
  }

  wxString database;
  if (cfg.Read(kDatabaseKey, &database) && !database.empty()) {
    s.database = std::filesystem::path(ToUtf8(database));
  }

  long limit = kDefaultListLimit;
  if (cfg.Read(kListLimitKey, &limit)) s.listLimit = ClampListLimit(static_cast<int>(limit));

  bool verbose = false;
  if (cfg.Read(kVerboseKey, &verbose)) s.verbose = verbose;

  return s;
}

bool Save(wxConfigBase& cfg, const Settings& s) {
  cfg.Write(kRootKey, FromPath(s.root));
  cfg.Write(kDatabaseKey, FromPath(s.database));
  cfg.Write(kListLimitKey, static_cast<long>(s.listLimit));
  cfg.Write(kVerboseKey, s.verbose);
  return cfg.Flush();
}

int ClampListLimit(int limit) {
  if (limit <= 0) return kDefaultListLimit;
  return std::min(limit, kMaxListLimit);
}

}  // namespace settings
