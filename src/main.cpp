#include "FileService.h"
#include "Settings.h"

#include <wx/app.h>
#include <wx/cmdline.h>
#include <wx/crt.h>
#include <wx/log.h>

#include <chrono>
#include <string>
#include <vector>

namespace {
constexpr auto kPollInterval = std::chrono::milliseconds(250);

std::vector<std::string> SplitList(const std::string& s, char delim) {
  std::vector<std::string> out;
  std::string cur;
  for (char c : s) {
    if (c == delim) {
      if (!cur.empty()) out.push_back(cur);
      cur.clear();
    } else {
      cur.push_back(c);
    }
  }
  if (!cur.empty()) out.push_back(cur);
  return out;
}

wxString U(const std::string& s) { return wxString::FromUTF8(s); }

void PrintTask(const TaskRecord& t) {
  std::string names;
  for (const auto& n : t.names) {
    if (!names.empty()) names += ",";
    names += n;
  }
  wxPrintf("%s  %-11s %-4s %llu/%llu  %s -> %s  [%s]\n", U(t.id), TaskStatusName(t.status),
           TransferOpName(t.operation), static_cast<unsigned long long>(t.processedUnits),
           static_cast<unsigned long long>(t.totalUnits), U("/" + t.sourcePath),
           U("/" + t.targetPath), U(names));
  if (t.currentItem) wxPrintf("    current: %s\n", U(*t.currentItem));
  if (t.error) wxPrintf("    error: %s\n", U(*t.error));
}

int Fail(const OpResult& res) {
  wxLogError("%s", res.message);
  return 1;
}
}  // namespace

class TandemApp final : public wxAppConsole {
public:
  void OnInitCmdLine(wxCmdLineParser& parser) override {
    wxAppConsole::OnInitCmdLine(parser);

    parser.AddOption("r", "root", "directory all paths are relative to", wxCMD_LINE_VAL_STRING);
    parser.AddOption("c", "config", "settings file (default: per-user Tandem config)",
                     wxCMD_LINE_VAL_STRING);
    parser.AddOption("d", "db", "task database file", wxCMD_LINE_VAL_STRING);
    parser.AddOption("o", "overwrite", "comma separated names that may replace existing entries",
                     wxCMD_LINE_VAL_STRING);
    parser.AddOption("l", "limit", "number of tasks to list", wxCMD_LINE_VAL_NUMBER);
    parser.AddSwitch("s", "save", "write --root, --db, --limit and --verbose to the settings");

    parser.AddParam("COMMAND", wxCMD_LINE_VAL_STRING);
    parser.AddParam("ARGS", wxCMD_LINE_VAL_STRING,
                    wxCMD_LINE_PARAM_OPTIONAL | wxCMD_LINE_PARAM_MULTIPLE);

    parser.SetLogo(
        "Usage: tandem [options] COMMAND [ARGS...]\n\n"
        "Commands:\n"
        "  copy SRC DST NAME...     copy and wait for the task to finish\n"
        "  move SRC DST NAME...     move and wait for the task to finish\n"
        "  tasks                    list recent tasks\n"
        "  task ID                  show one task\n"
        "  cancel ID                cancel a queued or running task\n"
        "  clear                    forget completed tasks\n"
        "  conflicts DST NAME...    names that already exist in DST\n"
        "  delete PATH NAME         move to trash (or purge inside the trash)\n"
        "  restore TRASHPATH        put a trashed entry back\n"
        "  trash                    list trashed entries\n"
        "  empty-trash              purge the trash\n"
        "  ls [PATH]                list a directory\n"
        "  impact PATH NAME         what a delete would remove\n"
        "  config                   show the effective settings\n\n"
        "While a transfer runs, other tandem processes on the same database can\n"
        "only observe and cancel tasks.\n");
  }

  bool OnCmdLineParsed(wxCmdLineParser& parser) override {
    if (!wxAppConsole::OnCmdLineParsed(parser)) return false;

    parser.Found("root", &m_root);
    parser.Found("config", &m_configFile);
    parser.Found("db", &m_database);
    parser.Found("overwrite", &m_overwrite);
    parser.Found("limit", &m_limit);
    m_save = parser.Found("save");

    m_command = parser.GetParam(0).ToStdString();
    for (size_t i = 1; i < parser.GetParamCount(); i++) {
      m_args.push_back(std::string(parser.GetParam(i).utf8_str()));
    }
    return true;
  }

  bool OnInit() override {
    delete wxLog::SetActiveTarget(new wxLogStderr);
    return wxAppConsole::OnInit();
  }

  int OnRun() override {
    auto cfg = settings::OpenConfig(m_configFile);
    auto s = settings::Load(*cfg);
    if (!m_root.empty()) s.root = std::filesystem::path(std::string(m_root.utf8_str()));
    if (!m_database.empty()) s.database = std::filesystem::path(std::string(m_database.utf8_str()));
    if (m_limit > 0) s.listLimit = settings::ClampListLimit(static_cast<int>(m_limit));
    if (wxLog::GetVerbose()) s.verbose = true;
    if (s.verbose) wxLog::SetVerbose(true);

    if (m_save) {
      if (!settings::Save(*cfg, s)) return Fail(FailResult("Cannot save settings"));
      wxLogVerbose("Settings saved");
    }
    if (m_command == "config") return ShowConfig(s);

    FileService service(s);
    const auto res = service.Start();
    if (!res.ok) return Fail(res);

    const int code = RunCommand(service);
    service.Shutdown();
    return code;
  }

private:
  bool NeedArgs(size_t count, bool exact) const {
    if (m_args.size() < count || (exact && m_args.size() != count)) {
      wxLogError("Wrong number of arguments for '%s' (see --help)", m_command);
      return false;
    }
    return true;
  }

  int RunCommand(FileService& service) {
    if (m_command == "copy") return Transfer(service, TransferOp::Copy);
    if (m_command == "move") return Transfer(service, TransferOp::Move);
    if (m_command == "tasks") return ListTasks(service);
    if (m_command == "task") return ShowTask(service);
    if (m_command == "cancel") return Cancel(service);
    if (m_command == "clear") return Clear(service);
    if (m_command == "conflicts") return Conflicts(service);
    if (m_command == "delete") return Delete(service);
    if (m_command == "restore") return Restore(service);
    if (m_command == "trash") return ListTrash(service);
    if (m_command == "empty-trash") return EmptyTrash(service);
    if (m_command == "ls") return List(service);
    if (m_command == "impact") return Impact(service);

    wxLogError("Unknown command '%s' (see --help)", m_command);
    return 1;
  }

  int Transfer(FileService& service, TransferOp op) {
    if (!NeedArgs(3, false)) return 1;

    TransferRequest request;
    request.operation = op;
    request.sourcePath = m_args[0];
    request.targetPath = m_args[1];
    request.names.assign(m_args.begin() + 2, m_args.end());
    request.overwriteNames = SplitList(std::string(m_overwrite.utf8_str()), ',');

    std::string taskId;
    auto res = service.CreateTransferTask(request, taskId);
    if (!res.ok) return Fail(res);
    wxPrintf("%s\n", U(taskId));

    std::uint64_t lastProcessed = 0;
    while (!service.WaitIdle(kPollInterval)) {
      std::optional<TaskRecord> t;
      res = service.GetTask(taskId, t);
      if (!res.ok) return Fail(res);
      if (t && t->processedUnits != lastProcessed) {
        lastProcessed = t->processedUnits;
        wxLogVerbose("%llu/%llu %s", static_cast<unsigned long long>(t->processedUnits),
                     static_cast<unsigned long long>(t->totalUnits),
                     U(t->currentItem.value_or("")));
      }
    }

    std::optional<TaskRecord> t;
    res = service.GetTask(taskId, t);
    if (!res.ok) return Fail(res);
    if (!t) return Fail(FailResult("Task not found"));
    PrintTask(*t);
    return t->status == TaskStatus::Completed ? 0 : 1;
  }

  int ShowConfig(const settings::Settings& s) {
    if (!NeedArgs(0, true)) return 1;
    wxPrintf("root      %s\n", FromPath(s.root));
    wxPrintf("database  %s\n", FromPath(s.DatabasePath()));
    wxPrintf("listLimit %d\n", s.listLimit);
    wxPrintf("verbose   %s\n", s.verbose ? "yes" : "no");
    return 0;
  }

  int ListTasks(FileService& service) {
    std::vector<TaskRecord> tasks;
    const auto res = service.ListTasks(static_cast<int>(m_limit), tasks);
    if (!res.ok) return Fail(res);
    for (const auto& t : tasks) PrintTask(t);
    return 0;
  }

  int ShowTask(FileService& service) {
    if (!NeedArgs(1, true)) return 1;
    std::optional<TaskRecord> t;
    const auto res = service.GetTask(m_args[0], t);
    if (!res.ok) return Fail(res);
    if (!t) return Fail(FailResult("Task not found"));
    PrintTask(*t);
    return 0;
  }

  int Cancel(FileService& service) {
    if (!NeedArgs(1, true)) return 1;
    bool found = false;
    const auto res = service.CancelTask(m_args[0], found);
    if (!res.ok) return Fail(res);
    if (!found) return Fail(FailResult("Task not found"));
    wxPrintf("ok\n");
    return 0;
  }

  int Clear(FileService& service) {
    int count = 0;
    const auto res = service.ClearCompletedTasks(count);
    if (!res.ok) return Fail(res);
    wxPrintf("%d\n", count);
    return 0;
  }

  int Conflicts(FileService& service) {
    if (!NeedArgs(2, false)) return 1;
    std::vector<std::string> names(m_args.begin() + 1, m_args.end());
    std::vector<std::string> conflicts;
    const auto res = service.FindConflicts(m_args[0], names, conflicts);
    if (!res.ok) return Fail(res);
    for (const auto& n : conflicts) wxPrintf("%s\n", U(n));
    return 0;
  }

  int Delete(FileService& service) {
    if (!NeedArgs(2, true)) return 1;
    DeleteOutcome outcome;
    const auto res = service.DeleteEntry(m_args[0], m_args[1], outcome);
    if (!res.ok) return Fail(res);
    if (outcome.permanent) {
      wxPrintf("deleted permanently\n");
    } else {
      wxPrintf("%s\n", U(outcome.trashPath));
    }
    return 0;
  }

  int Restore(FileService& service) {
    if (!NeedArgs(1, true)) return 1;
    std::string restored;
    const auto res = service.RestoreTrashEntry(m_args[0], restored);
    if (!res.ok) return Fail(res);
    wxPrintf("%s\n", U(restored));
    return 0;
  }

  int ListTrash(FileService& service) {
    std::vector<TrashEntry> entries;
    const auto res = service.ListTrash(entries);
    if (!res.ok) return Fail(res);
    for (const auto& e : entries) {
      wxPrintf("%s\t%s\t%s\n", U(e.trashPath), U(e.originalPath.empty() ? "?" : e.originalPath),
               U(e.deletedAt));
    }
    return 0;
  }

  int EmptyTrash(FileService& service) {
    const auto res = service.EmptyTrash();
    if (!res.ok) return Fail(res);
    return 0;
  }

  int List(FileService& service) {
    if (m_args.size() > 1) {
      wxLogError("Wrong number of arguments for '%s' (see --help)", m_command);
      return 1;
    }
    std::vector<std::string> names;
    const auto res = service.ListEntries(m_args.empty() ? std::string() : m_args[0], names);
    if (!res.ok) return Fail(res);
    for (const auto& n : names) wxPrintf("%s\n", U(n));
    return 0;
  }

  int Impact(FileService& service) {
    if (!NeedArgs(2, true)) return 1;
    DeleteImpact impact;
    const auto res = service.MeasureDeleteImpact(m_args[0], m_args[1], impact);
    if (!res.ok) return Fail(res);
    wxPrintf("%s: %llu file(s), %llu folder(s), %s\n", U(impact.targetName),
             static_cast<unsigned long long>(impact.fileCount),
             static_cast<unsigned long long>(impact.directoryCount),
             U(HumanSize(impact.totalBytes)));
    return 0;
  }

  wxString m_root;
  wxString m_configFile;
  wxString m_database;
  wxString m_overwrite;
  long m_limit{0};
  bool m_save{false};
  std::string m_command;
  std::vector<std::string> m_args;
};

wxIMPLEMENT_APP_CONSOLE(TandemApp);
