/**
 * @file launcher.cpp
 * @brief Command-line front end implementation
 */

#include "SmoothWrite/app/launcher.hpp"
#include "SmoothWrite/core/logger.hpp"
#include "SmoothWrite/notes/config_manager.hpp"
#include "SmoothWrite/notes/interfaces/MemoryContentSurface.hpp"
#include "SmoothWrite/notes/note_index.hpp"
#include "SmoothWrite/notes/note_session.hpp"
#include "SmoothWrite/notes/note_storage.hpp"
#include <QDir>
#include <QFileInfo>
#include <cstddef>
#include <exception>
#include <ostream>
#include <string>

namespace SmoothWrite::app {

namespace {

struct CommandArity {
  const char* name;
  usize minArgs;
  usize maxArgs;
};

constexpr usize UNBOUNDED = static_cast<usize>(-1);

constexpr CommandArity COMMANDS[] = {
    {"list", 0, 0},   {"search", 1, UNBOUNDED}, {"show", 1, 1},     {"new", 0, 1},
    {"edit", 2, 2},   {"delete", 1, 1},         {"favorite", 1, 2}, {"count", 0, 0},
};

const CommandArity* findCommand(const std::string& name) {
  for (const auto& command : COMMANDS) {
    if (name == command.name) {
      return &command;
    }
  }
  return nullptr;
}

QString fromStd(const std::string& text) {
  return QString::fromStdString(text);
}

std::string formatTime(const QDateTime& time) {
  return time.toLocalTime().toString(QStringLiteral("yyyy-MM-dd HH:mm")).toStdString();
}

} // namespace

Launcher::Launcher(std::ostream& out, std::ostream& err) : m_out(out), m_err(err) {}

Launcher::~Launcher() = default;

// ============================================================================
// Argument parsing
// ============================================================================

Result<LaunchOptions> Launcher::parseArgs(const std::vector<std::string>& args) {
  LaunchOptions opts;

  usize i = 0;
  auto requireValue = [&](const std::string& option) -> Result<std::string> {
    if (i + 1 >= args.size()) {
      return Result<std::string>::error("Option " + option + " requires a value");
    }
    return Result<std::string>::ok(args[++i]);
  };

  // Options come first; everything from the command on is positional
  for (; i < args.size(); ++i) {
    const std::string& arg = args[i];

    if (arg == "-h" || arg == "--help") {
      opts.help = true;
    } else if (arg == "--version") {
      opts.version = true;
    } else if (arg == "--verbose" || arg == "-v") {
      opts.verbose = true;
    } else if (arg == "--no-welcome") {
      opts.noWelcome = true;
    } else if (arg == "--config") {
      auto value = requireValue(arg);
      if (value.isError()) {
        return Result<LaunchOptions>::error(value.error());
      }
      opts.configPath = value.value();
    } else if (arg == "--notes-dir") {
      auto value = requireValue(arg);
      if (value.isError()) {
        return Result<LaunchOptions>::error(value.error());
      }
      opts.notesDir = value.value();
    } else if (arg == "--delay") {
      auto value = requireValue(arg);
      if (value.isError()) {
        return Result<LaunchOptions>::error(value.error());
      }
      i32 delay = -1;
      try {
        usize consumed = 0;
        delay = std::stoi(value.value(), &consumed);
        if (consumed != value.value().size()) {
          delay = -1;
        }
      } catch (const std::exception&) {
        delay = -1;
      }
      if (delay < 0) {
        return Result<LaunchOptions>::error("Invalid delay: " + value.value());
      }
      opts.autoSaveDelayMs = delay;
    } else if (arg.size() > 1 && arg[0] == '-') {
      return Result<LaunchOptions>::error("Unknown option: " + arg);
    } else {
      break;
    }
  }

  if (opts.help || opts.version) {
    return Result<LaunchOptions>::ok(opts);
  }

  if (i >= args.size()) {
    return Result<LaunchOptions>::error("No command given");
  }

  opts.command = args[i++];
  const CommandArity* command = findCommand(opts.command);
  if (!command) {
    return Result<LaunchOptions>::error("Unknown command: " + opts.command);
  }

  opts.args.assign(args.begin() + static_cast<std::ptrdiff_t>(i), args.end());
  if (opts.args.size() < command->minArgs || opts.args.size() > command->maxArgs) {
    return Result<LaunchOptions>::error("Wrong number of arguments for '" + opts.command + "'");
  }

  if (opts.command == "favorite" && opts.args.size() == 2 && opts.args[1] != "on" &&
      opts.args[1] != "off") {
    return Result<LaunchOptions>::error("favorite expects 'on' or 'off', got: " + opts.args[1]);
  }

  return Result<LaunchOptions>::ok(opts);
}

// ============================================================================
// Run
// ============================================================================

i32 Launcher::run(int argc, char* argv[]) {
  std::vector<std::string> args;
  for (int i = 1; i < argc; ++i) {
    args.emplace_back(argv[i]);
  }

  auto parsed = parseArgs(args);
  if (parsed.isError()) {
    m_err << "smoothwrite: " << parsed.error() << "\n";
    m_err << "Try 'smoothwrite --help' for more information.\n";
    return static_cast<i32>(ExitCode::UsageError);
  }

  if (parsed.value().help) {
    printHelp(argc > 0 ? argv[0] : "smoothwrite");
    return static_cast<i32>(ExitCode::Success);
  }
  return run(parsed.value());
}

i32 Launcher::run(const LaunchOptions& options) {
  if (options.help) {
    printHelp("smoothwrite");
    return static_cast<i32>(ExitCode::Success);
  }
  if (options.version) {
    printVersion();
    return static_cast<i32>(ExitCode::Success);
  }

  auto configResult = initializeConfig(options);
  if (configResult.isError()) {
    m_err << "Error: " << configResult.error() << "\n";
    return static_cast<i32>(ExitCode::CommandFailed);
  }
  initializeLogging();

  notes::NoteStorage storage(m_config.notesDirectory);
  notes::NoteIndex index;
  notes::MemoryContentSurface surface;

  notes::NoteSessionOptions sessionOptions;
  sessionOptions.autoSaveDelayMs = m_config.autoSaveDelayMs;
  sessionOptions.createWelcomeNote = m_config.createWelcomeNote;
  notes::NoteSession session(storage, index, surface, sessionOptions);

  auto opened = session.open();
  if (opened.isError()) {
    m_err << "Error: " << opened.error() << "\n";
    return static_cast<i32>(ExitCode::CommandFailed);
  }

  const ExitCode code = dispatch(options, session, storage, index, surface);
  session.close();
  core::Logger::instance().closeOutputFile();
  return static_cast<i32>(code);
}

Result<void> Launcher::initializeConfig(const LaunchOptions& options) {
  notes::ConfigManager manager;

  const QString path = options.configPath.empty()
                           ? QString::fromLatin1(notes::ConfigManager::DEFAULT_CONFIG_FILE)
                           : fromStd(options.configPath);
  auto loaded = manager.loadFromFile(path);
  if (loaded.isError()) {
    return loaded;
  }
  if (!options.configPath.empty() && manager.loadedFrom().isEmpty()) {
    SMOOTHWRITE_LOG_WARN("Config file {} not found, using defaults", options.configPath);
  }

  notes::ConfigOverrides overrides;
  if (options.notesDir) {
    overrides.notesDirectory = fromStd(*options.notesDir);
  }
  overrides.autoSaveDelayMs = options.autoSaveDelayMs;
  if (options.noWelcome) {
    overrides.createWelcomeNote = false;
  }
  if (options.verbose) {
    overrides.logLevel = core::LogLevel::Debug;
  }
  manager.applyOverrides(overrides);

  m_config = manager.getConfig();
  return Result<void>::ok();
}

void Launcher::initializeLogging() {
  auto& logger = core::Logger::instance();
  logger.setLevel(m_config.logLevel);

  if (m_config.logFile.isEmpty()) {
    return;
  }

  const QFileInfo info(m_config.logFile);
  if (!QDir().mkpath(info.absolutePath()) ||
      !logger.setOutputFile(info.absoluteFilePath().toStdString())) {
    // Console logging still works; the session must not fail over this
    SMOOTHWRITE_LOG_WARN("Cannot open log file {}", m_config.logFile.toStdString());
  }
}

// ============================================================================
// Commands
// ============================================================================

ExitCode Launcher::dispatch(const LaunchOptions& options, notes::NoteSession& session,
                            notes::NoteStorage& storage, notes::NoteIndex& index,
                            notes::MemoryContentSurface& surface) {
  const std::string& command = options.command;
  const auto& args = options.args;

  if (command == "list") {
    return listNotes(index.notes());
  }
  if (command == "search") {
    std::string query;
    for (const auto& word : args) {
      query += query.empty() ? word : " " + word;
    }
    return listNotes(index.search(fromStd(query)));
  }
  if (command == "show") {
    return showNote(index, args[0]);
  }
  if (command == "new") {
    return newNote(session, surface, args);
  }
  if (command == "edit") {
    return editNote(session, surface, args[0], args[1]);
  }
  if (command == "delete") {
    return deleteNote(session, args[0]);
  }
  if (command == "favorite") {
    return favoriteNote(session, args);
  }
  if (command == "count") {
    m_out << storage.noteCount() << "\n";
    return ExitCode::Success;
  }

  m_err << "Unknown command: " << command << "\n";
  return ExitCode::UsageError;
}

ExitCode Launcher::listNotes(const QList<notes::Note>& list) const {
  for (const auto& note : list) {
    m_out << note.id().toStdString() << "  " << formatTime(note.modifiedAt()) << "  "
          << (note.isFavorite() ? "*" : " ") << " " << note.title().toStdString() << "\n";
  }
  return ExitCode::Success;
}

ExitCode Launcher::showNote(const notes::NoteIndex& index, const std::string& id) const {
  auto note = index.find(fromStd(id));
  if (!note) {
    m_err << "Note not found: " << id << "\n";
    return ExitCode::CommandFailed;
  }

  m_out << note->title().toStdString() << "\n";
  m_out << "Created:  " << formatTime(note->createdAt()) << "\n";
  m_out << "Modified: " << formatTime(note->modifiedAt()) << "\n";
  if (note->isFavorite()) {
    m_out << "Favorite: yes\n";
  }
  m_out << "\n" << note->plainText().toStdString() << "\n";
  return ExitCode::Success;
}

ExitCode Launcher::newNote(notes::NoteSession& session, notes::MemoryContentSurface& surface,
                           const std::vector<std::string>& args) {
  auto created = session.createNote();
  if (created.isError()) {
    m_err << "Error: " << created.error() << "\n";
    return ExitCode::CommandFailed;
  }

  if (!args.empty()) {
    surface.applyEdit(fromStd(args[0]));
    auto saved = session.saveCurrentNote();
    if (saved.isError()) {
      m_err << "Error: " << saved.error() << "\n";
      return ExitCode::CommandFailed;
    }
  }

  m_out << created.value().id().toStdString() << "\n";
  return ExitCode::Success;
}

ExitCode Launcher::editNote(notes::NoteSession& session, notes::MemoryContentSurface& surface,
                            const std::string& id, const std::string& html) {
  if (!session.selectNote(fromStd(id))) {
    m_err << "Note not found: " << id << "\n";
    return ExitCode::CommandFailed;
  }

  surface.applyEdit(fromStd(html));
  auto saved = session.saveCurrentNote();
  if (saved.isError()) {
    m_err << "Error: " << saved.error() << "\n";
    return ExitCode::CommandFailed;
  }
  return ExitCode::Success;
}

ExitCode Launcher::deleteNote(notes::NoteSession& session, const std::string& id) {
  const auto status = session.deleteNote(fromStd(id));
  switch (status) {
  case notes::StorageStatus::Ok:
    m_out << "Deleted " << id << "\n";
    return ExitCode::Success;
  case notes::StorageStatus::NotFound:
    m_err << "Note not found: " << id << "\n";
    return ExitCode::CommandFailed;
  case notes::StorageStatus::Corrupt:
  case notes::StorageStatus::IoFailure:
    break;
  }
  m_err << "Error: failed to delete " << id << " (" << notes::storageStatusToString(status)
        << ")\n";
  return ExitCode::CommandFailed;
}

ExitCode Launcher::favoriteNote(notes::NoteSession& session,
                                const std::vector<std::string>& args) {
  const bool favorite = args.size() < 2 || args[1] == "on";
  auto result = session.setFavorite(fromStd(args[0]), favorite);
  if (result.isError()) {
    m_err << "Error: " << result.error() << "\n";
    return ExitCode::CommandFailed;
  }
  return ExitCode::Success;
}

// ============================================================================
// Help
// ============================================================================

void Launcher::printVersion() const {
  m_out << "SmoothWrite version " << SMOOTHWRITE_VERSION_STRING << "\n";
  m_out << "A small, fast note-taking engine\n";
}

void Launcher::printHelp(const char* programName) const {
  m_out << "Usage: " << programName << " [options] <command> [args]\n\n";
  m_out << "Commands:\n";
  m_out << "  list                      List notes, most recently modified first\n";
  m_out << "  search <query>            List notes whose title or text contains query\n";
  m_out << "  show <id>                 Print a note as plain text\n";
  m_out << "  new [html]                Create a note and print its id\n";
  m_out << "  edit <id> <html>          Replace a note's content\n";
  m_out << "  delete <id>               Delete a note\n";
  m_out << "  favorite <id> [on|off]    Mark or unmark a note as favorite\n";
  m_out << "  count                     Print the number of stored notes\n\n";
  m_out << "Options:\n";
  m_out << "  --config <path>    Config file (default: smoothwrite.json)\n";
  m_out << "  --notes-dir <path> Directory holding the notes\n";
  m_out << "  --delay <ms>       Auto-save delay in milliseconds\n";
  m_out << "  --no-welcome       Do not create the welcome note in an empty store\n";
  m_out << "  --verbose          Verbose logging\n";
  m_out << "  -h, --help         Show this help message\n";
  m_out << "  --version          Show version information\n";
}

} // namespace SmoothWrite::app
