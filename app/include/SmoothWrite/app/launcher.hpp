#pragma once

/**
 * @file launcher.hpp
 * @brief Command-line front end for the note engine
 *
 * The launcher:
 * - Parses command-line options and the command to run
 * - Loads configuration (defaults, smoothwrite.json, command-line overrides)
 * - Initializes logging (console on stderr, optional log file)
 * - Opens a NoteSession over an in-memory content surface
 * - Runs one command and flushes pending edits before exiting
 *
 * Usage:
 *   smoothwrite list
 *   smoothwrite --notes-dir ~/notes search groceries
 *   smoothwrite new "<p>Buy milk</p>"
 */

#include "SmoothWrite/core/result.hpp"
#include "SmoothWrite/core/types.hpp"
#include "SmoothWrite/notes/app_config.hpp"
#include "SmoothWrite/notes/note.hpp"
#include <QList>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace SmoothWrite::notes {
class NoteIndex;
class NoteSession;
class NoteStorage;
class MemoryContentSurface;
} // namespace SmoothWrite::notes

namespace SmoothWrite::app {

/**
 * @brief Process exit codes
 */
enum class ExitCode : i32 { Success = 0, CommandFailed = 1, UsageError = 2 };

/**
 * @brief Parsed command line
 */
struct LaunchOptions {
  std::string configPath;                // Config file (default: smoothwrite.json)
  std::optional<std::string> notesDir;   // Overrides notes_directory
  std::optional<i32> autoSaveDelayMs;    // Overrides auto_save_delay_ms
  bool noWelcome = false;                // Do not seed an empty store
  bool verbose = false;                  // Debug logging
  bool help = false;                     // Show help
  bool version = false;                  // Show version
  std::string command;                   // list, search, show, new, edit, ...
  std::vector<std::string> args;         // Command arguments
};

class Launcher {
public:
  Launcher(std::ostream& out, std::ostream& err);
  ~Launcher();

  // Non-copyable
  Launcher(const Launcher&) = delete;
  Launcher& operator=(const Launcher&) = delete;

  /**
   * @brief Parse and run a command line
   * @return Process exit code
   */
  i32 run(int argc, char* argv[]);

  /**
   * @brief Run already parsed options
   */
  i32 run(const LaunchOptions& options);

  /**
   * @brief Parse arguments (without the program name)
   * @return Options, or a usage error message
   */
  [[nodiscard]] static Result<LaunchOptions> parseArgs(const std::vector<std::string>& args);

  /**
   * @brief Effective configuration of the last run()
   */
  [[nodiscard]] const notes::AppConfig& config() const { return m_config; }

  void printHelp(const char* programName) const;
  void printVersion() const;

private:
  Result<void> initializeConfig(const LaunchOptions& options);
  void initializeLogging();

  ExitCode dispatch(const LaunchOptions& options, notes::NoteSession& session,
                    notes::NoteStorage& storage, notes::NoteIndex& index,
                    notes::MemoryContentSurface& surface);

  ExitCode listNotes(const QList<notes::Note>& list) const;
  ExitCode showNote(const notes::NoteIndex& index, const std::string& id) const;
  ExitCode newNote(notes::NoteSession& session, notes::MemoryContentSurface& surface,
                   const std::vector<std::string>& args);
  ExitCode editNote(notes::NoteSession& session, notes::MemoryContentSurface& surface,
                    const std::string& id, const std::string& html);
  ExitCode deleteNote(notes::NoteSession& session, const std::string& id);
  ExitCode favoriteNote(notes::NoteSession& session, const std::vector<std::string>& args);

  std::ostream& m_out;
  std::ostream& m_err;
  notes::AppConfig m_config;
};

} // namespace SmoothWrite::app
