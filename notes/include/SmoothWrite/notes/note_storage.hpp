#pragma once

/**
 * @file note_storage.hpp
 * @brief One-file-per-note persistence under a root directory
 *
 * Every note lives in <root>/<id>.json. There is no manifest: the directory
 * listing is the index, rebuilt by loadAllNotes() on each start. Writes go
 * through a temporary file and an atomic rename, so an interrupted save
 * leaves the previous version intact.
 *
 * Expected conditions never throw. Saves return Result<void>, loads return a
 * NoteLoadResult carrying a StorageStatus, deletes return a StorageStatus.
 */

#include "SmoothWrite/core/result.hpp"
#include "SmoothWrite/core/types.hpp"
#include "SmoothWrite/notes/note.hpp"
#include <QList>
#include <QString>
#include <filesystem>
#include <optional>

namespace SmoothWrite::notes {

/**
 * @brief Outcome of a storage operation
 */
enum class StorageStatus : u8 {
  Ok = 0,       ///< Operation succeeded
  NotFound = 1, ///< No file backs the identifier (a normal outcome)
  Corrupt = 2,  ///< File exists but could not be parsed
  IoFailure = 3 ///< Permission, disk or other filesystem error
};

[[nodiscard]] const char* storageStatusToString(StorageStatus status);

/**
 * @brief Result of loading a single note
 */
struct NoteLoadResult {
  StorageStatus status = StorageStatus::NotFound;
  std::optional<Note> note; ///< Set only when status == Ok
  QString message;          ///< Diagnostic for Corrupt / IoFailure

  [[nodiscard]] bool found() const { return status == StorageStatus::Ok && note.has_value(); }
};

class NoteStorage {
public:
  static constexpr const char* FILE_EXTENSION = ".json";
  static constexpr const char* TEMP_SUFFIX = ".tmp";

  /**
   * @brief Bind storage to a root directory
   *
   * The directory is created on the first save, not here.
   */
  explicit NoteStorage(const QString& rootDirectory);

  [[nodiscard]] const QString& rootDirectory() const { return m_rootDirectory; }

  /**
   * @brief Persist a note, replacing any previous version
   */
  Result<void> saveNote(const Note& note);

  /**
   * @brief Load one note by id
   */
  [[nodiscard]] NoteLoadResult loadNote(const QString& id) const;

  /**
   * @brief Load every readable note, newest modification first
   *
   * Corrupt or unreadable records are logged and skipped. Leftover
   * temporary files from interrupted saves are removed.
   */
  [[nodiscard]] QList<Note> loadAllNotes() const;

  /**
   * @brief Delete a note's file
   * @return Ok, NotFound for unknown ids, or IoFailure
   */
  StorageStatus removeNote(const QString& id);

  /**
   * @brief Number of persisted records (no parsing involved)
   */
  [[nodiscard]] i32 noteCount() const;

  [[nodiscard]] bool noteExists(const QString& id) const;

  /**
   * @brief Absolute path of the file backing @p id
   */
  [[nodiscard]] QString notePath(const QString& id) const;

  /**
   * @brief Whether an id can be used as a file name inside the root
   */
  [[nodiscard]] static bool isValidId(const QString& id);

private:
  [[nodiscard]] std::filesystem::path rootPath() const;
  [[nodiscard]] std::filesystem::path pathFor(const QString& id) const;
  Result<void> ensureRootDirectory() const;
  [[nodiscard]] static bool isNoteFile(const std::filesystem::directory_entry& entry);

  QString m_rootDirectory;
};

} // namespace SmoothWrite::notes
