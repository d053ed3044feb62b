#pragma once

/**
 * @file note_session.hpp
 * @brief Coordinates the editing surface, auto-save, storage and index
 *
 * NoteSession owns the "current note" and the auto-save scheduler for it.
 * The list UI calls selectNote()/createNote()/deleteNote(); the editing
 * surface reports edits, which are debounced and committed:
 *
 *   surface edit -> AutoSaveScheduler::trigger() -> (idle) -> commit:
 *   read surface content -> Note::updateContent() -> NoteStorage::saveNote()
 *   -> NoteIndex::replace()
 *
 * Explicit saves report failures through saveFailed(); auto-save failures
 * are only logged.
 */

#include "SmoothWrite/core/result.hpp"
#include "SmoothWrite/core/types.hpp"
#include "SmoothWrite/notes/auto_save_scheduler.hpp"
#include "SmoothWrite/notes/interfaces/IContentSurface.hpp"
#include "SmoothWrite/notes/note.hpp"
#include "SmoothWrite/notes/note_index.hpp"
#include "SmoothWrite/notes/note_storage.hpp"
#include <QObject>
#include <QString>
#include <optional>

namespace SmoothWrite::notes {

struct NoteSessionOptions {
  i32 autoSaveDelayMs = AutoSaveScheduler::DEFAULT_DELAY_MS;
  bool createWelcomeNote = true; ///< Seed an empty store with the welcome note
};

class NoteSession : public QObject {
  Q_OBJECT

public:
  NoteSession(NoteStorage& storage, NoteIndex& index, IContentSurface& surface,
              const NoteSessionOptions& options = {}, QObject* parent = nullptr);

  /**
   * @brief Flushes and closes the session if close() was not called
   */
  ~NoteSession() override;

  NoteSession(const NoteSession&) = delete;
  NoteSession& operator=(const NoteSession&) = delete;

  /**
   * @brief Load all notes and open the most recent one
   *
   * Seeds the welcome note into an empty store when enabled.
   */
  Result<void> open();

  /**
   * @brief Make @p noteId the current note
   *
   * Pending edits of the previous note are saved first.
   * @return false if the id is not in the index
   */
  bool selectNote(const QString& noteId);

  /**
   * @brief Create, persist and open a new empty note
   */
  Result<Note> createNote();

  /**
   * @brief Explicit save of the current note (Ctrl+S)
   *
   * Failures are returned and emitted via saveFailed().
   */
  Result<void> saveCurrentNote();

  /**
   * @brief Delete a note from storage and index
   */
  StorageStatus deleteNote(const QString& noteId);

  /**
   * @brief Set or clear the favourite flag and persist it
   */
  Result<void> setFavorite(const QString& noteId, bool favorite);

  /**
   * @brief Save pending edits and stop auto-save; idempotent
   */
  void close();

  [[nodiscard]] const std::optional<Note>& currentNote() const { return m_current; }
  [[nodiscard]] QString currentNoteId() const;
  [[nodiscard]] bool isOpen() const { return m_open; }

  [[nodiscard]] AutoSaveScheduler& autoSave() { return m_autoSave; }
  [[nodiscard]] const AutoSaveScheduler& autoSave() const { return m_autoSave; }

signals:
  void currentNoteChanged(const QString& noteId);
  void noteSaved(const QString& noteId);
  /**
   * @brief An explicit save failed; the UI should tell the user
   */
  void saveFailed(const QString& noteId, const QString& message);
  void noteDeleted(const QString& noteId);

private:
  /**
   * @brief Auto-save callback: commit surface content into the current note
   */
  Result<void> commitCurrentNote();

  Result<void> flushCurrentNote();
  void setCurrentNote(const Note& note);

  NoteStorage& m_storage;
  NoteIndex& m_index;
  IContentSurface& m_surface;
  NoteSessionOptions m_options;
  AutoSaveScheduler m_autoSave;
  std::optional<Note> m_current;
  bool m_open = false;
  bool m_closed = false;
};

} // namespace SmoothWrite::notes
