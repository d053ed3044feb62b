#pragma once

/**
 * @file note_index.hpp
 * @brief In-memory, recency-ordered working set of notes
 *
 * NoteIndex mirrors the persisted notes for the list UI:
 * - Ordered by modification time (newest first) as delivered by
 *   NoteStorage::loadAllNotes()
 * - New notes go to the front; edited notes keep their position
 * - Single selection tracking
 * - Case-insensitive substring search over title and plain-text content
 *
 * Search and favourites are projections; they never reorder or drop
 * records from the underlying sequence.
 */

#include "SmoothWrite/core/types.hpp"
#include "SmoothWrite/notes/note.hpp"
#include <QList>
#include <QObject>
#include <QString>
#include <optional>

namespace SmoothWrite::notes {

class NoteIndex : public QObject {
  Q_OBJECT

public:
  explicit NoteIndex(QObject* parent = nullptr);
  ~NoteIndex() override;

  // ==========================================================================
  // Mutation
  // ==========================================================================

  /**
   * @brief Replace the whole working set
   * @param notes Notes already sorted newest first
   */
  void load(const QList<Note>& notes);

  /**
   * @brief Prepend a newly created note
   *
   * A record with the same id is replaced in place instead.
   */
  void insertNew(const Note& note);

  /**
   * @brief Update the record with the same id, keeping its position
   * @return false if no record has that id
   */
  bool replace(const Note& note);

  /**
   * @brief Remove a record; no-op if absent
   * @return true if something was removed
   */
  bool remove(const QString& id);

  void clear();

  // ==========================================================================
  // Selection
  // ==========================================================================

  /**
   * @brief Select a note; unknown ids are ignored
   * @return true if the selection now points at @p id
   */
  bool select(const QString& id);

  void clearSelection();

  [[nodiscard]] std::optional<Note> findSelected() const;
  [[nodiscard]] const QString& selectedId() const { return m_selectedId; }

  // ==========================================================================
  // Queries
  // ==========================================================================

  /**
   * @brief Notes whose title or plain-text content contains @p query
   *
   * Case-insensitive. An empty or whitespace-only query returns every note.
   */
  [[nodiscard]] QList<Note> search(const QString& query) const;

  [[nodiscard]] QList<Note> favorites() const;

  [[nodiscard]] std::optional<Note> find(const QString& id) const;
  [[nodiscard]] bool contains(const QString& id) const { return indexOf(id) >= 0; }
  [[nodiscard]] qsizetype indexOf(const QString& id) const;

  [[nodiscard]] const QList<Note>& notes() const { return m_notes; }
  [[nodiscard]] qsizetype count() const { return m_notes.size(); }
  [[nodiscard]] bool isEmpty() const { return m_notes.isEmpty(); }

signals:
  void indexReset();
  void noteInserted(const QString& noteId);
  void noteReplaced(const QString& noteId, qsizetype position);
  void noteRemoved(const QString& noteId);
  void selectionChanged(const QString& noteId);

private:
  [[nodiscard]] static bool matches(const Note& note, const QString& query);

  QList<Note> m_notes;
  QString m_selectedId;
};

} // namespace SmoothWrite::notes
