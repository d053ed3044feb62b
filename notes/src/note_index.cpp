#include "SmoothWrite/notes/note_index.hpp"
#include "SmoothWrite/core/logger.hpp"

namespace SmoothWrite::notes {

NoteIndex::NoteIndex(QObject* parent) : QObject(parent) {}

NoteIndex::~NoteIndex() = default;

// ============================================================================
// Mutation
// ============================================================================

void NoteIndex::load(const QList<Note>& notes) {
  m_notes = notes;

  const bool selectionLost = !m_selectedId.isEmpty() && indexOf(m_selectedId) < 0;
  if (selectionLost) {
    m_selectedId.clear();
  }

  SMOOTHWRITE_LOG_DEBUG("Note index loaded with {} notes", m_notes.size());
  emit indexReset();
  if (selectionLost) {
    emit selectionChanged(QString());
  }
}

void NoteIndex::insertNew(const Note& note) {
  if (replace(note)) {
    return;
  }
  m_notes.prepend(note);
  emit noteInserted(note.id());
}

bool NoteIndex::replace(const Note& note) {
  const qsizetype position = indexOf(note.id());
  if (position < 0) {
    return false;
  }

  // Edited notes stay where they are; ordering is only rebuilt on load()
  m_notes[position] = note;
  emit noteReplaced(note.id(), position);
  return true;
}

bool NoteIndex::remove(const QString& id) {
  const qsizetype position = indexOf(id);
  if (position < 0) {
    return false;
  }

  m_notes.removeAt(position);
  emit noteRemoved(id);

  if (m_selectedId == id) {
    clearSelection();
  }
  return true;
}

void NoteIndex::clear() {
  load(QList<Note>());
}

// ============================================================================
// Selection
// ============================================================================

bool NoteIndex::select(const QString& id) {
  if (indexOf(id) < 0) {
    SMOOTHWRITE_LOG_DEBUG("Ignoring selection of unknown note {}", id.toStdString());
    return false;
  }
  if (m_selectedId != id) {
    m_selectedId = id;
    emit selectionChanged(id);
  }
  return true;
}

void NoteIndex::clearSelection() {
  if (m_selectedId.isEmpty()) {
    return;
  }
  m_selectedId.clear();
  emit selectionChanged(QString());
}

std::optional<Note> NoteIndex::findSelected() const {
  if (m_selectedId.isEmpty()) {
    return std::nullopt;
  }
  return find(m_selectedId);
}

// ============================================================================
// Queries
// ============================================================================

bool NoteIndex::matches(const Note& note, const QString& query) {
  if (note.title().contains(query, Qt::CaseInsensitive)) {
    return true;
  }
  return note.plainText().contains(query, Qt::CaseInsensitive);
}

QList<Note> NoteIndex::search(const QString& query) const {
  const QString needle = query.trimmed();
  if (needle.isEmpty()) {
    return m_notes;
  }

  QList<Note> result;
  for (const Note& note : m_notes) {
    if (matches(note, needle)) {
      result.append(note);
    }
  }
  return result;
}

QList<Note> NoteIndex::favorites() const {
  QList<Note> result;
  for (const Note& note : m_notes) {
    if (note.isFavorite()) {
      result.append(note);
    }
  }
  return result;
}

std::optional<Note> NoteIndex::find(const QString& id) const {
  const qsizetype position = indexOf(id);
  if (position < 0) {
    return std::nullopt;
  }
  return m_notes.at(position);
}

qsizetype NoteIndex::indexOf(const QString& id) const {
  for (qsizetype i = 0; i < m_notes.size(); ++i) {
    if (m_notes.at(i).id() == id) {
      return i;
    }
  }
  return -1;
}

} // namespace SmoothWrite::notes
