/**
 * @file note_session.cpp
 * @brief NoteSession implementation
 */

#include "SmoothWrite/notes/note_session.hpp"
#include "SmoothWrite/core/logger.hpp"
#include "SmoothWrite/notes/welcome_note.hpp"

namespace SmoothWrite::notes {

NoteSession::NoteSession(NoteStorage& storage, NoteIndex& index, IContentSurface& surface,
                         const NoteSessionOptions& options, QObject* parent)
    : QObject(parent), m_storage(storage), m_index(index), m_surface(surface),
      m_options(options),
      m_autoSave([this]() { return commitCurrentNote(); }, options.autoSaveDelayMs) {
  m_surface.setOnContentChanged([this]() { m_autoSave.trigger(); });
}

NoteSession::~NoteSession() {
  close();
}

QString NoteSession::currentNoteId() const {
  return m_current ? m_current->id() : QString();
}

// ============================================================================
// Lifecycle
// ============================================================================

Result<void> NoteSession::open() {
  if (m_closed) {
    return Result<void>::error("Note session is closed");
  }

  QList<Note> notes = m_storage.loadAllNotes();
  if (notes.isEmpty() && m_options.createWelcomeNote) {
    Note welcome = createWelcomeNote();
    auto saved = m_storage.saveNote(welcome);
    if (saved.isError()) {
      // Still shown; the next save writes it since its file is missing
      SMOOTHWRITE_LOG_WARN("Failed to persist welcome note: {}", saved.error());
    } else {
      SMOOTHWRITE_LOG_INFO("Created welcome note {}", welcome.id().toStdString());
    }
    notes.append(welcome);
  }

  m_index.load(notes);
  m_open = true;
  SMOOTHWRITE_LOG_INFO("Opened {} notes from {}", notes.size(),
                       m_storage.rootDirectory().toStdString());

  if (!notes.isEmpty()) {
    setCurrentNote(notes.first());
  }
  return Result<void>::ok();
}

void NoteSession::close() {
  if (m_closed) {
    return;
  }

  auto flushed = flushCurrentNote();
  if (flushed.isError()) {
    SMOOTHWRITE_LOG_ERROR("Final save of note {} failed: {}", currentNoteId().toStdString(),
                          flushed.error());
  }

  m_autoSave.shutdown();
  m_surface.setOnContentChanged({});
  m_closed = true;
  m_open = false;
  SMOOTHWRITE_LOG_DEBUG("Note session closed");
}

// ============================================================================
// Note operations
// ============================================================================

bool NoteSession::selectNote(const QString& noteId) {
  if (m_closed) {
    return false;
  }
  if (m_current && m_current->id() == noteId) {
    return m_index.select(noteId);
  }

  auto target = m_index.find(noteId);
  if (!target) {
    SMOOTHWRITE_LOG_WARN("Cannot open unknown note {}", noteId.toStdString());
    return false;
  }

  auto flushed = flushCurrentNote();
  if (flushed.isError()) {
    SMOOTHWRITE_LOG_ERROR("Saving note {} before switching failed: {}",
                          currentNoteId().toStdString(), flushed.error());
  }

  // The flush may have replaced the target's record; re-read it
  if (auto refreshed = m_index.find(noteId)) {
    target = refreshed;
  }
  setCurrentNote(*target);
  return true;
}

Result<Note> NoteSession::createNote() {
  if (m_closed) {
    return Result<Note>::error("Note session is closed");
  }

  auto flushed = flushCurrentNote();
  if (flushed.isError()) {
    SMOOTHWRITE_LOG_ERROR("Saving note {} before creating a new one failed: {}",
                          currentNoteId().toStdString(), flushed.error());
  }

  Note note = Note::create();
  auto saved = m_storage.saveNote(note);
  if (saved.isError()) {
    return Result<Note>::error(saved.error());
  }

  m_index.insertNew(note);
  setCurrentNote(note);
  SMOOTHWRITE_LOG_INFO("Created note {}", note.id().toStdString());
  return Result<Note>::ok(note);
}

Result<void> NoteSession::saveCurrentNote() {
  if (m_closed) {
    return Result<void>::error("Note session is closed");
  }
  if (!m_current) {
    return Result<void>::ok();
  }

  const QString id = m_current->id();
  auto result = m_autoSave.saveNow();
  if (result.isError()) {
    emit saveFailed(id, QString::fromStdString(result.error()));
  }
  return result;
}

StorageStatus NoteSession::deleteNote(const QString& noteId) {
  const StorageStatus status = m_storage.removeNote(noteId);
  if (status != StorageStatus::Ok && status != StorageStatus::NotFound) {
    SMOOTHWRITE_LOG_ERROR("Failed to delete note {}: {}", noteId.toStdString(),
                          storageStatusToString(status));
    return status;
  }

  const bool wasCurrent = m_current && m_current->id() == noteId;
  if (wasCurrent) {
    // Pending edits belong to the deleted note and must not recreate it
    m_autoSave.cancel();
    m_current.reset();
    m_surface.clear();
  }

  const bool wasIndexed = m_index.remove(noteId);
  if (status == StorageStatus::Ok || wasIndexed) {
    SMOOTHWRITE_LOG_INFO("Deleted note {}", noteId.toStdString());
    emit noteDeleted(noteId);
  }
  if (wasCurrent) {
    emit currentNoteChanged(QString());
  }
  return status;
}

Result<void> NoteSession::setFavorite(const QString& noteId, bool favorite) {
  if (m_closed) {
    return Result<void>::error("Note session is closed");
  }

  const bool isCurrent = m_current && m_current->id() == noteId;
  std::optional<Note> note = isCurrent ? m_current : m_index.find(noteId);
  if (!note) {
    auto loaded = m_storage.loadNote(noteId);
    if (!loaded.found()) {
      return Result<void>::error("Note not found: " + noteId.toStdString());
    }
    note = loaded.note;
  }

  if (note->isFavorite() == favorite) {
    return Result<void>::ok();
  }

  note->setFavorite(favorite);
  auto saved = m_storage.saveNote(*note);
  if (saved.isError()) {
    return saved;
  }

  if (isCurrent) {
    m_current->setFavorite(favorite);
  }
  m_index.replace(*note);
  emit noteSaved(noteId);
  return Result<void>::ok();
}

// ============================================================================
// Internals
// ============================================================================

Result<void> NoteSession::flushCurrentNote() {
  if (!m_current || m_autoSave.isShutDown()) {
    return Result<void>::ok();
  }
  return m_autoSave.saveNow();
}

Result<void> NoteSession::commitCurrentNote() {
  if (!m_current) {
    return Result<void>::ok();
  }

  const QString content = m_surface.content();
  const bool changed = content != m_current->content();
  // Unchanged notes are rewritten only when their file is missing
  if (!changed && m_storage.noteExists(m_current->id())) {
    return Result<void>::ok();
  }

  Note updated = *m_current;
  if (changed) {
    updated.updateContent(content);
  }
  auto saved = m_storage.saveNote(updated);
  if (saved.isError()) {
    return saved;
  }

  m_current = updated;
  m_index.replace(updated);
  SMOOTHWRITE_LOG_DEBUG("Saved note {} ({})", updated.id().toStdString(),
                        updated.title().toStdString());
  emit noteSaved(updated.id());
  return Result<void>::ok();
}

void NoteSession::setCurrentNote(const Note& note) {
  m_current = note;
  m_surface.setContent(note.content());
  m_index.select(note.id());
  emit currentNoteChanged(note.id());
}

} // namespace SmoothWrite::notes
