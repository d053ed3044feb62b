#include "SmoothWrite/notes/note_storage.hpp"
#include "SmoothWrite/core/logger.hpp"
#include <QJsonObject>
#include <algorithm>
#include <fstream>
#include <iterator>
#include <system_error>

namespace fs = std::filesystem;

namespace SmoothWrite::notes {

namespace {

constexpr qsizetype MAX_ID_LENGTH = 200;

std::string toStd(const QString& text) {
  return text.toStdString();
}

std::string pathString(const fs::path& path) {
  return QString::fromStdU16String(path.u16string()).toStdString();
}

Result<QByteArray> readFile(const fs::path& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    return Result<QByteArray>::error("Failed to open file: " + pathString(path));
  }

  std::string buffer((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
  if (file.bad()) {
    return Result<QByteArray>::error("Failed to read file: " + pathString(path));
  }
  return Result<QByteArray>::ok(QByteArray::fromStdString(buffer));
}

} // namespace

const char* storageStatusToString(StorageStatus status) {
  switch (status) {
  case StorageStatus::Ok:
    return "ok";
  case StorageStatus::NotFound:
    return "not found";
  case StorageStatus::Corrupt:
    return "corrupt";
  case StorageStatus::IoFailure:
    return "I/O failure";
  }
  return "unknown";
}

NoteStorage::NoteStorage(const QString& rootDirectory) : m_rootDirectory(rootDirectory) {}

bool NoteStorage::isValidId(const QString& id) {
  if (id.isEmpty() || id.size() > MAX_ID_LENGTH) {
    return false;
  }
  if (id.startsWith(QLatin1Char('.'))) {
    return false;
  }
  for (const QChar c : id) {
    if (c == QLatin1Char('/') || c == QLatin1Char('\\') || c == QLatin1Char(':') ||
        c.isNull() || c.category() == QChar::Other_Control) {
      return false;
    }
  }
  return true;
}

fs::path NoteStorage::rootPath() const {
  return fs::path(m_rootDirectory.toStdU16String());
}

fs::path NoteStorage::pathFor(const QString& id) const {
  return rootPath() / fs::path((id + QString::fromLatin1(FILE_EXTENSION)).toStdU16String());
}

QString NoteStorage::notePath(const QString& id) const {
  return QString::fromStdU16String(pathFor(id).u16string());
}

bool NoteStorage::isNoteFile(const fs::directory_entry& entry) {
  std::error_code ec;
  if (!entry.is_regular_file(ec) || ec || entry.path().extension() != FILE_EXTENSION) {
    return false;
  }
  return isValidId(QString::fromStdU16String(entry.path().stem().u16string()));
}

Result<void> NoteStorage::ensureRootDirectory() const {
  std::error_code ec;
  const fs::path root = rootPath();
  if (fs::is_directory(root, ec)) {
    return Result<void>::ok();
  }

  fs::create_directories(root, ec);
  if (ec) {
    return Result<void>::error("Failed to create notes directory " + pathString(root) + ": " +
                               ec.message());
  }
  SMOOTHWRITE_LOG_INFO("Created notes directory: " + pathString(root));
  return Result<void>::ok();
}

// ============================================================================
// Save (atomic)
// ============================================================================

Result<void> NoteStorage::saveNote(const Note& note) {
  if (!isValidId(note.id())) {
    const std::string message = "Refusing to save note with invalid id '" + toStd(note.id()) + "'";
    SMOOTHWRITE_LOG_ERROR(message);
    return Result<void>::error(message);
  }

  try {
    auto dirResult = ensureRootDirectory();
    if (dirResult.isError()) {
      SMOOTHWRITE_LOG_ERROR(dirResult.error());
      return dirResult;
    }

    const QByteArray data = note.serialize();
    const fs::path targetPath = pathFor(note.id());
    fs::path tempPath = targetPath;
    tempPath += TEMP_SUFFIX;

    // Write to temporary file
    {
      std::ofstream tempFile(tempPath, std::ios::binary | std::ios::trunc);
      if (!tempFile.is_open()) {
        const std::string message = "Failed to create temporary file: " + pathString(tempPath);
        SMOOTHWRITE_LOG_ERROR("Failed to save note {}: {}", toStd(note.id()), message);
        return Result<void>::error(message);
      }

      tempFile.write(data.constData(), static_cast<std::streamsize>(data.size()));
      tempFile.flush();

      if (tempFile.fail()) {
        tempFile.close();
        std::error_code cleanup;
        fs::remove(tempPath, cleanup);
        const std::string message = "Failed to write temporary file: " + pathString(tempPath);
        SMOOTHWRITE_LOG_ERROR("Failed to save note {}: {}", toStd(note.id()), message);
        return Result<void>::error(message);
      }
    }

    // Rename temp file over the target (atomic on the same filesystem)
    std::error_code ec;
    fs::rename(tempPath, targetPath, ec);
    if (ec) {
      std::error_code cleanup;
      fs::remove(tempPath, cleanup);
      const std::string message = "Atomic write failed for " + pathString(targetPath) + ": " +
                                  ec.message();
      SMOOTHWRITE_LOG_ERROR("Failed to save note {}: {}", toStd(note.id()), message);
      return Result<void>::error(message);
    }
  } catch (const std::exception& e) {
    const std::string message = std::string("Failed to save note: ") + e.what();
    SMOOTHWRITE_LOG_ERROR(message);
    return Result<void>::error(message);
  }

  SMOOTHWRITE_LOG_DEBUG("Saved note {}", toStd(note.id()));
  return Result<void>::ok();
}

// ============================================================================
// Load
// ============================================================================

NoteLoadResult NoteStorage::loadNote(const QString& id) const {
  NoteLoadResult result;

  if (!isValidId(id)) {
    SMOOTHWRITE_LOG_WARN("Note id '{}' is not a valid file name", toStd(id));
    result.status = StorageStatus::NotFound;
    return result;
  }

  const fs::path path = pathFor(id);
  std::error_code ec;
  const bool exists = fs::exists(path, ec);
  if (ec) {
    result.status = StorageStatus::IoFailure;
    result.message = QString::fromStdString("Failed to stat " + pathString(path) + ": " +
                                            ec.message());
    SMOOTHWRITE_LOG_ERROR(result.message.toStdString());
    return result;
  }
  if (!exists) {
    SMOOTHWRITE_LOG_DEBUG("Note {} not found", toStd(id));
    result.status = StorageStatus::NotFound;
    return result;
  }
  if (!fs::is_regular_file(path, ec)) {
    result.status = StorageStatus::IoFailure;
    result.message = QString::fromStdString(pathString(path) + " is not a regular file");
    SMOOTHWRITE_LOG_ERROR(result.message.toStdString());
    return result;
  }

  auto bytes = readFile(path);
  if (bytes.isError()) {
    result.status = StorageStatus::IoFailure;
    result.message = QString::fromStdString(bytes.error());
    SMOOTHWRITE_LOG_ERROR(bytes.error());
    return result;
  }

  auto parsed = Note::deserialize(bytes.value(), id);
  if (parsed.isError()) {
    result.status = StorageStatus::Corrupt;
    result.message = QString::fromStdString(parsed.error());
    SMOOTHWRITE_LOG_WARN("Note file {} is corrupt: {}", pathString(path), parsed.error());
    return result;
  }

  Note note = std::move(parsed).value();
  if (note.id() != id) {
    // The file name is the key; keep the record addressable by it
    SMOOTHWRITE_LOG_WARN("Note file {} declares id '{}', using '{}'", pathString(path),
                         toStd(note.id()), toStd(id));
    QJsonObject json = note.toJson();
    json.insert("id", id);
    note = Note::fromJson(json, id);
  }

  result.status = StorageStatus::Ok;
  result.note = std::move(note);
  return result;
}

QList<Note> NoteStorage::loadAllNotes() const {
  QList<Note> notes;
  const fs::path root = rootPath();

  std::error_code ec;
  if (!fs::is_directory(root, ec)) {
    SMOOTHWRITE_LOG_INFO("Notes directory {} does not exist yet", pathString(root));
    return notes;
  }

  i32 skipped = 0;
  fs::directory_iterator it(root, ec);
  const fs::directory_iterator end;
  for (; !ec && it != end; it.increment(ec)) {
    const fs::directory_entry& entry = *it;

    // Left by an interrupted save, or still being written by another
    // process; the next save of that note truncates it
    std::error_code typeError;
    if (entry.is_regular_file(typeError) && entry.path().extension() == TEMP_SUFFIX &&
        entry.path().stem().extension() == FILE_EXTENSION) {
      SMOOTHWRITE_LOG_WARN("Ignoring temporary file {}", pathString(entry.path()));
      continue;
    }

    if (!isNoteFile(entry)) {
      continue;
    }

    const QString id = QString::fromStdU16String(entry.path().stem().u16string());
    NoteLoadResult loaded = loadNote(id);
    if (!loaded.found()) {
      ++skipped;
      SMOOTHWRITE_LOG_ERROR("Skipping note file {} ({}): {}", pathString(entry.path()),
                            storageStatusToString(loaded.status), toStd(loaded.message));
      continue;
    }
    notes.append(std::move(*loaded.note));
  }

  if (ec) {
    SMOOTHWRITE_LOG_ERROR("Failed to enumerate notes directory {}: {}", pathString(root),
                          ec.message());
  }

  std::stable_sort(notes.begin(), notes.end(), [](const Note& a, const Note& b) {
    if (a.modifiedAt() != b.modifiedAt()) {
      return a.modifiedAt() > b.modifiedAt();
    }
    return a.id() < b.id();
  });

  SMOOTHWRITE_LOG_INFO("Loaded {} notes ({} skipped)", notes.size(), skipped);
  return notes;
}

// ============================================================================
// Delete / Count
// ============================================================================

StorageStatus NoteStorage::removeNote(const QString& id) {
  if (!isValidId(id)) {
    SMOOTHWRITE_LOG_WARN("Note id '{}' is not a valid file name", toStd(id));
    return StorageStatus::NotFound;
  }

  const fs::path path = pathFor(id);
  std::error_code ec;
  const bool removed = fs::remove(path, ec);
  if (ec) {
    SMOOTHWRITE_LOG_ERROR("Failed to delete note {}: {}", toStd(id), ec.message());
    return StorageStatus::IoFailure;
  }
  if (!removed) {
    SMOOTHWRITE_LOG_WARN("Note {} not found for deletion", toStd(id));
    return StorageStatus::NotFound;
  }

  SMOOTHWRITE_LOG_INFO("Deleted note {}", toStd(id));
  return StorageStatus::Ok;
}

bool NoteStorage::noteExists(const QString& id) const {
  if (!isValidId(id)) {
    return false;
  }
  std::error_code ec;
  return fs::is_regular_file(pathFor(id), ec);
}

i32 NoteStorage::noteCount() const {
  const fs::path root = rootPath();
  std::error_code ec;
  if (!fs::is_directory(root, ec)) {
    return 0;
  }

  i32 count = 0;
  fs::directory_iterator it(root, ec);
  const fs::directory_iterator end;
  for (; !ec && it != end; it.increment(ec)) {
    if (isNoteFile(*it)) {
      ++count;
    }
  }
  if (ec) {
    SMOOTHWRITE_LOG_ERROR("Failed to count notes in {}: {}", pathString(root), ec.message());
  }
  return count;
}

} // namespace SmoothWrite::notes
