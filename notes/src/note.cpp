#include "SmoothWrite/notes/note.hpp"
#include "SmoothWrite/core/logger.hpp"
#include "SmoothWrite/notes/html_text.hpp"
#include <QJsonDocument>
#include <QJsonParseError>
#include <QStringList>
#include <QUuid>

namespace SmoothWrite::notes {

namespace {

QString timestampToString(const QDateTime& timestamp) {
  return timestamp.toUTC().toString(Qt::ISODateWithMs);
}

QDateTime timestampFromJson(const QJsonValue& value, const QDateTime& fallback) {
  if (!value.isString()) {
    return fallback;
  }
  QDateTime parsed = QDateTime::fromString(value.toString(), Qt::ISODateWithMs);
  if (!parsed.isValid()) {
    parsed = QDateTime::fromString(value.toString(), Qt::ISODate);
  }
  return parsed.isValid() ? parsed.toUTC() : fallback;
}

} // namespace

Note::Note()
    : m_id(generateId()), m_title(QString::fromLatin1(UNTITLED)),
      m_createdAt(QDateTime::currentDateTimeUtc()), m_modifiedAt(m_createdAt) {}

Note Note::create() {
  return Note();
}

QString Note::generateId() {
  return QUuid::createUuid().toString(QUuid::WithoutBraces);
}

void Note::updateContent(const QString& content) {
  m_content = content;

  const QDateTime now = QDateTime::currentDateTimeUtc();
  if (!m_modifiedAt.isValid() || now > m_modifiedAt) {
    m_modifiedAt = now;
  }

  m_title = deriveTitle(content);
}

QString Note::plainText() const {
  return html::toPlainText(m_content);
}

QString Note::deriveTitle(const QString& content) {
  const QString untitled = QString::fromLatin1(UNTITLED);
  if (content.trimmed().isEmpty()) {
    return untitled;
  }

  const QString plain = html::toPlainText(content);
  const QStringList lines = plain.split(QLatin1Char('\n'));
  for (const QString& rawLine : lines) {
    const QString line = rawLine.trimmed();
    if (line.isEmpty()) {
      continue;
    }
    if (line.size() <= TITLE_MAX_LENGTH) {
      return line;
    }

    // Do not split a surrogate pair at the cut
    qsizetype cut = TITLE_MAX_LENGTH;
    if (line.at(cut - 1).isHighSurrogate()) {
      --cut;
    }
    return line.left(cut) + QString::fromLatin1(ELLIPSIS);
  }

  return untitled;
}

QJsonObject Note::toJson() const {
  QJsonObject obj;
  obj.insert("schema_version", SCHEMA_VERSION);
  obj.insert("id", m_id);
  obj.insert("title", m_title);
  obj.insert("content", m_content);
  obj.insert("created_at", timestampToString(m_createdAt));
  obj.insert("modified_at", timestampToString(m_modifiedAt));
  obj.insert("is_favorite", m_favorite);
  return obj;
}

Note Note::fromJson(const QJsonObject& json, const QString& fallbackId) {
  // Records written before schema_version existed count as version 0
  const i32 version = json.value("schema_version").toInt(0);
  if (version > SCHEMA_VERSION) {
    SMOOTHWRITE_LOG_WARN("Note record has schema version {} (supported: {}), loading known fields",
                         version, SCHEMA_VERSION);
  }

  const QDateTime now = QDateTime::currentDateTimeUtc();

  Note note;
  const QString id = json.value("id").toString();
  if (!id.isEmpty()) {
    note.m_id = id;
  } else if (!fallbackId.isEmpty()) {
    note.m_id = fallbackId;
  }

  note.m_content = json.value("content").toString();
  // The stored title is informational; the content is authoritative
  note.m_title = deriveTitle(note.m_content);
  note.m_createdAt = timestampFromJson(json.value("created_at"), now);
  note.m_modifiedAt = timestampFromJson(json.value("modified_at"), now);
  note.m_favorite = json.value("is_favorite").toBool(false);
  return note;
}

QByteArray Note::serialize() const {
  return QJsonDocument(toJson()).toJson(QJsonDocument::Indented);
}

Result<Note> Note::deserialize(const QByteArray& data, const QString& fallbackId) {
  QJsonParseError parseError;
  const QJsonDocument doc = QJsonDocument::fromJson(data, &parseError);
  if (parseError.error != QJsonParseError::NoError) {
    return Result<Note>::error("Invalid note JSON at offset " +
                               std::to_string(parseError.offset) + ": " +
                               parseError.errorString().toStdString());
  }
  if (!doc.isObject()) {
    return Result<Note>::error("Note JSON is not an object");
  }
  return Result<Note>::ok(fromJson(doc.object(), fallbackId));
}

bool Note::operator==(const Note& other) const {
  return m_id == other.m_id && m_title == other.m_title && m_content == other.m_content &&
         m_createdAt == other.m_createdAt && m_modifiedAt == other.m_modifiedAt &&
         m_favorite == other.m_favorite;
}

} // namespace SmoothWrite::notes
