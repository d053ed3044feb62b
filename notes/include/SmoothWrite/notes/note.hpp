#pragma once

/**
 * @file note.hpp
 * @brief Note record with derived title and JSON serialization
 *
 * A Note owns its rich-text content and the metadata derived from it. The
 * title is never set directly: updateContent() recomputes it together with
 * the modification timestamp, so title and content cannot drift apart.
 */

#include "SmoothWrite/core/result.hpp"
#include "SmoothWrite/core/types.hpp"
#include <QByteArray>
#include <QDateTime>
#include <QJsonObject>
#include <QString>

namespace SmoothWrite::notes {

class Note {
public:
  static constexpr const char* UNTITLED = "Untitled";
  static constexpr const char* ELLIPSIS = "...";
  static constexpr i32 TITLE_MAX_LENGTH = 50;
  static constexpr i32 SCHEMA_VERSION = 1;

  /**
   * @brief Construct a fresh, empty note (new id, timestamps set to now)
   */
  Note();

  /**
   * @brief Create a new empty note
   */
  [[nodiscard]] static Note create();

  [[nodiscard]] const QString& id() const { return m_id; }
  [[nodiscard]] const QString& title() const { return m_title; }
  [[nodiscard]] const QString& content() const { return m_content; }
  [[nodiscard]] const QDateTime& createdAt() const { return m_createdAt; }
  [[nodiscard]] const QDateTime& modifiedAt() const { return m_modifiedAt; }
  [[nodiscard]] bool isFavorite() const { return m_favorite; }

  /**
   * @brief Replace the content and refresh title and modification time
   *
   * modifiedAt never moves backwards, even if the wall clock does.
   */
  void updateContent(const QString& content);

  /**
   * @brief Set the favourite flag (does not touch modifiedAt)
   */
  void setFavorite(bool favorite) { m_favorite = favorite; }

  /**
   * @brief Plain-text rendering of the content
   */
  [[nodiscard]] QString plainText() const;

  /**
   * @brief Derive a title from rich-text content
   *
   * "Untitled" for empty content or content without visible text, otherwise
   * the first non-empty line of the plain text, cut to TITLE_MAX_LENGTH
   * characters followed by "..." when longer.
   */
  [[nodiscard]] static QString deriveTitle(const QString& content);

  [[nodiscard]] QJsonObject toJson() const;

  /**
   * @brief Build a note from a JSON object, defaulting missing fields
   * @param json Serialized note
   * @param fallbackId Id used when the record has none (a fresh id if empty)
   */
  [[nodiscard]] static Note fromJson(const QJsonObject& json, const QString& fallbackId = QString());

  /**
   * @brief Serialize to indented UTF-8 JSON
   */
  [[nodiscard]] QByteArray serialize() const;

  /**
   * @brief Parse serialized bytes
   * @return The note, or an error if the bytes are not a JSON object
   */
  [[nodiscard]] static Result<Note> deserialize(const QByteArray& data,
                                                const QString& fallbackId = QString());

  [[nodiscard]] static QString generateId();

  bool operator==(const Note& other) const;
  bool operator!=(const Note& other) const { return !(*this == other); }

private:
  QString m_id;
  QString m_title;
  QString m_content;
  QDateTime m_createdAt;
  QDateTime m_modifiedAt;
  bool m_favorite = false;
};

} // namespace SmoothWrite::notes
