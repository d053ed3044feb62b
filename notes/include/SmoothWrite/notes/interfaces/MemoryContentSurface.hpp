#pragma once

/**
 * @file MemoryContentSurface.hpp
 * @brief In-memory IContentSurface without any widget
 *
 * Used by the command-line front end and by tests. applyEdit() simulates a
 * user edit (content change plus notification); setContent() behaves like
 * an editor loading a document.
 */

#include "SmoothWrite/core/types.hpp"
#include "SmoothWrite/notes/interfaces/IContentSurface.hpp"
#include <utility>

namespace SmoothWrite::notes {

class MemoryContentSurface : public IContentSurface {
public:
  MemoryContentSurface() = default;
  ~MemoryContentSurface() override = default;

  // =========================================================================
  // IContentSurface Implementation
  // =========================================================================

  [[nodiscard]] QString content() const override {
    ++m_readCount;
    return m_content;
  }

  void setContent(const QString& html) override {
    m_content = html;
    ++m_setCount;
  }

  void clear() override {
    m_content.clear();
    ++m_clearCount;
  }

  void setOnContentChanged(std::function<void()> callback) override {
    m_onContentChanged = std::move(callback);
  }

  // =========================================================================
  // Editing
  // =========================================================================

  /**
   * @brief Replace the content as a user edit and notify the listener
   */
  void applyEdit(const QString& html) {
    m_content = html;
    ++m_editCount;
    if (m_onContentChanged) {
      m_onContentChanged();
    }
  }

  // =========================================================================
  // Inspection
  // =========================================================================

  [[nodiscard]] i32 readCount() const { return m_readCount; }
  [[nodiscard]] i32 setCount() const { return m_setCount; }
  [[nodiscard]] i32 clearCount() const { return m_clearCount; }
  [[nodiscard]] i32 editCount() const { return m_editCount; }
  [[nodiscard]] bool hasListener() const { return static_cast<bool>(m_onContentChanged); }

private:
  QString m_content;
  std::function<void()> m_onContentChanged;
  mutable i32 m_readCount = 0;
  i32 m_setCount = 0;
  i32 m_clearCount = 0;
  i32 m_editCount = 0;
};

} // namespace SmoothWrite::notes
