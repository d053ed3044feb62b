#pragma once

/**
 * @file IContentSurface.hpp
 * @brief Interface to the rich-text editing surface
 *
 * The note engine never talks to an editor widget directly. It pulls the
 * current HTML, pushes a note's HTML when another note is opened, and
 * listens for "content changed" notifications that drive auto-save.
 *
 * Implementations must not report setContent()/clear() calls as user edits.
 */

#include <QString>
#include <functional>

namespace SmoothWrite::notes {

class IContentSurface {
public:
  virtual ~IContentSurface() = default;

  /**
   * @brief Current content as HTML
   */
  [[nodiscard]] virtual QString content() const = 0;

  /**
   * @brief Replace the displayed content (not reported as an edit)
   */
  virtual void setContent(const QString& html) = 0;

  /**
   * @brief Empty the surface (not reported as an edit)
   */
  virtual void clear() = 0;

  /**
   * @brief Register the handler for user edits
   *
   * Notifications are delivered synchronously, in the order the edits
   * happen. Passing an empty function unregisters the handler.
   */
  virtual void setOnContentChanged(std::function<void()> callback) = 0;
};

} // namespace SmoothWrite::notes
