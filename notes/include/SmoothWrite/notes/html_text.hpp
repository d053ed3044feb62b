#pragma once

/**
 * @file html_text.hpp
 * @brief Markup-to-plain-text rendering used for titles and search
 *
 * The rich-text editor hands notes over as HTML (a full document with
 * <head> and <style> sections, or a bare fragment). Derived metadata only
 * cares about the visible text, which QTextDocument produces.
 *
 * QTextDocument needs a QGuiApplication; command-line front ends run it
 * on the offscreen platform.
 */

#include <QString>

namespace SmoothWrite::notes::html {

/**
 * @brief Render markup to plain text through QTextDocument
 *
 * Input is always parsed as HTML. Block boundaries and <br> become '\n',
 * non-breaking spaces become plain spaces, embedded objects are dropped and
 * the result is trimmed.
 */
[[nodiscard]] QString toPlainText(const QString& markup);

} // namespace SmoothWrite::notes::html
