#include "SmoothWrite/notes/html_text.hpp"

#include <QTextDocument>

namespace SmoothWrite::notes::html {

QString toPlainText(const QString& markup) {
  if (markup.trimmed().isEmpty()) {
    return {};
  }

  QTextDocument document;
  document.setHtml(markup);

  QString text = document.toPlainText();
  text.remove(QChar::ObjectReplacementCharacter);
  return text.trimmed();
}

} // namespace SmoothWrite::notes::html
