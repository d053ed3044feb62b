#include "SmoothWrite/notes/welcome_note.hpp"

namespace SmoothWrite::notes {

namespace {

constexpr const char* WELCOME_HTML = R"(<h1>Welcome to SmoothWrite!</h1>
<p>A calm place for quick notes and long drafts.</p>
<h2>What you get</h2>
<ul>
  <li><b>Rich text</b> &ndash; headings, lists and emphasis are kept as HTML</li>
  <li><b>Auto-save</b> &ndash; changes are written a moment after you stop typing</li>
  <li><b>Search</b> &ndash; filter notes by any word in the title or text</li>
  <li><b>Favourites</b> &ndash; star the notes you come back to</li>
</ul>
<p>Press <b>Ctrl+N</b> for a new note and <b>Ctrl+S</b> to save right away.</p>)";

} // namespace

Note createWelcomeNote() {
  Note note = Note::create();
  note.updateContent(QString::fromUtf8(WELCOME_HTML));
  return note;
}

} // namespace SmoothWrite::notes
