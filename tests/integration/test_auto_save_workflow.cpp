/**
 * @file test_auto_save_workflow.cpp
 * @brief Timing of debounced saves through a live session
 */

#include <catch2/catch_test_macros.hpp>

#include "SmoothWrite/notes/interfaces/MemoryContentSurface.hpp"
#include "SmoothWrite/notes/note_index.hpp"
#include "SmoothWrite/notes/note_session.hpp"
#include "SmoothWrite/notes/note_storage.hpp"
#include "support/qt_test_support.hpp"
#include <QElapsedTimer>
#include <QTemporaryDir>
#include <vector>

using namespace SmoothWrite;
using namespace SmoothWrite::notes;

TEST_CASE("Auto-save workflow: typing pauses drive disk writes",
          "[integration][auto_save][debounce]") {
  QtAppFixture fixture;
  QTemporaryDir tempDir;
  REQUIRE(tempDir.isValid());

  constexpr i32 delayMs = 300;

  NoteStorage storage(tempDir.path());
  NoteIndex index;
  MemoryContentSurface surface;
  NoteSession session(storage, index, surface, NoteSessionOptions{delayMs, false});
  REQUIRE(session.open().isOk());
  REQUIRE(session.createNote().isOk());
  const QString id = session.currentNoteId();

  QElapsedTimer clock;
  clock.start();
  std::vector<qint64> savedAt;
  QObject::connect(&session, &NoteSession::noteSaved,
                   [&](const QString&) { savedAt.push_back(clock.elapsed()); });

  SECTION("edits closer together than the delay produce one write") {
    // Keystrokes at roughly t=0, t=100, t=200
    surface.applyEdit("<p>D</p>");
    processEvents(100);
    surface.applyEdit("<p>Dr</p>");
    processEvents(100);
    const qint64 lastEdit = clock.elapsed();
    surface.applyEdit("<p>Draft</p>");

    processEvents(delayMs + 250);

    REQUIRE(savedAt.size() == 1);
    REQUIRE(savedAt[0] >= lastEdit + delayMs - 1);

    auto loaded = storage.loadNote(id);
    REQUIRE(loaded.found());
    REQUIRE(loaded.note->title() == "Draft");
  }

  SECTION("separate pauses produce separate writes") {
    surface.applyEdit("<p>One</p>");
    processEvents(delayMs + 200);
    surface.applyEdit("<p>Two</p>");
    processEvents(delayMs + 200);

    REQUIRE(savedAt.size() == 2);
    REQUIRE(index.find(id)->title() == "Two");
  }

  SECTION("disk state after a pause matches the editor") {
    surface.applyEdit("<p>Survives a crash</p>");
    processEvents(delayMs + 200);

    // A second storage view stands in for a fresh process after a crash
    NoteStorage afterCrash(tempDir.path());
    auto loaded = afterCrash.loadNote(id);
    REQUIRE(loaded.found());
    REQUIRE(loaded.note->content() == surface.content());
  }
}
