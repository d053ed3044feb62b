/**
 * @file test_note_index.cpp
 * @brief Tests for the in-memory note index: ordering, selection, search
 */

#include <catch2/catch_test_macros.hpp>

#include "SmoothWrite/notes/note_index.hpp"
#include "support/qt_test_support.hpp"
#include <QJsonObject>
#include <QSignalSpy>

using namespace SmoothWrite::notes;

namespace {

Note makeNote(const QString& id, const QString& content, bool favorite = false) {
  QJsonObject json;
  json["id"] = id;
  json["content"] = content;
  json["is_favorite"] = favorite;
  return Note::fromJson(json);
}

QStringList ids(const QList<Note>& notes) {
  QStringList result;
  for (const auto& note : notes) {
    result << note.id();
  }
  return result;
}

QList<Note> sampleNotes() {
  return {makeNote("a", "<h1>Groceries</h1><p>milk, eggs</p>"),
          makeNote("b", "<p>Meeting notes</p><p>Discuss the MILKSHAKE budget</p>", true),
          makeNote("c", "<p>Travel plans</p>")};
}

} // namespace

TEST_CASE("NoteIndex: load keeps the given order", "[note_index]") {
  QtAppFixture fixture;
  NoteIndex index;
  QSignalSpy resetSpy(&index, &NoteIndex::indexReset);

  index.load(sampleNotes());

  REQUIRE(resetSpy.count() == 1);
  REQUIRE(index.count() == 3);
  REQUIRE(ids(index.notes()) == QStringList{"a", "b", "c"});
  REQUIRE(index.indexOf("c") == 2);
  REQUIRE(index.indexOf("zzz") == -1);
}

TEST_CASE("NoteIndex: insertNew prepends", "[note_index]") {
  QtAppFixture fixture;
  NoteIndex index;
  index.load(sampleNotes());
  QSignalSpy insertedSpy(&index, &NoteIndex::noteInserted);

  index.insertNew(makeNote("d", "fresh"));

  REQUIRE(insertedSpy.count() == 1);
  REQUIRE(insertedSpy.at(0).at(0).toString() == "d");
  REQUIRE(ids(index.notes()) == QStringList{"d", "a", "b", "c"});

  SECTION("an existing id is replaced in place") {
    index.insertNew(makeNote("b", "changed"));
    REQUIRE(index.count() == 4);
    REQUIRE(index.indexOf("b") == 2);
    REQUIRE(index.find("b")->title() == "changed");
  }
}

TEST_CASE("NoteIndex: replace keeps the position", "[note_index]") {
  QtAppFixture fixture;
  NoteIndex index;
  index.load(sampleNotes());
  QSignalSpy replacedSpy(&index, &NoteIndex::noteReplaced);

  Note edited = *index.find("c");
  edited.updateContent("<p>Trip to Lisbon</p>");
  REQUIRE(index.replace(edited));

  REQUIRE(ids(index.notes()) == QStringList{"a", "b", "c"});
  REQUIRE(index.find("c")->title() == "Trip to Lisbon");
  REQUIRE(replacedSpy.count() == 1);
  REQUIRE(replacedSpy.at(0).at(1).value<qsizetype>() == 2);

  SECTION("unknown ids are not inserted") {
    REQUIRE_FALSE(index.replace(makeNote("zzz", "ghost")));
    REQUIRE(index.count() == 3);
  }
}

TEST_CASE("NoteIndex: remove", "[note_index]") {
  QtAppFixture fixture;
  NoteIndex index;
  index.load(sampleNotes());

  REQUIRE(index.remove("b"));
  REQUIRE(ids(index.notes()) == QStringList{"a", "c"});
  REQUIRE_FALSE(index.remove("b"));

  SECTION("removing the selected note clears the selection") {
    REQUIRE(index.select("a"));
    QSignalSpy selectionSpy(&index, &NoteIndex::selectionChanged);

    REQUIRE(index.remove("a"));
    REQUIRE(index.selectedId().isEmpty());
    REQUIRE_FALSE(index.findSelected().has_value());
    REQUIRE(selectionSpy.count() == 1);
    REQUIRE(selectionSpy.at(0).at(0).toString().isEmpty());
  }
}

TEST_CASE("NoteIndex: selection", "[note_index]") {
  QtAppFixture fixture;
  NoteIndex index;
  index.load(sampleNotes());
  QSignalSpy selectionSpy(&index, &NoteIndex::selectionChanged);

  REQUIRE(index.select("b"));
  REQUIRE(index.selectedId() == "b");
  REQUIRE(index.findSelected()->id() == "b");
  REQUIRE(selectionSpy.count() == 1);

  SECTION("selecting the same note again emits nothing") {
    REQUIRE(index.select("b"));
    REQUIRE(selectionSpy.count() == 1);
  }

  SECTION("unknown ids are ignored") {
    REQUIRE_FALSE(index.select("missing"));
    REQUIRE(index.selectedId() == "b");
  }

  SECTION("reloading without the selected note drops the selection") {
    index.load({makeNote("x", "other")});
    REQUIRE(index.selectedId().isEmpty());
  }

  SECTION("reloading with the selected note keeps it") {
    index.load(sampleNotes());
    REQUIRE(index.selectedId() == "b");
  }
}

TEST_CASE("NoteIndex: search", "[note_index][search]") {
  QtAppFixture fixture;
  NoteIndex index;
  index.load(sampleNotes());

  SECTION("matches title and body case-insensitively") {
    REQUIRE(ids(index.search("milk")) == QStringList{"a", "b"});
    REQUIRE(ids(index.search("GROCERIES")) == QStringList{"a"});
    REQUIRE(ids(index.search("travel")) == QStringList{"c"});
  }

  SECTION("markup is not searchable") {
    REQUIRE(index.search("<p>").isEmpty());
    REQUIRE(index.search("h1").isEmpty());
  }

  SECTION("entities are matched in their decoded form") {
    index.insertNew(makeNote("d", "<p>Caf&eacute; menu</p><p>cr&egrave;me br&ucirc;l&eacute;e</p>"));
    REQUIRE(ids(index.search(QString::fromUtf8("CAF\xC3\x89"))) == QStringList{"d"});
    REQUIRE(ids(index.search(QString::fromUtf8("cr\xC3\xA8me"))) == QStringList{"d"});
    REQUIRE(index.search("eacute").isEmpty());
  }

  SECTION("empty query returns everything in order") {
    REQUIRE(ids(index.search("")) == QStringList{"a", "b", "c"});
    REQUIRE(ids(index.search("   ")) == QStringList{"a", "b", "c"});
  }

  SECTION("surrounding whitespace is ignored") {
    REQUIRE(ids(index.search("  plans ")) == QStringList{"c"});
  }

  SECTION("no match") {
    REQUIRE(index.search("nothing like this").isEmpty());
  }

  SECTION("search does not modify the index") {
    (void)index.search("milk");
    REQUIRE(index.count() == 3);
  }
}

TEST_CASE("NoteIndex: favorites", "[note_index]") {
  QtAppFixture fixture;
  NoteIndex index;
  index.load(sampleNotes());

  REQUIRE(ids(index.favorites()) == QStringList{"b"});
}
