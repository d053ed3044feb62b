/**
 * @file test_launcher_args.cpp
 * @brief Command-line parsing tests
 */

#include <catch2/catch_test_macros.hpp>

#include "SmoothWrite/app/launcher.hpp"

using namespace SmoothWrite::app;

TEST_CASE("Launcher::parseArgs: options and commands", "[launcher]") {
  SECTION("plain command") {
    auto parsed = Launcher::parseArgs({"list"});
    REQUIRE(parsed.isOk());
    REQUIRE(parsed.value().command == "list");
    REQUIRE(parsed.value().args.empty());
  }

  SECTION("options before the command") {
    auto parsed = Launcher::parseArgs({"--notes-dir", "/tmp/n", "--delay", "250", "--no-welcome",
                                       "--verbose", "--config", "c.json", "show", "abc"});
    REQUIRE(parsed.isOk());

    const LaunchOptions& opts = parsed.value();
    REQUIRE(opts.notesDir == "/tmp/n");
    REQUIRE(opts.autoSaveDelayMs == 250);
    REQUIRE(opts.noWelcome);
    REQUIRE(opts.verbose);
    REQUIRE(opts.configPath == "c.json");
    REQUIRE(opts.command == "show");
    REQUIRE(opts.args == std::vector<std::string>{"abc"});
  }

  SECTION("arguments after the command are not options") {
    auto parsed = Launcher::parseArgs({"search", "--verbose"});
    REQUIRE(parsed.isOk());
    REQUIRE_FALSE(parsed.value().verbose);
    REQUIRE(parsed.value().args == std::vector<std::string>{"--verbose"});
  }

  SECTION("search joins several words") {
    auto parsed = Launcher::parseArgs({"search", "two", "words"});
    REQUIRE(parsed.isOk());
    REQUIRE(parsed.value().args.size() == 2);
  }

  SECTION("help and version need no command") {
    REQUIRE(Launcher::parseArgs({"--help"}).value().help);
    REQUIRE(Launcher::parseArgs({"-h"}).value().help);
    REQUIRE(Launcher::parseArgs({"--version"}).value().version);
  }

  SECTION("favorite accepts on and off") {
    REQUIRE(Launcher::parseArgs({"favorite", "id"}).isOk());
    REQUIRE(Launcher::parseArgs({"favorite", "id", "off"}).isOk());
    REQUIRE(Launcher::parseArgs({"favorite", "id", "maybe"}).isError());
  }
}

TEST_CASE("Launcher::parseArgs: usage errors", "[launcher]") {
  REQUIRE(Launcher::parseArgs({}).isError());
  REQUIRE(Launcher::parseArgs({"--verbose"}).isError());
  REQUIRE(Launcher::parseArgs({"frobnicate"}).isError());
  REQUIRE(Launcher::parseArgs({"--bogus", "list"}).isError());
  REQUIRE(Launcher::parseArgs({"--delay"}).isError());
  REQUIRE(Launcher::parseArgs({"--delay", "soon", "list"}).isError());
  REQUIRE(Launcher::parseArgs({"--delay", "-3", "list"}).isError());
  REQUIRE(Launcher::parseArgs({"--delay", "10ms", "list"}).isError());
  REQUIRE(Launcher::parseArgs({"show"}).isError());
  REQUIRE(Launcher::parseArgs({"show", "a", "b"}).isError());
  REQUIRE(Launcher::parseArgs({"edit", "id"}).isError());
  REQUIRE(Launcher::parseArgs({"list", "extra"}).isError());
}
