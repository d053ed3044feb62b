/**
 * @file test_auto_save_scheduler.cpp
 * @brief Tests for the debounced auto-save scheduler
 */

#include <catch2/catch_test_macros.hpp>

#include "SmoothWrite/notes/auto_save_scheduler.hpp"
#include "support/qt_test_support.hpp"
#include <QElapsedTimer>
#include <QSignalSpy>
#include <stdexcept>

using namespace SmoothWrite;
using namespace SmoothWrite::notes;

TEST_CASE("AutoSaveScheduler: trigger saves once after the delay", "[auto_save]") {
  QtAppFixture fixture;
  int saveCount = 0;
  AutoSaveScheduler scheduler(
      [&saveCount]() {
        ++saveCount;
        return Result<void>::ok();
      },
      100);

  scheduler.trigger();
  REQUIRE(scheduler.isPending());
  REQUIRE(saveCount == 0);

  processEvents(250);

  REQUIRE(saveCount == 1);
  REQUIRE_FALSE(scheduler.isPending());
}

TEST_CASE("AutoSaveScheduler: bursts collapse into one save", "[auto_save][debounce]") {
  QtAppFixture fixture;
  constexpr int delayMs = 300;

  QElapsedTimer clock;
  clock.start();
  qint64 firedAt = -1;
  int saveCount = 0;

  AutoSaveScheduler scheduler(
      [&]() {
        ++saveCount;
        firedAt = clock.elapsed();
        return Result<void>::ok();
      },
      delayMs);

  // Edits at roughly t=0, t=100 and t=200
  scheduler.trigger();
  processEvents(100);
  scheduler.trigger();
  processEvents(100);
  const qint64 lastTrigger = clock.elapsed();
  scheduler.trigger();

  REQUIRE(saveCount == 0);

  processEvents(delayMs + 250);

  REQUIRE(saveCount == 1);
  REQUIRE(firedAt >= lastTrigger + delayMs - 1);
}

TEST_CASE("AutoSaveScheduler: saveNow", "[auto_save]") {
  QtAppFixture fixture;
  int saveCount = 0;
  bool fail = false;
  AutoSaveScheduler scheduler(
      [&]() {
        ++saveCount;
        return fail ? Result<void>::error("disk full") : Result<void>::ok();
      },
      100);

  SECTION("fires immediately and cancels the pending save") {
    scheduler.trigger();
    REQUIRE(scheduler.saveNow().isOk());
    REQUIRE(saveCount == 1);
    REQUIRE_FALSE(scheduler.isPending());

    processEvents(200);
    REQUIRE(saveCount == 1);
  }

  SECTION("works without a pending trigger") {
    REQUIRE(scheduler.saveNow().isOk());
    REQUIRE(saveCount == 1);
  }

  SECTION("returns the callback's error and signals it") {
    QSignalSpy failedSpy(&scheduler, &AutoSaveScheduler::saveFailed);
    fail = true;

    auto result = scheduler.saveNow();
    REQUIRE(result.isError());
    REQUIRE(result.error() == "disk full");
    REQUIRE(failedSpy.count() == 1);
    REQUIRE(failedSpy.at(0).at(0).toString() == "disk full");
  }

  SECTION("runs while disabled") {
    scheduler.disable();
    REQUIRE(scheduler.saveNow().isOk());
    REQUIRE(saveCount == 1);
  }
}

TEST_CASE("AutoSaveScheduler: timer-fired failures are reported, not thrown",
          "[auto_save]") {
  QtAppFixture fixture;
  AutoSaveScheduler scheduler([]() -> Result<void> { throw std::runtime_error("boom"); }, 50);
  QSignalSpy failedSpy(&scheduler, &AutoSaveScheduler::saveFailed);
  QSignalSpy succeededSpy(&scheduler, &AutoSaveScheduler::saveSucceeded);

  scheduler.trigger();
  REQUIRE_NOTHROW(processEvents(200));

  REQUIRE(failedSpy.count() == 1);
  REQUIRE(succeededSpy.count() == 0);

  SECTION("explicit saves turn exceptions into errors") {
    auto result = scheduler.saveNow();
    REQUIRE(result.isError());
    REQUIRE(result.error().find("boom") != std::string::npos);
  }
}

TEST_CASE("AutoSaveScheduler: non-standard exceptions are reported too", "[auto_save]") {
  QtAppFixture fixture;
  AutoSaveScheduler scheduler([]() -> Result<void> { throw 42; }, 50);
  QSignalSpy failedSpy(&scheduler, &AutoSaveScheduler::saveFailed);

  scheduler.trigger();
  REQUIRE_NOTHROW(processEvents(200));
  REQUIRE(failedSpy.count() == 1);

  auto result = scheduler.saveNow();
  REQUIRE(result.isError());
  REQUIRE(failedSpy.count() == 2);
}

TEST_CASE("AutoSaveScheduler: disable and enable", "[auto_save]") {
  QtAppFixture fixture;
  int saveCount = 0;
  AutoSaveScheduler scheduler(
      [&saveCount]() {
        ++saveCount;
        return Result<void>::ok();
      },
      50);

  scheduler.trigger();
  scheduler.disable();
  REQUIRE_FALSE(scheduler.isEnabled());
  REQUIRE_FALSE(scheduler.isPending());

  scheduler.trigger();
  REQUIRE_FALSE(scheduler.isPending());
  processEvents(150);
  REQUIRE(saveCount == 0);

  scheduler.enable();
  scheduler.trigger();
  processEvents(150);
  REQUIRE(saveCount == 1);
}

TEST_CASE("AutoSaveScheduler: cancel drops the pending save", "[auto_save]") {
  QtAppFixture fixture;
  int saveCount = 0;
  AutoSaveScheduler scheduler(
      [&saveCount]() {
        ++saveCount;
        return Result<void>::ok();
      },
      50);

  scheduler.trigger();
  scheduler.cancel();
  processEvents(150);

  REQUIRE(saveCount == 0);
  REQUIRE(scheduler.isEnabled());
}

TEST_CASE("AutoSaveScheduler: shutdown", "[auto_save]") {
  QtAppFixture fixture;
  int saveCount = 0;
  AutoSaveScheduler scheduler(
      [&saveCount]() {
        ++saveCount;
        return Result<void>::ok();
      },
      50);

  scheduler.trigger();
  scheduler.shutdown();

  REQUIRE(scheduler.isShutDown());
  REQUIRE_FALSE(scheduler.isPending());

  scheduler.trigger();
  processEvents(150);
  REQUIRE(saveCount == 0);

  REQUIRE(scheduler.saveNow().isError());
  REQUIRE(saveCount == 0);

  scheduler.enable();
  REQUIRE_FALSE(scheduler.isEnabled());

  // Idempotent
  scheduler.shutdown();
  REQUIRE(scheduler.isShutDown());
}

TEST_CASE("AutoSaveScheduler: delay configuration", "[auto_save]") {
  QtAppFixture fixture;
  AutoSaveScheduler scheduler([]() { return Result<void>::ok(); });

  REQUIRE(scheduler.delay() == AutoSaveScheduler::DEFAULT_DELAY_MS);
  REQUIRE(scheduler.remainingMs() == -1);

  scheduler.trigger();
  REQUIRE(scheduler.remainingMs() > 0);
  REQUIRE(scheduler.remainingMs() <= AutoSaveScheduler::DEFAULT_DELAY_MS);

  scheduler.setDelay(250);
  REQUIRE(scheduler.delay() == 250);

  scheduler.setDelay(-10);
  REQUIRE(scheduler.delay() == 0);

  AutoSaveScheduler clamped([]() { return Result<void>::ok(); }, -5);
  REQUIRE(clamped.delay() == 0);
}
