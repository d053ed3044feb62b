/**
 * @file auto_save_scheduler.cpp
 * @brief Implementation of the debounced auto-save scheduler
 */

#include "SmoothWrite/notes/auto_save_scheduler.hpp"
#include "SmoothWrite/core/logger.hpp"
#include <algorithm>
#include <exception>

namespace SmoothWrite::notes {

AutoSaveScheduler::AutoSaveScheduler(SaveCallback saveCallback, i32 delayMs, QObject* parent)
    : QObject(parent), m_saveCallback(std::move(saveCallback)), m_delayMs(std::max(0, delayMs)) {
  m_timer.setSingleShot(true);
  // Coarse timers may fire up to 5% early
  m_timer.setTimerType(Qt::PreciseTimer);
  connect(&m_timer, &QTimer::timeout, this, &AutoSaveScheduler::onTimeout);
  SMOOTHWRITE_LOG_INFO("Auto-save initialized with {}ms delay", m_delayMs);
}

AutoSaveScheduler::~AutoSaveScheduler() {
  m_timer.stop();
}

void AutoSaveScheduler::trigger() {
  if (!m_enabled || m_shutDown) {
    return;
  }

  // Restart the countdown (debounce)
  m_timer.start(m_delayMs);
  SMOOTHWRITE_LOG_TRACE("Auto-save triggered");
}

Result<void> AutoSaveScheduler::saveNow() {
  m_timer.stop();
  if (m_shutDown) {
    SMOOTHWRITE_LOG_WARN("Save requested after auto-save shutdown");
    return Result<void>::error("Auto-save scheduler has been shut down");
  }
  return runSaveCallback("explicit");
}

void AutoSaveScheduler::cancel() {
  if (m_timer.isActive()) {
    m_timer.stop();
    SMOOTHWRITE_LOG_TRACE("Pending auto-save cancelled");
  }
}

void AutoSaveScheduler::enable() {
  if (m_shutDown) {
    SMOOTHWRITE_LOG_WARN("Cannot enable auto-save after shutdown");
    return;
  }
  m_enabled = true;
  SMOOTHWRITE_LOG_INFO("Auto-save enabled");
}

void AutoSaveScheduler::disable() {
  m_enabled = false;
  m_timer.stop();
  SMOOTHWRITE_LOG_INFO("Auto-save disabled");
}

void AutoSaveScheduler::setDelay(i32 delayMs) {
  if (delayMs < 0) {
    SMOOTHWRITE_LOG_WARN("Negative auto-save delay {}ms clamped to 0", delayMs);
    delayMs = 0;
  }
  m_delayMs = delayMs;
  SMOOTHWRITE_LOG_INFO("Auto-save delay changed to {}ms", m_delayMs);
}

void AutoSaveScheduler::shutdown() {
  if (m_shutDown) {
    return;
  }
  m_timer.stop();
  m_enabled = false;
  m_shutDown = true;
  m_saveCallback = nullptr;
  SMOOTHWRITE_LOG_DEBUG("Auto-save shut down");
}

i32 AutoSaveScheduler::remainingMs() const {
  return m_timer.isActive() ? m_timer.remainingTime() : -1;
}

void AutoSaveScheduler::onTimeout() {
  // Nobody can receive the error here; runSaveCallback logs and signals it
  (void)runSaveCallback("auto");
}

Result<void> AutoSaveScheduler::runSaveCallback(const char* origin) {
  if (!m_saveCallback) {
    return Result<void>::error("No save callback registered");
  }

  Result<void> result = Result<void>::ok();
  try {
    SMOOTHWRITE_LOG_DEBUG("Executing {} save", origin);
    result = m_saveCallback();
  } catch (const std::exception& e) {
    result = Result<void>::error(std::string("Save callback threw: ") + e.what());
  } catch (...) {
    // Must not reach the event loop that drives onTimeout()
    result = Result<void>::error("Save callback threw a non-standard exception");
  }

  if (result.isError()) {
    SMOOTHWRITE_LOG_ERROR("{} save failed: {}", origin, result.error());
    emit saveFailed(QString::fromStdString(result.error()));
  } else {
    emit saveSucceeded();
  }
  return result;
}

} // namespace SmoothWrite::notes
