#pragma once

/**
 * @file auto_save_scheduler.hpp
 * @brief Debounced auto-save for the note being edited
 *
 * Collapses bursts of "content changed" notifications into a single save
 * once the user has been idle for the configured delay.
 *
 * States: Idle -> trigger() -> Pending(deadline = now + delay). Each further
 * trigger() restarts the deadline. When it elapses the save callback runs
 * and the scheduler returns to Idle. saveNow() fires immediately from any
 * state and cancels the pending deadline.
 *
 * The callback reads the content when it runs, so a save always sees the
 * latest edit. Failures of a timer-fired save are logged and reported via
 * saveFailed(), never thrown out of the event loop.
 *
 * Example usage:
 * @code
 *   AutoSaveScheduler autoSave([this]() { return commitCurrentNote(); });
 *   surface.setOnContentChanged([&autoSave]() { autoSave.trigger(); });
 *   ...
 *   autoSave.saveNow();   // flush before switching notes or quitting
 *   autoSave.shutdown();
 * @endcode
 */

#include "SmoothWrite/core/result.hpp"
#include "SmoothWrite/core/types.hpp"
#include <QObject>
#include <QString>
#include <QTimer>
#include <functional>

namespace SmoothWrite::notes {

class AutoSaveScheduler : public QObject {
  Q_OBJECT

public:
  using SaveCallback = std::function<Result<void>()>;

  static constexpr i32 DEFAULT_DELAY_MS = 1000;

  /**
   * @brief Construct a scheduler
   * @param saveCallback Invoked when a save fires
   * @param delayMs Idle period before a triggered save fires
   * @param parent Parent QObject
   */
  explicit AutoSaveScheduler(SaveCallback saveCallback, i32 delayMs = DEFAULT_DELAY_MS,
                             QObject* parent = nullptr);
  ~AutoSaveScheduler() override;

  /**
   * @brief Force an immediate save, cancelling any pending deadline
   *
   * Runs even while disabled. The callback result is returned so an explicit
   * save can be reported to the user.
   */
  Result<void> saveNow();

  /**
   * @brief Drop a pending save without running it
   */
  void cancel();

  /**
   * @brief Re-enable triggering after disable()
   */
  void enable();

  /**
   * @brief Cancel any pending save and ignore trigger() until enable()
   *
   * No final save is made; call saveNow() first if one is needed.
   */
  void disable();

  /**
   * @brief Change the idle period for subsequent triggers
   *
   * An already pending deadline keeps its original delay.
   */
  void setDelay(i32 delayMs);

  /**
   * @brief Stop the timer and release the callback
   *
   * Performs no implicit flush. Afterwards trigger() is ignored and
   * saveNow() reports an error.
   */
  void shutdown();

  [[nodiscard]] bool isEnabled() const { return m_enabled; }
  [[nodiscard]] bool isPending() const { return m_timer.isActive(); }
  [[nodiscard]] bool isShutDown() const { return m_shutDown; }
  [[nodiscard]] i32 delay() const { return m_delayMs; }

  /**
   * @brief Milliseconds until the pending save fires, or -1 when idle
   */
  [[nodiscard]] i32 remainingMs() const;

public slots:
  /**
   * @brief Signal that content changed; restarts the idle countdown
   */
  void trigger();

signals:
  void saveSucceeded();
  void saveFailed(const QString& message);

private slots:
  void onTimeout();

private:
  Result<void> runSaveCallback(const char* origin);

  QTimer m_timer;
  SaveCallback m_saveCallback;
  i32 m_delayMs;
  bool m_enabled = true;
  bool m_shutDown = false;
};

} // namespace SmoothWrite::notes
