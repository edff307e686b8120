#pragma once

#include "djonline/session_ui.h"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <thread>

namespace djonline {

/**
 * Single UI thread draining a queue of tasks in order.
 *
 * Tasks that throw are logged and dropped; the thread keeps running.
 */
class UiDispatcher {
 public:
  using Task = std::function<void()>;

  UiDispatcher() = default;
  /// Drains pending tasks and joins the thread.
  ~UiDispatcher();

  UiDispatcher(const UiDispatcher&) = delete;
  UiDispatcher& operator=(const UiDispatcher&) = delete;

  bool Start();
  /// Run remaining tasks, then join the thread. No-op when not running.
  void Stop();
  bool IsRunning() const { return running_; }

  /// Queue a task. Returns false once the dispatcher is stopped.
  bool Post(Task task);
  /// Block until every task posted before the call has run. Must not be
  /// called from the UI thread.
  void Flush();

  /// Whether the caller is the UI thread.
  bool OnUiThread() const;

 private:
  void Loop();

  std::atomic<bool> running_{false};
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<Task> tasks_;
  bool stopping_ = false;
  std::thread thread_;
};

/**
 * Terminal rendition of the session UI. Handles are handed out immediately;
 * all output happens on the dispatcher thread.
 */
class ConsoleSessionUi : public SessionUi {
 public:
  /// The dispatcher and stream must outlive this object.
  ConsoleSessionUi(UiDispatcher& dispatcher, std::ostream& out, bool color = true);

  IndicatorHandle ShowSearching(Action on_continue_offline, Action on_quit) override;
  IndicatorHandle ShowTroubleshooting(const std::string& report,
                                      Action on_continue_offline,
                                      Action on_quit) override;
  void RefreshTroubleshooting(IndicatorHandle handle, const std::string& report) override;
  void Dismiss(IndicatorHandle handle) override;
  void Alert(AlertKind kind, const std::string& title, const std::string& message) override;

  /**
   * Operator key press, run on the UI thread. 'o' continues offline and 'q'
   * quits through the most recently shown indicator that is still open.
   * Between dismissing the last open indicator and showing the next one, keys
   * still reach the dismissed indicator's actions.
   *
   * @return true if an action was fired.
   */
  bool HandleKey(char key);

  /// Most recently shown indicator still open, or kNoIndicator.
  IndicatorHandle ActiveIndicator() const;

 private:
  struct Indicator {
    Action on_continue_offline;
    Action on_quit;
  };

  IndicatorHandle Show(const std::string& banner,
                       const std::string& report,
                       Action on_continue_offline,
                       Action on_quit);
  const char* Color(const char* code) const;

  UiDispatcher& dispatcher_;
  std::ostream& out_;
  const bool color_;
  std::atomic<IndicatorHandle> next_handle_{1};

  mutable std::mutex mutex_;
  std::map<IndicatorHandle, Indicator> indicators_;
  // Last dismissed indicator, kept until a replacement is shown.
  std::optional<Indicator> retired_;
};

}  // namespace djonline
