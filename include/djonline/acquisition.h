#pragma once

#include "djonline/log.h"
#include "djonline/network.h"
#include "djonline/presence.h"
#include "djonline/session_ui.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace djonline {

/// Polls spent silently searching before the troubleshooting report appears.
constexpr int kSearchTries = 200;
/// Polls between troubleshooting report refreshes.
constexpr int kTroubleshootingRefreshTries = 20;

/**
 * Which indicator the session is showing.
 */
enum class AcquisitionMode {
  kSearching,
  kTroubleshooting,
};

/**
 * How an acquisition attempt ended.
 */
enum class AcquisitionOutcome {
  /// A presence was claimed.
  kOnline,
  /// Devices were seen but the presence could not be claimed.
  kClaimFailed,
  /// The operator chose to continue offline.
  kOffline,
  /// The operator chose to quit the application.
  kQuit,
};

/**
 * Anomalies reported to the operator during an attempt.
 */
enum class AcquisitionProblem {
  kClaimStartFailure,
  kNetworkConflict,
  kUnreachablePeers,
};

struct AcquisitionResult {
  AcquisitionOutcome outcome = AcquisitionOutcome::kOffline;
  /// Player number claimed when online, 0 otherwise.
  uint8_t player_number = 0;
  std::vector<AcquisitionProblem> problems;
};

/**
 * Callbacks run once an attempt ends.
 */
struct StartupHooks {
  /// Runs after an online, offline or claim-failed outcome.
  std::function<void()> finish_startup;
  /// Runs after the operator asked to quit, instead of finish_startup.
  std::function<void()> application_quit;
};

/**
 * Timing and identity settings for an acquisition attempt.
 */
struct AcquisitionConfig {
  using SleepFunction = std::function<void(std::chrono::milliseconds)>;

  int initial_tries = kSearchTries;
  int refresh_tries = kTroubleshootingRefreshTries;
  /// Cadence of device polls.
  std::chrono::milliseconds poll_interval{100};
  /// Ask the claimant for a real player number (1-4).
  bool use_real_player_number = false;
  /// Used between polls; defaults to a wait the destructor can interrupt.
  SleepFunction sleep;
  /// Optional log callback (defaults to stderr).
  LogCallback log_callback;

  /**
   * Validate configuration values.
   *
   * @param error Optional output string describing the first validation error.
   * @return true if the configuration is valid.
   */
  bool Validate(std::string* error = nullptr) const;
};

/**
 * State of the single in-flight attempt. The operator's flags may be set from
 * any thread, each at most once.
 */
class AcquisitionSession {
 public:
  AcquisitionSession(bool use_real_player_number, int tries);

  AcquisitionSession(const AcquisitionSession&) = delete;
  AcquisitionSession& operator=(const AcquisitionSession&) = delete;

  /// Returns false if the flag was already set.
  bool RequestContinueOffline();
  /// Returns false if the flag was already set.
  bool RequestQuit();

  bool continue_offline() const { return continue_offline_.load(); }
  bool quit() const { return quit_.load(); }
  bool use_real_player_number() const { return use_real_player_number_; }

 private:
  friend class AcquisitionStateMachine;

  std::atomic<bool> continue_offline_{false};
  std::atomic<bool> quit_{false};
  const bool use_real_player_number_;
  // Written only by the thread running the attempt.
  std::atomic<int> tries_remaining_;
  std::atomic<IndicatorHandle> indicator_{kNoIndicator};
  std::atomic<AcquisitionMode> mode_{AcquisitionMode::kSearching};
};

/**
 * Searches for DJ Link devices, escalates to troubleshooting when none show
 * up, and claims a presence once some do.
 *
 * Typical use is Start() followed by Wait(). Run() performs the whole attempt
 * on the calling thread; Begin() and Step() expose single polls.
 */
class AcquisitionStateMachine {
 public:
  /// The collaborators must outlive the state machine.
  AcquisitionStateMachine(AcquisitionConfig config,
                          DeviceObserver& observer,
                          PresenceClaimant& claimant,
                          const NetworkDiagnostics& diagnostics,
                          SessionUi& ui,
                          StartupHooks hooks);
  /// Abandons an attempt still in progress without running any hook, then
  /// joins the worker.
  ~AcquisitionStateMachine();

  AcquisitionStateMachine(const AcquisitionStateMachine&) = delete;
  AcquisitionStateMachine& operator=(const AcquisitionStateMachine&) = delete;

  /// Run the attempt on a worker thread. Returns false if one was already
  /// started, or the configuration is invalid (see GetLastError()).
  bool Start();
  /// Block until the worker finishes and return its result.
  std::optional<AcquisitionResult> Wait();
  /// Whether the worker started by Start() is still working.
  bool IsRunning() const { return running_; }

  /// Perform a whole attempt on the calling thread. Empty when the attempt
  /// could not begin.
  std::optional<AcquisitionResult> Run();

  /// Open a session: start the observer and show the searching indicator.
  /// Returns false if a session is already open.
  bool Begin();
  /// Evaluate one poll. Returns true when the attempt has ended.
  bool Step();

  /// Operator gestures; ignored when no session is open.
  bool RequestContinueOffline();
  bool RequestQuit();

  bool InSession() const;
  /// Values of the open session; 0 / kSearching when none is open.
  int tries_remaining() const;
  AcquisitionMode mode() const;
  IndicatorHandle indicator() const;

  /// Result of the last finished attempt.
  std::optional<AcquisitionResult> result() const;
  std::string GetLastError() const;

 private:
  void Finish(const AcquisitionResult& result);
  AcquisitionResult Claim(AcquisitionSession& session);
  void ShowTroubleshooting(const std::shared_ptr<AcquisitionSession>& session);
  std::string BuildNetworkDescription() const;
  void RunHook(const std::function<void()>& hook, const char* name);
  void Sleep();

  AcquisitionConfig config_;
  DeviceObserver& observer_;
  PresenceClaimant& claimant_;
  const NetworkDiagnostics& diagnostics_;
  SessionUi& ui_;
  StartupHooks hooks_;

  mutable std::mutex mutex_;
  std::shared_ptr<AcquisitionSession> session_;
  std::optional<AcquisitionResult> result_;
  std::string last_error_;

  std::atomic<bool> started_{false};
  std::atomic<bool> running_{false};
  std::atomic<bool> abort_{false};
  std::mutex sleep_mutex_;
  std::condition_variable sleep_cv_;
  std::thread worker_;
};

/// Human readable outcome name for logs.
const char* ToString(AcquisitionOutcome outcome);

}  // namespace djonline
