#pragma once

#include <cstdint>
#include <functional>
#include <string>

namespace djonline {

/**
 * Opaque reference to a displayed indicator (searching or troubleshooting).
 */
using IndicatorHandle = uint32_t;
constexpr IndicatorHandle kNoIndicator = 0;

enum class AlertKind {
  kWarning,
  kError,
};

/**
 * Presentation surface driven by the acquisition state machine.
 *
 * Calls arrive on the acquisition worker thread. Implementations marshal the
 * visible work onto their UI thread and must return without waiting for the
 * operator. The actions passed to the Show* calls are the operator's
 * "continue offline" and "quit" gestures; they may be invoked from any thread.
 */
class SessionUi {
 public:
  using Action = std::function<void()>;

  virtual ~SessionUi() = default;

  /// Show the "searching for devices" indicator.
  virtual IndicatorHandle ShowSearching(Action on_continue_offline, Action on_quit) = 0;
  /// Show the troubleshooting indicator with a network report.
  virtual IndicatorHandle ShowTroubleshooting(const std::string& report,
                                              Action on_continue_offline,
                                              Action on_quit) = 0;
  /// Replace the report shown by an existing troubleshooting indicator.
  virtual void RefreshTroubleshooting(IndicatorHandle handle, const std::string& report) = 0;
  /// Close an indicator.
  virtual void Dismiss(IndicatorHandle handle) = 0;
  /// Fire-and-forget notification.
  virtual void Alert(AlertKind kind, const std::string& title, const std::string& message) = 0;
};

}  // namespace djonline
