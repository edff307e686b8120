#include "djonline/console_ui.h"
#include "djonline/log.h"

#include <exception>
#include <future>
#include <memory>
#include <utility>

namespace djonline {
namespace {

const char* kColorReset = "\033[0m";
const char* kColorBold = "\033[1m";
const char* kColorYellow = "\033[33m";
const char* kColorCyan = "\033[36m";
const char* kColorRed = "\033[31m";

const char* kKeyHelp = "  o. Continue offline\n  q. Quit\n";

}  // namespace

UiDispatcher::~UiDispatcher() { Stop(); }

bool UiDispatcher::Start() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (running_) {
    return true;
  }
  stopping_ = false;
  try {
    thread_ = std::thread([this]() { Loop(); });
  } catch (const std::exception& ex) {
    Log(std::string("UI thread start failed: ") + ex.what(), nullptr);
    return false;
  }
  running_ = true;
  return true;
}

void UiDispatcher::Stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_) {
      return;
    }
    stopping_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
  running_ = false;
}

bool UiDispatcher::Post(Task task) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_ || stopping_) {
      return false;
    }
    tasks_.push_back(std::move(task));
  }
  cv_.notify_one();
  return true;
}

void UiDispatcher::Flush() {
  auto done = std::make_shared<std::promise<void>>();
  auto future = done->get_future();
  if (!Post([done]() { done->set_value(); })) {
    return;
  }
  future.wait();
}

bool UiDispatcher::OnUiThread() const {
  return std::this_thread::get_id() == thread_.get_id();
}

void UiDispatcher::Loop() {
  std::unique_lock<std::mutex> lock(mutex_);
  while (true) {
    cv_.wait(lock, [this]() { return stopping_ || !tasks_.empty(); });
    if (tasks_.empty()) {
      return;
    }
    Task task = std::move(tasks_.front());
    tasks_.pop_front();
    lock.unlock();
    try {
      task();
    } catch (const std::exception& ex) {
      Log(std::string("UI task threw exception: ") + ex.what(), nullptr);
    } catch (...) {
      Log("UI task threw exception", nullptr);
    }
    lock.lock();
  }
}

ConsoleSessionUi::ConsoleSessionUi(UiDispatcher& dispatcher, std::ostream& out, bool color)
    : dispatcher_(dispatcher), out_(out), color_(color) {}

IndicatorHandle ConsoleSessionUi::ShowSearching(Action on_continue_offline, Action on_quit) {
  return Show("Looking for DJ Link devices...", {}, std::move(on_continue_offline),
              std::move(on_quit));
}

IndicatorHandle ConsoleSessionUi::ShowTroubleshooting(const std::string& report,
                                                      Action on_continue_offline,
                                                      Action on_quit) {
  return Show("No DJ Link devices found", report, std::move(on_continue_offline),
              std::move(on_quit));
}

IndicatorHandle ConsoleSessionUi::Show(const std::string& banner,
                                       const std::string& report,
                                       Action on_continue_offline,
                                       Action on_quit) {
  const IndicatorHandle handle = next_handle_.fetch_add(1);
  {
    // Registered here so a key press racing the first paint still finds it.
    std::lock_guard<std::mutex> lock(mutex_);
    indicators_[handle] = Indicator{std::move(on_continue_offline), std::move(on_quit)};
    retired_.reset();
  }
  dispatcher_.Post([this, banner, report]() {
    out_ << Color(kColorBold) << Color(kColorCyan) << banner << Color(kColorReset) << "\n";
    if (!report.empty()) {
      out_ << report << "\n";
    }
    out_ << kKeyHelp << std::flush;
  });
  return handle;
}

void ConsoleSessionUi::RefreshTroubleshooting(IndicatorHandle handle,
                                              const std::string& report) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (indicators_.count(handle) == 0) {
      return;
    }
  }
  dispatcher_.Post([this, report]() {
    out_ << Color(kColorYellow) << "Still looking." << Color(kColorReset) << "\n"
         << report << "\n"
         << kKeyHelp << std::flush;
  });
}

void ConsoleSessionUi::Dismiss(IndicatorHandle handle) {
  if (handle == kNoIndicator) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = indicators_.find(handle);
  if (it == indicators_.end()) {
    return;
  }
  if (indicators_.size() == 1) {
    retired_ = std::move(it->second);
  }
  indicators_.erase(it);
}

void ConsoleSessionUi::Alert(AlertKind kind,
                             const std::string& title,
                             const std::string& message) {
  dispatcher_.Post([this, kind, title, message]() {
    const char* color = kind == AlertKind::kError ? kColorRed : kColorYellow;
    out_ << Color(kColorBold) << Color(color)
         << (kind == AlertKind::kError ? "Error: " : "Warning: ") << title
         << Color(kColorReset) << "\n"
         << message << "\n"
         << std::flush;
  });
}

bool ConsoleSessionUi::HandleKey(char key) {
  Action action;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (indicators_.empty() && !retired_) {
      return false;
    }
    const Indicator& active = indicators_.empty() ? *retired_ : indicators_.rbegin()->second;
    if (key == 'o' || key == 'O') {
      action = active.on_continue_offline;
    } else if (key == 'q' || key == 'Q') {
      action = active.on_quit;
    }
  }
  if (!action) {
    return false;
  }
  action();
  return true;
}

IndicatorHandle ConsoleSessionUi::ActiveIndicator() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return indicators_.empty() ? kNoIndicator : indicators_.rbegin()->first;
}

const char* ConsoleSessionUi::Color(const char* code) const {
  return color_ ? code : "";
}

}  // namespace djonline
