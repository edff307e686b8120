#include "djonline/acquisition.h"

#include <algorithm>
#include <exception>
#include <sstream>

namespace djonline {
namespace {

constexpr const char* kConnectionFailedTitle = "DJ Link Connection Failed";
constexpr const char* kNetworkProblemTitle = "Network Configuration Problem";

std::string Join(const std::vector<std::string>& parts, const std::string& separator) {
  std::string joined;
  for (size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) {
      joined += separator;
    }
    joined += parts[i];
  }
  return joined;
}

SessionUi::Action MakeAction(std::weak_ptr<AcquisitionSession> weak,
                             bool (AcquisitionSession::*request)()) {
  // A gesture arriving after the session ended has nothing left to cancel.
  return [weak, request]() {
    if (auto session = weak.lock()) {
      ((*session).*request)();
    }
  };
}

}  // namespace

const char* ToString(AcquisitionOutcome outcome) {
  switch (outcome) {
    case AcquisitionOutcome::kOnline:
      return "online";
    case AcquisitionOutcome::kClaimFailed:
      return "claim failed";
    case AcquisitionOutcome::kOffline:
      return "offline";
    case AcquisitionOutcome::kQuit:
      return "quit";
  }
  return "unknown";
}

bool AcquisitionConfig::Validate(std::string* error) const {
  auto fail = [&](const std::string& message) {
    if (error) {
      *error = message;
    }
    return false;
  };
  if (initial_tries < 0 || refresh_tries <= 0) {
    return fail("initial_tries must not be negative and refresh_tries must be positive");
  }
  if (poll_interval.count() <= 0) {
    return fail("poll_interval must be positive");
  }
  return true;
}

AcquisitionSession::AcquisitionSession(bool use_real_player_number, int tries)
    : use_real_player_number_(use_real_player_number), tries_remaining_(tries) {}

bool AcquisitionSession::RequestContinueOffline() {
  bool expected = false;
  return continue_offline_.compare_exchange_strong(expected, true);
}

bool AcquisitionSession::RequestQuit() {
  bool expected = false;
  return quit_.compare_exchange_strong(expected, true);
}

AcquisitionStateMachine::AcquisitionStateMachine(AcquisitionConfig config,
                                                 DeviceObserver& observer,
                                                 PresenceClaimant& claimant,
                                                 const NetworkDiagnostics& diagnostics,
                                                 SessionUi& ui,
                                                 StartupHooks hooks)
    : config_(std::move(config)),
      observer_(observer),
      claimant_(claimant),
      diagnostics_(diagnostics),
      ui_(ui),
      hooks_(std::move(hooks)) {}

AcquisitionStateMachine::~AcquisitionStateMachine() {
  {
    std::lock_guard<std::mutex> lock(sleep_mutex_);
    abort_ = true;
  }
  sleep_cv_.notify_all();
  if (worker_.joinable()) {
    worker_.join();
  }
}

bool AcquisitionStateMachine::Start() {
  std::string error;
  if (!config_.Validate(&error)) {
    std::lock_guard<std::mutex> lock(mutex_);
    last_error_ = error;
    Log(error, config_.log_callback);
    return false;
  }
  if (started_.exchange(true)) {
    return false;
  }
  running_ = true;
  try {
    worker_ = std::thread([this]() {
      Run();
      running_ = false;
    });
  } catch (const std::exception& ex) {
    std::lock_guard<std::mutex> lock(mutex_);
    last_error_ = std::string("thread start failed: ") + ex.what();
    Log(last_error_, config_.log_callback);
    running_ = false;
    started_ = false;
    return false;
  }
  return true;
}

std::optional<AcquisitionResult> AcquisitionStateMachine::Wait() {
  if (worker_.joinable()) {
    worker_.join();
  }
  started_ = false;
  return result();
}

std::optional<AcquisitionResult> AcquisitionStateMachine::Run() {
  if (!Begin()) {
    return std::nullopt;
  }
  while (!Step()) {
  }
  return result();
}

bool AcquisitionStateMachine::Begin() {
  std::shared_ptr<AcquisitionSession> session;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (session_) {
      return false;
    }
    std::string error;
    if (!config_.Validate(&error)) {
      last_error_ = error;
      Log(error, config_.log_callback);
      return false;
    }
    session = std::make_shared<AcquisitionSession>(config_.use_real_player_number,
                                                   config_.initial_tries);
    session_ = session;
    result_.reset();
    last_error_.clear();
  }

  std::weak_ptr<AcquisitionSession> weak = session;
  session->indicator_ =
      ui_.ShowSearching(MakeAction(weak, &AcquisitionSession::RequestContinueOffline),
                        MakeAction(weak, &AcquisitionSession::RequestQuit));

  // We look for devices ourselves so the operator can interrupt us.
  if (!observer_.Start()) {
    Log("Unable to start listening for DJ Link devices: " + observer_.GetLastError(),
        config_.log_callback);
  }
  Log(std::string("Trying to go online, use real player number? ") +
          (session->use_real_player_number() ? "true" : "false"),
      config_.log_callback);
  return true;
}

bool AcquisitionStateMachine::Step() {
  std::shared_ptr<AcquisitionSession> session;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    session = session_;
  }
  if (!session) {
    return true;
  }

  // Torn down mid-attempt: the caller is gone, so no hooks and no result.
  if (abort_) {
    Log("Abandoning attempt to go online.", config_.log_callback);
    ui_.Dismiss(session->indicator_.exchange(kNoIndicator));
    std::lock_guard<std::mutex> lock(mutex_);
    session_.reset();
    return true;
  }

  if (session->quit()) {
    Log("Giving up attempt to go online, user wants to quit.", config_.log_callback);
    ui_.Dismiss(session->indicator_.exchange(kNoIndicator));
    AcquisitionResult result;
    result.outcome = AcquisitionOutcome::kQuit;
    Finish(result);
    return true;
  }

  if (session->continue_offline()) {
    Log("Giving up attempt to go online, user wants to continue offline.",
        config_.log_callback);
    ui_.Dismiss(session->indicator_.exchange(kNoIndicator));
    AcquisitionResult result;
    result.outcome = AcquisitionOutcome::kOffline;
    Finish(result);
    return true;
  }

  // Seeing a device wins over an exhausted budget.
  if (!observer_.GetCurrentDevices().empty()) {
    Finish(Claim(*session));
    return true;
  }

  if (session->tries_remaining_ == 0) {
    ShowTroubleshooting(session);
    return false;
  }

  --session->tries_remaining_;
  Sleep();
  return false;
}

bool AcquisitionStateMachine::RequestContinueOffline() {
  std::lock_guard<std::mutex> lock(mutex_);
  return session_ && session_->RequestContinueOffline();
}

bool AcquisitionStateMachine::RequestQuit() {
  std::lock_guard<std::mutex> lock(mutex_);
  return session_ && session_->RequestQuit();
}

bool AcquisitionStateMachine::InSession() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return session_ != nullptr;
}

int AcquisitionStateMachine::tries_remaining() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return session_ ? session_->tries_remaining_.load() : 0;
}

AcquisitionMode AcquisitionStateMachine::mode() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return session_ ? session_->mode_.load() : AcquisitionMode::kSearching;
}

IndicatorHandle AcquisitionStateMachine::indicator() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return session_ ? session_->indicator_.load() : kNoIndicator;
}

std::optional<AcquisitionResult> AcquisitionStateMachine::result() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return result_;
}

std::string AcquisitionStateMachine::GetLastError() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_error_;
}

void AcquisitionStateMachine::Finish(const AcquisitionResult& result) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    session_.reset();
    result_ = result;
  }
  if (result.outcome == AcquisitionOutcome::kQuit) {
    RunHook(hooks_.application_quit, "application_quit");
  } else {
    RunHook(hooks_.finish_startup, "finish_startup");
  }
}

AcquisitionResult AcquisitionStateMachine::Claim(AcquisitionSession& session) {
  ui_.Dismiss(session.indicator_.exchange(kNoIndicator));
  claimant_.SetUseStandardPlayerNumber(session.use_real_player_number());

  AcquisitionResult result;
  bool started = false;
  std::string cause;
  try {
    started = claimant_.Start();
  } catch (const std::exception& ex) {
    cause = ex.what();
    Log("Unable to start virtual player: " + cause, config_.log_callback);
  } catch (...) {
    cause = "unknown exception";
    Log("Unable to start virtual player: " + cause, config_.log_callback);
  }
  if (!started) {
    std::string message = "Unable to create virtual player, check the log for details.";
    if (cause.empty()) {
      cause = claimant_.GetLastError();
    }
    if (!cause.empty()) {
      message += "\n\n" + cause;
    }
    ui_.Alert(AlertKind::kError, kConnectionFailedTitle, message);
    result.outcome = AcquisitionOutcome::kClaimFailed;
    result.problems.push_back(AcquisitionProblem::kClaimStartFailure);
    return result;
  }

  result.outcome = AcquisitionOutcome::kOnline;
  result.player_number = claimant_.GetDeviceNumber();
  Log("Went online, using player number " + std::to_string(result.player_number),
      config_.log_callback);

  const auto conflicts = diagnostics_.ListConflictingInterfaces(claimant_);
  if (!conflicts.empty()) {
    ui_.Alert(AlertKind::kWarning, kNetworkProblemTitle,
              "Found multiple network interfaces on the DJ Link network.\n"
              "This can lead to duplicate packets and unreliable results:\n\n" +
                  Join(conflicts, "\n"));
    result.problems.push_back(AcquisitionProblem::kNetworkConflict);
  }

  const auto unreachables = claimant_.FindUnreachablePeers();
  if (!unreachables.empty()) {
    std::vector<std::string> descriptions;
    descriptions.reserve(unreachables.size());
    for (const auto& peer : unreachables) {
      descriptions.push_back(peer.name + " (" + peer.address + ")");
    }
    std::sort(descriptions.begin(), descriptions.end());
    std::ostringstream message;
    message << "Found devices on multiple networks, and DJ Link can only use one.\n"
            << "We will not be able to communicate with the following device"
            << (unreachables.size() > 1 ? "s" : "") << ":\n\n"
            << Join(descriptions, "\n");
    ui_.Alert(AlertKind::kError, kNetworkProblemTitle, message.str());
    result.problems.push_back(AcquisitionProblem::kUnreachablePeers);
  }
  return result;
}

void AcquisitionStateMachine::ShowTroubleshooting(
    const std::shared_ptr<AcquisitionSession>& session) {
  const std::string report = BuildNetworkDescription();
  if (session->mode_ == AcquisitionMode::kSearching) {
    ui_.Dismiss(session->indicator_.exchange(kNoIndicator));
    session->mode_ = AcquisitionMode::kTroubleshooting;
    std::weak_ptr<AcquisitionSession> weak = session;
    session->indicator_ = ui_.ShowTroubleshooting(
        report, MakeAction(weak, &AcquisitionSession::RequestContinueOffline),
        MakeAction(weak, &AcquisitionSession::RequestQuit));
  } else {
    ui_.RefreshTroubleshooting(session->indicator_, report);
  }
  session->tries_remaining_ = config_.refresh_tries;
}

std::string AcquisitionStateMachine::BuildNetworkDescription() const {
  const auto interfaces = diagnostics_.ListInterfaces();
  Log("Failed going online. Found no DJ Link devices on network interfaces: " +
          Join(interfaces, "; "),
      config_.log_callback);
  return "No DJ Link devices were seen on any network, still looking.\n\n"
         "The following network interfaces were found:\n" +
         Join(interfaces, "\n");
}

void AcquisitionStateMachine::RunHook(const std::function<void()>& hook,
                                      const char* name) {
  if (!hook) {
    return;
  }
  try {
    hook();
  } catch (const std::exception& ex) {
    Log(std::string("startup hook ") + name + " threw exception: " + ex.what(),
        config_.log_callback);
  } catch (...) {
    Log(std::string("startup hook ") + name + " threw exception", config_.log_callback);
  }
}

void AcquisitionStateMachine::Sleep() {
  if (config_.sleep) {
    config_.sleep(config_.poll_interval);
    return;
  }
  std::unique_lock<std::mutex> lock(sleep_mutex_);
  sleep_cv_.wait_for(lock, config_.poll_interval, [this]() { return abort_.load(); });
}

}  // namespace djonline
