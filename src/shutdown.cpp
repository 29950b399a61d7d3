#include <picstash/shutdown.hpp>
#include <picstash/registry.hpp>

#include <trantor/utils/Logger.h>

#include <algorithm>
#include <chrono>

namespace picstash {

namespace {

// Written from signal context, so it must be a lock-free atomic.
std::atomic<int> g_pending_signal{0};
static_assert(std::atomic<int>::is_always_lock_free, "signal flag must be lock-free");

// Set while some ShutdownHandler has the process signal handlers installed.
std::atomic<bool> g_signals_owned{false};

constexpr auto kWatchInterval = std::chrono::milliseconds(100);

}  // namespace

ShutdownHandler::~ShutdownHandler() { RestoreSignalHandlers(); }

void ShutdownHandler::RegisterRegistry(Registry* registry) {
  if (!registry) return;

  std::lock_guard<std::mutex> lock(mutex_);
  if (std::find(registries_.begin(), registries_.end(), registry) == registries_.end()) {
    registries_.push_back(registry);
  }
}

void ShutdownHandler::UnregisterRegistry(Registry* registry) {
  if (!registry) return;

  std::lock_guard<std::mutex> lock(mutex_);
  registries_.erase(std::remove(registries_.begin(), registries_.end(), registry),
                    registries_.end());
}

void ShutdownHandler::OnShutdown(std::function<void()> callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  callbacks_.push_back(std::move(callback));
}

void ShutdownHandler::OnSignal(int signum) {
  g_pending_signal.store(signum);
}

bool ShutdownHandler::InstallSignalHandlers() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (handlers_installed_) return true;

  bool expected = false;
  if (!g_signals_owned.compare_exchange_strong(expected, true)) {
    LOG_WARN << "Signal handlers already owned by another ShutdownHandler";
    return false;
  }

  struct sigaction sa;
  sa.sa_handler = OnSignal;
  sigemptyset(&sa.sa_mask);
  sa.sa_flags = SA_RESTART;

  if (sigaction(SIGTERM, &sa, &old_sigterm_) != 0) {
    g_signals_owned.store(false);
    return false;
  }
  if (sigaction(SIGINT, &sa, &old_sigint_) != 0) {
    sigaction(SIGTERM, &old_sigterm_, nullptr);
    g_signals_owned.store(false);
    return false;
  }
  if (sigaction(SIGHUP, &sa, &old_sighup_) != 0) {
    sigaction(SIGTERM, &old_sigterm_, nullptr);
    sigaction(SIGINT, &old_sigint_, nullptr);
    g_signals_owned.store(false);
    return false;
  }

  g_pending_signal.store(0);
  {
    std::lock_guard<std::mutex> watch_lock(watch_mu_);
    stop_watching_ = false;
  }
  watcher_ = std::thread([this] { Watch(); });
  handlers_installed_ = true;
  return true;
}

void ShutdownHandler::RestoreSignalHandlers() {
  std::thread watcher;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!handlers_installed_) return;

    sigaction(SIGTERM, &old_sigterm_, nullptr);
    sigaction(SIGINT, &old_sigint_, nullptr);
    sigaction(SIGHUP, &old_sighup_, nullptr);
    handlers_installed_ = false;
    g_signals_owned.store(false);
    watcher = std::move(watcher_);
  }

  {
    std::lock_guard<std::mutex> watch_lock(watch_mu_);
    stop_watching_ = true;
  }
  watch_cv_.notify_all();
  // Joined outside mutex_: the watcher may be inside Shutdown().
  if (watcher.joinable() && watcher.get_id() != std::this_thread::get_id()) {
    watcher.join();
  } else if (watcher.joinable()) {
    watcher.detach();
  }
}

void ShutdownHandler::Watch() {
  std::unique_lock<std::mutex> lock(watch_mu_);
  while (!stop_watching_) {
    watch_cv_.wait_for(lock, kWatchInterval);
    int signum = g_pending_signal.exchange(0);
    if (signum == 0) continue;

    lock.unlock();
    LOG_INFO << "Received signal " << signum << ", shutting down";
    received_signal_.store(signum);
    Shutdown();
    lock.lock();
  }
}

bool ShutdownHandler::Shutdown() {
  bool expected = false;
  if (!shutdown_requested_.compare_exchange_strong(expected, true)) {
    return false;
  }

  std::vector<std::function<void()>> callbacks;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    callbacks = callbacks_;
  }
  // Stop taking requests before the registries go away.
  for (const auto& callback : callbacks) {
    if (callback) callback();
  }

  // Closed under mutex_ so UnregisterRegistry() cannot return while a close
  // is running. Close() itself waits for in-flight registry calls.
  std::lock_guard<std::mutex> lock(mutex_);
  for (Registry* registry : registries_) {
    registry->Close();
  }
  LOG_INFO << "Shutdown complete, closed " << registries_.size() << " registries";
  registries_.clear();
  return true;
}

}  // namespace picstash
