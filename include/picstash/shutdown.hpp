#pragma once

#include <atomic>
#include <condition_variable>
#include <csignal>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace picstash {

class Registry;  // Forward declaration

/**
 * ShutdownHandler turns SIGTERM, SIGINT or SIGHUP into an orderly stop:
 * shutdown callbacks run first (the server uses one to quit the Drogon
 * loop), then every registered registry is closed.
 *
 * The signal handler itself only records the signal number. A watcher
 * thread started by InstallSignalHandlers() notices it and calls
 * Shutdown() outside signal context.
 *
 * Only one handler per process can have its signal handlers installed.
 */
class ShutdownHandler {
 public:
  ShutdownHandler() = default;

  /** Stops the watcher and restores the previous signal dispositions. */
  ~ShutdownHandler();

  ShutdownHandler(const ShutdownHandler&) = delete;
  ShutdownHandler& operator=(const ShutdownHandler&) = delete;

  /** The registry must stay valid until it is unregistered or closed. */
  void RegisterRegistry(Registry* registry);

  /**
   * Forget a registry. Waits for a Close() that Shutdown() is running on it,
   * so the caller may destroy the registry afterwards.
   */
  void UnregisterRegistry(Registry* registry);

  void OnShutdown(std::function<void()> callback);

  /**
   * Install the signal handlers and start the watcher thread. Returns false
   * if sigaction fails or another ShutdownHandler already owns the signals.
   */
  bool InstallSignalHandlers();
  void RestoreSignalHandlers();

  /**
   * Run the callbacks in registration order, then close the registries.
   * Only the first call does anything; later calls return false.
   */
  bool Shutdown();

  bool IsShutdownRequested() const { return shutdown_requested_.load(); }

  /** Signal that triggered shutdown, 0 if none did. */
  int received_signal() const { return received_signal_.load(); }

 private:
  static void OnSignal(int signum);
  void Watch();

  std::mutex mutex_;
  std::vector<Registry*> registries_;
  std::vector<std::function<void()>> callbacks_;
  std::atomic<bool> shutdown_requested_{false};
  std::atomic<int> received_signal_{0};

  std::mutex watch_mu_;
  std::condition_variable watch_cv_;
  bool stop_watching_ = false;
  std::thread watcher_;

  bool handlers_installed_ = false;
  struct sigaction old_sigterm_;
  struct sigaction old_sigint_;
  struct sigaction old_sighup_;
};

}  // namespace picstash
