#include <picstash/server/server.hpp>
#include <picstash/server/handlers.hpp>
#include <picstash/version.hpp>

#include <drogon/drogon.h>
#include <trantor/utils/Logger.h>

#include <iostream>
#include <stdexcept>
#include <thread>

namespace picstash::server {

namespace {

trantor::Logger::LogLevel ToLogLevel(const std::string& level) {
  if (level == "debug") return trantor::Logger::kDebug;
  if (level == "warn") return trantor::Logger::kWarn;
  if (level == "error") return trantor::Logger::kError;
  return trantor::Logger::kInfo;
}

}  // namespace

Server::Server(const Config& config) : config_(config) {
  // Validate configuration
  config_.Validate();

  // One sink shared by the registry, the service and the HTTP layer.
  if (config_.metrics.enabled) {
    metrics_ = std::make_shared<PrometheusMetrics>();
    config_.registry.metrics = metrics_;
    config_.service.metrics = metrics_;
  }

  auto status = RocksRegistry::Open(config_.storage.db_path, &registry_, config_.registry);
  if (!status.ok()) {
    throw std::runtime_error("Failed to open registry at " + config_.storage.db_path +
                             ": " + status.ToString());
  }

  objects_ = std::make_unique<FileObjectStore>(config_.storage.images_dir);
  service_ = std::make_unique<ImageService>(registry_.get(), objects_.get(), config_.service);
}

Server::~Server() {
  if (running_) {
    Shutdown();
  }
  shutdown_.RestoreSignalHandlers();
  shutdown_.UnregisterRegistry(registry_.get());
}

void Server::SetupRoutes() {
  RegisterHandlers(service_.get(), config_);
  RegisterRequestAccounting(registry_.get(), metrics_);

  if (config_.metrics.enabled && metrics_) {
    RegisterMetricsHandler(metrics_, config_.metrics.path, registry_.get());
  }
}

void Server::SetupShutdown() {
  shutdown_.RegisterRegistry(registry_.get());
  if (!shutdown_.InstallSignalHandlers()) {
    LOG_WARN << "Could not install signal handlers; stop the server with Shutdown()";
  }

  // Stop Drogon first; the registry is closed once the callbacks return.
  shutdown_.OnShutdown([]() {
    std::cout << "Shutting down HTTP server..." << std::endl;
    drogon::app().quit();
  });
}

void Server::Run() {
  running_ = true;

  trantor::Logger::setLogLevel(ToLogLevel(config_.server.log_level));

  // Configure Drogon
  auto& app = drogon::app();

  // Set listener address and port
  app.addListener(config_.server.host, config_.server.port);

  // Set number of threads
  uint32_t threads = config_.server.threads;
  if (threads == 0) {
    threads = std::thread::hardware_concurrency();
    if (threads == 0) threads = 4;  // Fallback
  }
  app.setThreadNum(threads);

  // Configure timeouts and limits
  app.setMaxConnectionNum(10000);
  app.setMaxConnectionNumPerIP(100);
  app.setIdleConnectionTimeout(60);
  app.setKeepaliveRequestsNumber(100);
  app.setClientMaxBodySize(config_.server.max_body_bytes);

  // Disable session support (not needed for API server)
  app.disableSession();

  // SIGTERM goes through ShutdownHandler so the registry is closed too.
  app.disableSigtermHandling();

  // Set up routes
  SetupRoutes();

  // Set up graceful shutdown
  SetupShutdown();

  std::cout << "picstash " << Version() << " starting on " << config_.server.host
            << ":" << config_.server.port << " with " << threads << " threads" << std::endl;
  std::cout << "Images: " << config_.storage.images_dir
            << ", registry: " << config_.storage.db_path << std::endl;

  // Run Drogon (blocking)
  app.run();

  running_ = false;
  std::cout << "Server stopped." << std::endl;
}

void Server::Shutdown() {
  if (running_) {
    shutdown_.Shutdown();
  }
}

}  // namespace picstash::server
