#pragma once

#include <picstash/image_service.hpp>
#include <picstash/object_store.hpp>
#include <picstash/rocks_registry.hpp>
#include <picstash/server/config.hpp>
#include <picstash/server/metrics.hpp>
#include <picstash/shutdown.hpp>

#include <memory>
#include <string>

namespace picstash::server {

/**
 * picstash HTTP Server.
 *
 * Opens the registry and the image directory, wraps them in an
 * ImageService and exposes it over a REST API using Drogon.
 */
class Server {
 public:
  /**
   * Create a server with the given configuration.
   * @throws std::runtime_error if the config is invalid or storage cannot
   *         be opened.
   */
  explicit Server(const Config& config);

  ~Server();

  // Non-copyable, non-movable
  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  /**
   * Start the server (blocking).
   * Returns when the server shuts down.
   */
  void Run();

  /**
   * Request shutdown (async).
   * The server will stop accepting new connections and drain existing ones.
   */
  void Shutdown();

  ImageService* GetService() { return service_.get(); }
  RocksRegistry* GetRegistry() { return registry_.get(); }

 private:
  void SetupRoutes();
  void SetupShutdown();

  Config config_;
  std::shared_ptr<PrometheusMetrics> metrics_;
  std::unique_ptr<RocksRegistry> registry_;
  std::unique_ptr<FileObjectStore> objects_;
  std::unique_ptr<ImageService> service_;
  bool running_ = false;

  // Declared last so its watcher thread stops before the registry is freed.
  ShutdownHandler shutdown_;
};

}  // namespace picstash::server
