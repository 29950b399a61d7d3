#pragma once

#include <picstash/image_service.hpp>
#include <picstash/rocks_registry.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace picstash::server {

/**
 * Server configuration.
 */
struct ServerConfig {
  std::string host = "0.0.0.0";
  uint16_t port = 5000;
  uint32_t threads = 0;  // 0 = auto-detect CPU cores
  std::string log_level = "info";
  uint64_t max_body_bytes = 32ull * 1024ull * 1024ull;
};

/**
 * Where images and the registry live.
 */
struct StorageConfig {
  std::string images_dir;
  std::string db_path;
};

/**
 * Shared-secret check for mutating endpoints.
 * An empty secret disables those endpoints.
 */
struct AuthConfig {
  std::string secret;
};

/**
 * Metrics configuration.
 */
struct MetricsConfig {
  bool enabled = true;
  std::string path = "/metrics";
};

/**
 * Complete server configuration.
 */
struct Config {
  ServerConfig server;
  StorageConfig storage;
  RegistryOptions registry;
  ServiceOptions service;
  AuthConfig auth;
  MetricsConfig metrics;

  /**
   * Load configuration from a YAML-like file (`section:` / `  key: value`).
   * @throws std::runtime_error if file cannot be read or parsed.
   */
  static Config LoadFromFile(const std::string& path);

  /**
   * Parse command-line arguments; a --config file is loaded first and the
   * flags override it. PICSTASH_SECRET supplies auth.secret when neither
   * sets it.
   * @throws std::runtime_error on invalid arguments.
   */
  static Config LoadFromArgs(int argc, char** argv);

  /**
   * Validate configuration.
   * @throws std::runtime_error if configuration is invalid.
   */
  void Validate() const;
};

}  // namespace picstash::server
