#include <picstash/server/config.hpp>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace picstash::server {

namespace {

void PrintUsage(const char* argv0) {
  std::cerr << "Usage: " << argv0 << " [options]\n"
            << "\nOptions:\n"
            << "  --config, -c <path>       Path to YAML config file\n"
            << "  --host <addr>             Bind address (default: 0.0.0.0)\n"
            << "  --port, -p <port>         Listen port (default: 5000)\n"
            << "  --threads <n>             Worker threads (default: auto)\n"
            << "  --images-dir <path>       Directory for stored images (required)\n"
            << "  --db-path <path>          Registry database path (required)\n"
            << "  --id-length <n>           Identifier length (default: 6)\n"
            << "  --max-tries <n>           Claim attempts per upload (default: 10)\n"
            << "  --log-level <level>       Log level: debug, info, warn, error\n"
            << "  --help, -h                Show this help\n"
            << "\nThe upload secret is read from auth.secret or $PICSTASH_SECRET.\n"
            << "\nExamples:\n"
            << "  " << argv0 << " --images-dir /srv/images --db-path /srv/registry\n"
            << "  " << argv0 << " --config /etc/picstash/server.yaml\n";
}

// Simple YAML-like parser for basic config files
// Format:
//   key: value
//   section:
//     key: value
std::string Trim(const std::string& s) {
  size_t start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) return "";
  size_t end = s.find_last_not_of(" \t\r\n");
  return s.substr(start, end - start + 1);
}

bool ParseBool(const std::string& value) {
  return value == "true" || value == "1" || value == "yes";
}

uint64_t ParseUnsigned(const std::string& key, const std::string& value) {
  if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
    throw std::runtime_error("Invalid number for " + key + ": '" + value + "'");
  }
  try {
    return std::stoull(value);
  } catch (const std::out_of_range&) {
    throw std::runtime_error("Number out of range for " + key + ": " + value);
  }
}

std::vector<std::string> ParseList(const std::string& value) {
  std::vector<std::string> out;
  std::stringstream ss(value);
  std::string item;
  while (std::getline(ss, item, ',')) {
    item = Trim(item);
    if (!item.empty()) out.push_back(item);
  }
  return out;
}

const char* NextArg(int argc, char** argv, int* i, const std::string& what) {
  if (++*i >= argc) {
    throw std::runtime_error(std::string(argv[*i - 1]) + " requires " + what);
  }
  return argv[*i];
}

}  // namespace

Config Config::LoadFromFile(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("Cannot open config file: " + path);
  }

  Config config;
  std::string current_section;
  std::string line;

  while (std::getline(file, line)) {
    line = Trim(line);

    // Skip empty lines and comments
    if (line.empty() || line[0] == '#') {
      continue;
    }

    size_t colon_pos = line.find(':');
    if (colon_pos == std::string::npos) {
      continue;
    }

    std::string key = Trim(line.substr(0, colon_pos));
    std::string value = Trim(line.substr(colon_pos + 1));

    // If value is empty, this is a section header
    if (value.empty()) {
      current_section = key;
      continue;
    }

    // Remove quotes from value if present
    if (value.size() >= 2 &&
        ((value.front() == '"' && value.back() == '"') ||
         (value.front() == '\'' && value.back() == '\''))) {
      value = value.substr(1, value.size() - 2);
    }

    const std::string qualified = current_section.empty() ? key : current_section + "." + key;

    if (current_section == "server") {
      if (key == "host") {
        config.server.host = value;
      } else if (key == "port") {
        config.server.port = static_cast<uint16_t>(ParseUnsigned(qualified, value));
      } else if (key == "threads") {
        config.server.threads = static_cast<uint32_t>(ParseUnsigned(qualified, value));
      } else if (key == "log_level") {
        config.server.log_level = value;
      } else if (key == "max_body_bytes") {
        config.server.max_body_bytes = ParseUnsigned(qualified, value);
      }
    } else if (current_section == "storage") {
      if (key == "images_dir") {
        config.storage.images_dir = value;
      } else if (key == "db_path") {
        config.storage.db_path = value;
      }
    } else if (current_section == "registry") {
      if (key == "block_cache_bytes") {
        config.registry.block_cache_bytes = ParseUnsigned(qualified, value);
      } else if (key == "lock_timeout_ms") {
        config.registry.lock_timeout_ms = static_cast<int>(ParseUnsigned(qualified, value));
      } else if (key == "acquire_timeout_ms") {
        config.registry.acquire_timeout_ms = static_cast<int>(ParseUnsigned(qualified, value));
      } else if (key == "max_concurrent_ops") {
        config.registry.max_concurrent_ops = static_cast<int>(ParseUnsigned(qualified, value));
      }
    } else if (current_section == "allocation") {
      if (key == "id_length") {
        config.service.allocator.id_length = ParseUnsigned(qualified, value);
      } else if (key == "max_tries") {
        config.service.allocator.max_tries = static_cast<int>(ParseUnsigned(qualified, value));
      } else if (key == "extensions") {
        config.service.allocator.allowed_extensions = ParseList(value);
      } else if (key == "sweep_grace_seconds") {
        config.service.sweep_grace_seconds = ParseUnsigned(qualified, value);
      }
    } else if (current_section == "auth") {
      if (key == "secret") {
        config.auth.secret = value;
      }
    } else if (current_section == "metrics") {
      if (key == "enabled") {
        config.metrics.enabled = ParseBool(value);
      } else if (key == "path") {
        config.metrics.path = value;
      }
    } else if (current_section.empty()) {
      // Top-level keys
      if (key == "images_dir") {
        config.storage.images_dir = value;
      } else if (key == "db_path") {
        config.storage.db_path = value;
      }
    }
  }

  return config;
}

Config Config::LoadFromArgs(int argc, char** argv) {
  // Pass 1: find the config file so flags can override it.
  std::string config_file;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      PrintUsage(argv[0]);
      std::exit(0);
    }
    if (arg == "--config" || arg == "-c") {
      config_file = NextArg(argc, argv, &i, "a path argument");
    }
  }

  Config config = config_file.empty() ? Config{} : LoadFromFile(config_file);

  // Pass 2: flags.
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--config" || arg == "-c") {
      ++i;
    } else if (arg == "--host") {
      config.server.host = NextArg(argc, argv, &i, "an address argument");
    } else if (arg == "--port" || arg == "-p") {
      config.server.port =
          static_cast<uint16_t>(ParseUnsigned(arg, NextArg(argc, argv, &i, "a port number")));
    } else if (arg == "--threads") {
      config.server.threads =
          static_cast<uint32_t>(ParseUnsigned(arg, NextArg(argc, argv, &i, "a number")));
    } else if (arg == "--images-dir") {
      config.storage.images_dir = NextArg(argc, argv, &i, "a path");
    } else if (arg == "--db-path") {
      config.storage.db_path = NextArg(argc, argv, &i, "a path");
    } else if (arg == "--id-length") {
      config.service.allocator.id_length = ParseUnsigned(arg, NextArg(argc, argv, &i, "a number"));
    } else if (arg == "--max-tries") {
      config.service.allocator.max_tries =
          static_cast<int>(ParseUnsigned(arg, NextArg(argc, argv, &i, "a number")));
    } else if (arg == "--log-level") {
      config.server.log_level = NextArg(argc, argv, &i, "a level");
    } else if (!arg.empty() && arg[0] == '-') {
      throw std::runtime_error("Unknown option: " + arg);
    }
  }

  if (config.auth.secret.empty()) {
    if (const char* env = std::getenv("PICSTASH_SECRET")) {
      config.auth.secret = env;
    }
  }

  return config;
}

void Config::Validate() const {
  if (storage.images_dir.empty()) {
    throw std::runtime_error("images_dir is required (use --images-dir or config file)");
  }
  if (storage.db_path.empty()) {
    throw std::runtime_error("db_path is required (use --db-path or config file)");
  }

  if (server.port == 0) {
    throw std::runtime_error("Invalid port number: " + std::to_string(server.port));
  }

  const auto& alloc = service.allocator;
  if (alloc.id_length == 0 || alloc.id_length > 64) {
    throw std::runtime_error("allocation.id_length must be in [1, 64]");
  }
  if (alloc.max_tries <= 0) {
    throw std::runtime_error("allocation.max_tries must be positive");
  }
  if (alloc.allowed_extensions.empty()) {
    throw std::runtime_error("allocation.extensions must not be empty");
  }
  if (service.sweep_grace_seconds < kMinSweepGraceSeconds) {
    throw std::runtime_error("allocation.sweep_grace_seconds must be at least " +
                             std::to_string(kMinSweepGraceSeconds));
  }

  if (registry.max_concurrent_ops <= 0) {
    throw std::runtime_error("registry.max_concurrent_ops must be positive");
  }

  // Validate log level
  if (server.log_level != "debug" && server.log_level != "info" &&
      server.log_level != "warn" && server.log_level != "error") {
    throw std::runtime_error("Invalid log_level: " + server.log_level +
                             " (must be debug, info, warn, or error)");
  }
}

}  // namespace picstash::server
