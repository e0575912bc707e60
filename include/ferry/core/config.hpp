#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

#include "ferry/core/types.hpp"

namespace ferry {

// Settings applied to the agent thread and its engine
struct AgentConfig {
  // Engine connection limits; 0 leaves the engine default in place
  std::size_t max_connections = 0;
  std::size_t max_connections_per_host = 0;
  std::size_t connection_cache_size = 0;

  // Upper bound on a single blocking poll, regardless of the engine's timer
  std::chrono::milliseconds poll_ceiling{1000};
};

// Defaults applied to requests that don't set their own
struct RequestDefaults {
  std::optional<std::chrono::milliseconds> timeout;
  std::chrono::milliseconds connect_timeout{300000};
  bool follow_redirects = false;
  std::optional<long> max_redirects;
  bool metrics = false;
};

// Client configuration
struct ClientConfig {
  AgentConfig agent;
  RequestDefaults request;

  // Soft capacity of each response body pipe
  std::size_t response_buffer_size = 64 * 1024;

  // Logging
  std::string log_level = "info";
  std::optional<std::filesystem::path> log_file;

  // Load from file; missing or malformed files yield the defaults
  static ClientConfig load(const std::filesystem::path& path);

  // Load the user config file if there is one
  static ClientConfig load_default();

  // Load config from environment variables, with file config as base
  // Reads: FERRY_MAX_CONNECTIONS, FERRY_MAX_CONNECTIONS_PER_HOST,
  //        FERRY_CONNECTION_CACHE_SIZE, FERRY_LOG_LEVEL, FERRY_METRICS
  static ClientConfig from_env();

  static ClientConfig from_json(const json& j);

  json to_json() const;

  // Save to file
  void save(const std::filesystem::path& path) const;
};

// Configuration paths
namespace config_paths {
std::filesystem::path home_dir();

std::filesystem::path config_dir();

std::filesystem::path default_config_file();
}  // namespace config_paths

}  // namespace ferry
