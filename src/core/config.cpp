#include "ferry/core/config.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>

namespace ferry {

namespace fs = std::filesystem;

namespace {

std::optional<std::size_t> env_size(const char* name) {
  const char* value = std::getenv(name);
  if (!value) {
    return std::nullopt;
  }
  try {
    return static_cast<std::size_t>(std::stoull(value));
  } catch (const std::exception &) {
    spdlog::warn("Ignoring {}: not a number ({})", name, value);
    return std::nullopt;
  }
}

bool is_truthy(const std::string& value) {
  return value == "true" || value == "1" || value == "yes";
}

}  // namespace

ClientConfig ClientConfig::from_json(const json& j) {
  ClientConfig config;

  if (j.contains("agent")) {
    const auto& a = j["agent"];
    config.agent.max_connections = a.value("max_connections", std::size_t(0));
    config.agent.max_connections_per_host = a.value("max_connections_per_host", std::size_t(0));
    config.agent.connection_cache_size = a.value("connection_cache_size", std::size_t(0));
    config.agent.poll_ceiling = std::chrono::milliseconds(a.value("poll_ceiling_ms", int64_t(1000)));
  }

  if (j.contains("request")) {
    const auto& r = j["request"];
    if (r.contains("timeout_ms")) {
      config.request.timeout = std::chrono::milliseconds(r["timeout_ms"].get<int64_t>());
    }
    config.request.connect_timeout = std::chrono::milliseconds(r.value("connect_timeout_ms", int64_t(300000)));
    config.request.follow_redirects = r.value("follow_redirects", false);
    if (r.contains("max_redirects")) {
      config.request.max_redirects = r["max_redirects"].get<long>();
    }
    config.request.metrics = r.value("metrics", false);
  }

  config.response_buffer_size = j.value("response_buffer_size", std::size_t(64 * 1024));

  config.log_level = j.value("log_level", "info");
  if (j.contains("log_file")) {
    config.log_file = j["log_file"].get<std::string>();
  }

  return config;
}

ClientConfig ClientConfig::load(const fs::path& path) {
  if (!fs::exists(path)) {
    return ClientConfig{};
  }

  std::ifstream file(path);
  if (!file.is_open()) {
    spdlog::warn("Failed to open config file {}", path.string());
    return ClientConfig{};
  }

  try {
    return from_json(json::parse(file));
  } catch (const std::exception& e) {
    spdlog::warn("Failed to parse config file {}: {}", path.string(), e.what());
  }

  return ClientConfig{};
}

ClientConfig ClientConfig::load_default() {
  auto global_config = config_paths::default_config_file();
  if (fs::exists(global_config)) {
    return load(global_config);
  }

  return ClientConfig{};
}

ClientConfig ClientConfig::from_env() {
  ClientConfig config = load_default();

  if (auto max = env_size("FERRY_MAX_CONNECTIONS")) {
    config.agent.max_connections = *max;
  }
  if (auto max = env_size("FERRY_MAX_CONNECTIONS_PER_HOST")) {
    config.agent.max_connections_per_host = *max;
  }
  if (auto size = env_size("FERRY_CONNECTION_CACHE_SIZE")) {
    config.agent.connection_cache_size = *size;
  }

  if (const char* level = std::getenv("FERRY_LOG_LEVEL")) {
    config.log_level = level;
  }

  if (const char* metrics = std::getenv("FERRY_METRICS")) {
    config.request.metrics = is_truthy(metrics);
  }

  return config;
}

json ClientConfig::to_json() const {
  json j;

  j["agent"] = {{"max_connections", agent.max_connections},
                {"max_connections_per_host", agent.max_connections_per_host},
                {"connection_cache_size", agent.connection_cache_size},
                {"poll_ceiling_ms", agent.poll_ceiling.count()}};

  json r;
  if (request.timeout) {
    r["timeout_ms"] = request.timeout->count();
  }
  r["connect_timeout_ms"] = request.connect_timeout.count();
  r["follow_redirects"] = request.follow_redirects;
  if (request.max_redirects) {
    r["max_redirects"] = *request.max_redirects;
  }
  r["metrics"] = request.metrics;
  j["request"] = r;

  j["response_buffer_size"] = response_buffer_size;

  j["log_level"] = log_level;
  if (log_file) {
    j["log_file"] = log_file->string();
  }

  return j;
}

void ClientConfig::save(const fs::path& path) const {
  std::error_code ec;
  if (path.has_parent_path()) {
    fs::create_directories(path.parent_path(), ec);
  }

  std::ofstream file(path);
  if (!file.is_open()) {
    spdlog::warn("Failed to write config file {}", path.string());
    return;
  }
  file << to_json().dump(2);
}

namespace config_paths {

fs::path home_dir() {
  if (const char* home = std::getenv("HOME")) {
    return fs::path(home);
  }
  return fs::temp_directory_path();
}

fs::path config_dir() {
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME")) {
    return fs::path(xdg) / "ferry";
  }
  return home_dir() / ".config" / "ferry";
}

fs::path default_config_file() {
  return config_dir() / "config.json";
}

}  // namespace config_paths

}  // namespace ferry
