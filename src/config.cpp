#include "fliprpc/config.hpp"

#include <picojson.h>

#include <cstdlib>
#include <limits>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace fliprpc {

namespace {

const picojson::value* find_key(const picojson::value& v,
                                const std::string& key) {
  if (!v.is<picojson::object>()) return nullptr;
  const auto& obj = v.get<picojson::object>();
  auto it = obj.find(key);
  return it == obj.end() ? nullptr : &it->second;
}

std::string get_string(const picojson::value& v, const std::string& key,
                       const std::string& def) {
  const auto* found = find_key(v, key);
  if (!found || !found->is<std::string>()) return def;
  return found->get<std::string>();
}

// Numbers past INT_MAX saturate.
int get_int(const picojson::value& v, const std::string& key, int def) {
  const auto* found = find_key(v, key);
  if (!found || !found->is<double>()) return def;
  double d = found->get<double>();
  if (d < 0) return def;
  if (d >= static_cast<double>(std::numeric_limits<int>::max())) {
    return std::numeric_limits<int>::max();
  }
  return static_cast<int>(d);
}

// Zero is as unusable as a negative count or duration.
int get_positive_int(const picojson::value& v, const std::string& key,
                     int def) {
  int n = get_int(v, key, def);
  return n > 0 ? n : def;
}

bool get_bool(const picojson::value& v, const std::string& key, bool def) {
  const auto* found = find_key(v, key);
  if (!found || !found->is<bool>()) return def;
  return found->get<bool>();
}

}  // namespace

std::string ConfigManager::get_config_dir() {
  const char* xdg_config = std::getenv("XDG_CONFIG_HOME");
  if (xdg_config && *xdg_config) {
    return std::string(xdg_config) + "/fliprpc";
  }

  const char* home = std::getenv("HOME");
  if (home && *home) {
    return std::string(home) + "/.config/fliprpc";
  }

  return ".config/fliprpc";
}

std::string ConfigManager::get_config_path() {
  return get_config_dir() + "/config.json";
}

std::optional<Config> ConfigManager::parse_config(const std::string& text) {
  picojson::value json;
  std::string err = picojson::parse(json, text);
  if (!err.empty() || !json.is<picojson::object>()) {
    return std::nullopt;
  }

  Config defaults;
  Config config;
  config.port = get_string(json, "port", defaults.port);
  config.baud = get_positive_int(json, "baud", defaults.baud);
  config.timeout_ms =
      get_positive_int(json, "timeout_ms", defaults.timeout_ms);
  config.chunk_size = static_cast<size_t>(get_positive_int(
      json, "chunk_size", static_cast<int>(defaults.chunk_size)));
  config.prefetch_metadata =
      get_bool(json, "prefetch_metadata", defaults.prefetch_metadata);
  config.keepalive = get_bool(json, "keepalive", defaults.keepalive);
  config.keepalive_interval_ms = get_positive_int(
      json, "keepalive_interval_ms", defaults.keepalive_interval_ms);
  config.varint_decode = get_string(json, "varint_decode", "fast") == "slow"
                             ? VarintDecode::Slow
                             : VarintDecode::Fast;
  return config;
}

std::string ConfigManager::serialize_config(const Config& config) {
  picojson::object obj;
  obj["port"] = picojson::value(config.port);
  obj["baud"] = picojson::value(static_cast<double>(config.baud));
  obj["timeout_ms"] = picojson::value(static_cast<double>(config.timeout_ms));
  obj["chunk_size"] = picojson::value(static_cast<double>(config.chunk_size));
  obj["prefetch_metadata"] = picojson::value(config.prefetch_metadata);
  obj["keepalive"] = picojson::value(config.keepalive);
  obj["keepalive_interval_ms"] =
      picojson::value(static_cast<double>(config.keepalive_interval_ms));
  obj["varint_decode"] = picojson::value(
      std::string(config.varint_decode == VarintDecode::Slow ? "slow" : "fast"));

  return picojson::value(obj).serialize(true);
}

std::optional<Config> ConfigManager::load_config() {
  std::string path = get_config_path();

  if (!fs::exists(path)) {
    return Config{};
  }

  std::ifstream file(path);
  if (!file) {
    return std::nullopt;
  }

  std::ostringstream ss;
  ss << file.rdbuf();
  return parse_config(ss.str());
}

bool ConfigManager::save_config(const Config& config) {
  std::error_code ec;
  fs::create_directories(get_config_dir(), ec);
  if (ec) {
    return false;
  }

  std::ofstream file(get_config_path());
  if (!file) {
    return false;
  }

  file << serialize_config(config);
  return file.good();
}

SessionOptions ConfigManager::to_session_options(const Config& config,
                                                 bool verbose) {
  SessionOptions options;
  options.timeout = std::chrono::milliseconds(config.timeout_ms);
  options.chunk_size = config.chunk_size;
  options.prefetch_metadata = config.prefetch_metadata;
  options.keepalive = config.keepalive;
  options.keepalive_interval =
      std::chrono::milliseconds(config.keepalive_interval_ms);
  options.varint_decode = config.varint_decode;
  options.verbose = verbose;
  return options;
}

}  // namespace fliprpc
