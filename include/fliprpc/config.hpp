#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include "serial_port.hpp"
#include "session.hpp"

namespace fliprpc {

struct Config {
  std::string port;  // Empty = must be given with -p
  int baud = DEFAULT_BAUD;
  int timeout_ms = static_cast<int>(DEFAULT_TIMEOUT.count());
  size_t chunk_size = DEFAULT_CHUNK_SIZE;
  bool prefetch_metadata = false;
  bool keepalive = true;
  int keepalive_interval_ms =
      static_cast<int>(DEFAULT_KEEPALIVE_INTERVAL.count());
  VarintDecode varint_decode = VarintDecode::Fast;
};

class ConfigManager {
 public:
  static std::string get_config_dir();
  static std::string get_config_path();

  // Defaults when the file does not exist, nullopt when it cannot be read
  // or parsed.
  static std::optional<Config> load_config();
  static bool save_config(const Config& config);

  // Missing keys keep their defaults; values of the wrong type are
  // ignored the same way.
  static std::optional<Config> parse_config(const std::string& text);
  static std::string serialize_config(const Config& config);

  static SessionOptions to_session_options(const Config& config,
                                           bool verbose = false);
};

}  // namespace fliprpc
