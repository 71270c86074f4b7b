#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <memory>
#include <sstream>
#include <thread>

#include "fliprpc/config.hpp"
#include "fliprpc/error.hpp"
#include "fliprpc/session.hpp"
#include "fliprpc/shell.hpp"
#include "fliprpc/storage.hpp"
#include "fliprpc/system.hpp"

static void print_usage(const char* prog) {
  std::cout
      << "Usage: " << prog
      << " <command> [options]\n\n"
         "Commands:\n"
         "  ping [byte...]          Ping the device (default payload 1 2 3 4)\n"
         "  info                    Show device info\n"
         "  version                 Show the device's RPC protocol version\n"
         "  ls <dir>                List a directory\n"
         "  read <remote> [local]   Read a file (to stdout without <local>)\n"
         "  write <local> <remote>  Write a file and verify its MD5\n"
         "  rm [-r] <path>          Delete a file or directory\n"
         "  mkdir <path>            Create a directory\n"
         "  stat <path>             Show file size\n"
         "  md5 <path>              Show the device-side MD5 of a file\n"
         "  rename <old> <new>      Rename a file or directory\n"
         "  extract <tar> <dir>     Unpack a tar archive on the device\n"
         "  shell <command...>      Run a text shell command (e.g. led g 255)\n"
         "  config show|save        Show or save the effective config\n\n"
         "Options:\n"
         "  -p, --port <path>       Serial port\n"
         "  -b, --baud <rate>       Baud rate (default: 115200)\n"
         "  -v, --verbose           Verbose output\n"
         "  --progress              Print transfer progress\n"
         "  --prefetch              Query file size before reading\n"
         "  --no-keepalive          Never ping during long writes\n"
         "  --keepalive-interval <ms>\n"
         "                          Idle time before a keep-alive ping\n"
         "  --chunk-size <n>        Bytes per write frame (default: 512)\n"
         "  --timeout <ms>          Per-read timeout (default: 10000)\n"
         "  --slow-varint           Decode frame lengths byte by byte\n";
}

static int report_status(const fliprpc::Status& status) {
  if (status.is_ok()) return 0;
  std::cerr << "Error: " << status.to_string() << "\n";
  return 1;
}

// Drains a progress channel on its own thread for the length of a transfer.
class ProgressPrinter {
 public:
  explicit ProgressPrinter(bool enabled) {
    if (!enabled) return;
    channel_ = std::make_shared<fliprpc::ProgressChannel>();
    auto channel = channel_;
    thread_ = std::thread([channel] {
      auto start = std::chrono::steady_clock::now();
      while (auto event = channel->receive()) {
        std::chrono::duration<double> elapsed =
            std::chrono::steady_clock::now() - start;
        std::cerr << "[+" << std::fixed << std::setprecision(2)
                  << elapsed.count() << "s] Progress: " << event->transferred;
        if (event->total) std::cerr << "/" << *event->total;
        std::cerr << "\n";
      }
    });
  }

  ~ProgressPrinter() {
    if (channel_) channel_->close();
    if (thread_.joinable()) thread_.join();
  }

  std::shared_ptr<fliprpc::ProgressChannel> channel() const { return channel_; }

 private:
  std::shared_ptr<fliprpc::ProgressChannel> channel_;
  std::thread thread_;
};

static int cmd_ping(fliprpc::Session& session,
                    const std::vector<std::string>& args) {
  std::vector<uint8_t> payload;
  for (const auto& a : args) {
    int b = std::atoi(a.c_str());
    if (b < 0 || b > 255) {
      std::cerr << "Ping bytes must be 0-255: " << a << "\n";
      return 1;
    }
    payload.push_back(static_cast<uint8_t>(b));
  }
  if (args.empty()) payload = {1, 2, 3, 4};

  fliprpc::System system(session);
  auto start = std::chrono::steady_clock::now();
  auto echoed = system.ping(payload);
  if (!echoed.ok()) return report_status(echoed.status);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start)
                .count();

  std::cout << "Pong (" << echoed.value->size() << " bytes, " << ms << " ms):";
  for (uint8_t b : *echoed.value) std::cout << " " << static_cast<int>(b);
  std::cout << "\n";
  return *echoed.value == payload ? 0 : 1;
}

static int cmd_info(fliprpc::Session& session) {
  fliprpc::System system(session);
  auto info = system.device_info();
  if (!info.ok()) return report_status(info.status);

  std::cout << "Device Information:\n";
  for (const auto& kv : *info.value) {
    std::cout << "  " << kv.first << ": " << kv.second << "\n";
  }
  return 0;
}

static int cmd_version(fliprpc::Session& session) {
  fliprpc::System system(session);
  auto version = system.protobuf_version();
  if (!version.ok()) return report_status(version.status);

  std::cout << "Protobuf version: " << version.value->major << "."
            << version.value->minor << "\n";
  return 0;
}

static int cmd_ls(fliprpc::Session& session, const std::string& path) {
  fliprpc::Storage storage(session);
  auto listing = storage.list(path);
  if (!listing.ok()) return report_status(listing.status);

  std::cout << path << ": " << listing.value->remaining() << " entries\n";
  for (const auto& entry : *listing.value) {
    if (entry.is_dir()) {
      std::cout << "  [DIR]  " << entry.name << "/\n";
    } else {
      std::cout << "  " << std::setw(10) << entry.size << "  " << entry.name;
      if (entry.md5) std::cout << "  " << *entry.md5;
      std::cout << "\n";
    }
  }
  return 0;
}

static int cmd_read(fliprpc::Session& session, const std::string& remote,
                    const std::string& local, bool progress) {
  fliprpc::Storage storage(session);
  fliprpc::Result<std::vector<uint8_t>> data;
  {
    ProgressPrinter printer(progress);
    data = storage.read(remote, printer.channel());
  }
  if (!data.ok()) return report_status(data.status);

  if (local.empty()) {
    std::cout.write(reinterpret_cast<const char*>(data.value->data()),
                    static_cast<std::streamsize>(data.value->size()));
    return 0;
  }

  std::ofstream file(local, std::ios::binary);
  if (!file) {
    std::cerr << "Cannot open " << local << " for writing\n";
    return 1;
  }
  file.write(reinterpret_cast<const char*>(data.value->data()),
             static_cast<std::streamsize>(data.value->size()));
  if (!file.good()) {
    std::cerr << "Failed to write " << local << "\n";
    return 1;
  }
  std::cout << "Read " << data.value->size() << " bytes into " << local
            << "\n";
  return 0;
}

static int cmd_write(fliprpc::Session& session, const std::string& local,
                     const std::string& remote, bool progress) {
  std::ifstream file(local, std::ios::binary);
  if (!file) {
    std::cerr << "File not found: " << local << "\n";
    return 1;
  }
  std::vector<uint8_t> data((std::istreambuf_iterator<char>(file)),
                            std::istreambuf_iterator<char>());

  fliprpc::Storage storage(session);
  fliprpc::Status status;
  {
    ProgressPrinter printer(progress);
    status = storage.write(remote, data, printer.channel());
  }
  if (!status.is_ok()) return report_status(status);

  std::cout << "Wrote " << data.size() << " bytes to " << remote;
  if (storage.keepalives_sent() > 0) {
    std::cout << " (" << storage.keepalives_sent() << " keep-alive pings)";
  }
  std::cout << "\n";
  return 0;
}

static int cmd_config(const std::string& action, const fliprpc::Config& config) {
  if (action == "show") {
    std::cout << "# " << fliprpc::ConfigManager::get_config_path() << "\n"
              << fliprpc::ConfigManager::serialize_config(config);
    return 0;
  }
  if (action == "save") {
    if (!fliprpc::ConfigManager::save_config(config)) {
      std::cerr << "Failed to save "
                << fliprpc::ConfigManager::get_config_path() << "\n";
      return 1;
    }
    std::cout << "Saved " << fliprpc::ConfigManager::get_config_path() << "\n";
    return 0;
  }
  std::cerr << "Unknown config command: " << action << "\n";
  return 1;
}

static bool needs_args(const std::string& command,
                       const std::vector<std::string>& args, size_t count,
                       const char* usage) {
  if (args.size() >= count) return true;
  std::cerr << "Usage: fliprpc " << command << " " << usage << "\n";
  return false;
}

static int run_command(const std::string& command,
                       const std::vector<std::string>& args,
                       const fliprpc::Config& config, bool verbose,
                       bool progress) {
  if (command == "config") {
    if (!needs_args(command, args, 1, "<show|save>")) return 1;
    return cmd_config(args[0], config);
  }

  if (config.port.empty()) {
    std::cerr << "No port given. Use -p or set \"port\" in "
              << fliprpc::ConfigManager::get_config_path() << "\n";
    return 1;
  }

  auto options = fliprpc::ConfigManager::to_session_options(config, verbose);
  if (verbose) std::cerr << "Opening " << config.port << "\n";

  if (command == "shell") {
    if (!needs_args(command, args, 1, "<command...>")) return 1;
    std::string line = args[0];
    for (size_t i = 1; i < args.size(); ++i) line += " " + args[i];

    auto shell = fliprpc::ShellSession::open(config.port, options, config.baud);
    std::string output = shell.run(line);
    if (!output.empty()) std::cout << output << "\n";
    return 0;
  }

  auto session = fliprpc::Session::open(config.port, options, config.baud);

  fliprpc::Storage storage(session);

  if (command == "ping") {
    return cmd_ping(session, args);
  } else if (command == "info") {
    return cmd_info(session);
  } else if (command == "version") {
    return cmd_version(session);
  } else if (command == "ls") {
    return cmd_ls(session, args.empty() ? "/ext" : args[0]);
  } else if (command == "read") {
    if (!needs_args(command, args, 1, "<remote> [local]")) return 1;
    return cmd_read(session, args[0], args.size() > 1 ? args[1] : "",
                    progress);
  } else if (command == "write") {
    if (!needs_args(command, args, 2, "<local> <remote>")) return 1;
    return cmd_write(session, args[0], args[1], progress);
  } else if (command == "rm") {
    bool recursive = false;
    std::string path;
    for (const auto& a : args) {
      if (a == "-r") {
        recursive = true;
      } else {
        path = a;
      }
    }
    if (path.empty()) {
      std::cerr << "Usage: fliprpc rm [-r] <path>\n";
      return 1;
    }
    return report_status(storage.remove(path, recursive));
  } else if (command == "mkdir") {
    if (!needs_args(command, args, 1, "<path>")) return 1;
    return report_status(storage.mkdir(args[0]));
  } else if (command == "stat") {
    if (!needs_args(command, args, 1, "<path>")) return 1;
    auto size = storage.metadata(args[0]);
    if (!size.ok()) return report_status(size.status);
    std::cout << args[0] << ": " << *size.value << " bytes\n";
    return 0;
  } else if (command == "md5") {
    if (!needs_args(command, args, 1, "<path>")) return 1;
    auto md5 = storage.md5sum(args[0]);
    if (!md5.ok()) return report_status(md5.status);
    std::cout << *md5.value << "  " << args[0] << "\n";
    return 0;
  } else if (command == "rename") {
    if (!needs_args(command, args, 2, "<old> <new>")) return 1;
    return report_status(storage.rename(args[0], args[1]));
  } else if (command == "extract") {
    if (!needs_args(command, args, 2, "<tar> <out-dir>")) return 1;
    return report_status(storage.tar_extract(args[0], args[1]));
  }

  std::cerr << "Unknown command: " << command << "\n";
  return 1;
}

int main(int argc, char* argv[]) {
  if (argc < 2) {
    print_usage(argv[0]);
    return 1;
  }

  auto loaded = fliprpc::ConfigManager::load_config();
  if (!loaded) {
    std::cerr << "Ignoring unreadable config "
              << fliprpc::ConfigManager::get_config_path() << "\n";
  }
  fliprpc::Config config = loaded ? *loaded : fliprpc::Config{};

  bool verbose = false;
  bool progress = false;
  std::string command;
  std::vector<std::string> args;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-p" || arg == "--port") {
      if (++i < argc) config.port = argv[i];
    } else if (arg == "-b" || arg == "--baud") {
      if (++i < argc) config.baud = std::atoi(argv[i]);
    } else if (arg == "-v" || arg == "--verbose") {
      verbose = true;
    } else if (arg == "--progress") {
      progress = true;
    } else if (arg == "--prefetch") {
      config.prefetch_metadata = true;
    } else if (arg == "--no-keepalive") {
      config.keepalive = false;
    } else if (arg == "--keepalive-interval") {
      if (++i < argc) {
        int ms = std::atoi(argv[i]);
        if (ms > 0) config.keepalive_interval_ms = ms;
      }
    } else if (arg == "--chunk-size") {
      if (++i < argc) {
        int n = std::atoi(argv[i]);
        if (n > 0) config.chunk_size = static_cast<size_t>(n);
      }
    } else if (arg == "--timeout") {
      if (++i < argc) {
        int ms = std::atoi(argv[i]);
        if (ms > 0) config.timeout_ms = ms;
      }
    } else if (arg == "--slow-varint") {
      config.varint_decode = fliprpc::VarintDecode::Slow;
    } else if (arg == "-h" || arg == "--help") {
      print_usage(argv[0]);
      return 0;
    } else if (command.empty()) {
      command = arg;
    } else {
      args.push_back(arg);
    }
  }

  if (command.empty()) {
    print_usage(argv[0]);
    return 1;
  }

  try {
    return run_command(command, args, config, verbose, progress);
  } catch (const fliprpc::Error& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "Fatal: " << e.what() << "\n";
    return 1;
  }
}
