#include "client.hpp"
#include "context.hpp"
#include "error.hpp"
#include "logging.hpp"
#include "util.hpp"
#include <atomic>
#include <iostream>
#include <thread>

using namespace rgtp;

int main(int argc, char **argv) {
  std::string preset = "default";
  std::string source;
  std::string out;
  std::string key_hex;
  std::string log_level = "info";
  long port = -1, timeout = -1;

  for (int i = 1; i < argc; i++) {
    std::string a = argv[i];
    auto next = [&](int &i) -> std::string {
      if (i + 1 < argc)
        return std::string(argv[++i]);
      std::cerr << "missing value for " << a << "\n";
      std::exit(1);
    };
    if (a == "--source")
      source = next(i);
    else if (a == "--out")
      out = next(i);
    else if (a == "--preset")
      preset = next(i);
    else if (a == "--port")
      port = std::stol(next(i));
    else if (a == "--timeout")
      timeout = std::stol(next(i));
    else if (a == "--key")
      key_hex = next(i);
    else if (a == "--log-level")
      log_level = next(i);
    else if (a == "--version") {
      std::cout << Context::build_info() << std::endl;
      return 0;
    } else {
      std::cerr << "unknown option " << a << "\n";
      return 1;
    }
  }

  LogLevel lvl;
  if (!parse_log_level(log_level, lvl)) {
    std::cerr << "bad log level" << std::endl;
    return 1;
  }
  Logger::instance().set_level(lvl);

  Config cfg;
  if (!preset_by_name(preset, cfg)) {
    std::cerr << "unknown preset " << preset << std::endl;
    return 1;
  }
  std::string host;
  uint16_t sport;
  if (source.empty() || out.empty() || !parse_host_port(source, host, sport)) {
    std::cerr << "usage: rgtp_pull --source HOST:PORT --out PATH [--port N] "
                 "[--preset NAME] [--timeout MS] [--key HEX]"
              << std::endl;
    return 1;
  }
  if (port >= 0)
    cfg.port = (uint16_t)port;
  if (timeout > 0)
    cfg.timeout_ms = (int)timeout;
  if (!key_hex.empty()) {
    cfg.encryption_key = hex_to_bytes(key_hex);
    if (cfg.encryption_key.empty()) {
      std::cerr << "bad key" << std::endl;
      return 1;
    }
    cfg.enable_encryption = true;
  }

  Context ctx;
  std::error_code ec;
  ctx.init(ec);
  if (ec) {
    std::cerr << error_string(ec) << std::endl;
    return 1;
  }

  Client client(ctx, cfg);
  std::atomic<bool> done{false};
  std::thread monitor([&]() {
    while (!done) {
      std::this_thread::sleep_for(std::chrono::seconds(1));
      std::error_code sec;
      Stats s = client.get_stats(sec);
      if (!sec && s.total_chunks > 0 && !done)
        std::cout << to_string(s) << std::endl;
    }
  });

  client.pull_to_file(host, sport, out, ec);
  done = true;
  monitor.join();

  std::error_code sec;
  Stats s = client.get_stats(sec);
  client.close();
  if (ec) {
    std::cerr << "pull " << source << ": " << error_string(ec) << " ("
              << to_string(client.state()) << ")" << std::endl;
    return 1;
  }
  if (!sec)
    std::cout << to_string(s) << std::endl;
  std::cout << "saved " << out << std::endl;
  return 0;
}
