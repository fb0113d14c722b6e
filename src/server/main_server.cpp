#include "context.hpp"
#include "error.hpp"
#include "logging.hpp"
#include "session.hpp"
#include "util.hpp"
#include <iostream>
#include <thread>

using namespace rgtp;

int main(int argc, char **argv) {
  std::string preset = "default";
  std::string file;
  std::string announce;
  std::string key_hex;
  std::string log_level = "info";
  long port = -1, chunk_size = -1, rate = -1, timeout = -1;
  bool compress = false, once = false;

  for (int i = 1; i < argc; i++) {
    std::string a = argv[i];
    auto next = [&](int &i) -> std::string {
      if (i + 1 < argc)
        return std::string(argv[++i]);
      std::cerr << "missing value for " << a << "\n";
      std::exit(1);
    };
    if (a == "--file")
      file = next(i);
    else if (a == "--preset")
      preset = next(i);
    else if (a == "--port")
      port = std::stol(next(i));
    else if (a == "--chunk-size")
      chunk_size = std::stol(next(i));
    else if (a == "--rate")
      rate = std::stol(next(i));
    else if (a == "--timeout")
      timeout = std::stol(next(i));
    else if (a == "--key")
      key_hex = next(i);
    else if (a == "--compress")
      compress = true;
    else if (a == "--announce")
      announce = next(i);
    else if (a == "--once")
      once = true;
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
  if (file.empty()) {
    std::cerr << "usage: rgtp_expose --file PATH [--port N] [--preset NAME] "
                 "[--chunk-size N] [--rate N] [--timeout MS] [--key HEX] "
                 "[--compress] [--announce HOST:PORT] [--once]"
              << std::endl;
    return 1;
  }
  if (port >= 0)
    cfg.port = (uint16_t)port;
  if (chunk_size >= 0)
    cfg.chunk_size = (uint32_t)chunk_size;
  if (rate > 0)
    cfg.exposure_rate = (uint32_t)rate;
  if (timeout > 0)
    cfg.timeout_ms = (int)timeout;
  cfg.enable_compression = compress;
  if (!key_hex.empty()) {
    cfg.encryption_key = hex_to_bytes(key_hex);
    if (cfg.encryption_key.empty()) {
      std::cerr << "bad key" << std::endl;
      return 1;
    }
    cfg.enable_encryption = true;
  }
  cfg.on_error = [](const std::error_code &ec, const std::string &msg) {
    std::cerr << msg << ": " << error_string(ec) << std::endl;
  };

  Context ctx;
  std::error_code ec;
  ctx.init(ec);
  if (ec) {
    std::cerr << error_string(ec) << std::endl;
    return 1;
  }

  Session session(ctx, cfg);
  session.expose_file(file, ec);
  if (ec) {
    std::cerr << "expose " << file << ": " << error_string(ec) << std::endl;
    return 1;
  }
  Manifest m = session.manifest();
  std::cout << "exposing " << file << " (" << format_size(m.total_size)
            << ", " << m.chunk_count << " chunks) on port "
            << session.local_port() << std::endl;

  if (!announce.empty()) {
    std::string host;
    uint16_t aport;
    if (!parse_host_port(announce, host, aport)) {
      std::cerr << "bad announce target" << std::endl;
      return 1;
    }
    session.announce(host, aport, ec);
    if (ec) {
      std::cerr << "announce: " << error_string(ec) << std::endl;
      return 1;
    }
  }

  for (;;) {
    session.wait_complete(std::chrono::seconds(2), ec);
    std::error_code sec;
    Stats s = session.get_stats(sec);
    if (!sec)
      std::cout << to_string(s) << std::endl;
    if (ec && ec != errc::timeout)
      break;
    if (!ec && once)
      break;
    // complete, still serving late pullers
    if (!ec)
      std::this_thread::sleep_for(std::chrono::seconds(2));
  }
  session.close();
  if (ec) {
    std::cerr << "exposure: " << error_string(ec) << std::endl;
    return 1;
  }
  return 0;
}
