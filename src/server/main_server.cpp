
#include "logging.hpp"
#include "session_registry.hpp"
#include "util.hpp"
#include <algorithm>
#include <asio.hpp>
#include <climits>
#include <csignal>
#include <iostream>
#include <memory>
#include <thread>

using namespace scanlink;

int main(int argc, char **argv) {
  std::string listen = "0.0.0.0:8000";
  int threads = std::max(2u, std::thread::hardware_concurrency());
  double fps = 10.0;
  uint32_t max_message_size = kMaxMessageSize;
  uint32_t chunk_size = kChunkSize;
  SyntheticOptions synth;
  std::string replay;
  std::string log_level = "info";

  for (int i = 1; i < argc; i++) {
    std::string a = argv[i];
    auto next = [&](int &i) -> std::string {
      if (i + 1 < argc)
        return std::string(argv[++i]);
      std::cerr << "missing value for " << a << "\n";
      std::exit(1);
    };
    auto next_u32 = [&](int &i) -> uint32_t {
      unsigned long v = std::stoul(next(i));
      if (v > UINT32_MAX)
        throw std::out_of_range(a);
      return (uint32_t)v;
    };
    try {
      if (a == "--listen")
        listen = next(i);
      else if (a == "--threads")
        threads = std::stoi(next(i));
      else if (a == "--fps")
        fps = std::stod(next(i));
      else if (a == "--max-message-size")
        max_message_size = next_u32(i);
      else if (a == "--chunk-size")
        chunk_size = next_u32(i);
      else if (a == "--frames")
        synth.frames = next_u32(i);
      else if (a == "--rows")
        synth.rows = next_u32(i);
      else if (a == "--columns")
        synth.columns = next_u32(i);
      else if (a == "--replay")
        replay = next(i);
      else if (a == "--log-level")
        log_level = next(i);
      else {
        std::cerr << "unknown option " << a << "\n";
        return 1;
      }
    } catch (const std::logic_error &) {
      std::cerr << "bad value for " << a << "\n";
      return 1;
    }
  }

  LogLevel lvl;
  if (!parse_log_level(log_level, lvl)) {
    std::cerr << "bad log level" << std::endl;
    return 1;
  }
  Logger::instance().set_level(lvl);

  std::string host;
  uint16_t port;
  if (!parse_host_port(listen, host, port)) {
    std::cerr << "bad listen" << std::endl;
    return 1;
  }
  if (fps <= 0 || threads < 1) {
    std::cerr << "fps and threads must be positive" << std::endl;
    return 1;
  }

  ServerConfig cfg;
  cfg.listen_host = host;
  cfg.listen_port = port;
  cfg.threads = threads;
  cfg.session.fps = fps;
  cfg.session.plan.chunk_size = chunk_size;
  cfg.session.plan.max_message_size = max_message_size;
  std::string why;
  if (!validate_plan(cfg.session.plan, why)) {
    std::cerr << "bad chunk plan: " << why << std::endl;
    return 1;
  }

  std::unique_ptr<FrameSource> source;
  if (!replay.empty()) {
    Logger::instance().log(LogLevel::INFO, "replaying %s", replay.c_str());
    source.reset(new ReplayFrameSource(replay));
  } else {
    if (!validate_synthetic(synth, why)) {
      std::cerr << "bad synthetic geometry: " << why << std::endl;
      return 1;
    }
    Logger::instance().log(LogLevel::INFO,
                           "synthetic source: %u frames of %ux%u",
                           synth.frames, synth.rows, synth.columns);
    source.reset(new SyntheticFrameSource(synth));
  }

  asio::io_context io;
  SessionRegistry registry(io, cfg, *source);
  std::error_code ec;
  if (!registry.start(ec)) {
    std::cerr << "cannot listen on " << listen << ": " << ec.message()
              << std::endl;
    return 1;
  }

  asio::signal_set signals(io, SIGINT, SIGTERM);
  signals.async_wait([&](std::error_code, int) { registry.stop(); });

  std::vector<std::thread> th;
  th.reserve(cfg.threads);
  for (int i = 0; i < cfg.threads; i++)
    th.emplace_back([&]() { io.run(); });
  for (auto &t : th)
    t.join();
  return 0;
}
