
#include "logging.hpp"
#include "client_group.hpp"
#include "util.hpp"
#include <asio.hpp>
#include <climits>
#include <iostream>
#include <thread>

using namespace scanlink;

int main(int argc, char **argv) {
  std::string server = "127.0.0.1:8000";
  int threads = 2;
  uint32_t max_message_size = kMaxMessageSize;
  std::string record_dir;
  std::string log_level = "info";
  std::vector<StreamKind> streams;

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
      if (a == "--server")
        server = next(i);
      else if (a == "--stream") {
        std::string name = next(i);
        const StreamKindInfo *info = stream_kind_by_name(name);
        if (!info) {
          std::cerr << "unknown stream " << name << "\n";
          return 1;
        }
        streams.push_back(info->kind);
      } else if (a == "--threads")
        threads = std::stoi(next(i));
      else if (a == "--max-message-size")
        max_message_size = next_u32(i);
      else if (a == "--record")
        record_dir = next(i);
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
  if (!parse_host_port(server, host, port)) {
    std::cerr << "bad server" << std::endl;
    return 1;
  }
  if (threads < 1) {
    std::cerr << "threads must be positive" << std::endl;
    return 1;
  }
  if (streams.empty())
    for (auto k = stream_kinds_begin(); k != stream_kinds_end(); ++k)
      streams.push_back(k->kind);

  ClientConfig cfg;
  cfg.server_host = host;
  cfg.server_port = port;
  cfg.threads = threads;
  cfg.max_message_size = max_message_size;
  cfg.record_dir = record_dir;
  cfg.streams = streams;

  asio::io_context io;
  ClientGroup group(io, cfg);
  group.start();

  std::vector<std::thread> th;
  th.reserve(cfg.threads);
  for (int i = 0; i < cfg.threads; i++)
    th.emplace_back([&]() { io.run(); });
  for (auto &t : th)
    t.join();

  int status = 0;
  uint64_t total = 0;
  std::cout << "final frame counts:" << std::endl;
  for (auto &c : group.clients()) {
    const ReassemblyStats &st = c->stats();
    std::cout << "  " << c->name() << ": " << c->frames() << " frames, "
              << (double)c->bytes() / (1024.0 * 1024.0) << " MB, "
              << st.reassembled << " reassembled, " << st.dropped
              << " dropped" << std::endl;
    total += c->bytes();
    if (!c->server_error().empty() || c->error())
      status = 2;
  }
  std::cout << "total data received: " << (double)total / (1024.0 * 1024.0)
            << " MB" << std::endl;
  return status;
}
