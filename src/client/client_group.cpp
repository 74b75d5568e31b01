#include "client_group.hpp"
#include "logging.hpp"
#include <csignal>

namespace scanlink {

ClientGroup::ClientGroup(asio::io_context &io, const ClientConfig &cfg)
    : strand_(asio::make_strand(io)), signals_(strand_, SIGINT, SIGTERM) {
  for (StreamKind k : cfg.streams)
    clients_.push_back(std::make_shared<StreamClient>(io, cfg, k));
}

void ClientGroup::start() {
  open_ = clients_.size();
  signals_.async_wait([this](std::error_code ec, int sig) {
    if (ec)
      return;
    Logger::instance().log(LogLevel::INFO,
                           "signal %d, closing %zu streams", sig,
                           open_.load());
    stop();
  });
  if (clients_.empty()) {
    on_client_closed();
    return;
  }
  for (auto &c : clients_) {
    c->set_close_handler([this](StreamClient &) {
      if (--open_ == 0)
        on_client_closed();
    });
    c->start();
  }
}

void ClientGroup::stop() {
  for (auto &c : clients_)
    c->stop();
}

void ClientGroup::on_client_closed() {
  // close handlers run on the clients' own strands
  asio::post(strand_, [this]() { signals_.cancel(); });
}

} // namespace scanlink
