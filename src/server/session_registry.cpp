
#include "session_registry.hpp"
#include "logging.hpp"
#include <algorithm>
#include <nlohmann/json.hpp>

namespace scanlink {

static const char *kServiceName = "scanlink streaming server";
static const char *kServiceVersion = "1.0.0";

SessionRegistry::SessionRegistry(asio::io_context &io, const ServerConfig &cfg,
                                 FrameSource &source)
    : io_(io), cfg_(cfg), source_(source), acceptor_(asio::make_strand(io)) {}

bool SessionRegistry::start(std::error_code &ec) {
  asio::ip::address addr = asio::ip::make_address(cfg_.listen_host, ec);
  if (ec)
    return false;
  tcp::endpoint ep(addr, cfg_.listen_port);
  acceptor_.open(ep.protocol(), ec);
  if (ec)
    return false;
  acceptor_.set_option(asio::socket_base::reuse_address(true), ec);
  if (ec)
    return false;
  acceptor_.bind(ep, ec);
  if (ec)
    return false;
  acceptor_.listen(asio::socket_base::max_listen_connections, ec);
  if (ec)
    return false;
  bound_port_ = acceptor_.local_endpoint(ec).port();
  if (ec)
    return false;
  Logger::instance().log(LogLevel::INFO, "listening on %s:%u",
                         cfg_.listen_host.c_str(), (unsigned)bound_port_);
  asio::dispatch(acceptor_.get_executor(), [this]() { do_accept(); });
  return true;
}

void SessionRegistry::do_accept() {
  acceptor_.async_accept(
      asio::make_strand(io_), [this](std::error_code ec, tcp::socket sock) {
        if (ec) {
          if (ec == asio::error::operation_aborted)
            return;
          Logger::instance().log(LogLevel::ERROR, "accept failed: %s",
                                 ec.message().c_str());
        } else {
          auto p = std::make_shared<Pending>(std::move(sock));
          {
            std::lock_guard<std::mutex> lk(mtx_);
            if (stopped_)
              return;
            pending_.push_back(p);
          }
          asio::dispatch(p->sock.get_executor(),
                         [this, p]() { read_request(p); });
        }
        if (acceptor_.is_open())
          do_accept();
      });
}

void SessionRegistry::read_request(std::shared_ptr<Pending> p) {
  p->sock.async_read_some(
      asio::buffer(p->buf), [this, p](std::error_code ec, std::size_t n) {
        if (ec) {
          forget_pending(p);
          return;
        }
        p->reader.feed(p->buf.data(), n);
        Envelope req;
        std::error_code rec;
        if (p->reader.next(req, rec)) {
          forget_pending(p);
          handle_request(p, req);
          return;
        }
        if (rec) {
          Logger::instance().log(LogLevel::WARN, "bad channel request: %s",
                                 rec.message().c_str());
          forget_pending(p);
          std::error_code ec2;
          p->sock.close(ec2);
          return;
        }
        read_request(p);
      });
}

void SessionRegistry::handle_request(std::shared_ptr<Pending> p,
                                     const Envelope &req) {
  if (req.op != Opcode::Text) {
    nlohmann::json j = {{"error", "expected a channel path"},
                        {"type", "error"}};
    reply_and_close(p, j.dump());
    return;
  }
  std::string path = req.text();

  if (path == "/") {
    nlohmann::json endpoints = nlohmann::json::object();
    for (auto k = stream_kinds_begin(); k != stream_kinds_end(); ++k)
      endpoints[k->name] = k->path;
    nlohmann::json j = {{"service", kServiceName},
                        {"version", kServiceVersion},
                        {"endpoints", endpoints},
                        {"status", "running"}};
    reply_and_close(p, j.dump());
    return;
  }
  if (path == "/health") {
    reply_and_close(p, nlohmann::json({{"status", "healthy"}}).dump());
    return;
  }

  const StreamKindInfo *info = stream_kind_by_path(path);
  if (!info) {
    Logger::instance().log(LogLevel::WARN, "unknown channel %s", path.c_str());
    nlohmann::json j = {{"error", "unknown channel: " + path},
                        {"type", "error"}};
    reply_and_close(p, j.dump());
    return;
  }

  std::shared_ptr<StreamSession> s;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    if (stopped_)
      return;
    uint64_t id = next_id_++;
    s = std::make_shared<StreamSession>(
        id, std::move(p->sock), info->kind, source_, cfg_.session,
        [this](uint64_t sid, SessionState st) { on_session_closed(sid, st); });
    sessions_[id] = s;
  }
  Logger::instance().log(LogLevel::INFO, "session %llu connected to %s",
                         (unsigned long long)s->id(), path.c_str());
  s->start();
}

void SessionRegistry::reply_and_close(std::shared_ptr<Pending> p,
                                      const std::string &text) {
  auto buf = std::make_shared<Bytes>(make_text_envelope(text));
  pack_envelope_header(Opcode::Close, 0, p->buf.data());
  std::array<asio::const_buffer, 2> bufs = {
      asio::buffer(*buf), asio::buffer(p->buf.data(), kEnvelopeHeaderSize)};
  asio::async_write(p->sock, bufs, [p, buf](std::error_code, std::size_t) {
    std::error_code ec2;
    p->sock.shutdown(tcp::socket::shutdown_both, ec2);
    p->sock.close(ec2);
  });
}

void SessionRegistry::on_session_closed(uint64_t id, SessionState st) {
  std::lock_guard<std::mutex> lk(mtx_);
  sessions_.erase(id);
  Logger::instance().log(LogLevel::DEBUG,
                         "session %llu removed (%s), %zu active",
                         (unsigned long long)id, state_name(st),
                         sessions_.size());
}

void SessionRegistry::forget_pending(const std::shared_ptr<Pending> &p) {
  std::lock_guard<std::mutex> lk(mtx_);
  pending_.erase(std::remove_if(pending_.begin(), pending_.end(),
                                [&p](const std::weak_ptr<Pending> &w) {
                                  auto sp = w.lock();
                                  return !sp || sp == p;
                                }),
                 pending_.end());
}

void SessionRegistry::stop() {
  std::vector<std::shared_ptr<StreamSession>> sessions;
  std::vector<std::shared_ptr<Pending>> pending;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    if (stopped_)
      return;
    stopped_ = true;
    for (auto &kv : sessions_)
      sessions.push_back(kv.second);
    for (auto &w : pending_)
      if (auto sp = w.lock())
        pending.push_back(sp);
    pending_.clear();
  }
  asio::post(acceptor_.get_executor(), [this]() {
    std::error_code ec2;
    acceptor_.close(ec2);
  });
  for (auto &p : pending)
    asio::post(p->sock.get_executor(), [p]() {
      std::error_code ec2;
      p->sock.close(ec2);
    });
  for (auto &s : sessions)
    s->stop();
  Logger::instance().log(LogLevel::INFO, "registry stopped, %zu sessions cancelled",
                         sessions.size());
}

size_t SessionRegistry::active_sessions() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return sessions_.size();
}

uint64_t SessionRegistry::total_sessions() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return next_id_ - 1;
}

} // namespace scanlink
