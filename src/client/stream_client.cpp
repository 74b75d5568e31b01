
#include "stream_client.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "util.hpp"
#include <nlohmann/json.hpp>

namespace scanlink {

StreamClient::StreamClient(asio::io_context &io, const ClientConfig &cfg,
                           StreamKind kind)
    : cfg_(cfg), kind_(kind), name_(stream_kind_info(kind)->name),
      sock_(asio::make_strand(io)), resolver_(sock_.get_executor()),
      read_buf_(64 * 1024), reader_(cfg.max_message_size) {}

void StreamClient::start() {
  if (!cfg_.record_dir.empty()) {
    std::string path = join_path(cfg_.record_dir, std::string(name_) + ".bin");
    record_.open(path, std::ios::binary | std::ios::trunc);
    if (!record_)
      Logger::instance().log(LogLevel::WARN, "cannot record %s to %s", name_,
                             path.c_str());
  }
  auto self = shared_from_this();
  asio::dispatch(sock_.get_executor(), [this, self]() { connect(); });
}

void StreamClient::stop() {
  auto self = shared_from_this();
  asio::post(sock_.get_executor(), [this, self]() {
    if (closed_)
      return;
    // orderly close request, then drop the connection
    auto buf = std::make_shared<Bytes>(make_envelope(Opcode::Close, nullptr, 0));
    asio::async_write(sock_, asio::buffer(*buf),
                      [this, self, buf](std::error_code, std::size_t) {
                        close(std::error_code());
                      });
  });
}

void StreamClient::connect() {
  auto self = shared_from_this();
  resolver_.async_resolve(
      cfg_.server_host, std::to_string(cfg_.server_port),
      [this, self](std::error_code ec, tcp::resolver::results_type res) {
        if (ec) {
          Logger::instance().log(LogLevel::ERROR, "%s: resolve failed: %s",
                                 name_, ec.message().c_str());
          close(ec);
          return;
        }
        asio::async_connect(
            sock_, res, [this, self](std::error_code ec, const tcp::endpoint &) {
              if (ec) {
                Logger::instance().log(LogLevel::ERROR,
                                       "%s: connect failed: %s", name_,
                                       ec.message().c_str());
                close(ec);
                return;
              }
              Logger::instance().log(LogLevel::INFO, "connected to %s stream",
                                     name_);
              send_request();
              do_read();
            });
      });
}

void StreamClient::send_request() {
  auto self = shared_from_this();
  request_ = make_text_envelope(stream_kind_info(kind_)->path);
  asio::async_write(sock_, asio::buffer(request_),
                    [this, self](std::error_code ec, std::size_t) {
                      if (ec)
                        close(ec);
                    });
}

void StreamClient::do_read() {
  auto self = shared_from_this();
  sock_.async_read_some(
      asio::buffer(read_buf_), [this, self](std::error_code ec, std::size_t n) {
        if (closed_)
          return;
        if (ec) {
          if (ec == asio::error::eof) {
            Logger::instance().log(LogLevel::INFO, "%s stream connection closed",
                                   name_);
            close(std::error_code());
          } else {
            Logger::instance().log(LogLevel::WARN, "%s: read error: %s", name_,
                                   ec.message().c_str());
            close(ec);
          }
          return;
        }
        reader_.feed(read_buf_.data(), n);
        Envelope env;
        std::error_code rec;
        while (reader_.next(env, rec)) {
          if (!handle(std::move(env)))
            return;
        }
        if (rec) {
          Logger::instance().log(LogLevel::ERROR, "%s: %s", name_,
                                 rec.message().c_str());
          close(rec);
          return;
        }
        do_read();
      });
}

bool StreamClient::handle(Envelope &&env) {
  switch (env.op) {
  case Opcode::Binary:
    handle_binary(std::move(env.payload));
    return true;
  case Opcode::Text:
    handle_text(env.text());
    return true;
  case Opcode::Close:
    Logger::instance().log(LogLevel::INFO, "%s stream ended by server", name_);
    close(std::error_code());
    return false;
  }
  return true;
}

void StreamClient::handle_binary(Bytes &&message) {
  std::error_code ec;
  auto complete = reassembler_.push(std::move(message), ec);
  if (!complete) {
    if (ec)
      Logger::instance().log(LogLevel::WARN, "%s: message dropped: %s", name_,
                             ec.message().c_str());
    return;
  }

  DecodedFrame frame;
  if (!decode_frame(complete->data(), complete->size(), frame, ec)) {
    Logger::instance().log(LogLevel::WARN, "%s: frame rejected: %s", name_,
                           ec.message().c_str());
    return;
  }
  frames_++;
  bytes_ += complete->size() - kHeaderSize;
  if (record_.is_open()) {
    record_.write((const char *)complete->data(),
                  (std::streamsize)complete->size());
    if (!record_) {
      Logger::instance().log(LogLevel::WARN, "%s: recording stopped", name_);
      record_.close();
    }
  }

  if (Logger::instance().enabled(LogLevel::DEBUG)) {
    const DataHeader &h = frame.hdr;
    Logger::instance().log(
        LogLevel::DEBUG, "%s frame %u: shape=[%u, %u] range=[%.3f, %.3f] %.2fMB",
        name_, h.frame_number, h.shape0, h.shape1, (double)h.min_value,
        (double)h.max_value,
        (double)(complete->size() - kHeaderSize) / (1024.0 * 1024.0));
  }
  if (on_frame_)
    on_frame_(frame);
}

void StreamClient::handle_text(const std::string &text) {
  nlohmann::json j = nlohmann::json::parse(text, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    Logger::instance().log(LogLevel::WARN, "%s: unexpected text message", name_);
    return;
  }
  if (j.contains("error") && j["error"].is_string()) {
    server_error_ = j["error"].get<std::string>();
    Logger::instance().log(LogLevel::ERROR, "error from %s: %s", name_,
                           server_error_.c_str());
  }
}

void StreamClient::close(const std::error_code &ec) {
  if (closed_)
    return;
  error_ = ec;
  std::error_code ec2;
  sock_.shutdown(tcp::socket::shutdown_both, ec2);
  sock_.close(ec2);
  last_stats_ = reassembler_.stats();
  if (reassembler_.pending_frames() > 0)
    Logger::instance().log(LogLevel::DEBUG,
                           "%s: discarding %zu partial frames", name_,
                           reassembler_.pending_frames());
  reassembler_.clear();
  if (record_.is_open())
    record_.close();
  closed_ = true;
  if (on_close_)
    on_close_(*this);
}

} // namespace scanlink
