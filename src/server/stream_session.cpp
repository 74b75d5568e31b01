
#include "stream_session.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include <chrono>
#include <nlohmann/json.hpp>

namespace scanlink {

const char *state_name(SessionState s) {
  switch (s) {
  case SessionState::Idle:
    return "idle";
  case SessionState::Streaming:
    return "streaming";
  case SessionState::Draining:
    return "draining";
  case SessionState::Closed:
    return "closed";
  case SessionState::Failed:
    return "failed";
  }
  return "unknown";
}

StreamSession::StreamSession(uint64_t id, tcp::socket sock, StreamKind kind,
                             FrameSource &source, const SessionOptions &opts,
                             CloseHandler on_close)
    : id_(id), sock_(std::move(sock)), pacer_(sock_.get_executor()),
      kind_(kind), name_(stream_kind_info(kind)->name), source_(source),
      opts_(opts), chunker_(opts.plan), on_close_(std::move(on_close)) {}

void StreamSession::start() {
  auto self = shared_from_this();
  asio::dispatch(sock_.get_executor(), [this, self]() {
    if (state_ != SessionState::Idle)
      return;
    cursor_ = source_.open(kind_);
    if (!cursor_) {
      fail("frame source refused stream " + std::string(name_));
      return;
    }
    state_ = SessionState::Streaming;
    Logger::instance().log(
        LogLevel::INFO,
        "session %llu: starting %s stream with max message size %u bytes",
        (unsigned long long)id_, name_, opts_.plan.max_message_size);
    watch_peer();
    produce_next();
  });
}

void StreamSession::stop() {
  auto self = shared_from_this();
  asio::post(sock_.get_executor(), [this, self]() { cancel("stopped"); });
}

void StreamSession::produce_next() {
  if (state_ != SessionState::Streaming)
    return;
  for (;;) {
    std::error_code ec;
    if (!cursor_->next(frame_, ec)) {
      if (ec)
        fail("frame source: " + ec.message());
      else
        finish();
      return;
    }
    frame_.kind = kind_;
    frame_.frame_number = next_frame_number_;

    Bytes message;
    if (!encode_frame(frame_, message, ec)) {
      if (ec == Errc::SizeMismatch) {
        // nothing of this frame was sent yet, so it can be skipped
        Logger::instance().log(
            LogLevel::WARN,
            "session %llu: skipping %s frame with shape %ux%u and %zu values",
            (unsigned long long)id_, name_, frame_.shape0, frame_.shape1,
            frame_.values.size());
        continue;
      }
      fail("encode: " + ec.message());
      return;
    }

    std::vector<Bytes> parts;
    if (!chunker_.split(message, parts, ec)) {
      fail("chunking: " + ec.message());
      return;
    }
    if (parts.size() > 1)
      Logger::instance().log(LogLevel::DEBUG,
                             "chunking %s frame %u: %zu bytes -> %zu chunks",
                             name_, next_frame_number_, message.size(),
                             parts.size() - 1);
    outbox_.clear();
    for (auto &p : parts)
      outbox_.push_back(std::move(p));
    write_next();
    return;
  }
}

void StreamSession::write_next() {
  if (outbox_.empty()) {
    next_frame_number_++;
    frames_sent_++;
    wait_pacing();
    return;
  }
  auto self = shared_from_this();
  // owned by the handler: the reactor may still touch it after a close
  auto msg = std::make_shared<Bytes>(std::move(outbox_.front()));
  outbox_.pop_front();
  pack_envelope_header(Opcode::Binary, (uint32_t)msg->size(),
                       envelope_.data());
  std::array<asio::const_buffer, 2> bufs = {asio::buffer(envelope_),
                                            asio::buffer(*msg)};
  asio::async_write(sock_, bufs,
                    [this, self, msg](std::error_code ec, std::size_t) {
                      if (state_ != SessionState::Streaming)
                        return;
                      if (ec) {
                        fail("transport: " + ec.message());
                        return;
                      }
                      write_next();
                    });
}

void StreamSession::wait_pacing() {
  // fixed delay after each frame; time spent encoding and sending is not
  // subtracted
  auto interval = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
      std::chrono::duration<double>(opts_.fps > 0 ? 1.0 / opts_.fps : 0.0));
  auto self = shared_from_this();
  pacer_.expires_after(interval);
  pacer_.async_wait([this, self](std::error_code ec) {
    if (ec || state_ != SessionState::Streaming)
      return;
    produce_next();
  });
}

void StreamSession::watch_peer() {
  auto self = shared_from_this();
  sock_.async_read_some(
      asio::buffer(peer_buf_), [this, self](std::error_code ec, std::size_t n) {
        if (closed_)
          return;
        if (ec) {
          cancel(ec == asio::error::eof ? "peer disconnected"
                                        : ec.message().c_str());
          return;
        }
        peer_reader_.feed(peer_buf_.data(), n);
        Envelope env;
        std::error_code rec;
        while (peer_reader_.next(env, rec)) {
          if (env.op == Opcode::Close) {
            cancel("peer closed the channel");
            return;
          }
        }
        if (rec) {
          cancel(rec.message().c_str());
          return;
        }
        watch_peer();
      });
}

void StreamSession::finish() {
  state_ = SessionState::Draining;
  Logger::instance().log(LogLevel::INFO,
                         "session %llu: finished streaming %u frames for %s",
                         (unsigned long long)id_, frames_sent_.load(), name_);
  auto self = shared_from_this();
  pack_envelope_header(Opcode::Close, 0, envelope_.data());
  asio::async_write(sock_, asio::buffer(envelope_),
                    [this, self](std::error_code, std::size_t) {
                      close_transport(SessionState::Closed);
                    });
}

void StreamSession::fail(const std::string &what) {
  if (closed_ || state_ == SessionState::Failed)
    return;
  state_ = SessionState::Failed;
  Logger::instance().log(LogLevel::ERROR, "session %llu: error in %s stream: %s",
                         (unsigned long long)id_, name_, what.c_str());
  pacer_.cancel();
  outbox_.clear();

  nlohmann::json j = {{"error", what}, {"type", "error"}};
  auto buf = std::make_shared<Bytes>(make_text_envelope(j.dump()));
  auto self = shared_from_this();
  asio::async_write(sock_, asio::buffer(*buf),
                    [this, self, buf](std::error_code ec, std::size_t) {
                      if (ec)
                        Logger::instance().log(
                            LogLevel::DEBUG,
                            "session %llu: error notification not sent: %s",
                            (unsigned long long)id_, ec.message().c_str());
                      close_transport(SessionState::Failed);
                    });
}

void StreamSession::cancel(const char *why) {
  if (closed_)
    return;
  Logger::instance().log(LogLevel::INFO, "session %llu: %s stream cancelled: %s",
                         (unsigned long long)id_, name_, why);
  close_transport(state_ == SessionState::Failed ? SessionState::Failed
                                                 : SessionState::Closed);
}

void StreamSession::close_transport(SessionState final_state) {
  if (closed_)
    return;
  closed_ = true;
  state_ = final_state;
  std::error_code ec2;
  sock_.shutdown(tcp::socket::shutdown_both, ec2);
  sock_.close(ec2);
  pacer_.cancel();
  outbox_.clear();
  cursor_.reset();
  Logger::instance().log(LogLevel::INFO, "session %llu: %s stream %s",
                         (unsigned long long)id_, name_,
                         state_name(final_state));
  if (on_close_)
    on_close_(id_, final_state);
}

} // namespace scanlink
