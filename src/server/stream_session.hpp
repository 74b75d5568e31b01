
#pragma once
#include <asio.hpp>
#include <array>
#include <atomic>
#include <deque>
#include <functional>
#include <memory>
#include <string>
#include "chunker.hpp"
#include "frame_source.hpp"
#include "link.hpp"

namespace scanlink {

struct SessionOptions {
    double fps{10.0};
    ChunkPlan plan;
};

enum class SessionState { Idle, Streaming, Draining, Closed, Failed };
const char* state_name(SessionState s);

// Producer loop for one stream kind on one connection: pull a frame, encode,
// chunk, write every message in order, then sleep 1/fps before the next pull.
// All handlers run on the socket's strand.
class StreamSession : public std::enable_shared_from_this<StreamSession> {
public:
    using tcp = asio::ip::tcp;
    using CloseHandler = std::function<void(uint64_t id, SessionState final_state)>;

    StreamSession(uint64_t id, tcp::socket sock, StreamKind kind, FrameSource& source,
                  const SessionOptions& opts, CloseHandler on_close);
    void start();
    void stop();

    uint64_t id() const { return id_; }
    StreamKind kind() const { return kind_; }
    SessionState state() const { return state_.load(); }
    uint32_t frames_sent() const { return frames_sent_.load(); }
private:
    void produce_next();
    void write_next();
    void wait_pacing();
    void watch_peer();
    void finish();
    void fail(const std::string& what);
    void cancel(const char* why);
    void close_transport(SessionState final_state);

    uint64_t id_;
    tcp::socket sock_;
    asio::steady_timer pacer_;
    StreamKind kind_;
    const char* name_;
    FrameSource& source_;
    SessionOptions opts_;
    Chunker chunker_;
    CloseHandler on_close_;

    std::unique_ptr<FrameCursor> cursor_;
    Frame frame_;
    uint32_t next_frame_number_{0};
    std::deque<Bytes> outbox_;   // messages of the frame in flight
    std::array<uint8_t, kEnvelopeHeaderSize> envelope_{};
    std::array<uint8_t, 512> peer_buf_{};
    EnvelopeReader peer_reader_{4096};
    bool closed_{false};

    std::atomic<SessionState> state_{SessionState::Idle};
    std::atomic<uint32_t> frames_sent_{0};
};

} // namespace scanlink
