
#pragma once
#include <asio.hpp>
#include <array>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include "frame_source.hpp"
#include "link.hpp"
#include "session_registry.hpp"
#include "util.hpp"
#include "testutil.hpp"

namespace scanlink {
namespace test {

// Hands out a fixed list of frames, then ends or fails with `fail_with`.
class ScriptedSource : public FrameSource {
public:
    std::vector<Frame> frames;
    std::error_code fail_with;

    std::unique_ptr<FrameCursor> open(StreamKind) override {
        return std::unique_ptr<FrameCursor>(new Cursor(*this));
    }
private:
    class Cursor : public FrameCursor {
    public:
        explicit Cursor(const ScriptedSource& src) : src_(src) {}
        bool next(Frame& out, std::error_code& ec) override {
            ec.clear();
            if (idx_ < src_.frames.size()) {
                out = src_.frames[idx_++];
                return true;
            }
            ec = src_.fail_with;
            return false;
        }
    private:
        const ScriptedSource& src_;
        size_t idx_{0};
    };
};

// Registry on an ephemeral loopback port, driven by background threads.
class LoopbackServer {
public:
    LoopbackServer(FrameSource& source, const SessionOptions& opts, int threads = 2)
        : work_(asio::make_work_guard(io_)) {
        ServerConfig cfg;
        cfg.listen_host = "127.0.0.1";
        cfg.listen_port = 0;
        cfg.session = opts;
        registry_.reset(new SessionRegistry(io_, cfg, source));
        std::error_code ec;
        ok_ = registry_->start(ec);
        for (int i = 0; i < threads; i++)
            threads_.emplace_back([this]() { io_.run(); });
    }

    ~LoopbackServer() {
        registry_->stop();
        wait_until([this]() { return registry_->active_sessions() == 0; },
                   std::chrono::milliseconds(2000));
        work_.reset();
        io_.stop();
        for (auto& t : threads_)
            t.join();
    }

    bool ok() const { return ok_; }
    uint16_t port() const { return registry_->port(); }
    SessionRegistry& registry() { return *registry_; }
private:
    asio::io_context io_;
    asio::executor_work_guard<asio::io_context::executor_type> work_;
    std::unique_ptr<SessionRegistry> registry_;
    std::vector<std::thread> threads_;
    bool ok_{false};
};

// Blocking peer used to look at exactly what a server puts on the wire.
class RawChannel {
public:
    using tcp = asio::ip::tcp;

    explicit RawChannel(uint16_t port) : sock_(io_), reader_(kMaxMessageSize) {
        std::error_code ec;
        sock_.connect(tcp::endpoint(asio::ip::make_address("127.0.0.1"), port), ec);
        connected_ = !ec;
    }

    RawChannel(uint16_t port, const std::string& path) : RawChannel(port) {
        if (connected_)
            send(make_text_envelope(path));
    }

    bool connected() const { return connected_; }
    tcp::socket& socket() { return sock_; }

    void send(const Bytes& wire) {
        std::error_code ec;
        asio::write(sock_, asio::buffer(wire), ec);
    }

    // false once the connection is gone or the stream is unreadable
    bool read(Envelope& env) {
        for (;;) {
            std::error_code ec;
            if (reader_.next(env, ec))
                return true;
            if (ec)
                return false;
            size_t n = sock_.read_some(asio::buffer(buf_), ec);
            if (ec)
                return false;
            reader_.feed(buf_.data(), n);
        }
    }

    void close() {
        std::error_code ec;
        sock_.close(ec);
    }
private:
    asio::io_context io_;
    tcp::socket sock_;
    EnvelopeReader reader_;
    std::array<uint8_t, 64 * 1024> buf_{};
    bool connected_{false};
};

inline MessageType message_type(const Envelope& env) {
    MessageType t = MessageType::Data;
    std::error_code ec;
    TEST_ASSERT_TRUE(peek_type(env.payload.data(), env.payload.size(), t, ec));
    return t;
}

inline uint32_t message_frame(const Envelope& env) {
    TEST_ASSERT_TRUE(env.payload.size() >= kHeaderSize);
    return get_u32le(env.payload.data() + 8);
}

} // namespace test
} // namespace scanlink
