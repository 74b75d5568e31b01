
#pragma once
#include <asio.hpp>
#include <atomic>
#include <fstream>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "codec.hpp"
#include "link.hpp"
#include "reassembler.hpp"

namespace scanlink {

struct ClientConfig {
    std::string server_host{"127.0.0.1"};
    uint16_t server_port{8000};
    int threads{2};
    uint32_t max_message_size{kMaxMessageSize};
    std::string record_dir;
    std::vector<StreamKind> streams;
};

// Consumer for one channel: reassembles chunked frames, decodes them and
// hands each frame to the frame handler.
class StreamClient : public std::enable_shared_from_this<StreamClient> {
public:
    using tcp = asio::ip::tcp;
    using FrameHandler = std::function<void(const DecodedFrame&)>;
    using CloseHandler = std::function<void(StreamClient&)>;

    StreamClient(asio::io_context& io, const ClientConfig& cfg, StreamKind kind);
    void set_frame_handler(FrameHandler h) { on_frame_ = std::move(h); }
    void set_close_handler(CloseHandler h) { on_close_ = std::move(h); }
    void start();
    void stop();

    StreamKind kind() const { return kind_; }
    const char* name() const { return name_; }
    uint64_t frames() const { return frames_.load(); }
    uint64_t bytes() const { return bytes_.load(); }
    bool closed() const { return closed_.load(); }
    // Valid once closed() is true.
    const ReassemblyStats& stats() const { return last_stats_; }
    const std::string& server_error() const { return server_error_; }
    const std::error_code& error() const { return error_; }
private:
    void connect();
    void send_request();
    void do_read();
    bool handle(Envelope&& env);
    void handle_binary(Bytes&& message);
    void handle_text(const std::string& text);
    void close(const std::error_code& ec);

    ClientConfig cfg_;
    StreamKind kind_;
    const char* name_;
    tcp::socket sock_;
    tcp::resolver resolver_;
    std::vector<uint8_t> read_buf_;
    EnvelopeReader reader_;
    Reassembler reassembler_;
    std::ofstream record_;
    Bytes request_;
    FrameHandler on_frame_;
    CloseHandler on_close_;

    std::atomic<uint64_t> frames_{0};
    std::atomic<uint64_t> bytes_{0};
    std::atomic<bool> closed_{false};
    ReassemblyStats last_stats_;
    std::string server_error_;
    std::error_code error_;
};

} // namespace scanlink
