
#pragma once
#include <asio.hpp>
#include <array>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "frame_source.hpp"
#include "link.hpp"
#include "stream_session.hpp"

namespace scanlink {

struct ServerConfig {
    std::string listen_host{"0.0.0.0"};
    uint16_t listen_port{8000};
    int threads{4};
    SessionOptions session;
};

// Accepts connections, maps the requested channel path to a stream kind and
// runs one independent StreamSession per connection.
class SessionRegistry {
public:
    using tcp = asio::ip::tcp;

    SessionRegistry(asio::io_context& io, const ServerConfig& cfg, FrameSource& source);
    bool start(std::error_code& ec);
    void stop();

    uint16_t port() const { return bound_port_; }
    size_t active_sessions() const;
    uint64_t total_sessions() const;

private:
    struct Pending {
        tcp::socket sock;
        EnvelopeReader reader{4096};
        std::array<uint8_t, 1024> buf{};
        explicit Pending(tcp::socket s) : sock(std::move(s)) {}
    };

    void do_accept();
    void read_request(std::shared_ptr<Pending> p);
    void handle_request(std::shared_ptr<Pending> p, const Envelope& req);
    void reply_and_close(std::shared_ptr<Pending> p, const std::string& text);
    void on_session_closed(uint64_t id, SessionState st);
    void forget_pending(const std::shared_ptr<Pending>& p);

    asio::io_context& io_;
    ServerConfig cfg_;
    FrameSource& source_;
    tcp::acceptor acceptor_;
    uint16_t bound_port_{0};

    mutable std::mutex mtx_;
    bool stopped_{false};
    uint64_t next_id_{1};
    std::unordered_map<uint64_t, std::shared_ptr<StreamSession>> sessions_;
    std::vector<std::weak_ptr<Pending>> pending_;
};

} // namespace scanlink
