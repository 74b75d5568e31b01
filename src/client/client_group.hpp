
#pragma once
#include <asio.hpp>
#include <atomic>
#include <memory>
#include <vector>
#include "stream_client.hpp"

namespace scanlink {

// One StreamClient per configured stream. SIGINT and SIGTERM stop them all;
// the signal wait is released once the last client has closed, so the
// io_context runs out of work on its own.
class ClientGroup {
public:
    ClientGroup(asio::io_context& io, const ClientConfig& cfg);
    void start();
    void stop();

    const std::vector<std::shared_ptr<StreamClient>>& clients() const { return clients_; }
    size_t open_clients() const { return open_.load(); }
private:
    void on_client_closed();

    asio::strand<asio::io_context::executor_type> strand_;
    // only touched on strand_
    asio::signal_set signals_;
    std::vector<std::shared_ptr<StreamClient>> clients_;
    std::atomic<size_t> open_{0};
};

} // namespace scanlink
