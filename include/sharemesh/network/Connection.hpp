#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <vector>

namespace sharemesh::network {

// One TCP stream carrying length-prefixed frames.
class Connection {
public:
    using SocketHandle = int;
    static constexpr SocketHandle kInvalidSocket = -1;

    enum class ReceiveStatus {
        Frame,
        Timeout,
        Closed,
        Malformed
    };

    explicit Connection(SocketHandle socket);
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    // nullptr when the peer cannot be reached within timeout.
    static std::unique_ptr<Connection> connect(const std::string& host,
                                               std::uint16_t port,
                                               std::chrono::milliseconds timeout);

    // frame must already carry its length prefix.
    bool send_frame(std::span<const std::uint8_t> frame);

    // Waits up to wait for the start of a frame; body excludes the length prefix.
    ReceiveStatus receive(std::vector<std::uint8_t>& body, std::chrono::milliseconds wait);

    void shutdown() noexcept;
    bool is_shut_down() const noexcept { return shut_down_.load(); }

    const std::string& endpoint() const noexcept { return endpoint_; }
    const std::string& remote_host() const noexcept { return remote_host_; }

private:
    bool recv_exact(std::uint8_t* buffer,
                    std::size_t length,
                    std::chrono::steady_clock::time_point deadline);

    SocketHandle socket_{kInvalidSocket};
    std::atomic<bool> shut_down_{false};
    std::mutex send_mutex_;
    std::string endpoint_;
    std::string remote_host_;
};

class Listener {
public:
    Listener() = default;
    ~Listener();

    Listener(const Listener&) = delete;
    Listener& operator=(const Listener&) = delete;

    // Throws std::runtime_error when the address cannot be bound.
    void open(const std::string& host, std::uint16_t port);
    void close() noexcept;

    // nullptr on timeout or when the listener is closed.
    std::unique_ptr<Connection> accept(std::chrono::milliseconds wait);

    std::uint16_t port() const noexcept { return bound_port_; }
    bool is_open() const noexcept { return socket_.load() != Connection::kInvalidSocket; }

private:
    std::atomic<Connection::SocketHandle> socket_{Connection::kInvalidSocket};
    std::uint16_t bound_port_{0};
};

}  // namespace sharemesh::network
