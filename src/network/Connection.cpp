#include "sharemesh/network/Connection.hpp"

#include "sharemesh/protocol/Message.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <stdexcept>
#include <utility>

namespace sharemesh::network {

namespace {

constexpr std::chrono::seconds kFrameReadTimeout{30};

#ifdef MSG_NOSIGNAL
constexpr int kSendFlags = MSG_NOSIGNAL;
#else
constexpr int kSendFlags = 0;
#endif

bool set_non_blocking(int socket, bool enable) {
    int flags = fcntl(socket, F_GETFL, 0);
    if (flags < 0) {
        return false;
    }
    if (enable) {
        flags |= O_NONBLOCK;
    } else {
        flags &= ~O_NONBLOCK;
    }
    return fcntl(socket, F_SETFL, flags) == 0;
}

int poll_for(int socket, short events, std::chrono::milliseconds timeout) {
    pollfd descriptor{};
    descriptor.fd = socket;
    descriptor.events = events;
    const auto millis = static_cast<int>(std::max<std::chrono::milliseconds::rep>(timeout.count(), 0));
    while (true) {
        const auto result = ::poll(&descriptor, 1, millis);
        if (result < 0 && errno == EINTR) {
            continue;
        }
        if (result <= 0) {
            return result;
        }
        if ((descriptor.revents & (POLLERR | POLLNVAL)) != 0 && (descriptor.revents & POLLIN) == 0) {
            return -1;
        }
        return result;
    }
}

std::pair<std::string, std::string> describe_peer(int socket) {
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (::getpeername(socket, reinterpret_cast<sockaddr*>(&addr), &len) == 0) {
        char buffer[INET_ADDRSTRLEN]{};
        if (const char* text = ::inet_ntop(AF_INET, &addr.sin_addr, buffer, sizeof(buffer))) {
            const std::string host(text);
            return {host + ":" + std::to_string(ntohs(addr.sin_port)), host};
        }
    }
    return {"unknown", ""};
}

}  // namespace

Connection::Connection(SocketHandle socket)
    : socket_(socket) {
    int opt = 1;
    ::setsockopt(socket_, IPPROTO_TCP, TCP_NODELAY, &opt, sizeof(opt));
    auto [endpoint, host] = describe_peer(socket_);
    endpoint_ = std::move(endpoint);
    remote_host_ = std::move(host);
}

Connection::~Connection() {
    shutdown();
    if (socket_ != kInvalidSocket) {
        ::close(socket_);
    }
}

std::unique_ptr<Connection> Connection::connect(const std::string& host,
                                                std::uint16_t port,
                                                std::chrono::milliseconds timeout) {
    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    addrinfo* result = nullptr;
    if (const auto err = ::getaddrinfo(host.c_str(), nullptr, &hints, &result); err != 0 || result == nullptr) {
        if (result) {
            ::freeaddrinfo(result);
        }
        return nullptr;
    }
    sockaddr_in address = *reinterpret_cast<sockaddr_in*>(result->ai_addr);
    address.sin_port = htons(port);
    ::freeaddrinfo(result);

    const int socket = ::socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
    if (socket < 0) {
        return nullptr;
    }

    if (!set_non_blocking(socket, true)) {
        ::close(socket);
        return nullptr;
    }

    if (::connect(socket, reinterpret_cast<const sockaddr*>(&address), sizeof(address)) < 0) {
        if (errno != EINPROGRESS || poll_for(socket, POLLOUT, timeout) <= 0) {
            ::close(socket);
            return nullptr;
        }
        int error = 0;
        socklen_t len = sizeof(error);
        if (::getsockopt(socket, SOL_SOCKET, SO_ERROR, &error, &len) < 0 || error != 0) {
            ::close(socket);
            return nullptr;
        }
    }

    if (!set_non_blocking(socket, false)) {
        ::close(socket);
        return nullptr;
    }
    return std::make_unique<Connection>(socket);
}

bool Connection::send_frame(std::span<const std::uint8_t> frame) {
    std::scoped_lock lock(send_mutex_);
    if (shut_down_.load()) {
        return false;
    }
    std::size_t sent_total = 0;
    while (sent_total < frame.size()) {
        const auto sent = ::send(socket_, frame.data() + sent_total, frame.size() - sent_total, kSendFlags);
        if (sent < 0 && errno == EINTR) {
            continue;
        }
        if (sent <= 0) {
            return false;
        }
        sent_total += static_cast<std::size_t>(sent);
    }
    return true;
}

Connection::ReceiveStatus Connection::receive(std::vector<std::uint8_t>& body, std::chrono::milliseconds wait) {
    if (shut_down_.load()) {
        return ReceiveStatus::Closed;
    }

    const auto ready = poll_for(socket_, POLLIN, wait);
    if (ready == 0) {
        return ReceiveStatus::Timeout;
    }
    if (ready < 0) {
        return ReceiveStatus::Closed;
    }

    const auto deadline = std::chrono::steady_clock::now() + kFrameReadTimeout;
    std::array<std::uint8_t, protocol::kLengthFieldSize> prefix{};
    if (!recv_exact(prefix.data(), prefix.size(), deadline)) {
        return ReceiveStatus::Closed;
    }
    const std::uint32_t length = (static_cast<std::uint32_t>(prefix[0]) << 24) |
                                 (static_cast<std::uint32_t>(prefix[1]) << 16) |
                                 (static_cast<std::uint32_t>(prefix[2]) << 8) |
                                 static_cast<std::uint32_t>(prefix[3]);
    if (length < 2 || length > protocol::kMaxFrameSize) {
        return ReceiveStatus::Malformed;
    }

    body.resize(length);
    if (!recv_exact(body.data(), body.size(), deadline)) {
        return ReceiveStatus::Closed;
    }
    return ReceiveStatus::Frame;
}

void Connection::shutdown() noexcept {
    bool expected = false;
    if (shut_down_.compare_exchange_strong(expected, true) && socket_ != kInvalidSocket) {
        ::shutdown(socket_, SHUT_RDWR);
    }
}

bool Connection::recv_exact(std::uint8_t* buffer,
                            std::size_t length,
                            std::chrono::steady_clock::time_point deadline) {
    std::size_t received_total = 0;
    while (received_total < length) {
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0 || poll_for(socket_, POLLIN, remaining) <= 0) {
            return false;
        }
        const auto received = ::recv(socket_, buffer + received_total, length - received_total, 0);
        if (received < 0 && errno == EINTR) {
            continue;
        }
        if (received <= 0) {
            return false;
        }
        received_total += static_cast<std::size_t>(received);
    }
    return true;
}

Listener::~Listener() {
    close();
}

void Listener::open(const std::string& host, std::uint16_t port) {
    const int server_socket = ::socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
    if (server_socket < 0) {
        throw std::runtime_error("Failed to create listen socket");
    }

    int opt = 1;
    if (::setsockopt(server_socket, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        ::close(server_socket);
        throw std::runtime_error("Failed to configure listen socket");
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (host.empty() || host == "0.0.0.0") {
        addr.sin_addr.s_addr = htonl(INADDR_ANY);
    } else if (::inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
        ::close(server_socket);
        throw std::runtime_error("Invalid listen address " + host);
    }

    if (::bind(server_socket, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) < 0) {
        const auto error = errno;
        ::close(server_socket);
        throw std::runtime_error("Failed to bind listen socket: error " + std::to_string(error));
    }

    if (::listen(server_socket, SOMAXCONN) < 0) {
        const auto error = errno;
        ::close(server_socket);
        throw std::runtime_error("Failed to listen on socket: error " + std::to_string(error));
    }

    sockaddr_in bound{};
    socklen_t len = sizeof(bound);
    if (::getsockname(server_socket, reinterpret_cast<sockaddr*>(&bound), &len) == 0) {
        bound_port_ = ntohs(bound.sin_port);
    } else {
        bound_port_ = port;
    }
    socket_.store(server_socket);
}

void Listener::close() noexcept {
    const auto socket = socket_.exchange(Connection::kInvalidSocket);
    if (socket != Connection::kInvalidSocket) {
        ::shutdown(socket, SHUT_RDWR);
        ::close(socket);
    }
}

std::unique_ptr<Connection> Listener::accept(std::chrono::milliseconds wait) {
    const auto socket = socket_.load();
    if (socket == Connection::kInvalidSocket || poll_for(socket, POLLIN, wait) <= 0) {
        return nullptr;
    }
    sockaddr_in remote{};
    socklen_t len = sizeof(remote);
    const int client = ::accept(socket, reinterpret_cast<sockaddr*>(&remote), &len);
    if (client < 0) {
        return nullptr;
    }
    return std::make_unique<Connection>(client);
}

}  // namespace sharemesh::network
