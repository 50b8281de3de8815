/**
 * @file tcp_probe.cpp
 * @brief TcpProbe implementation: non-blocking connect with poll() timeout.
 * @author Dimitris Kafetzis
 */

#include "health/probe.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace compute_orchestrator {

namespace {

/**
 * @brief Owns a socket descriptor for the duration of one probe.
 */
class SocketGuard {
public:
    explicit SocketGuard(int fd) : fd_(fd) {}
    ~SocketGuard() {
        if (fd_ >= 0) ::close(fd_);
    }

    SocketGuard(const SocketGuard&) = delete;
    SocketGuard& operator=(const SocketGuard&) = delete;

    [[nodiscard]] int get() const noexcept { return fd_; }

private:
    int fd_;
};

}  // anonymous namespace

TcpProbe::TcpProbe(uint16_t port, uint32_t timeout_ms)
    : port_(port), timeout_ms_(timeout_ms) {}

ProbeResult TcpProbe::probe(const ComputeNode& node) {
    auto start = std::chrono::steady_clock::now();
    auto elapsed = [&start] {
        return std::chrono::duration_cast<Duration>(std::chrono::steady_clock::now() - start);
    };

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port_);
    if (::inet_pton(AF_INET, node.address.c_str(), &addr.sin_addr) != 1) {
        return ProbeResult{.reachable = false,
                           .detail = "Invalid address: " + node.address,
                           .latency = elapsed()};
    }

    SocketGuard sock(::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK, 0));
    if (sock.get() < 0) {
        return ProbeResult{.reachable = false,
                           .detail = "Failed to create socket: " + std::string(strerror(errno)),
                           .latency = elapsed()};
    }

    int ret = ::connect(sock.get(), reinterpret_cast<const sockaddr*>(&addr), sizeof(addr));
    if (ret < 0 && errno != EINPROGRESS) {
        return ProbeResult{.reachable = false,
                           .detail = "Connect failed: " + std::string(strerror(errno)),
                           .latency = elapsed()};
    }

    if (ret < 0) {
        pollfd pfd{};
        pfd.fd = sock.get();
        pfd.events = POLLOUT;

        int ready = ::poll(&pfd, 1, static_cast<int>(timeout_ms_));
        if (ready <= 0) {
            return ProbeResult{.reachable = false,
                               .detail = "Connect timed out",
                               .latency = elapsed()};
        }

        int err = 0;
        socklen_t len = sizeof(err);
        if (::getsockopt(sock.get(), SOL_SOCKET, SO_ERROR, &err, &len) < 0) {
            err = errno;
        }
        if (err != 0) {
            return ProbeResult{.reachable = false,
                               .detail = "Connect failed: " + std::string(strerror(err)),
                               .latency = elapsed()};
        }
    }

    ::shutdown(sock.get(), SHUT_RDWR);
    return ProbeResult{.reachable = true, .detail = "ok", .latency = elapsed()};
}

}  // namespace compute_orchestrator
