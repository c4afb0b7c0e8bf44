#include "TcpSocket.hpp"

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>
#include <cmath>
#include <cstring>
#include <iostream>
#include <stdexcept>

const char* ioResultName(IoResult r) noexcept {
    switch (r) {
    case IoResult::Ok: return "ok";
    case IoResult::Closed: return "closed";
    case IoResult::Timeout: return "timeout";
    case IoResult::Error: return "error";
    }
    return "unknown";
}

TcpSocket::TcpSocket(int fd) noexcept
    : m_fd(fd)
{
}

TcpSocket::~TcpSocket()
{
    Close();
}

TcpSocket::TcpSocket(TcpSocket&& other) noexcept
    : m_fd(other.m_fd.exchange(-1, std::memory_order_acq_rel))
{
}

TcpSocket& TcpSocket::operator=(TcpSocket&& other) noexcept
{
    if (this != &other) {
        Close();
        m_fd.store(other.m_fd.exchange(-1, std::memory_order_acq_rel), std::memory_order_release);
    }
    return *this;
}

TcpSocket TcpSocket::Listen(const std::string& host, uint16_t port, int backlog)
{
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_PASSIVE;

    const std::string service = std::to_string(port);
    addrinfo* result = nullptr;
    const int rc = ::getaddrinfo(host.empty() ? nullptr : host.c_str(), service.c_str(), &hints, &result);
    if (rc != 0) {
        throw std::runtime_error("failed to resolve " + host + ": " + gai_strerror(rc));
    }

    std::string lastError = "no usable address";
    for (addrinfo* p = result; p != nullptr; p = p->ai_next) {
        TcpSocket sock(::socket(p->ai_family, p->ai_socktype, p->ai_protocol));
        if (!sock.IsValid()) {
            lastError = std::strerror(errno);
            continue;
        }

        const int yes = 1;
        if (::setsockopt(sock.Fd(), SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes)) < 0) {
            std::cerr << "[net] SO_REUSEADDR failed: " << std::strerror(errno) << "\n";
        }

        if (::bind(sock.Fd(), p->ai_addr, p->ai_addrlen) < 0) {
            lastError = std::string("bind: ") + std::strerror(errno);
            continue;
        }
        if (::listen(sock.Fd(), backlog) < 0) {
            lastError = std::string("listen: ") + std::strerror(errno);
            continue;
        }
        ::freeaddrinfo(result);
        return sock;
    }

    ::freeaddrinfo(result);
    throw std::runtime_error("failed to listen on " + host + ":" + service + " (" + lastError + ")");
}

TcpSocket TcpSocket::Accept(std::string& remoteIp, uint16_t& remotePort) const
{
    sockaddr_storage addr{};
    socklen_t len = sizeof(addr);
    int fd = -1;
    do {
        len = sizeof(addr);
        fd = ::accept(Fd(), reinterpret_cast<sockaddr*>(&addr), &len);
    } while (fd < 0 && errno == EINTR);

    if (fd < 0) return TcpSocket();

    char buf[INET6_ADDRSTRLEN] = {};
    remotePort = 0;
    if (addr.ss_family == AF_INET) {
        const auto* in = reinterpret_cast<const sockaddr_in*>(&addr);
        ::inet_ntop(AF_INET, &in->sin_addr, buf, sizeof(buf));
        remotePort = ntohs(in->sin_port);
    }
    else if (addr.ss_family == AF_INET6) {
        const auto* in6 = reinterpret_cast<const sockaddr_in6*>(&addr);
        ::inet_ntop(AF_INET6, &in6->sin6_addr, buf, sizeof(buf));
        remotePort = ntohs(in6->sin6_port);
    }
    remoteIp = buf;
    return TcpSocket(fd);
}

IoResult TcpSocket::ReadExact(void* buffer, size_t length)
{
    auto* out = static_cast<uint8_t*>(buffer);
    size_t got = 0;
    while (got < length) {
        const int fd = Fd();
        if (fd < 0) return IoResult::Closed;
        const ssize_t n = ::recv(fd, out + got, length - got, 0);
        if (n > 0) {
            got += static_cast<size_t>(n);
            continue;
        }
        if (n == 0) return IoResult::Closed;
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) return IoResult::Timeout;
        return IoResult::Error;
    }
    return IoResult::Ok;
}

IoResult TcpSocket::WriteAll(const void* data, size_t length)
{
    const auto* in = static_cast<const uint8_t*>(data);
    size_t sent = 0;
    while (sent < length) {
        const int fd = Fd();
        if (fd < 0) return IoResult::Closed;
        const ssize_t n = ::send(fd, in + sent, length - sent, MSG_NOSIGNAL);
        if (n >= 0) {
            sent += static_cast<size_t>(n);
            continue;
        }
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) return IoResult::Timeout;
        if (errno == EPIPE || errno == ECONNRESET) return IoResult::Closed;
        return IoResult::Error;
    }
    return IoResult::Ok;
}

IoResult TcpSocket::TrySend(const void* data, size_t length)
{
    const int fd = Fd();
    if (fd < 0) return IoResult::Closed;
    ssize_t n = -1;
    do {
        n = ::send(fd, data, length, MSG_NOSIGNAL | MSG_DONTWAIT);
    } while (n < 0 && errno == EINTR);
    if (n >= 0) return static_cast<size_t>(n) == length ? IoResult::Ok : IoResult::Timeout;
    if (errno == EAGAIN || errno == EWOULDBLOCK) return IoResult::Timeout;
    if (errno == EPIPE || errno == ECONNRESET) return IoResult::Closed;
    return IoResult::Error;
}

bool TcpSocket::SetTimeoutOption(int option, double seconds)
{
    timeval tv{};
    if (seconds > 0.0 && std::isfinite(seconds)) {
        tv.tv_sec = static_cast<time_t>(seconds);
        tv.tv_usec = static_cast<suseconds_t>((seconds - static_cast<double>(tv.tv_sec)) * 1e6);
        if (tv.tv_sec == 0 && tv.tv_usec == 0) tv.tv_usec = 1;
    }
    return ::setsockopt(Fd(), SOL_SOCKET, option, &tv, sizeof(tv)) == 0;
}

bool TcpSocket::SetReceiveTimeout(double seconds)
{
    return SetTimeoutOption(SO_RCVTIMEO, seconds);
}

bool TcpSocket::SetSendTimeout(double seconds)
{
    return SetTimeoutOption(SO_SNDTIMEO, seconds);
}

bool TcpSocket::SetNoDelay(bool enabled)
{
    const int flag = enabled ? 1 : 0;
    return ::setsockopt(Fd(), IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag)) == 0;
}

uint16_t TcpSocket::LocalPort() const
{
    sockaddr_storage addr{};
    socklen_t len = sizeof(addr);
    if (::getsockname(Fd(), reinterpret_cast<sockaddr*>(&addr), &len) != 0) return 0;
    if (addr.ss_family == AF_INET) {
        return ntohs(reinterpret_cast<const sockaddr_in*>(&addr)->sin_port);
    }
    if (addr.ss_family == AF_INET6) {
        return ntohs(reinterpret_cast<const sockaddr_in6*>(&addr)->sin6_port);
    }
    return 0;
}

void TcpSocket::Shutdown() noexcept
{
    const int fd = Fd();
    if (fd >= 0) {
        ::shutdown(fd, SHUT_RDWR);
    }
}

void TcpSocket::Close() noexcept
{
    const int fd = m_fd.exchange(-1, std::memory_order_acq_rel);
    if (fd >= 0) {
        ::close(fd);
    }
}
