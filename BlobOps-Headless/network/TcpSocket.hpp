#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>

enum class IoResult : uint8_t {
    Ok = 0,
    Closed,   // orderly shutdown by the peer
    Timeout,  // SO_RCVTIMEO / SO_SNDTIMEO expired
    Error,
};

const char* ioResultName(IoResult r) noexcept;

// Owning wrapper around a blocking POSIX stream socket. Move-only.
// Shutdown() may be called from another thread to unblock a pending read;
// Close() must only be called by the owning thread.
class TcpSocket {
public:
    TcpSocket() = default;
    explicit TcpSocket(int fd) noexcept;
    ~TcpSocket();

    TcpSocket(const TcpSocket&) = delete;
    TcpSocket& operator=(const TcpSocket&) = delete;
    TcpSocket(TcpSocket&& other) noexcept;
    TcpSocket& operator=(TcpSocket&& other) noexcept;

    // Bound and listening socket (SO_REUSEADDR). Throws std::runtime_error.
    static TcpSocket Listen(const std::string& host, uint16_t port, int backlog);

    // Blocks until a connection arrives. Returns an invalid socket when the
    // listener was shut down or accept failed.
    TcpSocket Accept(std::string& remoteIp, uint16_t& remotePort) const;

    IoResult ReadExact(void* buffer, size_t length);
    IoResult WriteAll(const void* data, size_t length);
    // Single non-blocking send; anything the kernel does not take at once is dropped.
    IoResult TrySend(const void* data, size_t length);

    // seconds <= 0 disables the timeout
    bool SetReceiveTimeout(double seconds);
    bool SetSendTimeout(double seconds);
    bool SetNoDelay(bool enabled);

    // Port actually bound (useful after listening on port 0).
    uint16_t LocalPort() const;

    void Shutdown() noexcept;
    void Close() noexcept;

    [[nodiscard]] bool IsValid() const noexcept { return m_fd.load(std::memory_order_acquire) >= 0; }
    [[nodiscard]] int Fd() const noexcept { return m_fd.load(std::memory_order_acquire); }

private:
    bool SetTimeoutOption(int option, double seconds);

    std::atomic<int> m_fd{ -1 };
};
