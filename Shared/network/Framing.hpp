#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

/// Stream framing shared by client and server:
///   [u32 big-endian payload length][payload bytes]
/// A length of zero is never valid.

constexpr size_t kFrameHeaderSize = 4;
constexpr uint32_t kDefaultMaxMessageSize = 64 * 1024;

void writeFrameHeader(uint8_t* dst, uint32_t payloadLength) noexcept;
uint32_t readFrameHeader(const uint8_t* src) noexcept;

// header + payload in one buffer, ready for a single write
std::vector<uint8_t> encodeFrame(std::string_view payload);

// Incremental decoder for a byte stream (used by clients and tests; the server
// reads header and payload with blocking exact reads instead).
class FrameDecoder {
public:
    explicit FrameDecoder(uint32_t maxMessageSize = kDefaultMaxMessageSize);

    void feed(const uint8_t* data, size_t size);

    // Next complete payload, or nullopt if more bytes are needed or the
    // stream failed.
    std::optional<std::string> next();

    // true once a zero or oversized length prefix was seen; sticky
    bool failed() const noexcept { return m_failed; }
    size_t buffered() const noexcept { return m_buffer.size() - m_offset; }

private:
    std::vector<uint8_t> m_buffer;
    size_t m_offset = 0;
    uint32_t m_maxMessageSize;
    bool m_failed = false;
};
