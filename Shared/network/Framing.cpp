#include "Framing.hpp"
#include <cstring>

void writeFrameHeader(uint8_t* dst, uint32_t payloadLength) noexcept {
    dst[0] = uint8_t((payloadLength >> 24) & 0xFF);
    dst[1] = uint8_t((payloadLength >> 16) & 0xFF);
    dst[2] = uint8_t((payloadLength >> 8) & 0xFF);
    dst[3] = uint8_t(payloadLength & 0xFF);
}

uint32_t readFrameHeader(const uint8_t* src) noexcept {
    return (uint32_t(src[0]) << 24) | (uint32_t(src[1]) << 16) | (uint32_t(src[2]) << 8) | uint32_t(src[3]);
}

std::vector<uint8_t> encodeFrame(std::string_view payload) {
    std::vector<uint8_t> out(kFrameHeaderSize + payload.size());
    writeFrameHeader(out.data(), static_cast<uint32_t>(payload.size()));
    if (!payload.empty()) {
        std::memcpy(out.data() + kFrameHeaderSize, payload.data(), payload.size());
    }
    return out;
}

FrameDecoder::FrameDecoder(uint32_t maxMessageSize)
    : m_maxMessageSize(maxMessageSize)
{
}

void FrameDecoder::feed(const uint8_t* data, size_t size) {
    if (m_failed || size == 0) return;
    // compact consumed bytes before growing
    if (m_offset > 0 && m_offset == m_buffer.size()) {
        m_buffer.clear();
        m_offset = 0;
    }
    else if (m_offset > 4096 && m_offset * 2 > m_buffer.size()) {
        m_buffer.erase(m_buffer.begin(), m_buffer.begin() + static_cast<std::ptrdiff_t>(m_offset));
        m_offset = 0;
    }
    m_buffer.insert(m_buffer.end(), data, data + size);
}

std::optional<std::string> FrameDecoder::next() {
    if (m_failed) return std::nullopt;
    if (buffered() < kFrameHeaderSize) return std::nullopt;

    const uint32_t length = readFrameHeader(m_buffer.data() + m_offset);
    if (length == 0 || length > m_maxMessageSize) {
        m_failed = true;
        return std::nullopt;
    }
    if (buffered() < kFrameHeaderSize + length) return std::nullopt;

    const char* begin = reinterpret_cast<const char*>(m_buffer.data() + m_offset + kFrameHeaderSize);
    std::string payload(begin, length);
    m_offset += kFrameHeaderSize + length;
    return payload;
}
