#pragma once

#include <bit>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <span>

namespace UboFusion {

namespace writer {

inline constexpr std::size_t unbounded_capacity = std::numeric_limits<std::size_t>::max();

// Append-only byte destination of the reflective writer.
template<typename S>
concept ByteSinkLike = requires(const S sink,
                                S & mutable_sink,
                                std::byte b) {

    // Appends one byte; false when the sink is full
    { mutable_sink.put(b) } -> std::same_as<bool>;

    // Bytes appended so far
    { sink.written() } -> std::same_as<std::size_t>;

    // Total bytes the sink can take, unbounded_capacity for growable sinks
    { sink.capacity() } -> std::same_as<std::size_t>;
};


// Caller-owned fixed buffer.
class SpanSink {
    std::span<std::byte> m_buf;
    std::size_t m_pos = 0;
public:
    constexpr explicit SpanSink(std::span<std::byte> buf): m_buf(buf) {}

    constexpr bool put(std::byte b) {
        if(m_pos >= m_buf.size()) return false;
        m_buf[m_pos++] = b;
        return true;
    }
    constexpr std::size_t written() const {
        return m_pos;
    }
    constexpr std::size_t capacity() const {
        return m_buf.size();
    }
};

// Caller-owned growable container of bytes (std::vector<std::byte>, ...).
template<class C>
class ContainerSink {
    C & m_c;
    std::size_t m_start;
public:
    constexpr explicit ContainerSink(C & c): m_c(c), m_start(c.size()) {}

    constexpr bool put(std::byte b) {
        m_c.push_back(static_cast<typename C::value_type>(b));
        return true;
    }
    constexpr std::size_t written() const {
        return m_c.size() - m_start;
    }
    constexpr std::size_t capacity() const {
        return unbounded_capacity;
    }
};


// IEEE-754 single precision, little-endian
template<ByteSinkLike S>
constexpr bool put_float(S & sink, float f) {
    const std::uint32_t bits = std::bit_cast<std::uint32_t>(f);
    for(int shift = 0; shift < 32; shift += 8) {
        if(!sink.put(static_cast<std::byte>((bits >> shift) & 0xFFu))) return false;
    }
    return true;
}

template<ByteSinkLike S>
constexpr bool put_zeros(S & sink, std::size_t bytes) {
    for(std::size_t i = 0; i < bytes; i ++) {
        if(!sink.put(std::byte{0})) return false;
    }
    return true;
}

} // namespace writer

} // namespace UboFusion
