#pragma once
/**
 * @file header.hpp
 * @brief Frame header word encoding (port + length) and the preamble check.
 */

#include <cstddef>
#include <cstdint>
#include <optional>

#include "serlink/config/constants.hpp"
#include "serlink/stream/flit.hpp"

namespace serlink::framing {

/// Preamble word as seen on a link of any supported width.
inline constexpr stream::Word kPreamble = config::constants::FRAME_PREAMBLE;

/// Pack port and byte length into a header word; reserved bits are zero.
constexpr stream::Word encode_header(stream::Port port, std::uint16_t length) noexcept {
    using namespace config::constants;
    return (stream::Word{port} << HEADER_PORT_SHIFT) |
           (stream::Word{length} << HEADER_LENGTH_SHIFT);
}

constexpr stream::Port header_port(stream::Word w) noexcept {
    return static_cast<stream::Port>(w >> config::constants::HEADER_PORT_SHIFT);
}

constexpr std::uint16_t header_length(stream::Word w) noexcept {
    return static_cast<std::uint16_t>(w >> config::constants::HEADER_LENGTH_SHIFT);
}

/// Length field for @p words payload words; nullopt when it overflows 16 bits.
constexpr std::optional<std::uint16_t> payload_length(std::size_t words, unsigned bytes_per_word) noexcept {
    if (bytes_per_word == 0 || words > 0xFFFF / bytes_per_word) return std::nullopt;
    return static_cast<std::uint16_t>(words * bytes_per_word);
}

static_assert(encode_header(0x03, 8) == 0x00000803, "port in [0:8), length in [8:24)");

} // namespace serlink::framing
