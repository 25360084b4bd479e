#pragma once
/**
 * @file constants.hpp
 * @brief Centralized named defaults for the framing and multiplexing layers.
 * @details These values eliminate magic numbers from the codebase. Override via the
 *          Config Loader (key = value file) in deployments.
 */

#include <cstdint>

namespace serlink::config::constants {

// =====================
// Wire format
// =====================
/// Start-of-frame marker, first word of every frame.
inline constexpr std::uint32_t FRAME_PREAMBLE     = 0x5AA55AA5;

/// Header word: port in bits [0:8), length in bits [8:24), rest reserved.
inline constexpr unsigned      HEADER_PORT_SHIFT   = 0;
inline constexpr unsigned      HEADER_PORT_BITS    = 8;
inline constexpr unsigned      HEADER_LENGTH_SHIFT = 8;
inline constexpr unsigned      HEADER_LENGTH_BITS  = 16;

/// Smallest physical word that still carries the preamble and the header.
inline constexpr unsigned      MIN_WORD_BITS       = 32;
/// Widest physical word the 64-bit container can hold.
inline constexpr unsigned      MAX_WORD_BITS       = 64;

// =====================
// Link defaults
// =====================
inline constexpr unsigned      DEFAULT_WORD_BITS       = 32;
inline constexpr unsigned      DEFAULT_BYTES_PER_WORD  = 4;   ///< Divisor applied to the length field
inline constexpr std::uint32_t DEFAULT_TX_BUFFER_DEPTH = 8;   ///< Words
inline constexpr std::uint32_t DEFAULT_RX_BUFFER_DEPTH = 8;   ///< Words
inline constexpr std::uint32_t DEFAULT_LANE_BUFFER_DEPTH = 8; ///< Words, per multi-channel lane
inline constexpr bool          DEFAULT_RESET_ON_LINK_DOWN = true;

// =====================
// Depacketizer idle timeout (interval = clk_freq_hz * timeout_s ticks)
// =====================
inline constexpr std::uint64_t DEFAULT_CLK_FREQ_HZ = 100'000'000; ///< 100 MHz fabric clock
inline constexpr std::uint32_t DEFAULT_TIMEOUT_S   = 10;

// =====================
// Ports
// =====================
inline constexpr std::uint8_t  PORT_CONTROL_BUS = 0; ///< Control-plane bus channel
inline constexpr std::uint8_t  PORT_SERIO       = 1; ///< Scalar signal channel
/// Port stamped on every multi-channel lane packet (lanes are not shared).
inline constexpr std::uint8_t  PORT_LANE        = 0;

} // namespace serlink::config::constants
