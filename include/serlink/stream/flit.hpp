/**
 * @file flit.hpp
 * @brief Word and flit types exchanged between streaming components.
 *
 * A flit is one word-sized slice of a stream together with its handshake
 * metadata. `valid` is driven by the producer; readiness travels the other way
 * and is returned by the consuming component, never stored in the flit.
 */
#pragma once

#include <cstdint>
#include <vector>

namespace serlink::stream {

/// @brief Physical transfer unit. Configured width is at most 64 bits.
using Word = std::uint64_t;

/// @brief 8-bit logical channel identifier.
using Port = std::uint8_t;

/**
 * @brief Flit on a raw word stream (packetizer output, depacketizer input).
 */
struct WordFlit final {
  bool valid{false};
  bool last{false};
  Word data{0};

  bool operator==(const WordFlit&) const = default;
};

/**
 * @brief Flit on a packet-shaped stream.
 *
 * `port` and `length` are constant for every flit of one packet.
 * `data` holds the payload fields already packed by a PayloadLayout.
 * `first` marks the first payload word; it is informational (framing keys off
 * `last` only) and lets consumers drop a packet cut short by a timeout.
 */
struct PacketFlit final {
  bool          valid{false};
  bool          first{false};
  bool          last{false};
  Port          port{0};
  std::uint16_t length{0};   ///< Payload size in bytes
  Word          data{0};

  bool operator==(const PacketFlit&) const = default;
};

/**
 * @brief A complete packet, as assembled by queue endpoints and test benches.
 */
struct Packet final {
  Port              port{0};
  std::uint16_t     length{0};
  std::vector<Word> payload;

  bool operator==(const Packet&) const = default;
};

} // namespace serlink::stream
