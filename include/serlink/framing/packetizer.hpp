#pragma once
/**
 * @file packetizer.hpp
 * @brief Packet stream → framed word stream.
 *
 * Frame: preamble word, header word (port/length), then the payload words with
 * `last` on the final one. The state machine is exposed as a pure step function
 * so it can be exercised without a clock; Packetizer wraps it with the
 * registered state.
 *
 * States:
 *  - Preamble:   idle until input is valid, then offer the preamble until accepted.
 *  - PortLength: offer the header until accepted.
 *  - Data:       pass-through handshake; accepted last word returns to Preamble.
 *
 * Input that violates the length contract (zero words, length not a multiple of
 * the word byte width) is framed as-is.
 */

#include <cstdint>
#include <vector>

#include "serlink/stream/flit.hpp"
#include "serlink/stream/payload_layout.hpp"

namespace serlink::framing {

enum class PacketizerState : std::uint8_t { Preamble, PortLength, Data };

struct PacketizerInputs {
    stream::PacketFlit sink{};        ///< Offered packet flit
    bool               source_ready{false}; ///< Downstream accepts a word this tick
};

struct PacketizerOutputs {
    stream::WordFlit source{};        ///< Word offered downstream
    bool             sink_ready{false}; ///< Offered packet flit is consumed this tick
};

struct PacketizerStep {
    PacketizerState   next{PacketizerState::Preamble};
    PacketizerOutputs out{};
};

/**
 * @brief One tick of the packetizer.
 * @param payload_mask Bits of the packed payload that reach the wire.
 */
PacketizerStep packetizer_step(PacketizerState s, const PacketizerInputs& in,
                               stream::Word payload_mask) noexcept;

/** @class Packetizer
 *  @brief Registered packetizer bound to one payload layout.
 */
class Packetizer {
public:
    explicit Packetizer(stream::PayloadLayout layout);

    /// Evaluate combinational outputs for @p in and advance one tick.
    PacketizerOutputs tick(const PacketizerInputs& in) noexcept;

    /// Return to the initial state (link-down).
    void reset() noexcept { state_ = PacketizerState::Preamble; }

    PacketizerState state() const noexcept { return state_; }
    const stream::PayloadLayout& layout() const noexcept { return layout_; }

private:
    stream::PayloadLayout layout_;
    stream::Word          mask_{0};
    PacketizerState       state_{PacketizerState::Preamble};
};

/**
 * @brief Whole-frame encoder for tools and tests: the words a Packetizer emits
 *        for @p p when the downstream never stalls.
 */
std::vector<stream::Word> encode_frame(const stream::Packet& p);

} // namespace serlink::framing
