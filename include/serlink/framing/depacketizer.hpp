#pragma once
/**
 * @file depacketizer.hpp
 * @brief Framed word stream → packet stream, with idle-timeout resynchronization.
 *
 * States:
 *  - Preamble:   always ready; words other than the preamble are discarded.
 *  - PortLength: next word is the header; latch port/length, clear the counter.
 *  - Data:       forward words as payload; `last` when counter == words - 1.
 *
 * Idle timer: cleared in Preamble, counts every tick spent in PortLength/Data.
 * Once it reaches the configured interval the machine drops the partial frame
 * and returns to Preamble. Expiry wins over a transfer in the same tick, so no
 * word moves on the expiry tick. Nothing is reported upstream; the step outputs
 * carry event flags for counters only.
 *
 * Payload word count is `length / bytes_per_word`. A header announcing zero
 * words never produces `last`; such a frame ends on the idle timer.
 */

#include <cstdint>

#include "serlink/stream/flit.hpp"
#include "serlink/stream/payload_layout.hpp"

namespace serlink::framing {

enum class DepacketizerState : std::uint8_t { Preamble, PortLength, Data };

/// @brief Complete registered state of a depacketizer.
struct DepacketizerRegs {
    DepacketizerState state{DepacketizerState::Preamble};
    stream::Port      port{0};
    std::uint16_t     length{0};
    std::uint16_t     count{0};    ///< Payload words already delivered
    std::uint64_t     elapsed{0};  ///< Idle timer, ticks since the preamble matched

    bool operator==(const DepacketizerRegs&) const = default;
};

/// @brief Static parameters of one depacketizer instance.
struct DepacketizerParams {
    stream::Word  payload_mask{~stream::Word{0}};
    unsigned      bytes_per_word{4};
    std::uint64_t timeout_cycles{1};
};

struct DepacketizerInputs {
    stream::WordFlit sink{};            ///< Word offered by the rx buffer
    bool             source_ready{false}; ///< Consumer accepts a payload flit this tick
};

struct DepacketizerOutputs {
    stream::PacketFlit source{};        ///< Payload flit offered to the consumer
    bool sink_ready{false};             ///< Offered word is consumed this tick
    bool discarded{false};              ///< A non-preamble word was dropped while searching
    bool frame_done{false};             ///< Last payload word transferred
    bool timed_out{false};              ///< Partial frame aborted by the idle timer
};

struct DepacketizerStep {
    DepacketizerRegs    next{};
    DepacketizerOutputs out{};
};

/// @brief One tick of the depacketizer.
DepacketizerStep depacketizer_step(const DepacketizerRegs& r, const DepacketizerInputs& in,
                                   const DepacketizerParams& p) noexcept;

/** @class Depacketizer
 *  @brief Registered depacketizer bound to one payload layout.
 */
class Depacketizer {
public:
    /**
     * @param layout         Payload layout recovered from each data word.
     * @param bytes_per_word Divisor applied to the header length.
     * @param timeout_cycles Idle timer interval in ticks (at least 1).
     */
    Depacketizer(stream::PayloadLayout layout, unsigned bytes_per_word,
                 std::uint64_t timeout_cycles);

    /// Evaluate combinational outputs for @p in and advance one tick.
    DepacketizerOutputs tick(const DepacketizerInputs& in) noexcept;

    /// Return to the initial state (link-down).
    void reset() noexcept { regs_ = DepacketizerRegs{}; }

    DepacketizerState state() const noexcept { return regs_.state; }
    /// Port of the frame being delivered (meaningful in Data).
    stream::Port port() const noexcept { return regs_.port; }
    const DepacketizerRegs& regs() const noexcept { return regs_; }
    const DepacketizerParams& params() const noexcept { return params_; }
    const stream::PayloadLayout& layout() const noexcept { return layout_; }

private:
    stream::PayloadLayout layout_;
    DepacketizerParams    params_;
    DepacketizerRegs      regs_{};
};

} // namespace serlink::framing
