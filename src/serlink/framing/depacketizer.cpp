/**
 * @file depacketizer.cpp
 * @brief Depacketizer state machine.
 */
#include "serlink/framing/depacketizer.hpp"
#include "serlink/framing/header.hpp"

#include <algorithm>
#include <utility>

namespace serlink::framing {

using stream::PacketFlit;

DepacketizerStep depacketizer_step(const DepacketizerRegs& r, const DepacketizerInputs& in,
                                   const DepacketizerParams& p) noexcept {
    DepacketizerStep s{r, {}};
    auto& n   = s.next;
    auto& out = s.out;

    const bool expired = r.elapsed >= p.timeout_cycles;

    switch (r.state) {
        case DepacketizerState::Preamble:
            out.sink_ready = true;
            n.elapsed = 0;
            if (in.sink.valid) {
                if (in.sink.data == kPreamble) n.state = DepacketizerState::PortLength;
                else                           out.discarded = true;
            }
            return s;

        case DepacketizerState::PortLength:
            if (expired) break;
            out.sink_ready = true;
            if (in.sink.valid) {
                n.port   = header_port(in.sink.data);
                n.length = header_length(in.sink.data);
                n.count  = 0;
                n.state  = DepacketizerState::Data;
            }
            n.elapsed = r.elapsed + 1;
            return s;

        case DepacketizerState::Data: {
            if (expired) break;
            const unsigned words = r.length / std::max(p.bytes_per_word, 1u);
            const bool     last  = words != 0 && r.count == words - 1;
            out.source = PacketFlit{in.sink.valid, r.count == 0, last, r.port, r.length,
                                    in.sink.data & p.payload_mask};
            out.sink_ready = in.source_ready;
            if (in.sink.valid && in.source_ready) {
                n.count = static_cast<std::uint16_t>(r.count + 1);
                if (last) {
                    n.state = DepacketizerState::Preamble;
                    out.frame_done = true;
                }
            }
            n.elapsed = r.elapsed + 1;
            return s;
        }
    }

    // Idle timer expired in PortLength/Data: drop the partial frame.
    n = DepacketizerRegs{};
    out = DepacketizerOutputs{};
    out.timed_out = true;
    return s;
}

Depacketizer::Depacketizer(stream::PayloadLayout layout, unsigned bytes_per_word,
                           std::uint64_t timeout_cycles)
    : layout_(std::move(layout)),
      params_{layout_.mask(), std::max(bytes_per_word, 1u), std::max<std::uint64_t>(timeout_cycles, 1)} {}

DepacketizerOutputs Depacketizer::tick(const DepacketizerInputs& in) noexcept {
    auto step = depacketizer_step(regs_, in, params_);
    regs_ = step.next;
    return step.out;
}

} // namespace serlink::framing
