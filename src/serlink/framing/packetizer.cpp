/**
 * @file packetizer.cpp
 * @brief Packetizer state machine.
 */
#include "serlink/framing/packetizer.hpp"
#include "serlink/framing/header.hpp"

#include <utility>

namespace serlink::framing {

using stream::Word;
using stream::WordFlit;

PacketizerStep packetizer_step(PacketizerState s, const PacketizerInputs& in,
                               Word payload_mask) noexcept {
    PacketizerStep r{s, {}};
    switch (s) {
        case PacketizerState::Preamble:
            if (in.sink.valid) {
                r.out.source = WordFlit{true, false, kPreamble};
                if (in.source_ready) r.next = PacketizerState::PortLength;
            }
            break;

        case PacketizerState::PortLength:
            r.out.source = WordFlit{true, false, encode_header(in.sink.port, in.sink.length)};
            if (in.source_ready) r.next = PacketizerState::Data;
            break;

        case PacketizerState::Data:
            r.out.source   = WordFlit{in.sink.valid, in.sink.last, in.sink.data & payload_mask};
            r.out.sink_ready = in.source_ready;
            if (in.sink.valid && in.source_ready && in.sink.last) {
                r.next = PacketizerState::Preamble;
            }
            break;
    }
    return r;
}

Packetizer::Packetizer(stream::PayloadLayout layout)
    : layout_(std::move(layout)), mask_(layout_.mask()) {}

PacketizerOutputs Packetizer::tick(const PacketizerInputs& in) noexcept {
    const auto step = packetizer_step(state_, in, mask_);
    state_ = step.next;
    return step.out;
}

std::vector<Word> encode_frame(const stream::Packet& p) {
    std::vector<Word> out;
    out.reserve(p.payload.size() + 2);
    out.push_back(kPreamble);
    out.push_back(encode_header(p.port, p.length));
    out.insert(out.end(), p.payload.begin(), p.payload.end());
    return out;
}

} // namespace serlink::framing
