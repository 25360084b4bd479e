/**
 * @file axi_lite.cpp
 * @brief Lane-per-channel link: builder validation and per-lane data paths.
 */
#include "serlink/axi/axi_lite.hpp"
#include "serlink/config/constants.hpp"

#include <cassert>
#include <utility>

namespace serlink::axi {

using config::ConfigError;
using stream::PacketFlit;
using stream::PayloadField;
using stream::PayloadLayout;
using stream::WordFlit;

namespace {

template <class T>
using Expected = serlink_detail::expected<T, ConfigError>;
using Unexpected = serlink_detail::unexpected<ConfigError>;

PayloadLayout build_layout(std::vector<PayloadField> fields) {
    auto l = PayloadLayout::make(std::move(fields));
    assert(l && "axi: static layout exceeds 64 bits");
    return *l;
}

} // namespace

std::string_view to_string(Channel c) noexcept {
    switch (c) {
        case Channel::AW: return "aw";
        case Channel::W:  return "w";
        case Channel::AR: return "ar";
        case Channel::B:  return "b";
        case Channel::R:  return "r";
    }
    return "?";
}

const PayloadLayout& layout(Channel c) {
    static const std::array<PayloadLayout, kChannelCount> layouts{
        build_layout({{"addr", kAddrBits}, {"prot", kProtBits}}),   // AW
        build_layout({{"data", kDataBits}, {"strb", kStrbBits}}),   // W
        build_layout({{"addr", kAddrBits}, {"prot", kProtBits}}),   // AR
        build_layout({{"resp", kRespBits}}),                        // B
        build_layout({{"data", kDataBits}, {"resp", kRespBits}}),   // R
    };
    return layouts[index(c)];
}

//------------------------------- Builder ---------------------------------------

AxiLiteLinkBuilder::AxiLiteLinkBuilder(Role role, config::LinkConfig cfg, std::string_view name)
    : role_(role), cfg_(cfg), name_(name) {}

Expected<void> AxiLiteLinkBuilder::bind_lane(Channel c, phy::Transport& phy) {
    auto& slot = lanes_[index(c)];
    if (slot) return Unexpected(ConfigError::DuplicateLane);
    slot = &phy;
    return {};
}

Expected<void> AxiLiteLinkBuilder::attach_source(Channel c, stream::Source& src) {
    if (!transmits(role_, c)) return Unexpected(ConfigError::WrongDirection);
    auto& slot = sources_[index(c)];
    if (slot) return Unexpected(ConfigError::DuplicatePort);
    slot = &src;
    return {};
}

Expected<void> AxiLiteLinkBuilder::attach_sink(Channel c, stream::Sink& sink) {
    if (transmits(role_, c)) return Unexpected(ConfigError::WrongDirection);
    auto& slot = sinks_[index(c)];
    if (slot) return Unexpected(ConfigError::DuplicatePort);
    slot = &sink;
    return {};
}

Expected<AxiLiteLink> AxiLiteLinkBuilder::finalize() && {
    if (auto ok = cfg_.validate(); !ok) return Unexpected(ok.error());

    AxiLiteLink link(role_, cfg_, name_, observer_);
    for (const Channel c : kChannels) {
        const auto i = index(c);
        if (!lanes_[i]) return Unexpected(ConfigError::LaneMissing);
        if (layout(c).wire_bits() > config::constants::MAX_WORD_BITS) {
            return Unexpected(ConfigError::PayloadWidthMismatch);
        }

        auto buf = mem::ElasticBuffer<WordFlit>::with_depth(cfg_.lane_buffer_depth);
        if (!buf) return Unexpected(ConfigError::BufferDepthZero);

        if (transmits(role_, c)) {
            if (!sources_[i]) return Unexpected(ConfigError::EndpointMissing);
            link.tx_.push_back(AxiLiteLink::TxLane{
                c, framing::Packetizer(layout(c)), std::move(*buf), sources_[i], lanes_[i]});
        } else {
            if (!sinks_[i]) return Unexpected(ConfigError::EndpointMissing);
            link.rx_.push_back(AxiLiteLink::RxLane{
                c, std::move(*buf),
                framing::Depacketizer(layout(c), cfg_.bytes_per_word, cfg_.timeout_cycles()),
                sinks_[i], lanes_[i]});
        }
    }
    return link;
}

//------------------------------- Link ------------------------------------------

void AxiLiteLink::emit(obs::LinkEventKind kind, Channel c, std::uint16_t length) {
    if (!observer_) return;
    observer_->record(obs::LinkEvent{kind, name_, static_cast<stream::Port>(index(c)), length, cycle_});
}

std::size_t AxiLiteLink::buffered(Channel c) const noexcept {
    for (const auto& l : tx_) if (l.channel == c) return l.buffer.size();
    for (const auto& l : rx_) if (l.channel == c) return l.buffer.size();
    return 0;
}

void AxiLiteLink::tick() {
    ++cycle_;
    link_up_ = true;
    for (const auto& l : tx_) link_up_ = link_up_ && l.phy->link_ready();
    for (const auto& l : rx_) link_up_ = link_up_ && l.phy->link_ready();

    if (cfg_.reset_on_link_down && !link_up_) {
        hold_reset();
        return;
    }
    if (in_reset_) {
        in_reset_ = false;
        if (observer_) observer_->record(obs::LinkEvent{obs::LinkEventKind::LinkUp, name_, 0, 0, cycle_});
    }

    for (auto& l : tx_) step(l);
    for (auto& l : rx_) step(l);
}

void AxiLiteLink::hold_reset() {
    if (!in_reset_) {
        in_reset_ = true;
        if (observer_) observer_->record(obs::LinkEvent{obs::LinkEventKind::LinkDown, name_, 0, 0, cycle_});
        for (auto& l : tx_) l.source->on_link_reset();
        for (auto& l : rx_) l.sink->on_link_reset();
    }
    for (auto& l : tx_) { l.packetizer.reset(); l.buffer.reset(); }
    for (auto& l : rx_) { l.depacketizer.reset(); l.buffer.reset(); }
}

void AxiLiteLink::step(TxLane& l) {
    const bool buf_ready = !l.buffer.full();

    if (const auto* head = l.buffer.front(); head && l.phy->tx_ready()) {
        l.phy->transmit(head->data);
        l.buffer.drop();
    }

    // One beat per packet; port/length/last are owned by the lane.
    PacketFlit in = l.source->offer();
    in.port   = config::constants::PORT_LANE;
    in.length = static_cast<std::uint16_t>(cfg_.bytes_per_word);
    in.first  = true;
    in.last   = true;

    const auto out = l.packetizer.tick({in, buf_ready});
    if (out.source.valid && buf_ready) {
        [[maybe_unused]] const bool pushed = l.buffer.push(out.source);
        assert(pushed && "AxiLiteLink: lane buffer full after readiness check");
    }
    if (in.valid && out.sink_ready) {
        l.source->accept();
        emit(obs::LinkEventKind::FrameSent, l.channel, in.length);
    }
}

void AxiLiteLink::step(RxLane& l) {
    const bool buf_ready = !l.buffer.full();

    WordFlit in{};
    if (const auto* head = l.buffer.front()) in = *head;

    const bool source_ready = l.sink->ready();
    const auto out = l.depacketizer.tick({in, source_ready});
    if (in.valid && out.sink_ready) l.buffer.drop();

    if (out.source.valid && source_ready) l.sink->deliver(out.source);
    if (out.discarded) emit(obs::LinkEventKind::WordDiscarded, l.channel);
    if (out.timed_out) emit(obs::LinkEventKind::Timeout, l.channel);
    if (out.frame_done) emit(obs::LinkEventKind::FrameReceived, l.channel, out.source.length);

    if (buf_ready) {
        if (const auto w = l.phy->rx_peek()) {
            [[maybe_unused]] const bool pushed = l.buffer.push(WordFlit{true, false, *w});
            assert(pushed && "AxiLiteLink: lane buffer full after readiness check");
            l.phy->rx_pop();
        }
    }
}

} // namespace serlink::axi
