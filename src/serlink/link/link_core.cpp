/**
 * @file link_core.cpp
 * @brief LinkBuilder validation and the per-tick data path of LinkCore.
 */
#include "serlink/link/link_core.hpp"

#include <cassert>
#include <utility>

namespace serlink::link {

using config::ConfigError;
using stream::PacketFlit;
using stream::WordFlit;

namespace {

template <class T>
using Expected = serlink_detail::expected<T, ConfigError>;
using Unexpected = serlink_detail::unexpected<ConfigError>;

} // namespace

//------------------------------- Builder ---------------------------------------

LinkBuilder::LinkBuilder(phy::Transport& phy, config::LinkConfig cfg, std::string_view name)
    : phy_(&phy), cfg_(cfg), name_(name) {}

Expected<void> LinkBuilder::attach_downstream(stream::Port port, stream::Source& source) {
    return downstream_.add(port, source);
}

Expected<void> LinkBuilder::attach_upstream(stream::Port port, stream::Sink& sink) {
    return upstream_.add(port, sink);
}

Expected<LinkCore> LinkBuilder::finalize() && {
    if (auto ok = cfg_.validate(); !ok) return Unexpected(ok.error());
    // The length field counts bytes of whole link words.
    if (cfg_.bytes_per_word * 8 != cfg_.word_bits) return Unexpected(ConfigError::PayloadWidthMismatch);

    auto tx = mem::ElasticBuffer<WordFlit>::with_depth(cfg_.tx_buffer_depth);
    auto rx = mem::ElasticBuffer<WordFlit>::with_depth(cfg_.rx_buffer_depth);
    if (!tx || !rx) return Unexpected(ConfigError::BufferDepthZero);

    return LinkCore(*phy_, cfg_, name_, observer_, downstream_, upstream_,
                    std::move(*tx), std::move(*rx));
}

//------------------------------- Core ------------------------------------------

LinkCore::LinkCore(phy::Transport& phy, const config::LinkConfig& cfg, std::string_view name,
                   obs::Observer* observer,
                   const PortTable<stream::Source>& down, const PortTable<stream::Sink>& up,
                   mem::ElasticBuffer<WordFlit> tx, mem::ElasticBuffer<WordFlit> rx)
    : phy_(&phy),
      cfg_(cfg),
      name_(name),
      observer_(observer),
      sources_(down.endpoints()),
      sinks_(up.endpoints()),
      offers_(down.size()),
      arbiter_(down.ports()),
      packetizer_(stream::PayloadLayout::data(cfg.word_bits)),
      tx_buf_(std::move(tx)),
      rx_buf_(std::move(rx)),
      depacketizer_(stream::PayloadLayout::data(cfg.word_bits), cfg.bytes_per_word,
                    cfg.timeout_cycles()),
      dispatcher_(up.ports()) {}

void LinkCore::emit(obs::LinkEventKind kind, stream::Port port, std::uint16_t length) {
    if (!observer_) return;
    observer_->record(obs::LinkEvent{kind, name_, port, length, cycle_});
}

void LinkCore::tick() {
    ++cycle_;
    link_up_ = phy_->link_ready();

    if (cfg_.reset_on_link_down && !link_up_) {
        hold_reset();
        return;
    }
    if (in_reset_) {
        in_reset_ = false;
        emit(obs::LinkEventKind::LinkUp);
    }

    transmit_path();
    receive_path();
}

void LinkCore::hold_reset() {
    if (!in_reset_) {
        in_reset_ = true;
        emit(obs::LinkEventKind::LinkDown);
        for (auto* s : sources_) s->on_link_reset();
        for (auto* s : sinks_)   s->on_link_reset();
    }
    arbiter_.reset();
    packetizer_.reset();
    depacketizer_.reset();
    tx_buf_.reset();
    rx_buf_.reset();
}

void LinkCore::transmit_path() {
    const bool buf_ready = !tx_buf_.full();

    // Buffer head → transport.
    if (const auto* head = tx_buf_.front(); head && phy_->tx_ready()) {
        phy_->transmit(head->data);
        tx_buf_.drop();
    }

    // Producers → arbiter → packetizer.
    for (std::size_t i = 0; i < sources_.size(); ++i) offers_[i] = sources_[i]->offer();
    const auto grant = arbiter_.arbitrate(offers_);

    PacketFlit in{};
    if (grant) in = arbiter_.stamp(offers_[*grant], *grant);

    const auto out = packetizer_.tick({in, buf_ready});
    if (out.source.valid && buf_ready) {
        [[maybe_unused]] const bool pushed = tx_buf_.push(out.source);
        assert(pushed && "LinkCore: tx buffer full after readiness check");
    }
    if (grant && in.valid && out.sink_ready) {
        sources_[*grant]->accept();
        arbiter_.on_accept(in.last);
        if (in.last) emit(obs::LinkEventKind::FrameSent, in.port, in.length);
    }
}

void LinkCore::receive_path() {
    const bool buf_ready = !rx_buf_.full();

    WordFlit in{};
    if (const auto* head = rx_buf_.front()) in = *head;

    // Frames without a registered consumer are accepted and dropped.
    const auto route = dispatcher_.route(depacketizer_.port());
    const bool source_ready = route ? sinks_[*route]->ready() : true;

    const auto out = depacketizer_.tick({in, source_ready});
    if (in.valid && out.sink_ready) rx_buf_.drop();

    if (out.source.valid && source_ready && route) {
        sinks_[*route]->deliver(out.source);
    }
    if (out.discarded) emit(obs::LinkEventKind::WordDiscarded);
    if (out.timed_out) emit(obs::LinkEventKind::Timeout);
    if (out.frame_done) {
        emit(route ? obs::LinkEventKind::FrameReceived : obs::LinkEventKind::Unrouted,
             out.source.port, out.source.length);
    }

    // Transport → buffer.
    if (buf_ready) {
        if (const auto w = phy_->rx_peek()) {
            [[maybe_unused]] const bool pushed = rx_buf_.push(WordFlit{true, false, *w});
            assert(pushed && "LinkCore: rx buffer full after readiness check");
            phy_->rx_pop();
        }
    }
}

} // namespace serlink::link
