#pragma once
/**
 * @file packet_queue.hpp
 * @brief Queue-backed endpoints: whole packets in, flits out (and back).
 */

#include <cstddef>
#include <deque>
#include <vector>

#include "serlink/stream/endpoint.hpp"

namespace serlink::stream {

/** @class PacketQueueSource
 *  @brief Sends queued packets one flit per accept().
 *
 * The port stored in each packet is offered as-is; a link arbiter replaces it
 * with the registered port. A link reset drops the packet in progress, if any
 * of its words were already accepted.
 */
class PacketQueueSource final : public Source {
public:
    /// Queue a packet. Packets without payload words cannot be framed and are refused.
    bool enqueue(Packet p);

    PacketFlit offer() const override;
    void accept() override;
    void on_link_reset() override;

    /// Withhold `valid` (the head packet's port/length stay visible).
    void set_paused(bool paused) noexcept { paused_ = paused; }

    std::size_t pending() const noexcept { return queue_.size(); }
    std::size_t words_sent() const noexcept { return words_sent_; }
    std::size_t packets_sent() const noexcept { return packets_sent_; }
    std::size_t packets_dropped() const noexcept { return packets_dropped_; }

private:
    std::deque<Packet> queue_;
    std::size_t        index_{0};   ///< Next word of the head packet
    bool               paused_{false};
    std::size_t        words_sent_{0};
    std::size_t        packets_sent_{0};
    std::size_t        packets_dropped_{0};
};

/** @class PacketQueueSink
 *  @brief Reassembles delivered flits into packets.
 *
 * A packet is completed by a flit carrying `last`. A link reset, or a `first`
 * flit arriving while a packet is still open, discards the packet being
 * assembled, so no partial packet is ever reported.
 */
class PacketQueueSink final : public Sink {
public:
    bool ready() const override { return !paused_; }
    void deliver(const PacketFlit& flit) override;
    void on_link_reset() override;

    /// Deassert ready (consumer stall).
    void set_paused(bool paused) noexcept { paused_ = paused; }

    const std::vector<Packet>& received() const noexcept { return received_; }
    /// Move out everything received so far.
    std::vector<Packet> take();

    std::size_t flits_seen() const noexcept { return flits_seen_; }
    std::size_t partial_words() const noexcept { return partial_.payload.size(); }
    std::size_t partials_dropped() const noexcept { return partials_dropped_; }

private:
    std::vector<Packet> received_;
    Packet              partial_;
    bool                paused_{false};
    std::size_t         flits_seen_{0};
    std::size_t         partials_dropped_{0};
};

} // namespace serlink::stream
