#pragma once
/**
 * @file endpoint.hpp
 * @brief Producer/consumer interfaces that channels register with a link.
 *
 * Handshake model (one call sequence per tick):
 *  - Source: the link calls offer(); if the returned flit is valid and the
 *    link accepts it in this tick, it calls accept() exactly once.
 *  - Sink:   the link calls ready(); if ready and a valid flit is routed to
 *    the sink, it calls deliver() exactly once.
 * offer() and ready() must not change state; state moves only on accept(),
 * deliver() and on_link_reset(). Once offer() returns a valid flit the arbiter
 * commits the link to that source; dropping `valid` before accept() stalls the
 * whole link until the source offers again. A source must therefore never
 * retract a pending packet, it may only pause it.
 */

#include "serlink/stream/flit.hpp"

namespace serlink::stream {

/** @class Source
 *  @brief Producer side of an endpoint (channel → link).
 */
class Source {
public:
    virtual ~Source() = default;
    /// Current head flit. `valid == false` means nothing to send this tick.
    virtual PacketFlit offer() const = 0;
    /// The flit returned by offer() has been consumed.
    virtual void accept() = 0;
    /// Link went down; drop any partially transmitted packet.
    virtual void on_link_reset() {}
};

/** @class Sink
 *  @brief Consumer side of an endpoint (link → channel).
 */
class Sink {
public:
    virtual ~Sink() = default;
    /// True when deliver() may be called in this tick.
    virtual bool ready() const = 0;
    /// Hand one flit to the consumer.
    virtual void deliver(const PacketFlit& flit) = 0;
    /// Link went down; drop any partially received packet.
    virtual void on_link_reset() {}
};

} // namespace serlink::stream
