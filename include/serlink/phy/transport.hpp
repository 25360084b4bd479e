#pragma once
/**
 * @file transport.hpp
 * @brief Physical transport seen by the link: duplex word stream + link status.
 */

#include <optional>

#include "serlink/stream/flit.hpp"

namespace serlink::phy {

/** @class Transport
 *  @brief One end of a physical lane pair (serdes + link training live behind it).
 */
class Transport {
public:
    virtual ~Transport() = default;

    /// Link trained and usable.
    virtual bool link_ready() const = 0;

    /// transmit() may be called in this tick.
    virtual bool tx_ready() const = 0;
    /// Send one word. Only valid when tx_ready().
    virtual void transmit(stream::Word w) = 0;

    /// Oldest received word not yet consumed.
    virtual std::optional<stream::Word> rx_peek() const = 0;
    /// Consume the word returned by rx_peek().
    virtual void rx_pop() = 0;
};

} // namespace serlink::phy
