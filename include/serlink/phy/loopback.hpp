#pragma once
/**
 * @file loopback.hpp
 * @brief In-memory physical layer for benches, tools and tests.
 *
 * LoopbackLink owns two one-directional lanes and exposes both ends as
 * Transports. While the link is down neither end can send and everything in
 * flight is dropped. A clock-enable divisor makes each lane accept words only
 * one tick out of N, like a serdes running slower than the fabric clock. The
 * owner advances pacing with LoopbackLink::tick().
 */

#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>

#include "serlink/phy/transport.hpp"

namespace serlink::phy {

/** @struct LoopbackOptions
 *  @brief Lane capacity and pacing.
 */
struct LoopbackOptions {
    std::size_t lane_capacity{64}; ///< Words in flight per direction
    unsigned    ce_divisor{1};     ///< Lane accepts one word every ce_divisor ticks
    bool        link_ready{true};  ///< Initial link status
};

/** @class LoopbackLane
 *  @brief Bounded one-directional word pipe.
 */
class LoopbackLane {
public:
    LoopbackLane(std::size_t capacity, unsigned ce_divisor) noexcept;

    bool can_push() const noexcept;
    void push(stream::Word w);
    std::optional<stream::Word> peek() const noexcept;
    void pop() noexcept;
    /// Advance the clock-enable phase; push() is allowed on enabled ticks only.
    void tick() noexcept;
    void clear() noexcept { words_.clear(); }
    std::size_t size() const noexcept { return words_.size(); }

private:
    std::deque<stream::Word> words_;
    std::size_t              capacity_;
    unsigned                 ce_divisor_;
    unsigned                 phase_{0};
};

class LoopbackLink;

/** @class LoopbackEnd
 *  @brief One side of a LoopbackLink.
 */
class LoopbackEnd final : public Transport {
public:
    bool link_ready() const override;
    bool tx_ready() const override;
    void transmit(stream::Word w) override;
    std::optional<stream::Word> rx_peek() const override;
    void rx_pop() override;

private:
    friend class LoopbackLink;
    LoopbackEnd(LoopbackLink& link, LoopbackLane& tx, LoopbackLane& rx) noexcept
        : link_(link), tx_(tx), rx_(rx) {}

    LoopbackLink& link_;
    LoopbackLane& tx_;
    LoopbackLane& rx_;
};

/** @class LoopbackLink
 *  @brief Two lanes, two ends, one shared link status.
 */
class LoopbackLink {
public:
    explicit LoopbackLink(LoopbackOptions opts = {});

    LoopbackLink(const LoopbackLink&)            = delete;
    LoopbackLink& operator=(const LoopbackLink&) = delete;

    Transport& a() noexcept { return a_; }
    Transport& b() noexcept { return b_; }

    /// Lane carrying words sent by end A (for fault injection in tests).
    LoopbackLane& a_to_b() noexcept { return ab_; }
    LoopbackLane& b_to_a() noexcept { return ba_; }

    /// Change link status; going down drops all words in flight.
    void set_link_ready(bool up) noexcept;
    bool link_ready() const noexcept { return up_; }

    /// Advance both lanes by one tick.
    void tick() noexcept { ab_.tick(); ba_.tick(); }

private:
    LoopbackLane ab_;
    LoopbackLane ba_;
    LoopbackEnd  a_;
    LoopbackEnd  b_;
    bool         up_;
};

} // namespace serlink::phy
