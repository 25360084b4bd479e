#pragma once
/**
 * @file arbiter.hpp
 * @brief Round-robin merge of K port-tagged producers into one packet stream.
 * @details
 *  - Atomicity: the grant locks as soon as a valid flit of the granted producer
 *    is presented downstream and stays locked until that producer's last flit
 *    is accepted. A locked producer that drops `valid` mid-packet stalls the
 *    stream; no other producer is granted meanwhile.
 *  - Fairness: after a packet completes, the search for the next grant starts
 *    at the producer following the one just served.
 *  - Port stamping: the registered port replaces whatever the producer set.
 */

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include "serlink/stream/flit.hpp"

namespace serlink::mux {

/** @class Arbiter
 *  @brief Grant bookkeeping for one packetizer input.
 */
class Arbiter {
public:
    /// @param ports Registered port of each producer, by producer index.
    explicit Arbiter(std::vector<stream::Port> ports);

    /**
     * @brief Pick the producer whose flit is presented this tick.
     * @param offers One offered flit per producer (same order as ports).
     * @return Granted producer index; nullopt when nobody is granted.
     */
    std::optional<std::size_t> arbitrate(std::span<const stream::PacketFlit> offers) noexcept;

    /// Copy of @p f carrying the port registered for producer @p index.
    stream::PacketFlit stamp(const stream::PacketFlit& f, std::size_t index) const noexcept;

    /// The granted flit was accepted downstream; @p last releases the lock.
    void on_accept(bool last) noexcept;

    /// Return to the initial state (link-down).
    void reset() noexcept { grant_ = 0; locked_ = false; }

    bool locked() const noexcept { return locked_; }
    std::size_t grant() const noexcept { return grant_; }
    std::size_t size() const noexcept { return ports_.size(); }

private:
    std::vector<stream::Port> ports_;
    std::size_t               grant_{0};     ///< Current or next-to-consider producer
    bool                      locked_{false};
};

} // namespace serlink::mux
