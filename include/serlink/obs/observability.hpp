#pragma once
/**
 * @file observability.hpp
 * @brief Minimal observability facade: link events + counters.
 * @details The framing layer never reports errors upstream; anomalies are only
 *          visible here. Replace the backing implementation with spdlog/OpenTelemetry later.
 */

#include <cstdint>
#include <memory>
#include <string_view>

#include "serlink/stream/flit.hpp"

namespace serlink::obs {

    /** @enum LinkEventKind
     *  @brief What happened on a link.
     */
    enum class LinkEventKind : std::uint8_t {
        FrameSent,        ///< Last payload word of a frame entered the tx buffer
        FrameReceived,    ///< Last payload word of a frame reached its consumer
        WordDiscarded,    ///< Non-preamble word dropped during resynchronization
        Timeout,          ///< Depacketizer idle timer aborted a partial frame
        Unrouted,         ///< Complete frame whose port has no consumer (dropped)
        LinkDown,         ///< Link-status went low; stack reset
        LinkUp            ///< Link-status returned high
    };

    /// Stable label for logs.
    std::string_view to_string(LinkEventKind k) noexcept;

    /** @struct Counters
     *  @brief Cumulative counters for one observer.
     */
    struct Counters {
        uint64_t frames_sent{0};      ///< Frames handed to the transmit buffer
        uint64_t frames_received{0};  ///< Frames delivered to a consumer
        uint64_t words_discarded{0};  ///< Words dropped while hunting for a preamble
        uint64_t timeouts{0};         ///< Partial frames aborted by the idle timer
        uint64_t unrouted_frames{0};  ///< Frames dropped for lack of a consumer
        uint64_t link_resets{0};      ///< Link-down transitions

        bool operator==(const Counters&) const = default;
    };

    /** @struct LinkEvent
     *  @brief Payload describing a single link event.
     */
    struct LinkEvent {
        LinkEventKind    kind{LinkEventKind::FrameSent};
        std::string_view link;          ///< Link instance name (static lifetime)
        stream::Port     port{0};       ///< Port of the frame, when applicable
        std::uint16_t    length{0};     ///< Length field of the frame, when applicable
        std::uint64_t    cycle{0};      ///< Tick count of the emitting link
    };

    /** @class Observer
     *  @brief Observability sink interface.
     */
    class Observer {
    public:
        virtual ~Observer() = default;
        /// Record a single link event.
        virtual void record(const LinkEvent& e) = 0;
        /// Return a snapshot of counters.
        virtual Counters snapshot() const = 0;
    };

    /// Process-wide observer printing anomalies as JSON-ish lines on stdout.
    Observer* make_simple_observer();

    /// Fresh counting-only observer (no output); for tests, benches, per-link stats.
    std::unique_ptr<Observer> make_counting_observer();

} // namespace serlink::obs
