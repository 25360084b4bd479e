#pragma once
/**
 * @file serio.hpp
 * @brief Scalar signal channel: mirrors a 32-bit value across the link.
 *
 * Transmit: whenever the sampled input differs from the last value accepted by
 * the link, a one-word packet (length = one word of bytes) is offered. Once
 * raised, the offer stays valid until accepted and carries the latest input. Receive: always ready; the
 * payload of every last word becomes the output. After a link reset the current
 * input is sent again so the far side resynchronizes.
 */

#include <cstdint>

#include "serlink/compat/expected.hpp"
#include "serlink/config/config_error.hpp"
#include "serlink/config/constants.hpp"
#include "serlink/link/link_core.hpp"
#include "serlink/stream/endpoint.hpp"

namespace serlink::link {

class SerioChannel {
public:
    explicit SerioChannel(stream::Port port = config::constants::PORT_SERIO) noexcept : port_(port) {}

    SerioChannel(const SerioChannel&)            = delete;
    SerioChannel& operator=(const SerioChannel&) = delete;

    /// Register both directions with @p builder under this channel's port.
    serlink_detail::expected<void, config::ConfigError> attach(LinkBuilder& builder);

    /// Sample a new local input value.
    void set_input(std::uint32_t v) noexcept {
        tx_.input = v;
        if (v != tx_.sent) tx_.pending = true;
    }
    /// Last value received from the far side.
    std::uint32_t output() const noexcept { return rx_.output; }
    /// Number of updates received.
    std::uint64_t updates() const noexcept { return rx_.updates; }

    stream::Port port() const noexcept { return port_; }

private:
    struct Tx final : stream::Source {
        stream::PacketFlit offer() const override;
        void accept() override { sent = input; pending = false; dirty = false; }
        void on_link_reset() override { dirty = true; }

        std::uint32_t input{0};
        std::uint32_t sent{0};
        std::uint16_t length{config::constants::DEFAULT_BYTES_PER_WORD};
        bool          pending{false}; ///< Input changed since the last accepted update
        bool          dirty{false};   ///< Resend after a link reset
    };

    struct Rx final : stream::Sink {
        bool ready() const override { return true; }
        void deliver(const stream::PacketFlit& flit) override;

        std::uint32_t output{0};
        std::uint64_t updates{0};
    };

    stream::Port port_;
    Tx           tx_;
    Rx           rx_;
};

} // namespace serlink::link
