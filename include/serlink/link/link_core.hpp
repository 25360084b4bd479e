#pragma once
/**
 * @file link_core.hpp
 * @brief Single-lane link: arbiter → packetizer → tx buffer → transport →
 *        rx buffer → depacketizer → dispatcher.
 *
 * Composition:
 *  - LinkBuilder collects endpoints per direction (attach_downstream /
 *    attach_upstream), then finalize() validates the configuration and freezes
 *    the tables into index-addressed arrays owned by LinkCore.
 *  - Endpoints and the transport are borrowed; they must outlive the core.
 *
 * Tick model: every readiness decision uses the state at the start of the tick,
 * so a full buffer never accepts a word in the same tick it frees a slot.
 *
 * Link-down (when reset_on_link_down is set): while the transport reports
 * not-ready, the packetizer, depacketizer, arbiter and both buffers are held in
 * their initial state. Endpoints get on_link_reset() once per down transition.
 */

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

#include "serlink/compat/expected.hpp"
#include "serlink/config/config_error.hpp"
#include "serlink/config/config_loader.hpp"
#include "serlink/framing/depacketizer.hpp"
#include "serlink/framing/packetizer.hpp"
#include "serlink/link/port_table.hpp"
#include "serlink/mem/elastic_buffer.hpp"
#include "serlink/mux/arbiter.hpp"
#include "serlink/mux/dispatcher.hpp"
#include "serlink/obs/observability.hpp"
#include "serlink/phy/transport.hpp"
#include "serlink/stream/endpoint.hpp"

namespace serlink::link {

class LinkCore;

/** @class LinkBuilder
 *  @brief Registration API; produces a LinkCore once all channels are attached.
 */
class LinkBuilder {
public:
    /// @param name Instance label used in observer events (static lifetime).
    LinkBuilder(phy::Transport& phy, config::LinkConfig cfg, std::string_view name = "link");

    /// Attach a producer (channel → link) under @p port.
    serlink_detail::expected<void, config::ConfigError>
    attach_downstream(stream::Port port, stream::Source& source);

    /// Attach a consumer (link → channel) under @p port.
    serlink_detail::expected<void, config::ConfigError>
    attach_upstream(stream::Port port, stream::Sink& sink);

    /// Optional observer; null disables observation.
    LinkBuilder& observer(obs::Observer* o) noexcept { observer_ = o; return *this; }

    const config::LinkConfig& config() const noexcept { return cfg_; }

    /**
     * @brief Validate and build. Consumes the builder.
     * @return A LinkConfig::validate() error, or PayloadWidthMismatch when
     *         bytes_per_word * 8 != word_bits.
     */
    serlink_detail::expected<LinkCore, config::ConfigError> finalize() &&;

private:
    phy::Transport*           phy_;
    config::LinkConfig        cfg_;
    std::string_view          name_;
    obs::Observer*            observer_{nullptr};
    PortTable<stream::Source> downstream_;
    PortTable<stream::Sink>   upstream_;
};

/** @class LinkCore
 *  @brief Finalized, immutable composition advanced by tick().
 */
class LinkCore {
public:
    LinkCore(LinkCore&&) noexcept            = default;
    LinkCore& operator=(LinkCore&&) noexcept = default;
    LinkCore(const LinkCore&)                = delete;
    LinkCore& operator=(const LinkCore&)     = delete;

    /// Advance the whole stack by one clock.
    void tick();

    /// Transport status as sampled on the last tick.
    bool link_ready() const noexcept { return link_up_; }
    std::uint64_t cycles() const noexcept { return cycle_; }

    std::size_t tx_buffered() const noexcept { return tx_buf_.size(); }
    std::size_t rx_buffered() const noexcept { return rx_buf_.size(); }
    std::size_t downstream_count() const noexcept { return sources_.size(); }
    std::size_t upstream_count() const noexcept { return sinks_.size(); }

    const framing::Packetizer&   packetizer() const noexcept { return packetizer_; }
    const framing::Depacketizer& depacketizer() const noexcept { return depacketizer_; }
    const mux::Arbiter&          arbiter() const noexcept { return arbiter_; }
    const config::LinkConfig&    config() const noexcept { return cfg_; }

private:
    friend class LinkBuilder;

    LinkCore(phy::Transport& phy, const config::LinkConfig& cfg, std::string_view name,
             obs::Observer* observer,
             const PortTable<stream::Source>& down, const PortTable<stream::Sink>& up,
             mem::ElasticBuffer<stream::WordFlit> tx, mem::ElasticBuffer<stream::WordFlit> rx);

    void transmit_path();
    void receive_path();
    void hold_reset();
    void emit(obs::LinkEventKind kind, stream::Port port = 0, std::uint16_t length = 0);

    phy::Transport*                      phy_;
    config::LinkConfig                   cfg_;
    std::string_view                     name_;
    obs::Observer*                       observer_;

    std::vector<stream::Source*>         sources_;
    std::vector<stream::Sink*>           sinks_;
    std::vector<stream::PacketFlit>      offers_;   ///< Scratch, one per source

    mux::Arbiter                         arbiter_;
    framing::Packetizer                  packetizer_;
    mem::ElasticBuffer<stream::WordFlit> tx_buf_;
    mem::ElasticBuffer<stream::WordFlit> rx_buf_;
    framing::Depacketizer                depacketizer_;
    mux::Dispatcher                      dispatcher_;

    std::uint64_t                        cycle_{0};
    bool                                 link_up_{true};
    bool                                 in_reset_{false};
};

} // namespace serlink::link
