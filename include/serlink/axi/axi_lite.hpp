#pragma once
/**
 * @file axi_lite.hpp
 * @brief Multi-channel variant for an AXI-lite style split bus.
 *
 * Five sub-channels, each on its own physical lane with its own packetizer or
 * depacketizer and buffer; no arbiter or dispatcher since lanes are never
 * shared. Request channels (AW, W, AR) flow master → slave, response channels
 * (B, R) flow slave → master; the two roles are mirror images.
 *
 * Every bus beat travels as a one-word packet: port PORT_LANE, length one word
 * of bytes, `last` set. Lane word width is max(32, payload bits) so the
 * preamble and header always fit.
 *
 * Link-down: any lane reporting not-ready resets every sub-channel (when
 * reset_on_link_down is set), matching the single-lane LinkCore.
 */

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

#include "serlink/compat/expected.hpp"
#include "serlink/config/config_error.hpp"
#include "serlink/config/config_loader.hpp"
#include "serlink/framing/depacketizer.hpp"
#include "serlink/framing/packetizer.hpp"
#include "serlink/mem/elastic_buffer.hpp"
#include "serlink/obs/observability.hpp"
#include "serlink/phy/transport.hpp"
#include "serlink/stream/endpoint.hpp"
#include "serlink/stream/payload_layout.hpp"

namespace serlink::axi {

/// Bus geometry.
inline constexpr unsigned kAddrBits = 32;
inline constexpr unsigned kDataBits = 32;
inline constexpr unsigned kStrbBits = kDataBits / 8;
inline constexpr unsigned kProtBits = 3;
inline constexpr unsigned kRespBits = 2;

enum class Channel : std::uint8_t { AW = 0, W, AR, B, R };
inline constexpr std::size_t kChannelCount = 5;
inline constexpr std::array<Channel, kChannelCount> kChannels{
    Channel::AW, Channel::W, Channel::AR, Channel::B, Channel::R};

enum class Role : std::uint8_t { Master, Slave };

/// Response codes carried on B and R.
enum class Resp : std::uint8_t { Okay = 0, ExOkay = 1, SlvErr = 2, DecErr = 3 };

/// Field indices inside each channel's layout.
namespace field {
inline constexpr std::size_t kAddr = 0, kProt = 1;  ///< AW, AR
inline constexpr std::size_t kData = 0, kStrb = 1;  ///< W
inline constexpr std::size_t kResp = 0;             ///< B
inline constexpr std::size_t kRData = 0, kRResp = 1;///< R
} // namespace field

constexpr bool is_request(Channel c) noexcept {
    return c == Channel::AW || c == Channel::W || c == Channel::AR;
}

/// True when @p role packetizes (sends) sub-channel @p c.
constexpr bool transmits(Role role, Channel c) noexcept {
    return is_request(c) == (role == Role::Master);
}

constexpr std::size_t index(Channel c) noexcept { return static_cast<std::size_t>(c); }

std::string_view to_string(Channel c) noexcept;

/// Payload layout of sub-channel @p c: AW/AR {addr, prot}, W {data, strb},
/// B {resp}, R {data, resp}.
const stream::PayloadLayout& layout(Channel c);

class AxiLiteLink;

/** @class AxiLiteLinkBuilder
 *  @brief Binds lanes and bus endpoints for one role, then builds the link.
 */
class AxiLiteLinkBuilder {
public:
    AxiLiteLinkBuilder(Role role, config::LinkConfig cfg, std::string_view name = "axi-lite");

    /// Dedicate physical lane @p phy to sub-channel @p c.
    serlink_detail::expected<void, config::ConfigError> bind_lane(Channel c, phy::Transport& phy);

    /// Bus-side producer for a sub-channel this role sends.
    serlink_detail::expected<void, config::ConfigError> attach_source(Channel c, stream::Source& src);

    /// Bus-side consumer for a sub-channel this role receives.
    serlink_detail::expected<void, config::ConfigError> attach_sink(Channel c, stream::Sink& sink);

    AxiLiteLinkBuilder& observer(obs::Observer* o) noexcept { observer_ = o; return *this; }

    Role role() const noexcept { return role_; }

    /// Validate (every lane bound, every endpoint attached) and build.
    serlink_detail::expected<AxiLiteLink, config::ConfigError> finalize() &&;

private:
    Role                                        role_;
    config::LinkConfig                          cfg_;
    std::string_view                            name_;
    obs::Observer*                              observer_{nullptr};
    std::array<phy::Transport*, kChannelCount>  lanes_{};
    std::array<stream::Source*, kChannelCount>  sources_{};
    std::array<stream::Sink*, kChannelCount>    sinks_{};
};

/** @class AxiLiteLink
 *  @brief One endpoint (master or slave) of the lane-per-channel link.
 */
class AxiLiteLink {
public:
    AxiLiteLink(AxiLiteLink&&) noexcept            = default;
    AxiLiteLink& operator=(AxiLiteLink&&) noexcept = default;

    /// Advance every sub-channel by one clock.
    void tick();

    Role role() const noexcept { return role_; }
    bool link_ready() const noexcept { return link_up_; }
    std::uint64_t cycles() const noexcept { return cycle_; }

    /// Words waiting in the buffer of sub-channel @p c.
    std::size_t buffered(Channel c) const noexcept;

private:
    friend class AxiLiteLinkBuilder;

    struct TxLane {
        Channel                              channel;
        framing::Packetizer                  packetizer;
        mem::ElasticBuffer<stream::WordFlit> buffer;
        stream::Source*                      source;
        phy::Transport*                      phy;
    };

    struct RxLane {
        Channel                              channel;
        mem::ElasticBuffer<stream::WordFlit> buffer;
        framing::Depacketizer                depacketizer;
        stream::Sink*                        sink;
        phy::Transport*                      phy;
    };

    AxiLiteLink(Role role, const config::LinkConfig& cfg, std::string_view name,
                obs::Observer* observer) noexcept
        : role_(role), cfg_(cfg), name_(name), observer_(observer) {}

    void step(TxLane& l);
    void step(RxLane& l);
    void hold_reset();
    void emit(obs::LinkEventKind kind, Channel c, std::uint16_t length = 0);

    Role                 role_;
    config::LinkConfig   cfg_;
    std::string_view     name_;
    obs::Observer*       observer_;
    std::vector<TxLane>  tx_;
    std::vector<RxLane>  rx_;
    std::uint64_t        cycle_{0};
    bool                 link_up_{true};
    bool                 in_reset_{false};
};

} // namespace serlink::axi
