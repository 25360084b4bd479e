/**
 * @file axi_lite_master.cpp
 * @brief Request/response queues of the local bus master.
 */
#include "serlink/axi/axi_lite_master.hpp"

namespace serlink::axi {

serlink_detail::expected<void, config::ConfigError> AxiLiteMaster::attach(AxiLiteLinkBuilder& b) {
    if (auto ok = b.attach_source(Channel::AW, aw_); !ok) return ok;
    if (auto ok = b.attach_source(Channel::W,  w_);  !ok) return ok;
    if (auto ok = b.attach_source(Channel::AR, ar_); !ok) return ok;
    if (auto ok = b.attach_sink(Channel::B, b_);     !ok) return ok;
    return b.attach_sink(Channel::R, r_);
}

void AxiLiteMaster::write(std::uint32_t addr, std::uint32_t data, std::uint8_t strb, std::uint8_t prot) {
    aw_.push(layout(Channel::AW).pack({addr, prot}));
    w_.push(layout(Channel::W).pack({data, strb}));
    ++writes_;
}

void AxiLiteMaster::read(std::uint32_t addr, std::uint8_t prot) {
    ar_.push(layout(Channel::AR).pack({addr, prot}));
    ++reads_;
}

std::optional<Resp> AxiLiteMaster::pop_write_response() {
    const auto beat = b_.pop();
    if (!beat) return std::nullopt;
    ++b_done_;
    return static_cast<Resp>(layout(Channel::B).get(*beat, field::kResp));
}

std::optional<ReadResponse> AxiLiteMaster::pop_read_response() {
    const auto beat = r_.pop();
    if (!beat) return std::nullopt;
    ++r_done_;
    const auto& l = layout(Channel::R);
    return ReadResponse{static_cast<std::uint32_t>(l.get(*beat, field::kRData)),
                        static_cast<Resp>(l.get(*beat, field::kRResp))};
}

} // namespace serlink::axi
