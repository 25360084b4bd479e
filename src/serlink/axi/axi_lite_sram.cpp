/**
 * @file axi_lite_sram.cpp
 * @brief Memory model behind the slave end.
 */
#include "serlink/axi/axi_lite_sram.hpp"

namespace serlink::axi {

AxiLiteSram::AxiLiteSram(std::uint32_t base, std::size_t size_words)
    : base_(base), mem_(size_words, 0) {}

serlink_detail::expected<void, config::ConfigError> AxiLiteSram::attach(AxiLiteLinkBuilder& b) {
    if (auto ok = b.attach_sink(Channel::AW, aw_); !ok) return ok;
    if (auto ok = b.attach_sink(Channel::W,  w_);  !ok) return ok;
    if (auto ok = b.attach_sink(Channel::AR, ar_); !ok) return ok;
    if (auto ok = b.attach_source(Channel::B, b_); !ok) return ok;
    return b.attach_source(Channel::R, r_);
}

bool AxiLiteSram::decode(std::uint32_t addr, std::size_t& word) const noexcept {
    if (addr < base_) return false;
    word = (addr - base_) >> 2;
    return word < mem_.size();
}

void AxiLiteSram::tick() {
    // Write needs both its address and data beat.
    if (!aw_.empty() && !w_.empty()) {
        const auto aw = *aw_.pop();
        const auto w  = *w_.pop();
        const auto addr = static_cast<std::uint32_t>(layout(Channel::AW).get(aw, field::kAddr));
        const auto data = static_cast<std::uint32_t>(layout(Channel::W).get(w, field::kData));
        const auto strb = static_cast<std::uint32_t>(layout(Channel::W).get(w, field::kStrb));

        Resp resp = Resp::DecErr;
        std::size_t word = 0;
        if (decode(addr, word)) {
            std::uint32_t mask = 0;
            for (unsigned byte = 0; byte < kStrbBits; ++byte) {
                if (strb & (1u << byte)) mask |= 0xFFu << (8 * byte);
            }
            mem_[word] = (mem_[word] & ~mask) | (data & mask);
            resp = Resp::Okay;
        }
        b_.push(layout(Channel::B).pack({static_cast<stream::Word>(resp)}));
        ++writes_;
    }

    if (const auto ar = ar_.pop()) {
        const auto addr = static_cast<std::uint32_t>(layout(Channel::AR).get(*ar, field::kAddr));
        std::size_t word = 0;
        const bool hit = decode(addr, word);
        const std::uint32_t data = hit ? mem_[word] : 0;
        const Resp resp = hit ? Resp::Okay : Resp::DecErr;
        r_.push(layout(Channel::R).pack({data, static_cast<stream::Word>(resp)}));
        ++reads_;
    }
}

std::uint32_t AxiLiteSram::peek(std::uint32_t addr) const noexcept {
    std::size_t word = 0;
    return decode(addr, word) ? mem_[word] : 0;
}

void AxiLiteSram::poke(std::uint32_t addr, std::uint32_t data) noexcept {
    std::size_t word = 0;
    if (decode(addr, word)) mem_[word] = data;
}

} // namespace serlink::axi
