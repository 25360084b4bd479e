#pragma once
/**
 * @file axi_lite_sram.hpp
 * @brief Word-addressed memory served behind the slave end of an AxiLiteLink.
 * @details Serves at most one write (AW+W pair) and one read per tick.
 *          Addresses outside [base, base + 4*size) answer DECERR; reads return
 *          zero data then. Byte strobes select which bytes a write updates.
 */

#include <cstddef>
#include <cstdint>
#include <vector>

#include "serlink/axi/axi_lite.hpp"
#include "serlink/axi/beat_queue.hpp"

namespace serlink::axi {

class AxiLiteSram {
public:
    AxiLiteSram(std::uint32_t base, std::size_t size_words);
    AxiLiteSram(const AxiLiteSram&)            = delete;
    AxiLiteSram& operator=(const AxiLiteSram&) = delete;

    /// Attach AW/W/AR sinks and B/R sources to a slave-role builder.
    serlink_detail::expected<void, config::ConfigError> attach(AxiLiteLinkBuilder& b);

    /// Serve pending requests (one write, one read).
    void tick();

    /// Direct access for checks; out-of-range addresses read as 0 / are ignored.
    std::uint32_t peek(std::uint32_t addr) const noexcept;
    void poke(std::uint32_t addr, std::uint32_t data) noexcept;

    std::size_t writes_served() const noexcept { return writes_; }
    std::size_t reads_served() const noexcept { return reads_; }

private:
    bool decode(std::uint32_t addr, std::size_t& word) const noexcept;

    std::uint32_t              base_;
    std::vector<std::uint32_t> mem_;
    BeatSink                   aw_, w_, ar_;
    BeatSource                 b_, r_;
    std::size_t                writes_{0}, reads_{0};
};

} // namespace serlink::axi
