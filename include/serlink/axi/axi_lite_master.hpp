#pragma once
/**
 * @file axi_lite_master.hpp
 * @brief Local bus master attached to the master end of an AxiLiteLink.
 * @details Requests are queued as AW+W (write) or AR (read) beats; responses are
 *          popped in arrival order. No ordering is enforced between the write
 *          and read paths.
 */

#include <cstddef>
#include <cstdint>
#include <optional>

#include "serlink/axi/axi_lite.hpp"
#include "serlink/axi/beat_queue.hpp"

namespace serlink::axi {

struct ReadResponse {
    std::uint32_t data{0};
    Resp          resp{Resp::Okay};
};

class AxiLiteMaster {
public:
    AxiLiteMaster() = default;
    AxiLiteMaster(const AxiLiteMaster&)            = delete;
    AxiLiteMaster& operator=(const AxiLiteMaster&) = delete;

    /// Attach AW/W/AR sources and B/R sinks to a master-role builder.
    serlink_detail::expected<void, config::ConfigError> attach(AxiLiteLinkBuilder& b);

    void write(std::uint32_t addr, std::uint32_t data, std::uint8_t strb = 0xF, std::uint8_t prot = 0);
    void read(std::uint32_t addr, std::uint8_t prot = 0);

    std::optional<Resp>         pop_write_response();
    std::optional<ReadResponse> pop_read_response();

    std::size_t outstanding_writes() const noexcept { return writes_ - b_done_; }
    std::size_t outstanding_reads() const noexcept { return reads_ - r_done_; }

private:
    BeatSource  aw_, w_, ar_;
    BeatSink    b_, r_;
    std::size_t writes_{0}, reads_{0}, b_done_{0}, r_done_{0};
};

} // namespace serlink::axi
