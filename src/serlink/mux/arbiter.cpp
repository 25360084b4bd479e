/**
 * @file arbiter.cpp
 * @brief Round-robin arbiter with per-packet grant locking.
 */
#include "serlink/mux/arbiter.hpp"

#include <algorithm>
#include <utility>

namespace serlink::mux {

Arbiter::Arbiter(std::vector<stream::Port> ports) : ports_(std::move(ports)) {}

std::optional<std::size_t> Arbiter::arbitrate(std::span<const stream::PacketFlit> offers) noexcept {
    const std::size_t n = std::min(offers.size(), ports_.size());
    if (n == 0) return std::nullopt;
    if (locked_) return grant_;

    for (std::size_t k = 0; k < n; ++k) {
        const std::size_t idx = (grant_ + k) % n;
        if (offers[idx].valid) {
            grant_  = idx;
            locked_ = true;
            return idx;
        }
    }
    return std::nullopt;
}

stream::PacketFlit Arbiter::stamp(const stream::PacketFlit& f, std::size_t index) const noexcept {
    stream::PacketFlit out = f;
    out.port = ports_[index];
    return out;
}

void Arbiter::on_accept(bool last) noexcept {
    if (!last) return;
    locked_ = false;
    grant_  = ports_.empty() ? 0 : (grant_ + 1) % ports_.size();
}

} // namespace serlink::mux
