/**
 * @file loopback.cpp
 * @brief In-memory transport implementation.
 */
#include "serlink/phy/loopback.hpp"

#include <algorithm>

namespace serlink::phy {

LoopbackLane::LoopbackLane(std::size_t capacity, unsigned ce_divisor) noexcept
    : capacity_(std::max<std::size_t>(capacity, 1)),
      ce_divisor_(std::max(ce_divisor, 1u)) {}

bool LoopbackLane::can_push() const noexcept {
    return phase_ == 0 && words_.size() < capacity_;
}

void LoopbackLane::push(stream::Word w) {
    if (!can_push()) return;
    words_.push_back(w);
}

std::optional<stream::Word> LoopbackLane::peek() const noexcept {
    if (words_.empty()) return std::nullopt;
    return words_.front();
}

void LoopbackLane::pop() noexcept {
    if (!words_.empty()) words_.pop_front();
}

void LoopbackLane::tick() noexcept {
    phase_ = (phase_ + 1) % ce_divisor_;
}

bool LoopbackEnd::link_ready() const { return link_.link_ready(); }

bool LoopbackEnd::tx_ready() const { return link_.link_ready() && tx_.can_push(); }

void LoopbackEnd::transmit(stream::Word w) {
    if (tx_ready()) tx_.push(w);
}

std::optional<stream::Word> LoopbackEnd::rx_peek() const {
    if (!link_.link_ready()) return std::nullopt;
    return rx_.peek();
}

void LoopbackEnd::rx_pop() {
    if (link_.link_ready()) rx_.pop();
}

LoopbackLink::LoopbackLink(LoopbackOptions opts)
    : ab_(opts.lane_capacity, opts.ce_divisor),
      ba_(opts.lane_capacity, opts.ce_divisor),
      a_(*this, ab_, ba_),
      b_(*this, ba_, ab_),
      up_(opts.link_ready) {}

void LoopbackLink::set_link_ready(bool up) noexcept {
    if (!up) {
        ab_.clear();
        ba_.clear();
    }
    up_ = up;
}

} // namespace serlink::phy
