#pragma once
/**
 * @file beat_queue.hpp
 * @brief Single-beat bus endpoints for the lane-per-channel link.
 * @details A beat is one packed payload word (see axi::layout()). Beats are
 *          whole packets, so a link reset leaves nothing half-sent.
 */

#include <cstddef>
#include <deque>
#include <optional>

#include "serlink/stream/endpoint.hpp"

namespace serlink::axi {

/** @class BeatSource
 *  @brief FIFO of beats offered to a transmitting lane.
 */
class BeatSource final : public stream::Source {
public:
    void push(stream::Word beat) { beats_.push_back(beat); }

    stream::PacketFlit offer() const override {
        stream::PacketFlit f;
        if (beats_.empty()) return f;
        f.valid = true;
        f.data  = beats_.front();
        return f;
    }
    void accept() override { if (!beats_.empty()) beats_.pop_front(); }

    std::size_t pending() const noexcept { return beats_.size(); }

private:
    std::deque<stream::Word> beats_;
};

/** @class BeatSink
 *  @brief Bounded FIFO of beats received from a lane; full means not ready.
 */
class BeatSink final : public stream::Sink {
public:
    explicit BeatSink(std::size_t capacity = 16) noexcept : capacity_(capacity) {}

    bool ready() const override { return beats_.size() < capacity_; }
    void deliver(const stream::PacketFlit& flit) override { beats_.push_back(flit.data); }

    std::optional<stream::Word> pop() {
        if (beats_.empty()) return std::nullopt;
        const auto b = beats_.front();
        beats_.pop_front();
        return b;
    }
    bool empty() const noexcept { return beats_.empty(); }
    std::size_t size() const noexcept { return beats_.size(); }

private:
    std::deque<stream::Word> beats_;
    std::size_t              capacity_;
};

} // namespace serlink::axi
