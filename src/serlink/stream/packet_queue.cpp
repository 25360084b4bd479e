/**
 * @file packet_queue.cpp
 * @brief Queue-backed source and sink endpoints.
 */
#include "serlink/stream/packet_queue.hpp"

#include <utility>

namespace serlink::stream {

bool PacketQueueSource::enqueue(Packet p) {
    if (p.payload.empty()) return false;
    queue_.push_back(std::move(p));
    return true;
}

PacketFlit PacketQueueSource::offer() const {
    if (queue_.empty()) return {};
    const auto& head = queue_.front();
    PacketFlit f;
    f.valid  = !paused_;
    f.first  = index_ == 0;
    f.last   = index_ + 1 == head.payload.size();
    f.port   = head.port;
    f.length = head.length;
    f.data   = head.payload[index_];
    return f;
}

void PacketQueueSource::accept() {
    if (queue_.empty()) return;
    ++words_sent_;
    if (++index_ == queue_.front().payload.size()) {
        queue_.pop_front();
        index_ = 0;
        ++packets_sent_;
    }
}

void PacketQueueSource::on_link_reset() {
    if (index_ == 0 || queue_.empty()) return;
    queue_.pop_front();
    index_ = 0;
    ++packets_dropped_;
}

void PacketQueueSink::deliver(const PacketFlit& flit) {
    ++flits_seen_;
    if (flit.first && !partial_.payload.empty()) {
        partial_ = Packet{};
        ++partials_dropped_;
    }
    if (partial_.payload.empty()) {
        partial_.port   = flit.port;
        partial_.length = flit.length;
    }
    partial_.payload.push_back(flit.data);
    if (flit.last) {
        received_.push_back(std::move(partial_));
        partial_ = Packet{};
    }
}

void PacketQueueSink::on_link_reset() {
    if (!partial_.payload.empty()) ++partials_dropped_;
    partial_ = Packet{};
}

std::vector<Packet> PacketQueueSink::take() {
    std::vector<Packet> out;
    out.swap(received_);
    return out;
}

} // namespace serlink::stream
