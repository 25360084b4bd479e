/**
 * @file serio.cpp
 * @brief Scalar signal channel.
 */
#include "serlink/link/serio.hpp"

namespace serlink::link {

stream::PacketFlit SerioChannel::Tx::offer() const {
    stream::PacketFlit f;
    f.valid  = dirty || pending;
    f.first  = true;
    f.last   = true;
    f.length = length;
    f.data   = input;
    return f;
}

void SerioChannel::Rx::deliver(const stream::PacketFlit& flit) {
    if (!flit.last) return;
    output = static_cast<std::uint32_t>(flit.data);
    ++updates;
}

serlink_detail::expected<void, config::ConfigError> SerioChannel::attach(LinkBuilder& builder) {
    tx_.length = static_cast<std::uint16_t>(builder.config().bytes_per_word);
    if (auto ok = builder.attach_downstream(port_, tx_); !ok) return ok;
    return builder.attach_upstream(port_, rx_);
}

} // namespace serlink::link
