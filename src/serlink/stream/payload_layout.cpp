/**
 * @file payload_layout.cpp
 * @brief PayloadLayout construction, packing and extraction.
 */
#include "serlink/stream/payload_layout.hpp"
#include "serlink/config/constants.hpp"

#include <algorithm>
#include <utility>

namespace serlink::stream {

using serlink::config::ConfigError;

serlink_detail::expected<PayloadLayout, ConfigError>
PayloadLayout::make(std::vector<PayloadField> fields) {
    if (fields.empty()) {
        return serlink_detail::unexpected<ConfigError>(ConfigError::PayloadWidthMismatch);
    }
    PayloadLayout l;
    unsigned off = 0;
    for (const auto& f : fields) {
        if (f.bits == 0 || off + f.bits > config::constants::MAX_WORD_BITS) {
            return serlink_detail::unexpected<ConfigError>(ConfigError::PayloadWidthMismatch);
        }
        l.offsets_.push_back(off);
        off += f.bits;
    }
    l.fields_ = std::move(fields);
    l.bits_   = off;
    return l;
}

PayloadLayout PayloadLayout::data(unsigned bits) {
    PayloadLayout l;
    l.bits_ = std::clamp(bits, 1u, config::constants::MAX_WORD_BITS);
    l.fields_.push_back(PayloadField{"data", l.bits_});
    l.offsets_.push_back(0);
    return l;
}

Word PayloadLayout::mask() const noexcept {
    return low_mask(bits_);
}

Word PayloadLayout::pack(std::initializer_list<Word> values) const noexcept {
    Word w = 0;
    std::size_t i = 0;
    for (Word v : values) {
        if (i == fields_.size()) break;
        w |= (v & low_mask(fields_[i].bits)) << offsets_[i];
        ++i;
    }
    return w;
}

Word PayloadLayout::get(Word w, std::size_t index) const noexcept {
    if (index >= fields_.size()) return 0;
    return (w >> offsets_[index]) & low_mask(fields_[index].bits);
}

Word PayloadLayout::get(Word w, std::string_view name) const noexcept {
    for (std::size_t i = 0; i < fields_.size(); ++i) {
        if (fields_[i].name == name) return get(w, i);
    }
    return 0;
}

unsigned PayloadLayout::wire_bits() const noexcept {
    return std::max(bits_, config::constants::MIN_WORD_BITS);
}

} // namespace serlink::stream
