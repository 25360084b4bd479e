#pragma once
/**
 * @file payload_layout.hpp
 * @brief Ordered (field name, bit width) descriptor for multi-field payloads.
 * @details Fields are packed LSB-first in list order. A plain data stream is the
 *          single-field layout {"data", W}.
 */

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

#include "serlink/compat/expected.hpp"
#include "serlink/config/config_error.hpp"
#include "serlink/stream/flit.hpp"

namespace serlink::stream {

/** @struct PayloadField
 *  @brief One named bit field of a payload word.
 */
struct PayloadField {
    std::string name;   ///< Field name, e.g. "addr"
    unsigned    bits{0};///< Field width in bits

    bool operator==(const PayloadField&) const = default;
};

/** @class PayloadLayout
 *  @brief Immutable field list plus derived offsets and masks.
 */
class PayloadLayout {
public:
    /**
     * @brief Build and validate a layout.
     * @return PayloadWidthMismatch if the fields are empty, a field is zero-width,
     *         or the total exceeds 64 bits.
     */
    static serlink_detail::expected<PayloadLayout, config::ConfigError>
    make(std::vector<PayloadField> fields);

    /// Single "data" field of @p bits width.
    static PayloadLayout data(unsigned bits);

    /// Sum of field widths.
    unsigned bits() const noexcept { return bits_; }

    /// Mask covering all payload bits.
    Word mask() const noexcept;

    /// Bit offset of field @p index.
    unsigned offset(std::size_t index) const noexcept { return offsets_[index]; }

    const std::vector<PayloadField>& fields() const noexcept { return fields_; }

    /**
     * @brief Pack values (one per field, list order) into a payload word.
     * Missing trailing values are zero; excess bits of each value are masked off.
     */
    Word pack(std::initializer_list<Word> values) const noexcept;

    /// Extract field @p index from @p w.
    Word get(Word w, std::size_t index) const noexcept;

    /// Extract field by name; 0 when the name is unknown.
    Word get(Word w, std::string_view name) const noexcept;

    /// Physical word width needed to carry this layout plus preamble/header.
    unsigned wire_bits() const noexcept;

    bool operator==(const PayloadLayout& o) const noexcept { return fields_ == o.fields_; }

private:
    PayloadLayout() = default;

    std::vector<PayloadField> fields_;
    std::vector<unsigned>     offsets_;
    unsigned                  bits_{0};
};

/// All-ones mask of @p bits width (bits in [0, 64]).
constexpr Word low_mask(unsigned bits) noexcept {
    return bits >= 64 ? ~Word{0} : ((Word{1} << bits) - 1);
}

} // namespace serlink::stream
