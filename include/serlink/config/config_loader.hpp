#pragma once
/**
 * @file config_loader.hpp
 * @brief Link configuration aggregate and its `key = value` file loader.
 * @details All defaults reference named constants to avoid magic numbers.
 */

#include <cstdint>
#include <string>
#include <string_view>

#include "serlink/compat/expected.hpp"
#include "serlink/config/config_error.hpp"
#include "serlink/config/constants.hpp"

namespace serlink::config {

    /** @struct LinkConfig
     *  @brief Parameters of one link instance (single-channel core or lane set).
     */
    struct LinkConfig {
        unsigned      word_bits{constants::DEFAULT_WORD_BITS};                ///< Physical word width
        unsigned      bytes_per_word{constants::DEFAULT_BYTES_PER_WORD};      ///< Length field divisor
        std::uint32_t tx_buffer_depth{constants::DEFAULT_TX_BUFFER_DEPTH};    ///< Core transmit buffer
        std::uint32_t rx_buffer_depth{constants::DEFAULT_RX_BUFFER_DEPTH};    ///< Core receive buffer
        std::uint32_t lane_buffer_depth{constants::DEFAULT_LANE_BUFFER_DEPTH};///< Per multi-channel lane
        std::uint64_t clk_freq_hz{constants::DEFAULT_CLK_FREQ_HZ};            ///< Tick rate
        std::uint32_t timeout_s{constants::DEFAULT_TIMEOUT_S};                ///< Depacketizer idle timeout
        bool          reset_on_link_down{constants::DEFAULT_RESET_ON_LINK_DOWN};

        /// Idle timeout in ticks (clk_freq_hz * timeout_s, saturating).
        std::uint64_t timeout_cycles() const noexcept;

        /// Check invariants; the first violated one is reported.
        serlink_detail::expected<void, ConfigError> validate() const;
    };

    /** @class Loader
     *  @brief Source of link configuration (defaults or parsed files).
     *
     * File format: one `key = value` per line, `#` starts a comment, keys are the
     * LinkConfig member names. Absent keys keep their defaults.
     */
    class Loader {
    public:
        /// Defaults, validated.
        static LinkConfig defaults() { return LinkConfig{}; }

        /**
         * @brief Load and validate configuration from a file.
         * @return FileNotFound, ParseError or a validation error on failure.
         */
        static serlink_detail::expected<LinkConfig, ConfigError> load_from_file(const std::string& path);

        /// Same as load_from_file() for in-memory text.
        static serlink_detail::expected<LinkConfig, ConfigError> load_from_string(std::string_view text);
    };

} // namespace serlink::config
