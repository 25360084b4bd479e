#pragma once
/**
 * @file config_error.hpp
 * @brief Composition-time error codes shared by every builder in serlink.
 */

#include <cstdint>
#include <string_view>

namespace serlink::config {

/**
 * @brief Errors detected while composing or configuring a link.
 * These are fatal for setup and are never produced on the tick path.
 */
enum class ConfigError : std::uint8_t {
    DuplicatePort = 1,     ///< Port already registered in that direction
    WordWidthInvalid,      ///< Word width outside [32, 64] bits
    PayloadWidthMismatch,  ///< Payload layout does not fit the word width
    BytesPerWordInvalid,   ///< Zero bytes per word
    BufferDepthZero,       ///< Buffer depth must not be zero
    TimeoutZero,           ///< Idle timeout interval must not be zero
    WrongDirection,        ///< Endpoint attached to a sub-channel of the opposite direction
    LaneMissing,           ///< Multi-channel variant is missing a physical lane
    DuplicateLane,         ///< Sub-channel already bound to a physical lane
    EndpointMissing,       ///< Sub-channel has no attached endpoint
    FileNotFound,          ///< Config file could not be opened
    ParseError             ///< Config file line is malformed or has an unknown key
};

/// Stable label for logs and CLI messages.
std::string_view to_string(ConfigError e) noexcept;

} // namespace serlink::config
