/**
* @file config_loader.cpp
 * @brief `key = value` parser for LinkConfig plus validation.
 */
#include "serlink/config/config_loader.hpp"

#include <charconv>
#include <fstream>
#include <limits>
#include <sstream>

namespace serlink::config {

    using Result = serlink_detail::expected<LinkConfig, ConfigError>;

    std::string_view to_string(ConfigError e) noexcept {
        switch (e) {
            case ConfigError::DuplicatePort:        return "duplicate_port";
            case ConfigError::WordWidthInvalid:     return "word_width_invalid";
            case ConfigError::PayloadWidthMismatch: return "payload_width_mismatch";
            case ConfigError::BytesPerWordInvalid:  return "bytes_per_word_invalid";
            case ConfigError::BufferDepthZero:      return "buffer_depth_zero";
            case ConfigError::TimeoutZero:          return "timeout_zero";
            case ConfigError::WrongDirection:       return "wrong_direction";
            case ConfigError::LaneMissing:          return "lane_missing";
            case ConfigError::DuplicateLane:        return "duplicate_lane";
            case ConfigError::EndpointMissing:      return "endpoint_missing";
            case ConfigError::FileNotFound:         return "file_not_found";
            case ConfigError::ParseError:           return "parse_error";
        }
        return "unknown";
    }

    std::uint64_t LinkConfig::timeout_cycles() const noexcept {
        constexpr auto kMax = std::numeric_limits<std::uint64_t>::max();
        if (timeout_s != 0 && clk_freq_hz > kMax / timeout_s) return kMax;
        return clk_freq_hz * timeout_s;
    }

    serlink_detail::expected<void, ConfigError> LinkConfig::validate() const {
        using Err = serlink_detail::unexpected<ConfigError>;
        if (word_bits < constants::MIN_WORD_BITS || word_bits > constants::MAX_WORD_BITS) {
            return Err(ConfigError::WordWidthInvalid);
        }
        if (bytes_per_word == 0) return Err(ConfigError::BytesPerWordInvalid);
        if (tx_buffer_depth == 0 || rx_buffer_depth == 0 || lane_buffer_depth == 0) {
            return Err(ConfigError::BufferDepthZero);
        }
        if (timeout_cycles() == 0) return Err(ConfigError::TimeoutZero);
        return {};
    }

    namespace {

    std::string_view trim(std::string_view s) {
        const auto b = s.find_first_not_of(" \t\r");
        if (b == std::string_view::npos) return {};
        const auto e = s.find_last_not_of(" \t\r");
        return s.substr(b, e - b + 1);
    }

    template <class T>
    bool parse_uint(std::string_view v, T& out) {
        T tmp{};
        const auto* end = v.data() + v.size();
        auto [p, ec] = std::from_chars(v.data(), end, tmp);
        if (ec != std::errc{} || p != end) return false;
        out = tmp;
        return true;
    }

    bool parse_bool(std::string_view v, bool& out) {
        if (v == "true" || v == "1" || v == "yes")  { out = true;  return true; }
        if (v == "false" || v == "0" || v == "no")  { out = false; return true; }
        return false;
    }

    bool apply(LinkConfig& c, std::string_view key, std::string_view v) {
        if (key == "word_bits")          return parse_uint(v, c.word_bits);
        if (key == "bytes_per_word")     return parse_uint(v, c.bytes_per_word);
        if (key == "tx_buffer_depth")    return parse_uint(v, c.tx_buffer_depth);
        if (key == "rx_buffer_depth")    return parse_uint(v, c.rx_buffer_depth);
        if (key == "lane_buffer_depth")  return parse_uint(v, c.lane_buffer_depth);
        if (key == "clk_freq_hz")        return parse_uint(v, c.clk_freq_hz);
        if (key == "timeout_s")          return parse_uint(v, c.timeout_s);
        if (key == "reset_on_link_down") return parse_bool(v, c.reset_on_link_down);
        return false; // unknown key
    }

    } // namespace

    Result Loader::load_from_string(std::string_view text) {
        LinkConfig cfg;
        std::size_t pos = 0;
        while (pos <= text.size()) {
            auto eol = text.find('\n', pos);
            if (eol == std::string_view::npos) eol = text.size();
            auto line = text.substr(pos, eol - pos);
            pos = eol + 1;

            if (const auto hash = line.find('#'); hash != std::string_view::npos) {
                line = line.substr(0, hash);
            }
            line = trim(line);
            if (line.empty()) continue;

            const auto eq = line.find('=');
            if (eq == std::string_view::npos) {
                return serlink_detail::unexpected<ConfigError>(ConfigError::ParseError);
            }
            if (!apply(cfg, trim(line.substr(0, eq)), trim(line.substr(eq + 1)))) {
                return serlink_detail::unexpected<ConfigError>(ConfigError::ParseError);
            }
        }
        if (auto ok = cfg.validate(); !ok) {
            return serlink_detail::unexpected<ConfigError>(ok.error());
        }
        return cfg;
    }

    Result Loader::load_from_file(const std::string& path) {
        std::ifstream in(path);
        if (!in) return serlink_detail::unexpected<ConfigError>(ConfigError::FileNotFound);
        std::ostringstream ss;
        ss << in.rdbuf();
        return load_from_string(ss.str());
    }

} // namespace serlink::config
