#pragma once
/**
 * @file port_table.hpp
 * @brief Composition-time registration table: port → endpoint, one per direction.
 * @details Entries keep registration order; that order becomes the arbiter's
 *          producer index / the dispatcher's consumer index at finalization.
 */

#include <cstddef>
#include <vector>

#include "serlink/compat/expected.hpp"
#include "serlink/config/config_error.hpp"
#include "serlink/stream/flit.hpp"

namespace serlink::link {

template <class Endpoint>
class PortTable {
public:
    struct Entry {
        stream::Port port{0};
        Endpoint*    endpoint{nullptr};
    };

    /// Register @p ep under @p port. Fails with DuplicatePort if the port is taken.
    serlink_detail::expected<void, config::ConfigError> add(stream::Port port, Endpoint& ep) {
        if (contains(port)) {
            return serlink_detail::unexpected<config::ConfigError>(config::ConfigError::DuplicatePort);
        }
        entries_.push_back(Entry{port, &ep});
        return {};
    }

    [[nodiscard]] bool contains(stream::Port port) const noexcept {
        for (const auto& e : entries_) {
            if (e.port == port) return true;
        }
        return false;
    }

    /// Registered ports, in registration order.
    [[nodiscard]] std::vector<stream::Port> ports() const {
        std::vector<stream::Port> out;
        out.reserve(entries_.size());
        for (const auto& e : entries_) out.push_back(e.port);
        return out;
    }

    /// Registered endpoints, in registration order.
    [[nodiscard]] std::vector<Endpoint*> endpoints() const {
        std::vector<Endpoint*> out;
        out.reserve(entries_.size());
        for (const auto& e : entries_) out.push_back(e.endpoint);
        return out;
    }

    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] const std::vector<Entry>& entries() const noexcept { return entries_; }

private:
    std::vector<Entry> entries_;
};

} // namespace serlink::link
