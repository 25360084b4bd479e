#pragma once
/**
 * @file dispatcher.hpp
 * @brief Port → consumer index lookup for the receive path.
 * @details One equality test per registered consumer, first match in
 *          registration order. Unmatched ports have no consumer; the link
 *          drops those frames.
 */

#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

#include "serlink/stream/flit.hpp"

namespace serlink::mux {

class Dispatcher {
public:
    /// @param ports Registered port of each consumer, by consumer index.
    explicit Dispatcher(std::vector<stream::Port> ports) : ports_(std::move(ports)) {}

    /// Consumer index for @p port, or nullopt when no consumer is registered.
    std::optional<std::size_t> route(stream::Port port) const noexcept {
        for (std::size_t i = 0; i < ports_.size(); ++i) {
            if (ports_[i] == port) return i;
        }
        return std::nullopt;
    }

    std::size_t size() const noexcept { return ports_.size(); }

private:
    std::vector<stream::Port> ports_;
};

} // namespace serlink::mux
