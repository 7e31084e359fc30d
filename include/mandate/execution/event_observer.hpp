#pragma once

#include <mandate/schema/delegation_event.hpp>
#include <functional>

namespace mandate::execution {

using event_observer_t =
    std::function<void(const mandate::schema::delegation_event_t& event)>;

}  // namespace mandate::execution
