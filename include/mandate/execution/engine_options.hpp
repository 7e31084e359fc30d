#pragma once

#include <mandate/delegation/store.hpp>
#include <cstdint>

namespace mandate::execution {

struct engine_options final {
  /// Entries kept per delegator before the oldest are evicted.
  uint32_t history_capacity{mandate::delegation::kDefaultHistoryCapacity};
};

}  // namespace mandate::execution
