#pragma once

#include <mandate/schema/delegation_event.hpp>
#include <mandate/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace mandate::schema {

template <uint16_t Version>
struct operation_result;

template <>
struct operation_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string info;
  std::string codespace;
  std::optional<delegation_id_t> delegation_id;
  std::vector<delegation_event_t> events;
};

using operation_result_t = operation_result<1>;

}  // namespace mandate::schema
