#pragma once

#include <mandate/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace mandate::schema {

enum class vote_kind_t : uint8_t { approve = 0, abstain = 1 };

inline constexpr auto kVoteKindMappings = std::array{
    std::pair<std::string_view, vote_kind_t>{"approve", vote_kind_t::approve},
    std::pair<std::string_view, vote_kind_t>{"abstain", vote_kind_t::abstain}};

template <>
inline std::optional<vote_kind_t> try_from_string<vote_kind_t>(
    const std::string_view value) {
  return from_string(value, kVoteKindMappings);
}

inline constexpr std::string_view to_string(const vote_kind_t value) {
  return to_string(value, kVoteKindMappings).value_or("unknown");
}

}  // namespace mandate::schema
