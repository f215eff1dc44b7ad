#pragma once

#include <pledge/schema/enum_string.hpp>
#include <array>
#include <cstdint>
#include <string_view>
#include <utility>

// Schema type: entity alias.
// Short names accepted in place of a query path; each lists one entity kind
// under /list/<name>.
namespace pledge::schema {

enum class entity_alias : uint8_t {
  promise = 0,
  commitment = 1,
  commiter = 2,
  beneficiary = 3,
};

inline constexpr auto kEntityAliasNames =
    std::array<std::pair<std::string_view, entity_alias>, 4>{{
        {"promise", entity_alias::promise},
        {"commitment", entity_alias::commitment},
        {"commiter", entity_alias::commiter},
        {"beneficiary", entity_alias::beneficiary},
    }};

}  // namespace pledge::schema
