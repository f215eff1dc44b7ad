#pragma once

#include <pledge/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>
#include <utility>

// Schema type: body type.
// Discriminator carried in the "type" field of every transaction body.
namespace pledge::schema {

enum class body_type : uint8_t {
  commiter = 0,
  beneficiary = 1,
  promise = 2,
  commitment = 3,
};

inline constexpr auto kBodyTypeNames =
    std::array<std::pair<std::string_view, body_type>, 4>{{
        {"commiter", body_type::commiter},
        {"beneficiary", body_type::beneficiary},
        {"promise", body_type::promise},
        {"commitment", body_type::commitment},
    }};

}  // namespace pledge::schema
