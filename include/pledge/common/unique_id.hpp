#pragma once

#include <string>
#include <string_view>

namespace pledge::common {

/// Random version 4 UUID in canonical textual form.
std::string make_uuid();

/// "<prefix>:<uuid4>", used for beneficiary, promise and commitment ids.
std::string make_unique_id(std::string_view prefix);

}  // namespace pledge::common
