#pragma once

#include <cstdint>

// Schema type: client error code.
// Failure taxonomy shared by the key store, the envelope layer and both RPC
// paths. Numeric values are stable.
namespace pledge::schema {

enum class error_code : uint32_t {
  key_io = 1,
  encoding = 2,
  transport = 3,
  empty_result = 4,
  validation_rejected = 5,
  execution_rejected = 6,
  decode = 7,
  timeout = 8,
  invalid_argument = 9,
  signature_invalid = 10,
};

}  // namespace pledge::schema
