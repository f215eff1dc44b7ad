#include <pledge/schema/client_error.hpp>

#include <spdlog/fmt/fmt.h>

namespace pledge::schema {

client_error_t make_error(const error_code code, std::string message) {
  return client_error_t{.code = code, .message = std::move(message)};
}

std::string_view error_name(const error_code code) {
  return to_string(code, kErrorCodeNames).value_or("UnknownError");
}

std::string describe(const client_error_t& error) {
  return fmt::format("{}: {}", error_name(error.code), error.message);
}

}  // namespace pledge::schema
