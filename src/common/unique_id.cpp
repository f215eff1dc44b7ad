#include <pledge/common/unique_id.hpp>

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace pledge::common {

std::string make_uuid() {
  thread_local auto generator = boost::uuids::random_generator{};
  return boost::uuids::to_string(generator());
}

std::string make_unique_id(const std::string_view prefix) {
  auto id = std::string{prefix};
  id.push_back(':');
  id += make_uuid();
  return id;
}

}  // namespace pledge::common
