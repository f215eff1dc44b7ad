#include <pledge/keys/identity.hpp>

namespace pledge::keys {

std::string make_commiter_id(
    const pledge::schema::ed25519_public_key_t& public_key) {
  return std::string{kCommiterIdPrefix} +
         pledge::schema::to_base64(pledge::schema::bytes_view_t{
             public_key.data(), public_key.size()});
}

pledge::schema::commiter_t make_commiter(
    const pledge::schema::ed25519_public_key_t& public_key,
    std::string name) {
  return pledge::schema::commiter_t{
      .id = make_commiter_id(public_key),
      .name = std::move(name),
      .commiter_pubkey = pledge::schema::to_base64(
          pledge::schema::bytes_view_t{public_key.data(), public_key.size()})};
}

}  // namespace pledge::keys
