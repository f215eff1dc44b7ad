#include <pledge/keys/key_manager.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <iterator>
#include <system_error>

namespace pledge::keys {

namespace {

using pledge::schema::error_code;
using pledge::schema::make_error;

constexpr auto kPrivateKeyFileSize = size_t{64};

std::optional<pledge::schema::bytes_t> read_file(
    const std::filesystem::path& path) {
  auto input = std::ifstream{path, std::ios::binary};
  if (!input) {
    return std::nullopt;
  }
  auto bytes = pledge::schema::bytes_t{std::istreambuf_iterator<char>{input},
                                       std::istreambuf_iterator<char>{}};
  if (input.bad()) {
    return std::nullopt;
  }
  return bytes;
}

bool write_file(const std::filesystem::path& path,
                const pledge::schema::bytes_view_t& bytes,
                const std::filesystem::perms permissions,
                std::string& error) {
  auto output = std::ofstream{path, std::ios::binary | std::ios::trunc};
  if (!output) {
    error = "cannot open '" + path.string() + "' for writing";
    return false;
  }
  // Restrict before any key byte reaches the file.
  auto ec = std::error_code{};
  std::filesystem::permissions(path, permissions,
                               std::filesystem::perm_options::replace, ec);
  if (ec) {
    error = "cannot set permissions on '" + path.string() +
            "': " + ec.message();
    return false;
  }
  output.write(reinterpret_cast<const char*>(bytes.data()),
               static_cast<std::streamsize>(bytes.size()));
  output.flush();
  if (!output) {
    error = "failed writing '" + path.string() + "'";
    return false;
  }
  return true;
}

load_result fail(std::string message) {
  spdlog::error("{}", message);
  return load_result{.error = make_error(error_code::key_io,
                                         std::move(message))};
}

}  // namespace

key_manager::key_manager(std::filesystem::path key_directory)
    : key_directory_{std::move(key_directory)} {}

const std::filesystem::path& key_manager::key_directory() const {
  return key_directory_;
}

std::filesystem::path key_manager::private_key_path() const {
  return key_directory_ / kPrivateKeyFileName;
}

std::filesystem::path key_manager::public_key_path() const {
  return key_directory_ / kPublicKeyFileName;
}

load_result key_manager::ensure_keypair() const {
  auto ec = std::error_code{};
  auto exists = std::filesystem::exists(private_key_path(), ec);
  if (ec) {
    return fail("cannot stat '" + private_key_path().string() +
                "': " + ec.message());
  }
  if (!exists) {
    return generate();
  }
  return load();
}

load_result key_manager::load() const {
  auto private_bytes = read_file(private_key_path());
  if (!private_bytes) {
    return fail("cannot read private key '" + private_key_path().string() +
                "'");
  }
  auto public_bytes = read_file(public_key_path());
  if (!public_bytes) {
    return fail("cannot read public key '" + public_key_path().string() +
                "'");
  }

  auto pair = pledge::crypto::keypair{};
  if (private_bytes->size() != kPrivateKeyFileSize &&
      private_bytes->size() != pair.seed.size()) {
    return fail("private key '" + private_key_path().string() +
                "' has unexpected size " +
                std::to_string(private_bytes->size()));
  }
  if (public_bytes->size() != pair.public_key.size()) {
    return fail("public key '" + public_key_path().string() +
                "' has unexpected size " +
                std::to_string(public_bytes->size()));
  }
  std::copy_n(std::begin(*private_bytes), pair.seed.size(),
              std::begin(pair.seed));
  std::copy(std::begin(*public_bytes), std::end(*public_bytes),
            std::begin(pair.public_key));

  auto derived = pledge::crypto::derive_public_key(pair.seed);
  if (!derived || *derived != pair.public_key) {
    return fail("public key '" + public_key_path().string() +
                "' does not match the private key");
  }
  return load_result{.keypair = pair};
}

load_result key_manager::generate() const {
  spdlog::info("Generating new ed25519 keypair in '{}'",
               key_directory_.string());

  auto ec = std::error_code{};
  if (std::filesystem::create_directories(key_directory_, ec)) {
    std::filesystem::permissions(key_directory_,
                                 std::filesystem::perms::owner_all,
                                 std::filesystem::perm_options::replace, ec);
  }
  if (ec) {
    return fail("cannot create key directory '" + key_directory_.string() +
                "': " + ec.message());
  }

  auto pair = pledge::crypto::generate_keypair();
  if (!pair) {
    return fail("ed25519 key generation failed");
  }

  auto private_bytes = pledge::schema::bytes_t{};
  private_bytes.reserve(kPrivateKeyFileSize);
  private_bytes.insert(std::end(private_bytes), std::begin(pair->seed),
                       std::end(pair->seed));
  private_bytes.insert(std::end(private_bytes), std::begin(pair->public_key),
                       std::end(pair->public_key));

  auto error = std::string{};
  if (!write_file(private_key_path(), private_bytes,
                  std::filesystem::perms::owner_read |
                      std::filesystem::perms::owner_write,
                  error)) {
    return fail(error);
  }
  if (!write_file(public_key_path(),
                  pledge::schema::bytes_view_t{pair->public_key.data(),
                                               pair->public_key.size()},
                  std::filesystem::perms::owner_read |
                      std::filesystem::perms::owner_write |
                      std::filesystem::perms::group_read |
                      std::filesystem::perms::others_read,
                  error)) {
    return fail(error);
  }
  return load_result{.keypair = *pair, .generated = true};
}

}  // namespace pledge::keys
