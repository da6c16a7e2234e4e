#include "core/util/hash.hpp"

#include <array>

#include <sodium.h>

#include "core/util/canonical.hpp"

namespace hogpen::util {

Result initialize_sodium() {
  if (sodium_init() < 0) {
    return Result::failure("libsodium initialization failed.");
  }
  return Result::success();
}

std::string digest_hex(std::string_view payload) {
  std::array<unsigned char, crypto_generichash_BYTES> digest{};
  crypto_generichash(digest.data(), digest.size(), reinterpret_cast<const unsigned char*>(payload.data()),
                     static_cast<unsigned long long>(payload.size()), nullptr, 0);
  return to_hex(std::string_view{reinterpret_cast<const char*>(digest.data()), digest.size()});
}

std::string chain_digest_hex(std::string_view prev_hash, std::string_view payload) {
  std::array<unsigned char, crypto_generichash_BYTES> digest{};
  crypto_generichash_state state;
  crypto_generichash_init(&state, nullptr, 0, digest.size());
  crypto_generichash_update(&state, reinterpret_cast<const unsigned char*>(prev_hash.data()),
                            static_cast<unsigned long long>(prev_hash.size()));
  static constexpr unsigned char kSeparator = '\n';
  crypto_generichash_update(&state, &kSeparator, 1);
  crypto_generichash_update(&state, reinterpret_cast<const unsigned char*>(payload.data()),
                            static_cast<unsigned long long>(payload.size()));
  crypto_generichash_final(&state, digest.data(), digest.size());
  return to_hex(std::string_view{reinterpret_cast<const char*>(digest.data()), digest.size()});
}

}  // namespace hogpen::util
