#pragma once

#include <string>
#include <string_view>

#include "core/model/types.hpp"

namespace hogpen::util {

// Must succeed once per process before hashing or drawing random numbers.
Result initialize_sodium();

// BLAKE2b-256 digest, lowercase hex.
std::string digest_hex(std::string_view payload);

// Links a payload to its predecessor's digest.
std::string chain_digest_hex(std::string_view prev_hash, std::string_view payload);

}  // namespace hogpen::util
