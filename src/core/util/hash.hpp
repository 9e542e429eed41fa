#pragma once

#include <string>
#include <string_view>

namespace pawledger::util {

// One-time libsodium setup; false when the library cannot be initialised.
bool init_crypto();

// Lowercase hex SHA-256 of the payload (64 characters).
std::string sha256_hex(std::string_view payload);

}  // namespace pawledger::util
