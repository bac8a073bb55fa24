#ifndef ECRS_CRYPTO_HASH_HPP
#define ECRS_CRYPTO_HASH_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include "crypto/crypto_error.hpp"

namespace ecrs::crypto {

static constexpr size_t HASH_SIZE = 64;  // 512 bits for SHA-512

// Digest of a block, used both as a ContentKey and as a RetrievalAddress
using HashCode = std::array<uint8_t, HASH_SIZE>;

// ---- HASHING ----
// Computes the SHA-512 digest of a byte range using OpenSSL EVP
HashCode hash(const uint8_t* data, size_t length);
HashCode hash(const std::vector<uint8_t>& data);

// ---- CONVERSION ----
// Builds a HashCode from raw bytes, throws PreconditionError unless exactly HASH_SIZE bytes are given
HashCode hash_from_bytes(const uint8_t* data, size_t length);
// Lowercase hex rendering, used for log messages
std::string to_hex(const HashCode& code);

} // namespace ecrs::crypto

#endif // ECRS_CRYPTO_HASH_HPP
