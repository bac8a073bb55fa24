#ifndef ECRS_CRYPTO_BLOCK_CIPHER_HPP
#define ECRS_CRYPTO_BLOCK_CIPHER_HPP

#include <array>
#include <cstdint>
#include <vector>
#include "crypto/hash.hpp"
#include "crypto/crypto_error.hpp"

namespace ecrs::crypto {

// Forward declaration for OpenSSL cipher context
struct CipherContext;

// Key and iv for one block. Built once from the block's ContentKey, never modified
struct SessionKey {
  static constexpr size_t KEY_SIZE = 32;     // 256 bits for AES-256
  static constexpr size_t IV_SIZE = 16;      // 128 bits for CFB mode

  std::array<uint8_t, KEY_SIZE> key{};
  std::array<uint8_t, IV_SIZE> iv{};

  bool operator==(const SessionKey& other) const {
    return key == other.key && iv == other.iv;
  }
};

class BlockCipher {
public:
  static constexpr size_t BLOCK_SIZE = 16;   // AES block size

  // ---- KEY DERIVATION ----
  // Slices key and iv out of a digest: bytes [0, KEY_SIZE) become the key,
  // the next IV_SIZE bytes the iv, each zero-padded if the digest is short
  static SessionKey derive_key_iv(const uint8_t* digest, size_t length);
  static SessionKey derive_key_iv(const HashCode& digest);


  // ---- CONSTRUCTOR ----
  explicit BlockCipher(const SessionKey& session_key);


  // ---- ENCRYPTION/DECRYPTION OPERATIONS ----
  // AES-256-CFB, output always has the input's length
  std::vector<uint8_t> encrypt(const uint8_t* data, size_t length) const;
  std::vector<uint8_t> encrypt(const std::vector<uint8_t>& data) const;
  std::vector<uint8_t> decrypt(const uint8_t* data, size_t length) const;
  std::vector<uint8_t> decrypt(const std::vector<uint8_t>& data) const;


  // ---- GETTERS ----
  const SessionKey& session_key() const { return session_key_; }

private:
  // ---- PARAMETERS ----
  const SessionKey session_key_;


  // ---- STREAM PROCESSING ----
  // Runs one full cipher pass over the data in a fresh context
  std::vector<uint8_t> process(const uint8_t* data, size_t length, bool encrypting) const;
  // Initializes the cipher context for the requested direction
  void initializeCipher(CipherContext& context, bool encrypting) const;
};

} // namespace ecrs::crypto

#endif // ECRS_CRYPTO_BLOCK_CIPHER_HPP
