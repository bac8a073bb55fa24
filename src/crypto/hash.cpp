#include "crypto/hash.hpp"
#include <openssl/evp.h>
#include <iomanip>
#include <sstream>
#include <cstring>
#include <boost/log/trivial.hpp>

namespace ecrs::crypto {

//=================================================
// RAII WRAPPER TO MANAGE DIGEST CONTEXT LIFECYCLE
//=================================================

namespace {

struct DigestContext {
  EVP_MD_CTX* ctx = nullptr;

  DigestContext() {
    ctx = EVP_MD_CTX_new();
    if (!ctx) {
      throw HashError("Failed to create digest context");
    }
  }

  ~DigestContext() {
    if (ctx) {
      EVP_MD_CTX_free(ctx);
    }
  }

  DigestContext(const DigestContext&) = delete;
  DigestContext& operator=(const DigestContext&) = delete;

  EVP_MD_CTX* get() { return ctx; }
};

} // namespace

//==============================================
// HASHING
//==============================================

HashCode hash(const uint8_t* data, size_t length) {
  DigestContext context;

  if (!EVP_DigestInit_ex(context.get(), EVP_sha512(), nullptr)) {
    BOOST_LOG_TRIVIAL(error) << "Hash: Failed to initialize SHA-512 context";
    throw HashError("Failed to initialize hash context");
  }

  // An empty block still gets a digest, EVP accepts a zero length update
  if (length > 0 && !EVP_DigestUpdate(context.get(), data, length)) {
    throw HashError("Failed to update hash");
  }

  HashCode result{};
  unsigned int hash_len = 0;
  if (!EVP_DigestFinal_ex(context.get(), result.data(), &hash_len)) {
    throw HashError("Failed to finalize hash");
  }

  if (hash_len != HASH_SIZE) {
    BOOST_LOG_TRIVIAL(error) << "Hash: Unexpected digest length " << hash_len;
    throw HashError("Unexpected digest length");
  }

  return result;
}

HashCode hash(const std::vector<uint8_t>& data) {
  return hash(data.data(), data.size());
}

//==============================================
// CONVERSION
//==============================================

HashCode hash_from_bytes(const uint8_t* data, size_t length) {
  if (length != HASH_SIZE) {
    throw PreconditionError("hash code needs " + std::to_string(HASH_SIZE) +
                            " bytes, got " + std::to_string(length));
  }
  HashCode result{};
  std::memcpy(result.data(), data, HASH_SIZE);
  return result;
}

std::string to_hex(const HashCode& code) {
  std::stringstream ss;
  for (uint8_t byte : code) {
    ss << std::hex << std::setw(2) << std::setfill('0')
       << static_cast<int>(byte);
  }
  return ss.str();
}

} // namespace ecrs::crypto
