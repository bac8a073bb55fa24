#include "crypto/block_cipher.hpp"
#include <openssl/evp.h>
#include <algorithm>
#include <climits>
#include <boost/log/trivial.hpp>

namespace ecrs::crypto {

//=================================================
// RAII WRAPPER TO MANAGE CIPHER CONTEXT LIFECYCLE
//=================================================

struct CipherContext {
  EVP_CIPHER_CTX* ctx = nullptr;

   // Initialize new cipher context
  CipherContext() {
    ctx = EVP_CIPHER_CTX_new();
    if (!ctx) {
      throw CryptoError("Block cipher: Failed to create cipher context");
    }
  }

  // Clean up cipher context when object is destroyed
  ~CipherContext() {
    if (ctx) {
      EVP_CIPHER_CTX_free(ctx);
    }
  }

  CipherContext(const CipherContext&) = delete;
  CipherContext& operator=(const CipherContext&) = delete;

  // Access the underlying context
  EVP_CIPHER_CTX* get() { return ctx; }
};

//==============================================
// KEY DERIVATION
//==============================================

SessionKey BlockCipher::derive_key_iv(const uint8_t* digest, size_t length) {
  SessionKey session_key;

  size_t key_bytes = std::min(length, SessionKey::KEY_SIZE);
  std::copy(digest, digest + key_bytes, session_key.key.begin());

  if (length > SessionKey::KEY_SIZE) {
    size_t iv_bytes = std::min(length - SessionKey::KEY_SIZE, SessionKey::IV_SIZE);
    std::copy(digest + SessionKey::KEY_SIZE,
              digest + SessionKey::KEY_SIZE + iv_bytes,
              session_key.iv.begin());
  }

  return session_key;
}

SessionKey BlockCipher::derive_key_iv(const HashCode& digest) {
  return derive_key_iv(digest.data(), digest.size());
}

//==============================================
// CONSTRUCTOR
//==============================================

BlockCipher::BlockCipher(const SessionKey& session_key)
  : session_key_(session_key) {}

//==============================================
// CIPHER INITIALIZATION
//==============================================

void BlockCipher::initializeCipher(CipherContext& context, bool encrypting) const {
  const EVP_CIPHER* cipher = EVP_aes_256_cfb128();
  if (encrypting) {
    if (!EVP_EncryptInit_ex(context.get(), cipher, nullptr,
                            session_key_.key.data(), session_key_.iv.data())) {
      throw EncryptionError("Block cipher: Failed to initialize encryption context");
    }
  } else {
    if (!EVP_DecryptInit_ex(context.get(), cipher, nullptr,
                            session_key_.key.data(), session_key_.iv.data())) {
      throw DecryptionError("Block cipher: Failed to initialize decryption context");
    }
  }
}

//==============================================
// STREAM PROCESSING - ENCRYPTION/DECRYPTION
//==============================================

std::vector<uint8_t> BlockCipher::process(const uint8_t* data, size_t length,
                                          bool encrypting) const {
  std::vector<uint8_t> output(length);
  if (length == 0) {
    return output;
  }

  if (length > static_cast<size_t>(INT_MAX)) {
    throw PreconditionError("block too large for a single cipher pass");
  }

  BOOST_LOG_TRIVIAL(trace) << "Block cipher: " << (encrypting ? "Encrypting" : "Decrypting")
                           << " block of size " << length;

  CipherContext context;
  initializeCipher(context, encrypting);

  // CFB is a stream mode, the whole block comes out of the update call
  int outlen = 0;
  int final_outlen = 0;
  if (encrypting) {
    if (!EVP_EncryptUpdate(context.get(), output.data(), &outlen,
                           data, static_cast<int>(length))) {
      throw EncryptionError("Block cipher: Failed to encrypt data block");
    }
    if (!EVP_EncryptFinal_ex(context.get(), output.data() + outlen, &final_outlen)) {
      throw EncryptionError("Block cipher: Failed to finalize encryption");
    }
  } else {
    if (!EVP_DecryptUpdate(context.get(), output.data(), &outlen,
                           data, static_cast<int>(length))) {
      throw DecryptionError("Block cipher: Failed to decrypt data block");
    }
    if (!EVP_DecryptFinal_ex(context.get(), output.data() + outlen, &final_outlen)) {
      throw DecryptionError("Block cipher: Failed to finalize decryption");
    }
  }

  if (static_cast<size_t>(outlen + final_outlen) != length) {
    BOOST_LOG_TRIVIAL(error) << "Block cipher: Output length " << outlen + final_outlen
                             << " differs from input length " << length;
    throw CryptoError("Block cipher: Cipher changed the block length");
  }

  return output;
}

std::vector<uint8_t> BlockCipher::encrypt(const uint8_t* data, size_t length) const {
  return process(data, length, true);
}

std::vector<uint8_t> BlockCipher::encrypt(const std::vector<uint8_t>& data) const {
  return process(data.data(), data.size(), true);
}

std::vector<uint8_t> BlockCipher::decrypt(const uint8_t* data, size_t length) const {
  return process(data, length, false);
}

std::vector<uint8_t> BlockCipher::decrypt(const std::vector<uint8_t>& data) const {
  return process(data.data(), data.size(), false);
}

} // namespace ecrs::crypto
