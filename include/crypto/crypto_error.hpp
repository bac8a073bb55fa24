#ifndef ECRS_CRYPTO_ERROR_HPP
#define ECRS_CRYPTO_ERROR_HPP

#include <stdexcept>
#include <string>

namespace ecrs::crypto {

class CryptoError : public std::runtime_error {
public:
    explicit CryptoError(const std::string& message)
        : std::runtime_error(message) {}
};

class HashError : public CryptoError {
public:
    explicit HashError(const std::string& message)
        : CryptoError("Hash error: " + message) {}
};

class EncryptionError : public CryptoError {
public:
    explicit EncryptionError(const std::string& message)
        : CryptoError("Encryption error: " + message) {}
};

class DecryptionError : public CryptoError {
public:
    explicit DecryptionError(const std::string& message)
        : CryptoError("Decryption error: " + message) {}
};

// Raised for malformed inputs that only a programming error can produce
class PreconditionError : public std::logic_error {
public:
    explicit PreconditionError(const std::string& message)
        : std::logic_error("Precondition violated: " + message) {}
};

} // namespace ecrs::crypto

#endif // ECRS_CRYPTO_ERROR_HPP
