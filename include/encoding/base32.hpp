#ifndef ECRS_ENCODING_BASE32_HPP
#define ECRS_ENCODING_BASE32_HPP

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace ecrs {
namespace encoding {

class EncodingError : public std::runtime_error {
public:
  explicit EncodingError(const std::string& message) : std::runtime_error(message) {}
};

class Base32 {
public:
  // 32 symbols, 5 bits each
  static constexpr const char* ALPHABET = "0123456789ABCDEFGHIJKLMNOPQRSTUV";
  static constexpr unsigned BITS_PER_SYMBOL = 5;

  // ---- ENCODING ----
  // Treats the input as one bit stream, most significant bit first,
  // and zero-pads the final partial group
  static std::string encode(const uint8_t* data, size_t length);
  static std::string encode(const std::vector<uint8_t>& data);

  // ---- DECODING ----
  // Inverse of encode for an input of expected_length bytes. Throws EncodingError
  // on a wrong symbol count, a symbol outside the alphabet or non-zero padding bits
  static std::vector<uint8_t> decode(const std::string& text, size_t expected_length);

  // ---- QUERY OPERATIONS ----
  // Number of symbols encode produces for length bytes
  static size_t encoded_length(size_t length);

private:
  // Maps a symbol back to its 5-bit value, -1 if not in the alphabet
  static int symbol_value(char symbol);
};

} // namespace encoding
} // namespace ecrs

#endif // ECRS_ENCODING_BASE32_HPP
