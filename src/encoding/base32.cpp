#include "encoding/base32.hpp"
#include <boost/log/trivial.hpp>

namespace ecrs {
namespace encoding {

//==============================================
// ENCODING
//==============================================

std::string Base32::encode(const uint8_t* data, size_t length) {
  std::string result;
  result.reserve(encoded_length(length));

  uint32_t bits = 0;
  unsigned vbit = 0;  // valid bits held in the accumulator
  size_t rpos = 0;

  while (rpos < length || vbit > 0) {
    if (rpos < length && vbit < BITS_PER_SYMBOL) {
      bits = (bits << 8) | data[rpos++];
      vbit += 8;
    }
    if (vbit < BITS_PER_SYMBOL) {
      // zero-padding of the last group
      bits <<= (BITS_PER_SYMBOL - vbit);
      vbit = BITS_PER_SYMBOL;
    }
    result.push_back(ALPHABET[(bits >> (vbit - BITS_PER_SYMBOL)) & 31]);
    vbit -= BITS_PER_SYMBOL;
  }

  return result;
}

std::string Base32::encode(const std::vector<uint8_t>& data) {
  return encode(data.data(), data.size());
}

//==============================================
// DECODING
//==============================================

std::vector<uint8_t> Base32::decode(const std::string& text, size_t expected_length) {
  if (text.size() != encoded_length(expected_length)) {
    BOOST_LOG_TRIVIAL(debug) << "Base32: Expected " << encoded_length(expected_length)
                             << " symbols, got " << text.size();
    throw EncodingError("Base32: Wrong encoded length");
  }

  std::vector<uint8_t> result;
  result.reserve(expected_length);

  uint32_t bits = 0;
  unsigned vbit = 0;

  for (char symbol : text) {
    int value = symbol_value(symbol);
    if (value < 0) {
      throw EncodingError(std::string("Base32: Invalid symbol '") + symbol + "'");
    }
    bits = (bits << BITS_PER_SYMBOL) | static_cast<uint32_t>(value);
    vbit += BITS_PER_SYMBOL;
    if (vbit >= 8) {
      vbit -= 8;
      result.push_back(static_cast<uint8_t>((bits >> vbit) & 0xFF));
    }
    bits &= (1u << vbit) - 1;
  }

  // Whatever is left over is the padding encode added
  if (bits != 0) {
    throw EncodingError("Base32: Non-zero padding bits");
  }

  return result;
}

//==============================================
// QUERY OPERATIONS
//==============================================

size_t Base32::encoded_length(size_t length) {
  return (length * 8 + BITS_PER_SYMBOL - 1) / BITS_PER_SYMBOL;
}

int Base32::symbol_value(char symbol) {
  if (symbol >= '0' && symbol <= '9') {
    return symbol - '0';
  }
  if (symbol >= 'A' && symbol <= 'V') {
    return symbol - 'A' + 10;
  }
  return -1;
}

} // namespace encoding
} // namespace ecrs
