#include "locator/locator.hpp"
#include "encoding/base32.hpp"
#include "io/input_file.hpp"
#include <cctype>
#include <cstdint>
#include <sstream>
#include <boost/log/trivial.hpp>

namespace ecrs {
namespace locator {

namespace {

std::string chk_prefix() {
  return std::string(URI_PREFIX) + CHK_INFIX;
}

crypto::HashCode decode_hash(const std::string& text) {
  try {
    std::vector<uint8_t> bytes = encoding::Base32::decode(text, crypto::HASH_SIZE);
    return crypto::hash_from_bytes(bytes.data(), bytes.size());
  } catch (const encoding::EncodingError& e) {
    throw LocatorError(std::string("Locator: Malformed hash: ") + e.what());
  }
}

uint64_t parse_size(const std::string& text) {
  // Only plain decimal digits, as format writes them
  if (text.empty() || text.size() > 20) {
    throw LocatorError("Locator: Malformed file size");
  }
  uint64_t value = 0;
  for (char c : text) {
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      throw LocatorError("Locator: Malformed file size");
    }
    uint64_t digit = static_cast<uint64_t>(c - '0');
    if (value > (UINT64_MAX - digit) / 10) {
      throw LocatorError("Locator: File size out of range");
    }
    value = value * 10 + digit;
  }
  if (text.size() > 1 && text[0] == '0') {
    throw LocatorError("Locator: File size has leading zeros");
  }
  return value;
}

} // namespace

//==============================================
// FORMATTING
//==============================================

std::string format(const tree::FileIdentifier& identifier) {
  std::stringstream ss;
  ss << chk_prefix()
     << encoding::Base32::encode(identifier.chk.key.data(), identifier.chk.key.size())
     << '.'
     << encoding::Base32::encode(identifier.chk.query.data(), identifier.chk.query.size())
     << '.'
     << identifier.file_length;
  return ss.str();
}

//==============================================
// PARSING
//==============================================

tree::FileIdentifier parse(const std::string& locator) {
  const std::string prefix = chk_prefix();
  if (locator.compare(0, prefix.size(), prefix) != 0) {
    BOOST_LOG_TRIVIAL(debug) << "Locator: Missing prefix in " << locator;
    throw LocatorError("Locator: Not a CHK locator");
  }

  const std::string body = locator.substr(prefix.size());
  const size_t first_dot = body.find('.');
  const size_t second_dot = (first_dot == std::string::npos)
                              ? std::string::npos
                              : body.find('.', first_dot + 1);
  if (second_dot == std::string::npos || body.find('.', second_dot + 1) != std::string::npos) {
    throw LocatorError("Locator: Expected <key>.<query>.<size>");
  }

  tree::FileIdentifier identifier;
  identifier.chk.key = decode_hash(body.substr(0, first_dot));
  identifier.chk.query = decode_hash(body.substr(first_dot + 1, second_dot - first_dot - 1));
  identifier.file_length = parse_size(body.substr(second_dot + 1));
  return identifier;
}

//==============================================
// ENCODING
//==============================================

std::string locator_for_stream(std::istream& input, uint64_t size,
                               tree::BlockHandler block_handler,
                               tree::ProgressHandler progress_handler) {
  tree::TreeEncoder encoder(input, size);
  if (block_handler) {
    encoder.set_block_handler(std::move(block_handler));
  }
  if (progress_handler) {
    encoder.set_progress_handler(std::move(progress_handler));
  }

  std::string result = format(encoder.run());
  BOOST_LOG_TRIVIAL(info) << "Locator: " << result;
  return result;
}

std::string locator_for_file(const std::string& path,
                             tree::BlockHandler block_handler,
                             tree::ProgressHandler progress_handler) {
  io::InputFile input = io::open_input_file(path);
  return locator_for_stream(*input.stream, input.size,
                            std::move(block_handler), std::move(progress_handler));
}

} // namespace locator
} // namespace ecrs
