#ifndef ECRS_TREE_CHK_RECORD_HPP
#define ECRS_TREE_CHK_RECORD_HPP

#include <cstdint>
#include <vector>
#include "crypto/hash.hpp"

namespace ecrs::tree {

// Content hash key of one block: the plaintext hash (key) and the ciphertext hash (query)
struct ChkRecord {
  static constexpr size_t SERIALIZED_SIZE = 2 * crypto::HASH_SIZE;

  crypto::HashCode key{};
  crypto::HashCode query{};

  // Appends key || query, the form in which a parent block stores its children
  void append_to(std::vector<uint8_t>& payload) const {
    payload.insert(payload.end(), key.begin(), key.end());
    payload.insert(payload.end(), query.begin(), query.end());
  }

  bool operator==(const ChkRecord& other) const {
    return key == other.key && query == other.query;
  }
  bool operator!=(const ChkRecord& other) const { return !(*this == other); }
};

// The root record of a file, stamped with the file length
struct FileIdentifier {
  ChkRecord chk;
  uint64_t file_length = 0;

  bool operator==(const FileIdentifier& other) const {
    return chk == other.chk && file_length == other.file_length;
  }
};

} // namespace ecrs::tree

#endif // ECRS_TREE_CHK_RECORD_HPP
