#include "tree/tree_encoder.hpp"
#include "crypto/block_cipher.hpp"
#include "crypto/hash.hpp"
#include "io/input_file.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>
#include <boost/log/trivial.hpp>

namespace ecrs::tree {

//==============================================
// BLOCK ENCRYPTION
//==============================================

EncryptedBlock encrypt_block(const std::vector<uint8_t>& plaintext) {
  EncryptedBlock block;
  block.chk.key = crypto::hash(plaintext);

  const crypto::BlockCipher cipher(crypto::BlockCipher::derive_key_iv(block.chk.key));
  block.ciphertext = cipher.encrypt(plaintext);
  block.chk.query = crypto::hash(block.ciphertext);
  return block;
}

std::vector<uint8_t> ChkWindow::fold(unsigned count) const {
  std::vector<uint8_t> payload;
  payload.reserve(static_cast<size_t>(count) * ChkRecord::SERIALIZED_SIZE);
  for (unsigned slot = 0; slot < count; ++slot) {
    slots_.at(slot).append_to(payload);
  }
  return payload;
}

//==============================================
// CONSTRUCTOR
//==============================================

TreeEncoder::TreeEncoder(std::istream& input, uint64_t size, const TreeGeometry& geometry)
  : input_(input)
  , size_(size)
  , geometry_(geometry)
  , tree_depth_(geometry.depth_for_size(size))
  , levels_(tree_depth_, ChkWindow(geometry.fan_out())) {
  BOOST_LOG_TRIVIAL(info) << "Tree encoder: Encoding " << size_ << " bytes, tree depth "
                          << tree_depth_;
}

//==============================================
// ENCODING
//==============================================

FileIdentifier TreeEncoder::run() {
  while (next()) {
  }
  return result();
}

bool TreeEncoder::next() {
  if (result_) {
    return false;
  }

  if (current_depth_ == tree_depth_) {
    FileIdentifier root;
    root.chk = levels_[tree_depth_ - 1].at(0);
    root.file_length = size_;
    result_ = root;
    BOOST_LOG_TRIVIAL(info) << "Tree encoder: Finished, root query "
                            << crypto::to_hex(root.chk.query).substr(0, 16) << "...";
    return true;
  }

  const unsigned depth = current_depth_;
  const bool is_leaf = (depth == 0);

  // Leaves are placed by where they start, internal blocks by where they end
  const uint64_t slot_offset = publish_offset_;
  std::vector<uint8_t> payload = is_leaf ? read_leaf() : assemble_internal_block();
  const unsigned slot = geometry_.child_slot_index(depth, slot_offset);

  EncryptedBlock block = encrypt_block(payload);
  levels_[depth].store(slot, block.chk);

  BOOST_LOG_TRIVIAL(trace) << "Tree encoder: " << (is_leaf ? "DBlock" : "IBlock")
                           << " depth " << depth << " slot " << slot
                           << " size " << payload.size() << " at offset " << slot_offset;

  if (block_handler_) {
    const BlockEvent event{is_leaf ? BlockType::DBlock : BlockType::IBlock,
                           depth,
                           block_start_offset(slot_offset),
                           block.chk,
                           block.ciphertext};
    block_handler_(event);
  }

  if (is_leaf) {
    publish_offset_ += payload.size();
  }

  if (progress_handler_) {
    progress_handler_(publish_offset_, size_, depth);
  }

  advance();
  return true;
}

const FileIdentifier& TreeEncoder::result() const {
  if (!result_) {
    throw std::logic_error("Tree encoder: Encoding has not finished");
  }
  return *result_;
}

//==============================================
// BLOCK CONSTRUCTION
//==============================================

std::vector<uint8_t> TreeEncoder::read_leaf() {
  const uint64_t remaining = size_ - publish_offset_;
  const size_t pt_size = static_cast<size_t>(std::min<uint64_t>(geometry_.leaf_size(), remaining));

  std::vector<uint8_t> leaf(pt_size);
  if (pt_size == 0) {
    return leaf;
  }

  input_.read(reinterpret_cast<char*>(leaf.data()), static_cast<std::streamsize>(pt_size));
  const auto bytes_read = input_.gcount();
  if (input_.bad() || bytes_read != static_cast<std::streamsize>(pt_size)) {
    BOOST_LOG_TRIVIAL(error) << "Tree encoder: Read " << bytes_read << " of " << pt_size
                             << " bytes at offset " << publish_offset_;
    throw io::IoError("Tree encoder: Failed to read input at offset " +
                      std::to_string(publish_offset_));
  }
  return leaf;
}

std::vector<uint8_t> TreeEncoder::assemble_internal_block() const {
  const unsigned children = geometry_.internal_block_child_count(current_depth_, publish_offset_);
  return levels_[current_depth_ - 1].fold(children);
}

uint64_t TreeEncoder::block_start_offset(uint64_t slot_offset) const {
  if (current_depth_ == 0) {
    return slot_offset;
  }
  // The root covers the whole file, its span may not fit in 64 bits
  if (current_depth_ == tree_depth_ - 1) {
    return 0;
  }
  const uint64_t last = slot_offset - 1;
  return last - last % geometry_.span_at_depth(current_depth_);
}

//==============================================
// STATE TRANSITIONS
//==============================================

void TreeEncoder::advance() {
  const bool at_end = (publish_offset_ == size_);

  if (current_depth_ == 0) {
    // Stay on the leaves until a level-1 block is full or the input is done
    if (at_end || publish_offset_ % geometry_.span_at_depth(1) == 0) {
      current_depth_++;
    }
    return;
  }

  // A full block moves up, an open one goes back for more leaves
  const unsigned children = geometry_.internal_block_child_count(current_depth_, publish_offset_);
  if (children == geometry_.fan_out() || at_end) {
    current_depth_++;
  } else {
    current_depth_ = 0;
  }
}

} // namespace ecrs::tree
