#ifndef ECRS_TREE_ENCODER_HPP
#define ECRS_TREE_ENCODER_HPP

#include <cstdint>
#include <functional>
#include <istream>
#include <optional>
#include <vector>
#include "tree/chk_record.hpp"
#include "tree/tree_shape.hpp"

namespace ecrs::tree {

enum class BlockType {
  DBlock,   // leaf, raw file content
  IBlock    // internal block, children's records
};

// A block as it leaves the encoder
struct EncryptedBlock {
  ChkRecord chk;
  std::vector<uint8_t> ciphertext;
};

// Handed to the block handler for every block produced
struct BlockEvent {
  BlockType type;
  unsigned depth;
  // Offset of the first file byte the block covers
  uint64_t offset;
  const ChkRecord& chk;
  const std::vector<uint8_t>& ciphertext;
};

using BlockHandler = std::function<void(const BlockEvent&)>;
// Called after each block with the bytes consumed so far, the file size and the block depth
using ProgressHandler = std::function<void(uint64_t completed, uint64_t size, unsigned depth)>;

// Convergent encryption of one block: key = H(plaintext), query = H(ciphertext)
EncryptedBlock encrypt_block(const std::vector<uint8_t>& plaintext);


// Fixed window of fan_out records for one tree level, indexed by child slot
class ChkWindow {
public:
  explicit ChkWindow(unsigned fan_out) : slots_(fan_out) {}

  void store(unsigned slot, const ChkRecord& chk) { slots_.at(slot) = chk; }
  const ChkRecord& at(unsigned slot) const { return slots_.at(slot); }
  // Serializes slots [0, count) in slot order into one parent payload
  std::vector<uint8_t> fold(unsigned count) const;

private:
  std::vector<ChkRecord> slots_;
};


// Builds the CHK tree of one input stream bottom-up without holding more than
// one window per level. Leaves are read left to right; a level is filled until
// its block is complete, then the encoder moves up, and it drops back to the
// leaves whenever a higher block still needs children. Such an open block is
// emitted with the children it has so far and emitted again, into the same
// slot, each time it grows.
class TreeEncoder {
public:
  // ---- CONSTRUCTOR ----
  TreeEncoder(std::istream& input, uint64_t size,
              const TreeGeometry& geometry = TreeGeometry::canonical());


  // ---- HANDLERS ----
  void set_block_handler(BlockHandler handler) { block_handler_ = std::move(handler); }
  void set_progress_handler(ProgressHandler handler) { progress_handler_ = std::move(handler); }


  // ---- ENCODING ----
  // Runs the encoder to completion and returns the root. Throws io::IoError if
  // the input cannot deliver size bytes; nothing is returned in that case.
  FileIdentifier run();
  // Produces the next block, or the root once the tree is complete.
  // Returns false when there is nothing left to do.
  bool next();


  // ---- GETTERS ----
  bool finished() const { return result_.has_value(); }
  // Throws std::logic_error before the encoder has finished
  const FileIdentifier& result() const;
  unsigned tree_depth() const { return tree_depth_; }
  unsigned current_depth() const { return current_depth_; }
  uint64_t publish_offset() const { return publish_offset_; }
  uint64_t size() const { return size_; }

private:
  // ---- PARAMETERS ----
  std::istream& input_;
  const uint64_t size_;
  const TreeGeometry geometry_;
  const unsigned tree_depth_;
  unsigned current_depth_ = 0;
  uint64_t publish_offset_ = 0;
  // One window per level below the root's parent, levels_[0] holds leaves
  std::vector<ChkWindow> levels_;
  std::optional<FileIdentifier> result_;
  BlockHandler block_handler_;
  ProgressHandler progress_handler_;


  // ---- BLOCK CONSTRUCTION ----
  // Reads the next leaf from the input
  std::vector<uint8_t> read_leaf();
  // Concatenates the children of the internal block closing at publish_offset_
  std::vector<uint8_t> assemble_internal_block() const;
  // Offset of the first file byte covered by the current block
  uint64_t block_start_offset(uint64_t slot_offset) const;
  // Decides the level of the next block
  void advance();
};

} // namespace ecrs::tree

#endif // ECRS_TREE_ENCODER_HPP
