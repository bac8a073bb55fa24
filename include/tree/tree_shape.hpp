#ifndef ECRS_TREE_SHAPE_HPP
#define ECRS_TREE_SHAPE_HPP

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace ecrs::tree {

class ShapeError : public std::logic_error {
public:
  explicit ShapeError(const std::string& message) : std::logic_error(message) {}
};

// Leaf size and fan-out of a CHK tree. A full internal block holds fan_out
// records and must be exactly as large as a full leaf, so
// leaf_size == fan_out * ChkRecord::SERIALIZED_SIZE always holds.
class TreeGeometry {
public:
  static constexpr uint64_t CANONICAL_LEAF_SIZE = 32 * 1024;
  static constexpr unsigned CANONICAL_FAN_OUT = 256;

  // ---- CONSTRUCTOR ----
  // Throws ShapeError if the fan-out is below 2 or the size invariant does not hold
  TreeGeometry(uint64_t leaf_size, unsigned fan_out);

  // The geometry every published locator is computed with
  static const TreeGeometry& canonical();


  // ---- SHAPE CALCULATIONS ----
  // Minimal depth >= 1 whose top level can span size bytes. Stops growing
  // when the span would overflow 64 bits.
  unsigned depth_for_size(uint64_t size) const;
  // Bytes of file content covered by one block at depth (leaf_size * fan_out^depth)
  uint64_t span_at_depth(unsigned depth) const;
  // Position of a block in its parent. offset is a leaf's start offset, or
  // an internal block's end offset.
  unsigned child_slot_index(unsigned depth, uint64_t offset) const;
  // Number of children of the internal block at depth that closes at offset.
  // Requires depth > 0 and offset > 0.
  unsigned internal_block_child_count(unsigned depth, uint64_t offset) const;


  // ---- GETTERS ----
  uint64_t leaf_size() const { return leaf_size_; }
  unsigned fan_out() const { return fan_out_; }

private:
  uint64_t leaf_size_;
  unsigned fan_out_;

  // Span at depth, or nullopt once it no longer fits in 64 bits. Such a
  // block covers every representable offset.
  std::optional<uint64_t> checked_span(unsigned depth) const;
};

} // namespace ecrs::tree

#endif // ECRS_TREE_SHAPE_HPP
