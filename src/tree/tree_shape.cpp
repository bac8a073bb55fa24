#include "tree/tree_shape.hpp"
#include "tree/chk_record.hpp"
#include <limits>
#include <boost/log/trivial.hpp>

namespace ecrs::tree {

//==============================================
// CONSTRUCTOR
//==============================================

TreeGeometry::TreeGeometry(uint64_t leaf_size, unsigned fan_out)
  : leaf_size_(leaf_size)
  , fan_out_(fan_out) {
  if (fan_out_ < 2) {
    throw ShapeError("Tree shape: fan-out must be at least 2");
  }
  if (leaf_size_ != static_cast<uint64_t>(fan_out_) * ChkRecord::SERIALIZED_SIZE) {
    throw ShapeError("Tree shape: leaf size " + std::to_string(leaf_size_) +
                     " does not match fan-out " + std::to_string(fan_out_) +
                     " times the record size");
  }
}

const TreeGeometry& TreeGeometry::canonical() {
  static const TreeGeometry geometry(CANONICAL_LEAF_SIZE, CANONICAL_FAN_OUT);
  return geometry;
}

//==============================================
// SHAPE CALCULATIONS
//==============================================

unsigned TreeGeometry::depth_for_size(uint64_t size) const {
  unsigned depth = 1;
  uint64_t span = leaf_size_;

  while (span < size) {
    depth++;
    if (span > std::numeric_limits<uint64_t>::max() / fan_out_) {
      // Next level would overflow, report what we have
      BOOST_LOG_TRIVIAL(warning) << "Tree shape: Span overflow for size " << size
                                 << ", capping depth at " << depth;
      return depth;
    }
    span *= fan_out_;
  }
  return depth;
}

uint64_t TreeGeometry::span_at_depth(unsigned depth) const {
  const std::optional<uint64_t> span = checked_span(depth);
  if (!span) {
    throw ShapeError("Tree shape: span at depth " + std::to_string(depth) +
                     " does not fit in 64 bits");
  }
  return *span;
}

std::optional<uint64_t> TreeGeometry::checked_span(unsigned depth) const {
  uint64_t span = leaf_size_;
  for (unsigned i = 0; i < depth; ++i) {
    if (span > std::numeric_limits<uint64_t>::max() / fan_out_) {
      return std::nullopt;
    }
    span *= fan_out_;
  }
  return span;
}

unsigned TreeGeometry::child_slot_index(unsigned depth, uint64_t offset) const {
  // Internal blocks are identified by the last byte they cover
  if (depth > 0) {
    if (offset == 0) {
      throw ShapeError("Tree shape: internal block cannot close at offset 0");
    }
    offset--;
  }
  const std::optional<uint64_t> span = checked_span(depth);
  if (!span) {
    return 0;
  }
  return static_cast<unsigned>((offset / *span) % fan_out_);
}

unsigned TreeGeometry::internal_block_child_count(unsigned depth, uint64_t offset) const {
  if (depth == 0) {
    throw ShapeError("Tree shape: leaves have no children");
  }
  if (offset == 0) {
    throw ShapeError("Tree shape: internal block cannot close at offset 0");
  }

  const std::optional<uint64_t> span = checked_span(depth);
  uint64_t remainder = span ? offset % *span : offset;
  if (remainder == 0) {
    return fan_out_;
  }

  uint64_t child_span = span_at_depth(depth - 1);
  uint64_t count = remainder / child_span;
  if (remainder % child_span != 0) {
    count++;
  }
  return static_cast<unsigned>(count);
}

} // namespace ecrs::tree
