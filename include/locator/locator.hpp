#ifndef ECRS_LOCATOR_HPP
#define ECRS_LOCATOR_HPP

#include <cstdint>
#include <istream>
#include <stdexcept>
#include <string>
#include "tree/chk_record.hpp"
#include "tree/tree_encoder.hpp"

namespace ecrs {
namespace locator {

class LocatorError : public std::runtime_error {
public:
  explicit LocatorError(const std::string& message) : std::runtime_error(message) {}
};

static constexpr const char* URI_PREFIX = "gnunet://fs/";
static constexpr const char* CHK_INFIX = "chk/";

// ---- FORMATTING ----
// gnunet://fs/chk/<key>.<query>.<size>, both hashes in canonical base32
std::string format(const tree::FileIdentifier& identifier);

// ---- PARSING ----
// Inverse of format. Throws LocatorError on anything format could not have produced.
tree::FileIdentifier parse(const std::string& locator);

// ---- ENCODING ----
// Encodes size bytes of input with the canonical geometry and formats the root.
// Handlers, if given, are attached to the encoder.
std::string locator_for_stream(std::istream& input, uint64_t size,
                               tree::BlockHandler block_handler = nullptr,
                               tree::ProgressHandler progress_handler = nullptr);
// Opens path and encodes its content. Throws io::IoError if the file cannot be read.
std::string locator_for_file(const std::string& path,
                             tree::BlockHandler block_handler = nullptr,
                             tree::ProgressHandler progress_handler = nullptr);

} // namespace locator
} // namespace ecrs

#endif // ECRS_LOCATOR_HPP
