#ifndef ECRS_IO_INPUT_FILE_HPP
#define ECRS_IO_INPUT_FILE_HPP

#include <cstdint>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>

namespace ecrs {
namespace io {

class IoError : public std::runtime_error {
public:
  explicit IoError(const std::string& message) : std::runtime_error(message) {}
};

// An opened input together with its exact length, which the encoder needs up front
struct InputFile {
  std::unique_ptr<std::ifstream> stream;
  std::uint64_t size = 0;
};

// Opens a regular file in binary mode. Throws IoError if the path is missing,
// not a regular file or cannot be opened.
InputFile open_input_file(const std::string& path);

} // namespace io
} // namespace ecrs

#endif // ECRS_IO_INPUT_FILE_HPP
