#include "io/input_file.hpp"
#include <filesystem>
#include <system_error>
#include <boost/log/trivial.hpp>

namespace ecrs {
namespace io {

InputFile open_input_file(const std::string& path) {
  BOOST_LOG_TRIVIAL(info) << "Input file: Opening " << path;

  std::error_code ec;
  std::filesystem::path file_path(path);

  if (!std::filesystem::exists(file_path, ec)) {
    BOOST_LOG_TRIVIAL(error) << "Input file: File not found: " << path;
    throw IoError("Input file: File not found: " + path);
  }

  if (!std::filesystem::is_regular_file(file_path, ec)) {
    BOOST_LOG_TRIVIAL(error) << "Input file: Not a regular file: " << path;
    throw IoError("Input file: Not a regular file: " + path);
  }

  std::uintmax_t size = std::filesystem::file_size(file_path, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Input file: Failed to get size of " << path << ": " << ec.message();
    throw IoError("Input file: Failed to get file size: " + path);
  }

  // Open in binary mode so the bytes hashed are the bytes on disk
  InputFile input;
  input.stream = std::make_unique<std::ifstream>(file_path, std::ios::binary);
  if (!*input.stream) {
    BOOST_LOG_TRIVIAL(error) << "Input file: Failed to open file: " << path;
    throw IoError("Input file: Failed to open file: " + path);
  }
  input.size = size;

  BOOST_LOG_TRIVIAL(debug) << "Input file: Opened " << path << " (" << size << " bytes)";
  return input;
}

} // namespace io
} // namespace ecrs
