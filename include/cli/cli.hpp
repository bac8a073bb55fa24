#pragma once

#include <iostream>
#include <string>
#include "logger/logger.hpp"
#include "tree/tree_encoder.hpp"

namespace ecrs {
namespace cli {

struct ProgramOptions {
  std::string file;
  std::string log_file;
  logging::severity_level log_level{logging::severity_level::warning};
  bool list_blocks{false};
  bool show_progress{false};
  bool show_help{false};
  bool valid{false};
};

// Parses the ecrs-publish command line. Errors are reported on err and leave valid == false.
ProgramOptions parse_command_line(int argc, const char* const argv[], std::ostream& err = std::cerr);
void print_usage(const std::string& program_name, std::ostream& out);

class CLI {
public:
  // ---- CONSTRUCTOR ----
  CLI(const ProgramOptions& options, std::ostream& out, std::ostream& err);


  // ---- STARTUP ----
  // Encodes the file and prints its locator. Returns the process exit code.
  int run();

private:
  // ---- PARAMETERS ----
  const ProgramOptions options_;
  std::ostream& out_;
  std::ostream& err_;


  // ---- OUTPUT ----
  void print_block(const tree::BlockEvent& event);
  void print_progress(uint64_t completed, uint64_t size, unsigned depth);
  void log_and_display_error(const std::string& message, const std::string& error);
};

} // namespace cli
} // namespace ecrs
