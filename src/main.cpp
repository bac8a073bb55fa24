#include "cli/cli.hpp"
#include "logger/logger.hpp"
#include <exception>
#include <iostream>

int main(int argc, char* argv[]) {
  const auto options = ecrs::cli::parse_command_line(argc, argv);
  if (!options.valid) {
    return 1;
  }
  if (options.show_help) {
    ecrs::cli::print_usage(argv[0], std::cout);
    return 0;
  }

  try {
    ecrs::logging::init_logging(options.log_file, options.log_level);
  } catch (const std::exception& e) {
    std::cerr << "Error: Failed to set up logging: " << e.what() << '\n';
    return 1;
  }

  ecrs::cli::CLI cli(options, std::cout, std::cerr);
  return cli.run();
}
