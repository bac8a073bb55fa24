#include "cli/cli.hpp"
#include "encoding/base32.hpp"
#include "io/input_file.hpp"
#include "locator/locator.hpp"
#include <unordered_map>
#include <boost/log/trivial.hpp>

namespace ecrs {
namespace cli {

//==============================================
// COMMAND LINE PARSING
//==============================================

void print_usage(const std::string& program_name, std::ostream& out) {
  out << "Usage: " << program_name << " [options] <file>\n"
      << "Options:\n"
      << "  -l, --log-file <file>    Write the log to <file>\n"
      << "  -v, --verbosity <level>  trace|debug|info|warning|error|fatal (default: warning)\n"
      << "  -b, --blocks             List every block of the tree\n"
      << "  -p, --progress           Print encoding progress\n"
      << "  -h, --help               Display this help message\n"
      << "Example: " << program_name << " -v info report.pdf\n";
}

ProgramOptions parse_command_line(int argc, const char* const argv[], std::ostream& err) {
  enum class Flag { LogFile, Verbosity, Blocks, Progress, Help };
  const std::unordered_map<std::string, Flag> flag_map = {
    {"-l", Flag::LogFile},   {"--log-file", Flag::LogFile},
    {"-v", Flag::Verbosity}, {"--verbosity", Flag::Verbosity},
    {"-b", Flag::Blocks},    {"--blocks", Flag::Blocks},
    {"-p", Flag::Progress},  {"--progress", Flag::Progress},
    {"-h", Flag::Help},      {"--help", Flag::Help}
  };

  ProgramOptions options;
  const std::string program_name = argc > 0 ? argv[0] : "ecrs-publish";

  for (int i = 1; i < argc; ++i) {
    const std::string arg(argv[i]);

    auto it = flag_map.find(arg);
    if (it == flag_map.end()) {
      if (!arg.empty() && arg[0] == '-') {
        err << "Error: Unknown argument: " << arg << '\n';
        print_usage(program_name, err);
        return options;
      }
      if (!options.file.empty()) {
        err << "Error: Only one file can be encoded at a time\n";
        print_usage(program_name, err);
        return options;
      }
      options.file = arg;
      continue;
    }

    switch (it->second) {
      case Flag::Blocks:
        options.list_blocks = true;
        break;
      case Flag::Progress:
        options.show_progress = true;
        break;
      case Flag::Help:
        options.show_help = true;
        options.valid = true;
        return options;
      case Flag::LogFile:
      case Flag::Verbosity: {
        if (i + 1 >= argc) {
          err << "Error: Missing value for " << arg << '\n';
          print_usage(program_name, err);
          return options;
        }
        const std::string value(argv[++i]);
        if (it->second == Flag::LogFile) {
          options.log_file = value;
        } else if (auto level = logging::parse_severity(value)) {
          options.log_level = *level;
        } else {
          err << "Error: Invalid verbosity level: " << value << '\n';
          print_usage(program_name, err);
          return options;
        }
        break;
      }
    }
  }

  if (options.file.empty()) {
    err << "Error: No input file given\n";
    print_usage(program_name, err);
    return options;
  }

  options.valid = true;
  return options;
}

//==============================================
// CONSTRUCTOR
//==============================================

CLI::CLI(const ProgramOptions& options, std::ostream& out, std::ostream& err)
  : options_(options)
  , out_(out)
  , err_(err) {
  BOOST_LOG_TRIVIAL(debug) << "CLI initialized for " << options_.file;
}

//==============================================
// STARTUP
//==============================================

int CLI::run() {
  tree::BlockHandler block_handler;
  if (options_.list_blocks) {
    block_handler = [this](const tree::BlockEvent& event) { print_block(event); };
  }

  tree::ProgressHandler progress_handler;
  if (options_.show_progress) {
    progress_handler = [this](uint64_t completed, uint64_t size, unsigned depth) {
      print_progress(completed, size, depth);
    };
  }

  try {
    const std::string locator = locator::locator_for_file(options_.file, block_handler,
                                                          progress_handler);
    out_ << locator << std::endl;
    return 0;
  } catch (const io::IoError& e) {
    log_and_display_error("Error reading " + options_.file, e.what());
  } catch (const std::exception& e) {
    log_and_display_error("Error encoding " + options_.file, e.what());
  }
  return 1;
}

//==============================================
// OUTPUT
//==============================================

void CLI::print_block(const tree::BlockEvent& event) {
  out_ << (event.type == tree::BlockType::DBlock ? "DBLOCK" : "IBLOCK")
       << " depth=" << event.depth
       << " offset=" << event.offset
       << " size=" << event.ciphertext.size()
       << " query=" << encoding::Base32::encode(event.chk.query.data(), event.chk.query.size())
       << '\n';
}

void CLI::print_progress(uint64_t completed, uint64_t size, unsigned depth) {
  // Only leaves move the offset, report those
  if (depth != 0) {
    return;
  }
  const uint64_t percent = size == 0 ? 100 : (completed * 100) / size;
  err_ << "\rEncoded " << completed << " of " << size << " bytes (" << percent << "%)";
  if (completed == size) {
    err_ << '\n';
  }
  err_ << std::flush;
}

void CLI::log_and_display_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << message << ": " << error;
  err_ << message << ": " << error << std::endl;
}

} // namespace cli
} // namespace ecrs
