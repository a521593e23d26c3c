#include <cstdint>
#include <filesystem>
#include <iostream>
#include <regex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "error.hh"
#include "tcombine.hh"

using namespace std::literals;

namespace {

void usage() {
  std::cerr << "usage: tcombine [-r/--replace] [-j jobs] [-e exclude_regex] "
               "[-v/--verbose] [-h/--help] root_dir"
            << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
  std::vector<std::filesystem::path> root_dir;
  tcombine::options_t opt;
  bool verbose = false;

  for (int i = 1; i < argc; ++i) {
    if (argv[i] == "-r"sv || argv[i] == "--replace"sv) {
      opt.replace = true;
    } else if (argv[i] == "-e"sv) {
      ++i;
      if (i >= argc) {
        std::cerr << "missing exclude_regex" << std::endl;
        return 1;
      }
      try {
        opt.exclude_regex.emplace_back(argv[i]);
      } catch (const std::regex_error& e) {
        std::cerr << "invalid exclude_regex: " << argv[i] << std::endl;
        return 1;
      }
    } else if (argv[i] == "-j"sv) {
      ++i;
      if (i >= argc) {
        std::cerr << "missing jobs" << std::endl;
        return 1;
      }
      int jobs = 0;
      try {
        jobs = std::stoi(argv[i]);
      } catch (const std::logic_error& e) {
        std::cerr << "invalid jobs: " << argv[i] << std::endl;
        return 1;
      }
      if (jobs <= 0 || jobs > 256) {
        std::cerr << "jobs must be > 0 and <= 256" << std::endl;
        return 1;
      }
      opt.max_thread = (uint32_t)jobs;
    } else if (argv[i] == "-v"sv || argv[i] == "--verbose"sv) {
      verbose = true;
    } else if (argv[i] == "-h"sv || argv[i] == "--help"sv) {
      usage();
      return 0;
    } else if (argv[i][0] == '-' && argv[i][1] != '\0') {
      std::cerr << "unknown option: " << argv[i] << std::endl;
      return 1;
    } else {
      root_dir.emplace_back(argv[i]);
    }
  }
  if (root_dir.size() != 1) {
    usage();
    return 1;
  }

  tcombine::logger_t log(std::cerr, verbose);
  if (verbose) {
    opt.progress = [&log](const std::filesystem::path& dest, uint64_t written,
                          uint64_t total) {
      if (written == total) {
        log.dbg() << "copied " << written << " bytes: " << dest;
      }
    };
  }

  try {
    tcombine::combine(root_dir.front(), opt, log);
  } catch (const tcombine::startup_error_t& e) {
    log.err() << e.what();
    return 1;
  }
  return 0;
}
