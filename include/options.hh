#pragma once

#include <cstdint>
#include <regex>
#include <vector>

#include "chunk_io.hh"

namespace tcombine {

inline namespace detail_v1 {

struct options_t {
  // overwrite incomplete files in place instead of writing .merged siblings
  bool replace = false;
  // workers for listing and for processing groups
  uint32_t max_thread = 1;
  std::vector<std::regex> exclude_regex;
  progress_fn progress;
};

}  // namespace detail_v1

}  // namespace tcombine
