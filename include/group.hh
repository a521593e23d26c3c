#pragma once

#include <cstdint>
#include <vector>

#include "config.hh"
#include "file_entry.hh"

namespace tcombine {

inline namespace detail_v1 {

struct group_t {
  group_key_t key;
  // ordered by path
  std::vector<file_entry_t> members;

  // groups with a single member have nothing to merge
  inline bool is_inert() const noexcept { return members.size() < 2; }
};

/**
 * @brief partition files by (basename, size), files not larger than
 * min_size are dropped. The result is ordered by key and does not
 * depend on the order of file_list.
 *
 * @param file_list discovered files
 * @param min_size files must be strictly larger to be kept
 * @return groups, including inert ones
 */
std::vector<group_t> group_files(std::vector<file_entry_t> file_list,
                                 const uint64_t min_size = config::min_file_sz);

}  // namespace detail_v1

}  // namespace tcombine
