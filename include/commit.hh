#pragma once

#include <filesystem>
#include <string_view>
#include <vector>

#include "chunk_io.hh"
#include "group.hh"
#include "logger.hh"
#include "options.hh"

namespace tcombine {

inline namespace detail_v1 {

enum class outcome_t {
  complete,  // already equal to the merge, untouched
  updated,   // merge written per mode
  skipped,   // group rejected, untouched
  error      // I/O failure
};

std::string_view to_string(const outcome_t outcome) noexcept;

struct file_outcome_t {
  std::filesystem::path path;
  outcome_t outcome = outcome_t::error;
};

/**
 * @brief destination of the merge for one member,
 * the member itself in replace mode, else a .merged sibling
 */
std::filesystem::path output_path(const std::filesystem::path &path,
                                  const bool replace);

/**
 * @brief write the staged merge to the destination of every incomplete
 * member. Each destination is replaced atomically, the set is not:
 * outcomes already marked updated stay valid when this throws.
 *
 * @param group merged group
 * @param complete per member classification of the staged merge
 * @param stage finished temp file holding the merge, in the directory
 * of an incomplete member
 * @param opt run options
 * @param log logger
 * @param[out] outcomes set to updated per member as it is committed
 * @throws io_error_t, size_mismatch_error_t
 */
void commit_group(const group_t &group, const std::vector<bool> &complete,
                  temp_file_t &stage, const options_t &opt, logger_t &log,
                  std::vector<file_outcome_t> &outcomes);

}  // namespace detail_v1

}  // namespace tcombine
