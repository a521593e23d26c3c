#pragma once

#include <cstdint>
#include <filesystem>
#include <vector>

#include "commit.hh"
#include "config.hh"
#include "group.hh"
#include "logger.hh"
#include "options.hh"

namespace tcombine {

inline namespace detail_v1 {

struct run_summary_t {
  uint64_t file_count = 0;
  // groups with at least 2 members
  uint64_t group_count = 0;
  uint64_t inert_count = 0;
  uint64_t failed_count = 0;
  // per file of every merged group, ordered by path
  std::vector<file_outcome_t> outcomes;

  uint64_t count(const outcome_t outcome) const noexcept;
};

/**
 * @brief check, merge and write back one group. Failures are logged
 * and reported through the outcomes, never thrown.
 *
 * @param group group to process
 * @param opt run options
 * @param log logger
 * @return outcome per member, empty for inert groups
 */
TCOMBINE_EXPORT std::vector<file_outcome_t> process_group(
    const group_t &group, const options_t &opt, logger_t &log);

/**
 * @brief merge partial copies of the same files found under root.
 * Files sharing basename and size (larger than 1MiB) are merged when
 * their non-zero bytes agree.
 *
 * @param root directory to search
 * @param opt run options
 * @param log logger
 * @return summary of the run
 * @throws startup_error_t root is missing or not a directory
 */
TCOMBINE_EXPORT run_summary_t combine(const std::filesystem::path &root,
                                      const options_t &opt, logger_t &log);

}  // namespace detail_v1

}  // namespace tcombine
