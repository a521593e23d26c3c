#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <regex>
#include <vector>

#include "file_entry.hh"
#include "logger.hh"

#ifndef BOOST_ASIO_HAS_STD_INVOKE_RESULT
#define BOOST_ASIO_HAS_STD_INVOKE_RESULT
#endif

#include <boost/asio/thread_pool.hpp>

namespace tcombine {

inline namespace detail_v1 {

inline bool is_excluded(const std::filesystem::path &path,
                        const std::vector<std::regex> &exclude_regex) {
  for (const auto &regex : exclude_regex) {
    if (std::regex_match(path.native(), regex)) {
      return true;
    }
  }
  return false;
}

/**
 * @brief list directory recursively, symlinks are skipped,
 * unreadable entries are logged and dropped.
 *
 * @param dir directory path
 * @param[out] file_list regular files with their size, no order guarantee
 * @param mtx mutex for protecting file_list
 * @param pool thread pool for recursive calls
 * @param exclude_regex regular expression to exclude files or directories
 * @param log logger
 */
void ls_dir_rec(const std::filesystem::path dir,
                std::vector<file_entry_t> &file_list, std::mutex &mtx,
                boost::asio::thread_pool &pool,
                const std::vector<std::regex> &exclude_regex, logger_t &log);

/**
 * @brief list all regular files under root using max_thread workers
 */
std::vector<file_entry_t> ls_dir(const std::filesystem::path &root,
                                 const std::vector<std::regex> &exclude_regex,
                                 const uint32_t max_thread, logger_t &log);

}  // namespace detail_v1

}  // namespace tcombine
