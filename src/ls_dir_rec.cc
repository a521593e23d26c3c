#include "ls_dir_rec.hh"

#include <functional>

#include <boost/asio/post.hpp>

namespace tcombine {

inline namespace detail_v1 {

void ls_dir_rec(const std::filesystem::path dir,
                std::vector<file_entry_t> &file_list, std::mutex &mtx,
                boost::asio::thread_pool &pool,
                const std::vector<std::regex> &exclude_regex, logger_t &log) {
  std::vector<file_entry_t> file_list_tmp;
  try {
    for (const auto &dir_entry : std::filesystem::directory_iterator(dir)) {
      if (is_excluded(dir_entry.path(), exclude_regex)) {
        log.dbg() << "exclude: " << dir_entry.path();

      } else if (dir_entry.is_symlink()) {
        // symlink, skip
        log.dbg() << "skip symlink: " << dir_entry.path();

      } else if (dir_entry.is_directory()) {
        // directory, recursive call
        boost::asio::post(
            pool, std::bind(ls_dir_rec, dir_entry.path(), std::ref(file_list),
                            std::ref(mtx), std::ref(pool),
                            std::cref(exclude_regex), std::ref(log)));

      } else if (dir_entry.is_regular_file()) {
        std::error_code ec;
        auto file_size = dir_entry.file_size(ec);
        if (ec) {
          // error read file size, drop
          log.warn() << "skip file: " << dir_entry.path() << " - "
                     << ec.message();
        } else {
          file_list_tmp.emplace_back(dir_entry.path(), file_size);
        }

      } else {
        log.dbg() << "skip unsupported file: " << dir_entry.path();
      }
    }
  } catch (const std::filesystem::filesystem_error &e) {
    // error iterate directory, keep what was listed so far
    log.warn() << "skip directory: " << dir << " - " << e.code().message();
  }

  // append to shared list
  if (!file_list_tmp.empty()) {
    std::lock_guard lk(mtx);
    file_list.insert(file_list.end(),
                     std::make_move_iterator(file_list_tmp.begin()),
                     std::make_move_iterator(file_list_tmp.end()));
  }
}

std::vector<file_entry_t> ls_dir(const std::filesystem::path &root,
                                 const std::vector<std::regex> &exclude_regex,
                                 const uint32_t max_thread, logger_t &log) {
  std::vector<file_entry_t> file_list;
  if (is_excluded(root, exclude_regex)) {
    log.info() << "exclude: " << root;
    return file_list;
  }
  boost::asio::thread_pool pool(max_thread);
  std::mutex mtx;
  boost::asio::post(pool, std::bind(ls_dir_rec, root, std::ref(file_list),
                                    std::ref(mtx), std::ref(pool),
                                    std::cref(exclude_regex), std::ref(log)));
  pool.join();
  return file_list;
}

}  // namespace detail_v1

}  // namespace tcombine
