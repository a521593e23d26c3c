#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <span>
#include <string>
#include <vector>

#include "config.hh"
#include "file_entry.hh"
#include "logger.hh"

namespace tcombine {

inline namespace detail_v1 {

// called after every chunk written by copy_chunks, may throw to abort
using progress_fn = std::function<void(const std::filesystem::path &dest,
                                       uint64_t written, uint64_t total)>;

/**
 * @brief sequential fixed-size chunk reads of one file,
 * verifies the file still has the size it had at discovery.
 */
class chunk_reader_t {
  file_entry_t _file_entry;
  uint64_t _offset = 0;
  std::ifstream _file_stream;
  std::vector<char> _buf;

  [[noreturn]] void throw_short_read(uint64_t got) const;

 public:
  chunk_reader_t() = delete;
  /**
   * @throws io_error_t if the file can't be opened
   * @throws size_mismatch_error_t if the size differs from file_entry.size()
   */
  explicit chunk_reader_t(file_entry_t file_entry,
                          const std::size_t chunk_sz = config::chunk_sz);

  chunk_reader_t(const chunk_reader_t &) = delete;
  chunk_reader_t(chunk_reader_t &&) = default;
  chunk_reader_t &operator=(const chunk_reader_t &) = delete;
  chunk_reader_t &operator=(chunk_reader_t &&) = default;

  /**
   * @brief read the next chunk, the span is valid until the next call
   *
   * @return chunk of min(chunk_sz, remaining) bytes, empty at end of file
   */
  std::span<const uint8_t> next();

  inline const std::filesystem::path &path() const noexcept {
    return _file_entry.path();
  }
  inline uint64_t size() const noexcept { return _file_entry.size(); }
  inline uint64_t offset() const noexcept { return _offset; }
};

/**
 * @brief owns a writable descriptor, every write is complete or throws
 */
class chunk_writer_t {
  std::filesystem::path _path;
  int _fd = -1;
  uint64_t _written = 0;

 public:
  chunk_writer_t() noexcept = default;
  // takes ownership of fd
  chunk_writer_t(std::filesystem::path path, int fd) noexcept;
  ~chunk_writer_t() noexcept;

  chunk_writer_t(const chunk_writer_t &) = delete;
  chunk_writer_t(chunk_writer_t &&rhs) noexcept;
  chunk_writer_t &operator=(const chunk_writer_t &) = delete;
  chunk_writer_t &operator=(chunk_writer_t &&rhs) noexcept;

  void write(std::span<const uint8_t> data);
  // fsync then close
  void close();

  inline bool is_open() const noexcept { return _fd >= 0; }
  inline const std::filesystem::path &path() const noexcept { return _path; }
  inline uint64_t written() const noexcept { return _written; }
};

/**
 * @brief hidden temp file beside its destination, removed on
 * destruction unless persisted. Renaming within one directory
 * keeps the replacement atomic.
 */
class temp_file_t {
  std::filesystem::path _path;
  chunk_writer_t _writer;
  logger_t &_log;
  bool _persisted = false;

 public:
  /**
   * @param dir directory to create the file in
   * @param basename name the temp name is derived from
   * @throws io_error_t if the file can't be created
   */
  temp_file_t(const std::filesystem::path &dir, const std::string &basename,
              logger_t &log);
  ~temp_file_t() noexcept;

  temp_file_t(const temp_file_t &) = delete;
  temp_file_t(temp_file_t &&) = delete;
  temp_file_t &operator=(const temp_file_t &) = delete;
  temp_file_t &operator=(temp_file_t &&) = delete;

  inline chunk_writer_t &writer() noexcept { return _writer; }
  inline const std::filesystem::path &path() const noexcept { return _path; }

  // flush and close, content is final afterwards
  void finish();

  /**
   * @brief finish, apply perms and rename onto dest
   *
   * @throws io_error_t on failure, dest is untouched then
   */
  void persist(const std::filesystem::path &dest,
               const std::filesystem::perms perms);
};

/**
 * @brief copy the rest of src into dst chunk by chunk
 *
 * @param dest reported to progress, the final name of dst
 * @param progress optional callback after each chunk
 */
void copy_chunks(chunk_reader_t &src, chunk_writer_t &dst,
                 const std::filesystem::path &dest,
                 const progress_fn &progress);

}  // namespace detail_v1

}  // namespace tcombine
