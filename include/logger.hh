#pragma once

#include <mutex>
#include <ostream>
#include <sstream>
#include <string_view>

namespace tcombine {

inline namespace detail_v1 {

enum class log_lv { dbg, info, warn, err };

/**
 * @brief line oriented logger shared by pool workers,
 * passed by reference to every component that reports.
 */
class logger_t {
  std::ostream &_os;
  std::mutex _mtx;
  bool _verbose;

  void write(std::string_view line);

 public:
  // collects one line, written as a whole on destruction
  class line_t {
    logger_t *_logger;
    std::ostringstream _buf;

   public:
    line_t(logger_t *logger, log_lv lv);
    ~line_t();

    line_t(const line_t &) = delete;
    line_t(line_t &&) = delete;
    line_t &operator=(const line_t &) = delete;
    line_t &operator=(line_t &&) = delete;

    template <typename Tp>
    inline line_t &operator<<(const Tp &val) {
      if (_logger != nullptr) {
        _buf << val;
      }
      return *this;
    }
  };

  logger_t() = delete;
  explicit logger_t(std::ostream &os, bool verbose = false) noexcept
      : _os(os), _verbose(verbose) {}

  logger_t(const logger_t &) = delete;
  logger_t(logger_t &&) = delete;
  logger_t &operator=(const logger_t &) = delete;
  logger_t &operator=(logger_t &&) = delete;

  inline bool verbose() const noexcept { return _verbose; }

  inline line_t dbg() { return line_t(this, log_lv::dbg); }
  inline line_t info() { return line_t(this, log_lv::info); }
  inline line_t warn() { return line_t(this, log_lv::warn); }
  inline line_t err() { return line_t(this, log_lv::err); }
};

}  // namespace detail_v1

}  // namespace tcombine
