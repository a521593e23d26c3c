#pragma once

#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace tcombine {

inline namespace detail_v1 {

// root path missing or not a directory, aborts the run
class startup_error_t : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// base of errors local to one group
class error_t : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class io_error_t : public error_t {
  std::filesystem::path _path;
  std::error_code _ec;

 public:
  io_error_t(const std::string &what, std::filesystem::path path,
             std::error_code ec)
      : error_t(what + ": " + path.string() + " - " + ec.message()),
        _path(std::move(path)),
        _ec(ec) {}

  inline const std::filesystem::path &path() const noexcept { return _path; }
  inline std::error_code code() const noexcept { return _ec; }
};

// file size changed since discovery
class size_mismatch_error_t : public error_t {
  std::filesystem::path _path;
  uint64_t _expected;
  uint64_t _actual;

 public:
  size_mismatch_error_t(std::filesystem::path path, uint64_t expected,
                        uint64_t actual)
      : error_t("size changed: " + path.string() + " - expected " +
                std::to_string(expected) + " bytes, got " +
                std::to_string(actual)),
        _path(std::move(path)),
        _expected(expected),
        _actual(actual) {}

  inline const std::filesystem::path &path() const noexcept { return _path; }
  inline uint64_t expected() const noexcept { return _expected; }
  inline uint64_t actual() const noexcept { return _actual; }
};

/**
 * @brief first offset where members hold different non-zero bytes
 */
struct conflict_t {
  uint64_t offset = 0;
  // distinct non-zero values, ascending
  std::vector<uint8_t> values;
  // byte of every member at offset, in member order
  std::vector<uint8_t> member_bytes;
};

std::string to_string(const conflict_t &conflict);

class conflict_error_t : public error_t {
  conflict_t _conflict;

 public:
  explicit conflict_error_t(conflict_t conflict)
      : error_t("conflicting bytes " + to_string(conflict)),
        _conflict(std::move(conflict)) {}

  inline const conflict_t &conflict() const noexcept { return _conflict; }
};

}  // namespace detail_v1

}  // namespace tcombine
