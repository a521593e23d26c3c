#pragma once

#include <compare>
#include <cstdint>
#include <filesystem>
#include <string>
#include <utility>

namespace tcombine {

inline namespace detail_v1 {

class file_entry_t {
  std::filesystem::path _path;
  uint64_t _size = 0;

 public:
  template <typename Tp>
  inline file_entry_t(Tp &&path, const uint64_t size) noexcept(
      noexcept(std::filesystem::path(std::forward<Tp>(path))))
      : _path(std::forward<Tp>(path)), _size(size) {}

  inline file_entry_t(const file_entry_t &rhs) = default;
  inline file_entry_t(file_entry_t &&rhs) = default;
  inline file_entry_t &operator=(const file_entry_t &rhs) = default;
  inline file_entry_t &operator=(file_entry_t &&rhs) = default;

  inline const std::filesystem::path &path() const noexcept { return _path; }
  inline uint64_t size() const noexcept { return _size; }
  inline std::string basename() const { return _path.filename().string(); }
};

/**
 * @brief files with equal key are candidate copies of one content
 */
struct group_key_t {
  std::string basename;
  uint64_t size = 0;

  auto operator<=>(const group_key_t &rhs) const = default;
  bool operator==(const group_key_t &rhs) const = default;

  static inline group_key_t of(const file_entry_t &entry) {
    return group_key_t{entry.basename(), entry.size()};
  }
};

}  // namespace detail_v1

}  // namespace tcombine
