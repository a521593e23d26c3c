#include "group.hh"

#include <algorithm>
#include <iterator>
#include <tuple>
#include <utility>

namespace tcombine {

inline namespace detail_v1 {

std::vector<group_t> group_files(std::vector<file_entry_t> file_list,
                                 const uint64_t min_size) {
  std::erase_if(file_list, [min_size](const auto &entry) {
    return entry.size() <= min_size;
  });

  // sort by key, then path for a reproducible member order
  std::vector<std::pair<group_key_t, file_entry_t>> keyed;
  keyed.reserve(file_list.size());
  for (auto &entry : file_list) {
    auto key = group_key_t::of(entry);
    keyed.emplace_back(std::move(key), std::move(entry));
  }
  std::sort(keyed.begin(), keyed.end(), [](const auto &lhs, const auto &rhs) {
    return std::tie(lhs.first, lhs.second.path()) <
           std::tie(rhs.first, rhs.second.path());
  });

  std::vector<group_t> group_list;
  if (keyed.empty()) {
    return group_list;
  }
  // finding union of same key
  auto union_st = keyed.begin();
  auto union_ed = union_st + 1;
  while (true) {
    if (union_ed == keyed.end() || union_ed->first != union_st->first) {
      // end of union
      auto &group = group_list.emplace_back();
      group.key = union_st->first;
      group.members.reserve((uint64_t)std::distance(union_st, union_ed));
      for (; union_st != union_ed; ++union_st) {
        group.members.emplace_back(std::move(union_st->second));
      }
      if (union_ed == keyed.end()) {
        break;
      }
      union_st = union_ed;
    }
    ++union_ed;
  }
  return group_list;
}

}  // namespace detail_v1

}  // namespace tcombine
