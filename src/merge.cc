#include "merge.hh"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace tcombine {

inline namespace detail_v1 {

std::string to_string(const conflict_t &conflict) {
  std::ostringstream os;
  os << "at offset " << conflict.offset << ", values" << std::hex
     << std::setfill('0');
  for (const auto val : conflict.values) {
    os << " 0x" << std::setw(2) << (unsigned)val;
  }
  os << ", member bytes";
  for (const auto val : conflict.member_bytes) {
    os << " 0x" << std::setw(2) << (unsigned)val;
  }
  return os.str();
}

std::optional<std::size_t> merge_chunk(
    std::span<const std::span<const uint8_t>> chunks, std::span<uint8_t> out,
    std::vector<bool> &complete) {
  for (std::size_t pos = 0; pos < out.size(); ++pos) {
    uint8_t or_byte = 0;
    uint8_t non_zero = 0;
    for (const auto &chunk : chunks) {
      const auto byte = chunk[pos];
      if (byte != 0) {
        if (non_zero != 0 && non_zero != byte) {
          return pos;
        }
        non_zero = byte;
      }
      or_byte |= byte;
    }
    out[pos] = or_byte;
  }
  // a member is complete while it never lacked a merged byte
  for (std::size_t i = 0; i < chunks.size(); ++i) {
    if (complete[i] && !std::equal(out.begin(), out.end(), chunks[i].begin())) {
      complete[i] = false;
    }
  }
  return std::nullopt;
}

conflict_t make_conflict(std::span<const std::span<const uint8_t>> chunks,
                         const std::size_t pos, const uint64_t base_offset) {
  conflict_t conflict;
  conflict.offset = base_offset + pos;
  conflict.member_bytes.reserve(chunks.size());
  for (const auto &chunk : chunks) {
    conflict.member_bytes.push_back(chunk[pos]);
    if (chunk[pos] != 0) {
      conflict.values.push_back(chunk[pos]);
    }
  }
  std::sort(conflict.values.begin(), conflict.values.end());
  conflict.values.erase(
      std::unique(conflict.values.begin(), conflict.values.end()),
      conflict.values.end());
  return conflict;
}

std::vector<bool> merge_group(const group_t &group, chunk_writer_t *stage,
                              const std::size_t chunk_sz) {
  // open every member, at most group size descriptors
  std::vector<chunk_reader_t> readers;
  readers.reserve(group.members.size());
  for (const auto &member : group.members) {
    if (member.size() != group.key.size) {
      throw size_mismatch_error_t(member.path(), group.key.size,
                                  member.size());
    }
    readers.emplace_back(member, chunk_sz);
  }

  std::vector<bool> complete(readers.size(), true);
  std::vector<std::span<const uint8_t>> chunks(readers.size());
  std::vector<uint8_t> out(chunk_sz);
  uint64_t offset = 0;
  while (true) {
    // equal sizes are verified by the readers, chunks have equal length
    for (std::size_t i = 0; i < readers.size(); ++i) {
      chunks[i] = readers[i].next();
    }
    if (chunks.front().empty()) {
      break;
    }
    auto merged = std::span(out).first(chunks.front().size());
    if (auto pos = merge_chunk(chunks, merged, complete)) {
      throw conflict_error_t(make_conflict(chunks, *pos, offset));
    }
    if (stage != nullptr) {
      stage->write(merged);
    }
    offset += merged.size();
  }
  return complete;
}

}  // namespace detail_v1

}  // namespace tcombine
