#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include "chunk_io.hh"
#include "config.hh"
#include "error.hh"
#include "group.hh"

namespace tcombine {

inline namespace detail_v1 {

/**
 * @brief merge one chunk of every member.
 * At each offset the member bytes are valid if at most one distinct
 * non-zero value appears, the merged byte is the OR of all of them.
 *
 * @param chunks one span per member, all of the same length
 * @param[out] out merged bytes, same length as the chunks
 * @param[in,out] complete cleared for members whose chunk differs from out
 * @return position of the first conflicting byte, out and complete are
 * unspecified then
 */
std::optional<std::size_t> merge_chunk(
    std::span<const std::span<const uint8_t>> chunks, std::span<uint8_t> out,
    std::vector<bool> &complete);

/**
 * @brief describe the conflict at chunk position pos
 *
 * @param base_offset file offset of the chunks
 */
conflict_t make_conflict(std::span<const std::span<const uint8_t>> chunks,
                         const std::size_t pos, const uint64_t base_offset);

/**
 * @brief stream all members in lock-step, check consistency, write the
 * merged content to stage and classify members.
 * Stops at the first conflicting offset.
 *
 * @param group group of at least 2 members of equal size
 * @param stage receives the merged content, nullptr to only check and
 * classify
 * @param chunk_sz read size per member
 * @return per member, true if its content already equals the merge
 * @throws conflict_error_t members disagree, stage content is partial
 * @throws size_mismatch_error_t a member changed size since discovery
 * @throws io_error_t read or write failure
 */
std::vector<bool> merge_group(const group_t &group, chunk_writer_t *stage,
                              const std::size_t chunk_sz = config::chunk_sz);

}  // namespace detail_v1

}  // namespace tcombine
