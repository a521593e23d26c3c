#pragma once

#include <cstdint>
#include <string_view>

#define TCOMBINE_EXPORT __attribute__((visibility("default")))

namespace tcombine {

namespace config {

// 64KiB, per member read buffer
constexpr auto chunk_sz = 64UL * 1024UL;
// 1MiB, files must be strictly larger to be grouped
constexpr uint64_t min_file_sz = 1024UL * 1024UL;

constexpr std::string_view merged_suffix = ".merged";
// temp files are named ".<basename><tmp_infix>XXXXXX"
constexpr std::string_view tmp_infix = ".tcombine-";

}  // namespace config

}  // namespace tcombine
