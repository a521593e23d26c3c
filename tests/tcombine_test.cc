#include "tcombine.hh"

#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "error.hh"
#include "test_util.hh"

namespace tcombine {
namespace {

using test::big_sz;
using test::entry_of;
using test::names_in;
using test::padded;
using test::read_file;
using test::tmp_dir_t;
using test::write_file;

class CombineTest : public ::testing::Test {
 protected:
  tmp_dir_t dir;
  std::ostringstream os;
  logger_t log{os, true};

  std::filesystem::path put(const std::string &rel,
                            const std::vector<uint8_t> &data) {
    const auto path = dir / rel;
    write_file(path, data);
    return path;
  }

  outcome_t outcome_of(const run_summary_t &summary,
                       const std::filesystem::path &path) {
    for (const auto &entry : summary.outcomes) {
      if (entry.path == path) {
        return entry.outcome;
      }
    }
    ADD_FAILURE() << "no outcome for " << path;
    return outcome_t::error;
  }
};

TEST_F(CombineTest, MergesPartialCopiesIntoSiblings) {
  const auto x = put("a/x.bin", padded({0x41, 0x00, 0x00, 0x44}));
  const auto y = put("b/x.bin", padded({0x00, 0x42, 0x00, 0x44}));

  auto summary = combine(dir.path(), options_t{}, log);

  const auto merged = padded({0x41, 0x42, 0x00, 0x44});
  EXPECT_EQ(read_file(dir.path() / "a/x.bin.merged"), merged);
  EXPECT_EQ(read_file(dir.path() / "b/x.bin.merged"), merged);
  EXPECT_NE(read_file(x), merged);
  EXPECT_NE(read_file(y), merged);
  EXPECT_EQ(summary.file_count, 2U);
  EXPECT_EQ(summary.group_count, 1U);
  EXPECT_EQ(summary.failed_count, 0U);
  EXPECT_EQ(summary.count(outcome_t::updated), 2U);
  EXPECT_EQ(outcome_of(summary, x), outcome_t::updated);
  EXPECT_EQ(outcome_of(summary, y), outcome_t::updated);
}

TEST_F(CombineTest, ConflictLeavesGroupUntouched) {
  const auto x = put("a/x.bin", padded({0x41, 0x00, 0x00, 0x44}));
  const auto y = put("b/x.bin", padded({0x00, 0x42, 0x00, 0x55}));

  for (const bool replace : {false, true}) {
    options_t opt;
    opt.replace = replace;
    auto summary = combine(dir.path(), opt, log);

    EXPECT_EQ(names_in(dir.path() / "a"), (std::vector<std::string>{"x.bin"}));
    EXPECT_EQ(names_in(dir.path() / "b"), (std::vector<std::string>{"x.bin"}));
    EXPECT_EQ(read_file(x), padded({0x41, 0x00, 0x00, 0x44}));
    EXPECT_EQ(read_file(y), padded({0x00, 0x42, 0x00, 0x55}));
    EXPECT_EQ(summary.failed_count, 1U);
    EXPECT_EQ(outcome_of(summary, x), outcome_t::skipped);
    EXPECT_EQ(outcome_of(summary, y), outcome_t::skipped);
  }
  EXPECT_NE(os.str().find("failed consistency check"), std::string::npos);
  EXPECT_NE(os.str().find("at offset 3, values 0x44 0x55"), std::string::npos);
}

TEST_F(CombineTest, CompleteMemberIsNeverRewritten) {
  const auto z = put("a/z.bin", padded({0x10, 0x20, 0x30}));
  const auto w = put("b/z.bin", padded({0x10, 0x00, 0x30}));
  const auto z_time = std::filesystem::last_write_time(z);

  auto summary = combine(dir.path(), options_t{}, log);
  EXPECT_EQ(names_in(dir.path() / "a"), (std::vector<std::string>{"z.bin"}));
  EXPECT_EQ(read_file(dir.path() / "b/z.bin.merged"), read_file(z));
  EXPECT_EQ(outcome_of(summary, z), outcome_t::complete);
  EXPECT_EQ(outcome_of(summary, w), outcome_t::updated);

  options_t opt;
  opt.replace = true;
  summary = combine(dir.path(), opt, log);
  EXPECT_EQ(read_file(w), padded({0x10, 0x20, 0x30}));
  EXPECT_EQ(std::filesystem::last_write_time(z), z_time);
  EXPECT_EQ(outcome_of(summary, z), outcome_t::complete);
  EXPECT_EQ(outcome_of(summary, w), outcome_t::updated);
}

TEST_F(CombineTest, RerunAfterReplaceChangesNothing) {
  const auto x = put("a/x.bin", padded({0x41, 0x00}));
  const auto y = put("b/x.bin", padded({0x00, 0x42}));
  options_t opt;
  opt.replace = true;
  combine(dir.path(), opt, log);
  ASSERT_EQ(read_file(x), padded({0x41, 0x42}));
  ASSERT_EQ(read_file(y), padded({0x41, 0x42}));
  const auto x_time = std::filesystem::last_write_time(x);
  const auto y_time = std::filesystem::last_write_time(y);

  for (const bool replace : {false, true}) {
    opt.replace = replace;
    auto summary = combine(dir.path(), opt, log);
    EXPECT_EQ(summary.count(outcome_t::complete), 2U);
    EXPECT_EQ(summary.count(outcome_t::updated), 0U);
  }
  EXPECT_EQ(std::filesystem::last_write_time(x), x_time);
  EXPECT_EQ(std::filesystem::last_write_time(y), y_time);
  EXPECT_EQ(names_in(dir.path() / "a"), (std::vector<std::string>{"x.bin"}));
  EXPECT_EQ(names_in(dir.path() / "b"), (std::vector<std::string>{"x.bin"}));
}

TEST_F(CombineTest, FailedReplaceKeepsOriginal) {
  const auto x = put("a/x.bin", padded({0x41, 0x00}));
  const auto y = put("b/x.bin", padded({0x00, 0x42}));

  options_t opt;
  opt.replace = true;
  opt.progress = [](const std::filesystem::path &dest, uint64_t written,
                    uint64_t total) {
    if (written >= total / 2) {
      throw io_error_t("injected write failure", dest,
                       std::make_error_code(std::errc::io_error));
    }
  };
  auto summary = combine(dir.path(), opt, log);

  EXPECT_EQ(read_file(x), padded({0x41, 0x00}));
  EXPECT_EQ(read_file(y), padded({0x00, 0x42}));
  EXPECT_EQ(names_in(dir.path() / "a"), (std::vector<std::string>{"x.bin"}));
  EXPECT_EQ(names_in(dir.path() / "b"), (std::vector<std::string>{"x.bin"}));
  EXPECT_EQ(summary.failed_count, 1U);
  EXPECT_EQ(outcome_of(summary, x), outcome_t::error);
  EXPECT_EQ(outcome_of(summary, y), outcome_t::error);
  EXPECT_NE(os.str().find("injected write failure"), std::string::npos);
}

TEST_F(CombineTest, SmallFilesAreIgnored) {
  put("a/x.bin", padded({0x41, 0x00}, config::min_file_sz));
  put("b/x.bin", padded({0x00, 0x42}, config::min_file_sz));
  put("a/y.bin", padded({0x41, 0x00}, 100));
  put("b/y.bin", padded({0x00, 0x42}, 100));

  auto summary = combine(dir.path(), options_t{}, log);
  EXPECT_EQ(summary.file_count, 4U);
  EXPECT_EQ(summary.group_count, 0U);
  EXPECT_TRUE(summary.outcomes.empty());
  EXPECT_EQ(names_in(dir.path() / "a"),
            (std::vector<std::string>{"x.bin", "y.bin"}));
}

TEST_F(CombineTest, OnlyEqualNameAndSizeAreMerged) {
  put("a/x.bin", padded({0x41, 0x00}));
  put("b/x.bin", padded({0x00, 0x42}, big_sz + 1));
  put("c/y.bin", padded({0x00, 0x42}));

  auto summary = combine(dir.path(), options_t{}, log);
  EXPECT_EQ(summary.group_count, 0U);
  EXPECT_EQ(summary.inert_count, 3U);
  EXPECT_EQ(names_in(dir.path() / "a"), (std::vector<std::string>{"x.bin"}));
  EXPECT_NE(os.str().find("too few members"), std::string::npos);
}

TEST_F(CombineTest, ParallelGroupsMatchSequential) {
  for (int g = 0; g < 6; ++g) {
    const auto name = "f" + std::to_string(g) + ".bin";
    put("a/" + name, padded({(uint8_t)(g + 1), 0x00}));
    put("b/" + name, padded({0x00, (uint8_t)(g + 1)}));
  }
  put("a/bad.bin", padded({0x01}));
  put("b/bad.bin", padded({0x02}));

  options_t opt;
  opt.max_thread = 4;
  auto summary = combine(dir.path(), opt, log);
  EXPECT_EQ(summary.group_count, 7U);
  EXPECT_EQ(summary.failed_count, 1U);
  EXPECT_EQ(summary.count(outcome_t::updated), 12U);
  EXPECT_EQ(summary.count(outcome_t::skipped), 2U);
  for (int g = 0; g < 6; ++g) {
    const auto name = "f" + std::to_string(g) + ".bin";
    EXPECT_EQ(read_file(dir.path() / "a" / (name + ".merged")),
              padded({(uint8_t)(g + 1), (uint8_t)(g + 1)}));
  }
  for (std::size_t i = 1; i < summary.outcomes.size(); ++i) {
    EXPECT_LT(summary.outcomes[i - 1].path, summary.outcomes[i].path);
  }
}

TEST_F(CombineTest, ExcludedCopiesAreNotMerged) {
  put("a/x.bin", padded({0x41, 0x00}));
  put("skip/x.bin", padded({0x00, 0x42}));
  options_t opt;
  opt.exclude_regex.emplace_back(".*/skip");
  auto summary = combine(dir.path(), opt, log);
  EXPECT_EQ(summary.file_count, 1U);
  EXPECT_EQ(names_in(dir.path() / "a"), (std::vector<std::string>{"x.bin"}));
}

TEST_F(CombineTest, InvalidRootIsFatal) {
  EXPECT_THROW(combine(dir.path() / "missing", options_t{}, log),
               startup_error_t);
  const auto file = put("file.bin", {1});
  EXPECT_THROW(combine(file, options_t{}, log), startup_error_t);
}

TEST_F(CombineTest, SizeChangeAbortsGroup) {
  const auto x = put("a/x.bin", padded({0x41, 0x00}));
  const auto y = put("b/x.bin", padded({0x00, 0x42}));
  group_t group{group_key_t{"x.bin", big_sz}, {entry_of(x), entry_of(y)}};
  write_file(y, padded({0x00, 0x42}, big_sz - 1));

  auto outcomes = process_group(group, options_t{}, log);
  ASSERT_EQ(outcomes.size(), 2U);
  EXPECT_EQ(outcomes[0].outcome, outcome_t::skipped);
  EXPECT_EQ(outcomes[1].outcome, outcome_t::skipped);
  EXPECT_EQ(names_in(dir.path() / "a"), (std::vector<std::string>{"x.bin"}));
  EXPECT_NE(os.str().find("size changed"), std::string::npos);
}

TEST_F(CombineTest, InertGroupHasNoOutcome) {
  const auto x = put("a/x.bin", padded({0x41}));
  group_t group{group_key_t{"x.bin", big_sz}, {entry_of(x)}};
  EXPECT_TRUE(process_group(group, options_t{}, log).empty());
}

}  // namespace
}  // namespace tcombine
