#include "commit.hh"

#include <optional>
#include <system_error>

#include "config.hh"
#include "error.hh"

namespace tcombine {

inline namespace detail_v1 {

namespace {

std::filesystem::perms perms_of(const std::filesystem::path &path) {
  std::error_code ec;
  auto status = std::filesystem::status(path, ec);
  if (ec) {
    throw io_error_t("can't stat", path, ec);
  }
  return status.permissions();
}

}  // namespace

std::string_view to_string(const outcome_t outcome) noexcept {
  switch (outcome) {
    case outcome_t::complete:
      return "complete";
    case outcome_t::updated:
      return "updated";
    case outcome_t::skipped:
      return "skipped";
    case outcome_t::error:
      return "error";
  }
  return "unknown";
}

std::filesystem::path output_path(const std::filesystem::path &path,
                                  const bool replace) {
  if (replace) {
    return path;
  }
  auto merged = path;
  merged += config::merged_suffix;
  return merged;
}

void commit_group(const group_t &group, const std::vector<bool> &complete,
                  temp_file_t &stage, const options_t &opt, logger_t &log,
                  std::vector<file_outcome_t> &outcomes) {
  // the stage is renamed onto the last destination sharing its
  // directory, every other destination gets a copy
  const auto stage_dir = stage.path().parent_path();
  std::optional<std::size_t> stage_idx;
  for (std::size_t i = 0; i < group.members.size(); ++i) {
    if (!complete[i] && group.members[i].path().parent_path() == stage_dir) {
      stage_idx = i;
    }
  }

  const auto verb = opt.replace ? "replaced: " : "merged: ";
  for (std::size_t i = 0; i < group.members.size(); ++i) {
    if (complete[i] || stage_idx == i) {
      continue;
    }
    const auto &member = group.members[i];
    const auto dest = output_path(member.path(), opt.replace);
    temp_file_t tmp(member.path().parent_path(), group.key.basename, log);
    chunk_reader_t src(file_entry_t(stage.path(), group.key.size));
    copy_chunks(src, tmp.writer(), dest, opt.progress);
    tmp.persist(dest, perms_of(member.path()));
    outcomes[i].outcome = outcome_t::updated;
    log.info() << verb << dest;
  }

  if (stage_idx) {
    const auto &member = group.members[*stage_idx];
    const auto dest = output_path(member.path(), opt.replace);
    stage.persist(dest, perms_of(member.path()));
    outcomes[*stage_idx].outcome = outcome_t::updated;
    log.info() << verb << dest;
  }
}

}  // namespace detail_v1

}  // namespace tcombine
