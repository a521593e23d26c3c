#include "tcombine.hh"

#include <algorithm>
#include <chrono>
#include <iomanip>
#include <iterator>
#include <mutex>
#include <sstream>
#include <string>
#include <system_error>

#include "chunk_io.hh"
#include "error.hh"
#include "ls_dir_rec.hh"
#include "merge.hh"

#ifndef BOOST_ASIO_HAS_STD_INVOKE_RESULT
#define BOOST_ASIO_HAS_STD_INVOKE_RESULT
#endif

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

namespace tcombine {

inline namespace detail_v1 {

namespace {

class phase_timer_t {
  std::chrono::steady_clock::time_point _prev_time;

 public:
  phase_timer_t() noexcept : _prev_time(std::chrono::steady_clock::now()) {}
  std::chrono::milliseconds time() noexcept {
    auto cur_time = std::chrono::steady_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        cur_time - _prev_time);
    _prev_time = cur_time;
    return duration;
  }
};

std::string group_name(const group_t &group) {
  std::ostringstream os;
  os << std::quoted(group.key.basename) << " (" << group.key.size
     << " bytes, " << group.members.size() << " files)";
  return os.str();
}

// members not decided yet take the failure outcome
void mark_undecided(std::vector<file_outcome_t> &outcomes,
                    const outcome_t outcome) {
  for (auto &entry : outcomes) {
    if (entry.outcome == outcome_t::error) {
      entry.outcome = outcome;
    }
  }
}

}  // namespace

uint64_t run_summary_t::count(const outcome_t outcome) const noexcept {
  return (uint64_t)std::count_if(
      outcomes.begin(), outcomes.end(),
      [outcome](const auto &entry) { return entry.outcome == outcome; });
}

std::vector<file_outcome_t> process_group(const group_t &group,
                                          const options_t &opt,
                                          logger_t &log) {
  std::vector<file_outcome_t> outcomes;
  if (group.is_inert()) {
    log.dbg() << "skip group " << group_name(group) << ": too few members";
    return outcomes;
  }
  outcomes.reserve(group.members.size());
  for (const auto &member : group.members) {
    outcomes.push_back({member.path(), outcome_t::error});
  }

  try {
    // check and classify first, nothing is written for conflicting or
    // already merged groups
    auto complete = merge_group(group, nullptr);
    auto first_incomplete = std::find(complete.begin(), complete.end(), false);
    if (first_incomplete == complete.end()) {
      for (auto &entry : outcomes) {
        entry.outcome = outcome_t::complete;
        log.dbg() << "complete: " << entry.path;
      }
      return outcomes;
    }

    // stage the merge beside the first incomplete member
    const auto &owner =
        group.members[(std::size_t)std::distance(complete.begin(),
                                                 first_incomplete)];
    temp_file_t stage(owner.path().parent_path(), group.key.basename, log);
    complete = merge_group(group, &stage.writer());
    stage.finish();
    for (std::size_t i = 0; i < complete.size(); ++i) {
      if (complete[i]) {
        outcomes[i].outcome = outcome_t::complete;
        log.dbg() << "complete: " << outcomes[i].path;
      }
    }
    commit_group(group, complete, stage, opt, log, outcomes);

  } catch (const conflict_error_t &e) {
    log.err() << "group " << group_name(group)
              << " failed consistency check: " << e.what();
    const auto &member_bytes = e.conflict().member_bytes;
    for (std::size_t i = 0; i < member_bytes.size(); ++i) {
      log.err() << "  " << group.members[i].path() << ": 0x" << std::hex
                << std::setw(2) << std::setfill('0')
                << (unsigned)member_bytes[i];
    }
    mark_undecided(outcomes, outcome_t::skipped);

  } catch (const size_mismatch_error_t &e) {
    log.err() << "group " << group_name(group) << " aborted: " << e.what();
    mark_undecided(outcomes, outcome_t::skipped);

  } catch (const error_t &e) {
    log.err() << "group " << group_name(group) << " aborted: " << e.what();

  } catch (const std::filesystem::filesystem_error &e) {
    log.err() << "group " << group_name(group) << " aborted: " << e.what();
  }

  for (const auto &entry : outcomes) {
    if (entry.outcome == outcome_t::error) {
      log.err() << "error: " << entry.path;
    }
  }
  return outcomes;
}

run_summary_t combine(const std::filesystem::path &root, const options_t &opt,
                      logger_t &log) {
  std::error_code ec;
  if (!std::filesystem::is_directory(root, ec)) {
    throw startup_error_t("invalid root directory: " + root.string() +
                          (ec ? " - " + ec.message() : std::string()));
  }
  const auto max_thread = std::max(opt.max_thread, 1U);
  run_summary_t summary;

  // generate file list
  phase_timer_t timer;
  log.info() << "list files...";
  auto file_list = ls_dir(root, opt.exclude_regex, max_thread, log);
  summary.file_count = file_list.size();
  log.info() << "elapsed: " << timer.time().count() << "ms";
  log.info() << "file count: " << summary.file_count;

  // group by basename and size
  auto group_list = group_files(std::move(file_list));
  for (const auto &group : group_list) {
    if (group.is_inert()) {
      ++summary.inert_count;
    } else {
      ++summary.group_count;
    }
  }
  log.info() << "group count: " << summary.group_count;

  // merge groups, groups never share a path
  log.info() << "merge groups...";
  std::mutex mtx;
  auto run = [&](const group_t &group) {
    auto outcomes = process_group(group, opt, log);
    const bool failed =
        std::any_of(outcomes.begin(), outcomes.end(), [](const auto &entry) {
          return entry.outcome == outcome_t::skipped ||
                 entry.outcome == outcome_t::error;
        });
    std::lock_guard lk(mtx);
    if (failed) {
      ++summary.failed_count;
    }
    summary.outcomes.insert(summary.outcomes.end(),
                            std::make_move_iterator(outcomes.begin()),
                            std::make_move_iterator(outcomes.end()));
  };
  if (max_thread > 1) {
    boost::asio::thread_pool pool(max_thread);
    for (const auto &group : group_list) {
      boost::asio::post(pool, [&run, &group] { run(group); });
    }
    pool.join();
  } else {
    for (const auto &group : group_list) {
      run(group);
    }
  }
  std::sort(summary.outcomes.begin(), summary.outcomes.end(),
            [](const auto &lhs, const auto &rhs) { return lhs.path < rhs.path; });
  log.info() << "elapsed: " << timer.time().count() << "ms";
  log.info() << "updated: " << summary.count(outcome_t::updated)
             << ", complete: " << summary.count(outcome_t::complete)
             << ", skipped: " << summary.count(outcome_t::skipped)
             << ", error: " << summary.count(outcome_t::error);
  log.info() << "failed group count: " << summary.failed_count;

  return summary;
}

}  // namespace detail_v1

}  // namespace tcombine
