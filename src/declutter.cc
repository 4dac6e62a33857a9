#include "declutter/declutter.hh"

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

#include "declutter/cluster.hh"
#include "declutter/fingerprint.hh"
#include "declutter/log.hh"
#include "declutter/score.hh"
#include "declutter/search.hh"

namespace declutter {

inline namespace detail_v1 {

namespace {

using steady_t = std::chrono::steady_clock;

class budget_t {
  std::optional<steady_t::time_point> _deadline;

 public:
  budget_t(const steady_t::time_point start, const config_t &config) {
    if (config.time_budget) {
      _deadline = start + *config.time_budget;
    }
  }
  bool spent() const noexcept {
    return _deadline && steady_t::now() >= *_deadline;
  }
};

plan_entry_t make_entry(const file_record_t &record, const score_t &score,
                        const action_t act, const config_t &config) {
  plan_entry_t entry;
  entry.path = record.path();
  entry.size = record.size();
  entry.mtime = record.mtime();
  entry.action = act;
  entry.rule_action =
      record.ok() ? rule_action(score, config) : action_t::keep;
  entry.score = score;
  entry.error = record.error();
  return entry;
}

plan_t plan_impl(const file_record_vec &records, const config_t &config,
                 const steady_t::time_point start, bool truncated) {
  const logger_t logger(*config.log_stream);
  const budget_t budget(start, config);
  timer_t timer;

  plan_t plan;
  plan.truncated = truncated;
  plan.now = *config.now;

  logger.log("cluster duplicates...");
  const auto clusters = build_clusters(records, config);
  logger.log("elapsed: ", timer.time().count(), "ms");
  logger.log("cluster count: ", clusters.size());

  const auto scores =
      score_records(records, clusters, default_rules(config), config);

  logger.log("search cluster decisions...");
  std::vector<bool> clustered(records.size(), false);
  for (const auto &cluster : clusters) {
    if (budget.spent()) {
      plan.truncated = true;
      break;
    }
    cluster_summary_t summary;
    summary.id = cluster.id;
    summary.kind = cluster.kind;
    summary.size = cluster.members.size();
    summary.anchors = cluster.anchors;

    std::vector<action_t> actions(cluster.members.size(), action_t::keep);
    try {
      const cluster_problem_t problem(cluster, scores, config);
      auto result = search_cluster(problem, config.max_expansions);
      actions = std::move(result.actions);
      summary.cost = result.cost;
      summary.expanded = result.expanded;
      summary.solved = true;
    } catch (const search_error &e) {
      // keep the whole cluster, other clusters go on
      logger.err(e.what());
      plan.warnings.emplace_back(std::string(e.what()) + " - members kept");
    }

    for (std::size_t pos = 0; pos < cluster.members.size(); ++pos) {
      const auto idx = cluster.members[pos];
      auto &entry = plan.entries.emplace_back(
          make_entry(records[idx], scores[idx], actions[pos], config));
      entry.cluster_id = cluster.id;
      entry.cluster_kind = cluster.kind;
      entry.representative = idx == cluster.representative;
      clustered[idx] = true;
    }
    plan.clusters.push_back(summary);
  }
  logger.log("elapsed: ", timer.time().count(), "ms");

  if (!plan.truncated) {
    for (std::size_t i = 0; i < records.size(); ++i) {
      if (clustered[i]) {
        continue;
      }
      if (budget.spent()) {
        plan.truncated = true;
        break;
      }
      const auto &record = records[i];
      auto act = action_t::keep;
      if (!record.ok()) {
        // never act on a file that could not be verified
        logger.warn(to_string(record.error()), ": ", record.path());
        plan.warnings.emplace_back(std::string(to_string(record.error())) +
                                   ": " + record.path().string());
      } else if (scores[i].total > config.archive_threshold) {
        act = action_t::archive;
      }
      plan.entries.emplace_back(make_entry(record, scores[i], act, config));
    }
  }

  std::sort(plan.entries.begin(), plan.entries.end(),
            [](const auto &lhs, const auto &rhs) { return lhs.path < rhs.path; });
  if (plan.truncated) {
    logger.warn("budget exhausted, plan covers ", plan.entries.size(), " of ",
                records.size(), " files");
  }
  logger.log("keep: ", plan.count(action_t::keep),
             ", archive: ", plan.count(action_t::archive),
             ", delete: ", plan.count(action_t::remove),
             ", rules disagree: ", plan.disagreements());
  return plan;
}

config_t with_now(const config_t &config) {
  auto run_config = config;
  if (!run_config.now) {
    run_config.now = std::chrono::system_clock::now();
  }
  return run_config;
}

}  // namespace

const plan_entry_t *plan_t::find(
    const std::filesystem::path &path) const noexcept {
  auto it = std::lower_bound(
      entries.begin(), entries.end(), path,
      [](const plan_entry_t &entry, const std::filesystem::path &key) {
        return entry.path < key;
      });
  if (it == entries.end() || it->path != path) {
    return nullptr;
  }
  return &(*it);
}

std::size_t plan_t::count(const action_t act) const noexcept {
  return (std::size_t)std::count_if(
      entries.begin(), entries.end(),
      [act](const plan_entry_t &entry) { return entry.action == act; });
}

std::size_t plan_t::disagreements() const noexcept {
  return (std::size_t)std::count_if(
      entries.begin(), entries.end(), [](const plan_entry_t &entry) {
        return entry.rule_action != entry.action;
      });
}

std::string_view agreement(const plan_entry_t &entry) noexcept {
  if (entry.rule_action != entry.action) {
    return "disagree";
  }
  return entry.action == action_t::keep ? "" : "agree_action";
}

plan_t decide(file_entry_vec entries, const config_t &config) {
  const auto start = steady_t::now();
  const auto run_config = with_now(config);
  const logger_t logger(*run_config.log_stream);
  timer_t timer;

  std::sort(
      entries.begin(), entries.end(),
      [](const auto &lhs, const auto &rhs) { return lhs.path() < rhs.path(); });
  bool truncated = false;
  if (run_config.max_files && entries.size() > *run_config.max_files) {
    logger.warn("file cap ", *run_config.max_files, " of ", entries.size());
    entries.erase(entries.begin() + (std::ptrdiff_t)*run_config.max_files,
                  entries.end());
    truncated = true;
  }

  logger.log("fingerprint files...");
  const auto records = fingerprint_all(entries, run_config);
  logger.log("elapsed: ", timer.time().count(), "ms");
  logger.log("file count: ", records.size());

  return plan_impl(records, run_config, start, truncated);
}

plan_t decide_records(const file_record_vec &records, const config_t &config) {
  const auto start = steady_t::now();
  auto run_config = with_now(config);
  if (run_config.max_files && records.size() > *run_config.max_files) {
    auto capped = records;
    std::sort(
        capped.begin(), capped.end(),
        [](const auto &lhs, const auto &rhs) { return lhs.path() < rhs.path(); });
    capped.erase(capped.begin() + (std::ptrdiff_t)*run_config.max_files,
                 capped.end());
    return plan_impl(capped, run_config, start, true);
  }
  return plan_impl(records, run_config, start, false);
}

}  // namespace detail_v1

}  // namespace declutter
