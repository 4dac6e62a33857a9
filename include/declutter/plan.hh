#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "declutter/cluster.hh"
#include "declutter/file_record.hh"
#include "declutter/score.hh"

namespace declutter {

inline namespace detail_v1 {

struct plan_entry_t {
  std::filesystem::path path;
  uint64_t size = 0;
  time_point_t mtime;
  action_t action = action_t::keep;
  // score thresholds alone, kept beside the searched action for comparison
  action_t rule_action = action_t::keep;
  score_t score;
  std::optional<uint32_t> cluster_id;
  std::optional<cluster_kind_t> cluster_kind;
  bool representative = false;
  scan_error_t error = scan_error_t::none;
};

/**
 * @brief "disagree" when rules and search differ, "agree_action" when both
 * pick the same archive or delete, empty when both keep
 */
std::string_view agreement(const plan_entry_t &entry) noexcept;

struct cluster_summary_t {
  uint32_t id = 0;
  cluster_kind_t kind = cluster_kind_t::exact;
  std::size_t size = 0;
  std::vector<uint32_t> anchors;
  double cost = 0.0;
  std::size_t expanded = 0;
  // false when the search failed and every member was kept
  bool solved = false;
};

/**
 * @brief decision for every processed file, owned by the caller
 */
struct plan_t {
  std::vector<plan_entry_t> entries;  // ascending path
  std::vector<cluster_summary_t> clusters;
  std::vector<std::string> warnings;
  // set when max_files or time_budget left files undecided
  bool truncated = false;
  time_point_t now;

  const plan_entry_t *find(const std::filesystem::path &path) const noexcept;
  std::size_t count(action_t act) const noexcept;
  std::size_t disagreements() const noexcept;
};

}  // namespace detail_v1

}  // namespace declutter
