#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "declutter/cluster.hh"
#include "declutter/config.hh"
#include "declutter/file_record.hh"

namespace declutter {

inline namespace detail_v1 {

// full weight at or past stale_days, linear below
struct age_rule_t {
  double weight = 0.0;
  double stale_days = 180.0;
};

// only clustered files contribute
struct duplication_rule_t {
  double exact_weight = 0.0;
  double near_weight = 0.0;
  double representative_weight = 0.0;
};

// case-insensitive match on a parent directory name or on the extension
struct path_rule_t {
  enum class match_t : uint8_t { directory, extension };
  match_t match = match_t::directory;
  std::vector<std::string> names;
  double weight = 0.0;
};

struct size_rule_t {
  uint64_t min_bytes = 0;
  double weight = 0.0;
};

using rule_t =
    std::variant<age_rule_t, duplication_rule_t, path_rule_t, size_rule_t>;
using rule_vec = std::vector<rule_t>;

/**
 * @brief staleness/risk of one file, the breakdown is report metadata only
 */
struct score_t {
  double total = 0.0;
  double age = 0.0;
  double duplication = 0.0;
  double location = 0.0;
};

struct score_context_t {
  const file_record_t &record;
  std::optional<cluster_kind_t> kind;
  bool representative = false;
  time_point_t now;
};

double age_days(const file_record_t &record, time_point_t now) noexcept;

/**
 * @brief weighted sum of all rules, each rule feeds one breakdown slot
 */
score_t evaluate(const rule_vec &rules, const score_context_t &ctx);

rule_vec default_rules(const config_t &config);

/**
 * @brief what the score alone would recommend, without looking at other copies
 */
action_t rule_action(const score_t &score, const config_t &config) noexcept;

/**
 * @brief score every record against its cluster membership
 * @param config now must be set
 * @return scores in record order
 */
std::vector<score_t> score_records(const file_record_vec &records,
                                   const cluster_vec &clusters,
                                   const rule_vec &rules,
                                   const config_t &config);

}  // namespace detail_v1

}  // namespace declutter
