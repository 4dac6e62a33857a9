#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

#include "declutter/cluster.hh"
#include "declutter/config.hh"
#include "declutter/file_record.hh"
#include "declutter/score.hh"

namespace declutter {

inline namespace detail_v1 {

/**
 * @brief a cluster search ended without a legal terminal state
 */
class search_error : public std::logic_error {
 public:
  using std::logic_error::logic_error;
};

/**
 * @brief action costs and legality for one cluster, members are taken in
 * cluster order (ascending path)
 */
class cluster_problem_t {
  struct member_t {
    bool representative;
    bool deletable;
    double score;
  };

  uint32_t _cluster_id;
  // a copy survives in an anchoring exact cluster
  bool _anchored;
  std::vector<member_t> _members;
  // _rest_bound[i]: sum of isolated lower bounds of members i..n-1
  std::vector<double> _rest_bound;
  double _redundancy_penalty;
  double _archival_cost;
  double _archive_gain;
  double _deletion_cost;
  double _delete_gain;

 public:
  /**
   * @param cluster cluster to decide
   * @param scores scores indexed like the records the cluster refers to
   * @param config cost constants and deletion_confidence
   */
  cluster_problem_t(const duplicate_cluster_t &cluster,
                    const std::vector<score_t> &scores,
                    const config_t &config);

  inline std::size_t size() const noexcept { return _members.size(); }
  inline uint32_t cluster_id() const noexcept { return _cluster_id; }
  inline bool anchored() const noexcept { return _anchored; }

  /**
   * @brief exact duplicate copies and files past deletion_confidence
   */
  bool deletable(std::size_t pos) const noexcept;

  /**
   * @brief whether assigning act to member pos is a legal transition
   * @param kept_any some earlier member is already kept
   */
  bool legal(std::size_t pos, action_t act, bool kept_any) const noexcept;

  double step_cost(std::size_t pos, action_t act, bool kept_any) const noexcept;

  /**
   * @brief cheapest step of one member ignoring which copy survives
   */
  double min_step_cost(std::size_t pos) const noexcept;

  /**
   * @brief lower bound on the cost of assigning members depth..n-1
   */
  double heuristic(std::size_t depth) const noexcept;
};

struct cluster_assignment_t {
  std::vector<action_t> actions;  // parallel to cluster members
  double cost = 0.0;
  std::size_t expanded = 0;
};

/**
 * @brief best-first search for the cheapest assignment keeping at least one
 * member, or any assignment when the cluster is anchored
 *
 * states are expanded by f = g + h, ties in insertion order
 *
 * @throws search_error no terminal state found or max_expansions exceeded
 */
cluster_assignment_t search_cluster(const cluster_problem_t &problem,
                                    std::size_t max_expansions);

}  // namespace detail_v1

}  // namespace declutter
