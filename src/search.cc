#include "declutter/search.hh"

#include <algorithm>
#include <array>
#include <cstdint>
#include <functional>
#include <limits>
#include <queue>
#include <string>
#include <unordered_set>

namespace declutter {

inline namespace detail_v1 {

namespace {

constexpr std::array<action_t, 3> all_actions{action_t::keep,
                                              action_t::archive,
                                              action_t::remove};

// partial assignment, one char per assigned member
struct search_state_t {
  std::string assignment;
  double g = 0.0;
  bool kept_any = false;
};

struct open_entry_t {
  double f;
  uint64_t seq;
  std::size_t state;
};

// min-heap on f, first in first out among equal f
struct open_cmp_t {
  bool operator()(const open_entry_t &lhs, const open_entry_t &rhs) const
      noexcept {
    if (lhs.f != rhs.f) {
      return lhs.f > rhs.f;
    }
    return lhs.seq > rhs.seq;
  }
};

char encode(const action_t act) noexcept {
  switch (act) {
    case action_t::keep:
      return 'k';
    case action_t::archive:
      return 'a';
    case action_t::remove:
      return 'd';
  }
  return '?';
}

action_t decode(const char c) noexcept {
  return c == 'd' ? action_t::remove
                  : (c == 'a' ? action_t::archive : action_t::keep);
}

}  // namespace

cluster_problem_t::cluster_problem_t(const duplicate_cluster_t &cluster,
                                     const std::vector<score_t> &scores,
                                     const config_t &config)
    : _cluster_id(cluster.id),
      _anchored(!cluster.anchors.empty()),
      _redundancy_penalty(config.redundancy_penalty),
      _archival_cost(config.archival_cost),
      _archive_gain(config.archive_gain),
      _deletion_cost(config.deletion_cost),
      _delete_gain(config.delete_gain) {
  _members.reserve(cluster.members.size());
  for (auto idx : cluster.members) {
    const bool rep = idx == cluster.representative;
    const auto score = scores.at(idx).total;
    const bool copy = cluster.kind == cluster_kind_t::exact && !rep;
    _members.push_back({rep, copy || score > config.deletion_confidence, score});
  }
  _rest_bound.assign(_members.size() + 1, 0.0);
  for (auto pos = _members.size(); pos-- > 0;) {
    _rest_bound[pos] = _rest_bound[pos + 1] + min_step_cost(pos);
  }
}

bool cluster_problem_t::deletable(const std::size_t pos) const noexcept {
  return _members[pos].deletable;
}

bool cluster_problem_t::legal(const std::size_t pos, const action_t act,
                              const bool kept_any) const noexcept {
  // the last member must be kept when nothing else is
  if (!kept_any && !_anchored && pos + 1 == _members.size() &&
      act != action_t::keep) {
    return false;
  }
  return act != action_t::remove || deletable(pos);
}

double cluster_problem_t::step_cost(const std::size_t pos, const action_t act,
                                    const bool kept_any) const noexcept {
  const auto &member = _members[pos];
  switch (act) {
    case action_t::keep:
      return member.representative && !kept_any ? 0.0 : _redundancy_penalty;
    case action_t::archive:
      return _archival_cost - _archive_gain * member.score;
    case action_t::remove:
      return _deletion_cost - _delete_gain * member.score;
  }
  return std::numeric_limits<double>::infinity();
}

double cluster_problem_t::min_step_cost(const std::size_t pos) const noexcept {
  auto best = std::min(step_cost(pos, action_t::keep, false),
                       step_cost(pos, action_t::archive, false));
  if (deletable(pos)) {
    best = std::min(best, step_cost(pos, action_t::remove, false));
  }
  return best;
}

double cluster_problem_t::heuristic(const std::size_t depth) const noexcept {
  return _rest_bound[std::min(depth, _members.size())];
}

cluster_assignment_t search_cluster(const cluster_problem_t &problem,
                                    const std::size_t max_expansions) {
  const auto n = problem.size();
  std::vector<search_state_t> states;
  std::priority_queue<open_entry_t, std::vector<open_entry_t>, open_cmp_t> open;
  std::unordered_set<std::string> closed;
  uint64_t seq = 0;

  states.emplace_back().kept_any = problem.anchored();
  open.push({problem.heuristic(0), seq++, 0});

  std::size_t expanded = 0;
  while (!open.empty()) {
    const auto top = open.top();
    open.pop();
    const auto &state = states[top.state];
    const auto depth = state.assignment.size();

    if (depth == n && state.kept_any) {
      cluster_assignment_t result;
      result.actions.reserve(n);
      for (auto c : state.assignment) {
        result.actions.push_back(decode(c));
      }
      result.cost = state.g;
      result.expanded = expanded;
      return result;
    }
    if (depth == n || !closed.insert(state.assignment).second) {
      continue;
    }
    if (++expanded > max_expansions) {
      throw search_error("cluster " + std::to_string(problem.cluster_id()) +
                         ": expansion limit reached");
    }

    // states may reallocate below, copy what the successors need
    const auto prefix = state.assignment;
    const auto g = state.g;
    const auto kept_any = state.kept_any;
    for (auto act : all_actions) {
      if (!problem.legal(depth, act, kept_any)) {
        continue;
      }
      search_state_t next;
      next.assignment = prefix + encode(act);
      next.g = g + problem.step_cost(depth, act, kept_any);
      next.kept_any = kept_any || act == action_t::keep;
      if (closed.count(next.assignment) != 0) {
        continue;
      }
      const auto f = next.g + problem.heuristic(depth + 1);
      states.push_back(std::move(next));
      open.push({f, seq++, states.size() - 1});
    }
  }
  throw search_error("cluster " + std::to_string(problem.cluster_id()) +
                     ": no legal terminal state");
}

}  // namespace detail_v1

}  // namespace declutter
