#include "declutter/score.hh"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <stdexcept>

namespace declutter {

inline namespace detail_v1 {

namespace {

std::string lower(std::string str) {
  std::transform(str.begin(), str.end(), str.begin(),
                 [](unsigned char c) { return (char)std::tolower(c); });
  return str;
}

bool name_in(const std::string &name, const std::vector<std::string> &names) {
  const auto key = lower(name);
  return std::any_of(names.begin(), names.end(), [&](const auto &candidate) {
    return lower(candidate) == key;
  });
}

enum class slot_t : uint8_t { age, duplication, location };

struct contribution_t {
  slot_t slot;
  double value;
};

class rule_visitor_t {
  const score_context_t &_ctx;

 public:
  explicit rule_visitor_t(const score_context_t &ctx) noexcept : _ctx(ctx) {}

  contribution_t operator()(const age_rule_t &rule) const noexcept {
    const auto days = age_days(_ctx.record, _ctx.now);
    if (rule.stale_days <= 0.0 || days >= rule.stale_days) {
      return {slot_t::age, rule.weight};
    }
    return {slot_t::age, rule.weight * days / rule.stale_days};
  }

  contribution_t operator()(const duplication_rule_t &rule) const noexcept {
    if (!_ctx.kind) {
      return {slot_t::duplication, 0.0};
    }
    if (_ctx.representative) {
      return {slot_t::duplication, rule.representative_weight};
    }
    return {slot_t::duplication, *_ctx.kind == cluster_kind_t::exact
                                     ? rule.exact_weight
                                     : rule.near_weight};
  }

  contribution_t operator()(const path_rule_t &rule) const {
    const auto &path = _ctx.record.path();
    if (rule.match == path_rule_t::match_t::extension) {
      const auto ext = path.extension().string();
      return {slot_t::location,
              !ext.empty() && name_in(ext, rule.names) ? rule.weight : 0.0};
    }
    for (const auto &part : path.parent_path()) {
      if (name_in(part.string(), rule.names)) {
        return {slot_t::location, rule.weight};
      }
    }
    return {slot_t::location, 0.0};
  }

  contribution_t operator()(const size_rule_t &rule) const noexcept {
    return {slot_t::location,
            _ctx.record.size() >= rule.min_bytes ? rule.weight : 0.0};
  }
};

}  // namespace

double age_days(const file_record_t &record, const time_point_t now) noexcept {
  const auto elapsed =
      std::chrono::duration<double>(now - record.mtime()).count();
  return std::max(0.0, elapsed / seconds_per_day);
}

score_t evaluate(const rule_vec &rules, const score_context_t &ctx) {
  score_t score;
  const rule_visitor_t visitor(ctx);
  for (const auto &rule : rules) {
    const auto part = std::visit(visitor, rule);
    switch (part.slot) {
      case slot_t::age:
        score.age += part.value;
        break;
      case slot_t::duplication:
        score.duplication += part.value;
        break;
      case slot_t::location:
        score.location += part.value;
        break;
    }
  }
  score.total = score.age + score.duplication + score.location;
  return score;
}

rule_vec default_rules(const config_t &config) {
  rule_vec rules;
  rules.emplace_back(age_rule_t{config.stale_weight, config.stale_days});
  rules.emplace_back(duplication_rule_t{5.0, 2.0, 1.0});
  rules.emplace_back(path_rule_t{
      path_rule_t::match_t::directory,
      {"tmp", "temp", "cache", ".cache", "installer", "installers"},
      2.0});
  rules.emplace_back(path_rule_t{path_rule_t::match_t::extension,
                                 {".tmp", ".part", ".crdownload", ".bak"},
                                 1.5});
  // documents, installers and sources people come back to
  rules.emplace_back(path_rule_t{
      path_rule_t::match_t::extension,
      {".py", ".exe", ".msi", ".docx", ".xlsx", ".pptx"},
      -5.0});
  rules.emplace_back(size_rule_t{config.large_file_bytes, 1.5});
  return rules;
}

action_t rule_action(const score_t &score, const config_t &config) noexcept {
  if (score.total >= config.rule_delete_score) {
    return action_t::remove;
  }
  if (score.total >= config.rule_archive_score) {
    return action_t::archive;
  }
  return action_t::keep;
}

std::vector<score_t> score_records(const file_record_vec &records,
                                   const cluster_vec &clusters,
                                   const rule_vec &rules,
                                   const config_t &config) {
  if (!config.now) {
    throw std::invalid_argument("score_records: reference time not set");
  }
  const auto lookup = cluster_lookup(clusters, records.size());
  std::vector<score_t> scores;
  scores.reserve(records.size());
  for (std::size_t i = 0; i < records.size(); ++i) {
    score_context_t ctx{records[i], std::nullopt, false, *config.now};
    if (lookup[i]) {
      const auto &cluster = clusters[*lookup[i]];
      ctx.kind = cluster.kind;
      ctx.representative = cluster.representative == i;
    }
    scores.push_back(evaluate(rules, ctx));
  }
  return scores;
}

}  // namespace detail_v1

}  // namespace declutter
