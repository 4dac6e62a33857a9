#include "declutter/report.hh"

#include <algorithm>
#include <array>
#include <chrono>
#include <cstdio>
#include <string>
#include <vector>

#include "declutter/config.hh"
#include "declutter/parse_size.hh"

namespace declutter {

inline namespace detail_v1 {

namespace {

std::string csv_field(const std::string &field) {
  if (field.find_first_of(",\"\n\r") == std::string::npos) {
    return field;
  }
  std::string quoted = "\"";
  for (auto c : field) {
    if (c == '"') {
      quoted += '"';
    }
    quoted += c;
  }
  quoted += '"';
  return quoted;
}

std::string fixed(const double value, const char *fmt) {
  std::array<char, 64> buf{};
  std::snprintf(buf.data(), buf.size(), fmt, value);
  return buf.data();
}

}  // namespace

void write_csv(const plan_t &plan, std::ostream &os) {
  std::vector<const plan_entry_t *> ranked;
  ranked.reserve(plan.entries.size());
  for (const auto &entry : plan.entries) {
    ranked.push_back(&entry);
  }
  std::stable_sort(ranked.begin(), ranked.end(),
                   [](const plan_entry_t *lhs, const plan_entry_t *rhs) {
                     if (lhs->score.total != rhs->score.total) {
                       return lhs->score.total > rhs->score.total;
                     }
                     return lhs->path < rhs->path;
                   });

  os << "path,size,age_days,action,score,age_weight,duplication_weight,"
        "location_weight,cluster_id,cluster_kind,representative,error,"
        "rule_action,agreement\n";
  for (const auto *entry : ranked) {
    const auto age =
        std::chrono::duration<double>(plan.now - entry->mtime).count() /
        seconds_per_day;
    os << csv_field(entry->path.string()) << ',' << entry->size << ','
       << fixed(std::max(0.0, age), "%.1f") << ',' << to_string(entry->action)
       << ',' << fixed(entry->score.total, "%.3f") << ','
       << fixed(entry->score.age, "%.3f") << ','
       << fixed(entry->score.duplication, "%.3f") << ','
       << fixed(entry->score.location, "%.3f") << ',';
    if (entry->cluster_id) {
      os << *entry->cluster_id << ',' << to_string(*entry->cluster_kind);
    } else {
      os << ',';
    }
    os << ',' << (entry->representative ? "yes" : "") << ','
       << to_string(entry->error) << ',' << to_string(entry->rule_action)
       << ',' << agreement(*entry) << '\n';
  }
}

void write_summary(const plan_t &plan, std::ostream &os) {
  for (auto act : {action_t::keep, action_t::archive, action_t::remove}) {
    std::size_t cnt = 0;
    uint64_t bytes = 0;
    for (const auto &entry : plan.entries) {
      if (entry.action == act) {
        ++cnt;
        bytes += entry.size;
      }
    }
    os << to_string(act) << ": " << cnt << " files, "
       << utils::human_size(bytes) << '\n';
  }
  os << "rules disagree: " << plan.disagreements() << " files\n";
  if (plan.truncated) {
    os << "truncated: budget exhausted before every file was decided\n";
  }
}

}  // namespace detail_v1

}  // namespace declutter
