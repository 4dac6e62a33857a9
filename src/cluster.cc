#include "declutter/cluster.hh"

#include <algorithm>
#include <map>
#include <numeric>
#include <unordered_map>
#include <utility>

#include "declutter/fingerprint.hh"

namespace declutter {

inline namespace detail_v1 {

namespace {

constexpr uint32_t digest_bits = 64;

struct digest_hash_t {
  std::size_t operator()(const digest_t &digest) const noexcept {
    // digests are already uniformly distributed
    std::size_t h = 0;
    for (auto i = 0UL; i < std::min(digest.size(), sizeof(h)); ++i) {
      h = (h << 8U) | digest[i];
    }
    return h;
  }
};

void sort_by_path(const file_record_vec &records,
                  std::vector<std::size_t> &members) {
  std::sort(members.begin(), members.end(),
            [&](const std::size_t lhs, const std::size_t rhs) {
              return records[lhs].path() < records[rhs].path();
            });
}

struct group_t {
  std::vector<std::size_t> members;
  std::vector<uint32_t> anchors;
};

void append_clusters(const file_record_vec &records,
                     std::vector<group_t> groups, const cluster_kind_t kind,
                     cluster_vec &clusters) {
  for (auto &group : groups) {
    sort_by_path(records, group.members);
    std::sort(group.anchors.begin(), group.anchors.end());
  }
  std::sort(groups.begin(), groups.end(),
            [&](const auto &lhs, const auto &rhs) {
              return records[lhs.members.front()].path() <
                     records[rhs.members.front()].path();
            });
  for (auto &group : groups) {
    // an anchored group defers to the surviving copy of its first anchor
    const auto representative =
        group.anchors.empty()
            ? select_representative(records, group.members)
            : clusters[group.anchors.front()].representative;
    auto &cluster = clusters.emplace_back();
    cluster.id = (uint32_t)(clusters.size() - 1);
    cluster.kind = kind;
    cluster.representative = representative;
    cluster.members = std::move(group.members);
    cluster.anchors = std::move(group.anchors);
  }
}

std::vector<group_t> exact_groups(const file_record_vec &records) {
  std::unordered_map<digest_t, std::vector<std::size_t>, digest_hash_t> buckets;
  for (std::size_t i = 0; i < records.size(); ++i) {
    if (records[i].ok()) {
      buckets[records[i].digest()].push_back(i);
    }
  }
  std::vector<group_t> groups;
  for (auto &[digest, members] : buckets) {
    if (members.size() > 1) {
      groups.push_back({std::move(members), {}});
    }
  }
  return groups;
}

// candidates whose digests are within threshold end up in one set.
// distance <= t means at least one of t + 1 disjoint bit bands is equal, so
// only records sharing a band are compared.
std::vector<std::vector<std::size_t>> near_groups(
    const file_record_vec &records, const std::vector<std::size_t> &candidates,
    const uint32_t threshold) {
  disjoint_set_t dsu(candidates.size());
  auto link = [&](const std::vector<std::size_t> &bucket) {
    for (auto i = 0UL; i < bucket.size(); ++i) {
      for (auto j = i + 1; j < bucket.size(); ++j) {
        auto lhs = *records[candidates[bucket[i]]].phash();
        auto rhs = *records[candidates[bucket[j]]].phash();
        if (hamming_distance(lhs, rhs) <= threshold) {
          dsu.unite(bucket[i], bucket[j]);
        }
      }
    }
  };

  if (threshold >= digest_bits) {
    // every pair is within the threshold
    std::vector<std::size_t> all(candidates.size());
    std::iota(all.begin(), all.end(), 0UL);
    link(all);
  } else {
    const auto band_cnt = threshold + 1;
    std::map<std::pair<uint32_t, uint64_t>, std::vector<std::size_t>> buckets;
    for (std::size_t c = 0; c < candidates.size(); ++c) {
      const auto phash = *records[candidates[c]].phash();
      for (uint32_t band = 0; band < band_cnt; ++band) {
        const auto lo = band * digest_bits / band_cnt;
        const auto hi = (band + 1) * digest_bits / band_cnt;
        const auto width = hi - lo;
        const auto mask =
            width >= digest_bits ? ~0UL : ((1UL << width) - 1UL);
        buckets[{band, (phash >> lo) & mask}].push_back(c);
      }
    }
    for (const auto &[key, bucket] : buckets) {
      if (bucket.size() > 1) {
        link(bucket);
      }
    }
  }

  std::map<std::size_t, std::vector<std::size_t>> components;
  for (std::size_t c = 0; c < candidates.size(); ++c) {
    components[dsu.find(c)].push_back(candidates[c]);
  }
  std::vector<std::vector<std::size_t>> groups;
  for (auto &[root, members] : components) {
    if (members.size() > 1) {
      groups.emplace_back(std::move(members));
    }
  }
  return groups;
}

}  // namespace

std::string_view to_string(const cluster_kind_t kind) noexcept {
  return kind == cluster_kind_t::exact ? "exact" : "near";
}

disjoint_set_t::disjoint_set_t(const std::size_t n) : _parent(n), _size(n, 1) {
  std::iota(_parent.begin(), _parent.end(), 0UL);
}

std::size_t disjoint_set_t::find(std::size_t x) noexcept {
  auto root = x;
  while (_parent[root] != root) {
    root = _parent[root];
  }
  while (_parent[x] != root) {
    x = std::exchange(_parent[x], root);
  }
  return root;
}

bool disjoint_set_t::unite(std::size_t a, std::size_t b) noexcept {
  a = find(a);
  b = find(b);
  if (a == b) {
    return false;
  }
  if (_size[a] < _size[b]) {
    std::swap(a, b);
  }
  _parent[b] = a;
  _size[a] += _size[b];
  return true;
}

std::size_t select_representative(const file_record_vec &records,
                                  const std::vector<std::size_t> &members) {
  return *std::min_element(
      members.begin(), members.end(),
      [&](const std::size_t lhs, const std::size_t rhs) {
        const auto &l = records[lhs];
        const auto &r = records[rhs];
        if (l.mtime() != r.mtime()) {
          return l.mtime() < r.mtime();
        }
        const auto l_len = l.path().native().size();
        const auto r_len = r.path().native().size();
        if (l_len != r_len) {
          return l_len < r_len;
        }
        return l.path() < r.path();
      });
}

cluster_vec build_clusters(const file_record_vec &records,
                           const config_t &config) {
  cluster_vec clusters;
  append_clusters(records, exact_groups(records), cluster_kind_t::exact,
                  clusters);

  std::vector<std::optional<uint32_t>> exact_of(records.size());
  for (const auto &cluster : clusters) {
    for (auto idx : cluster.members) {
      exact_of[idx] = cluster.id;
    }
  }
  // an exact cluster takes part in near clustering through its representative
  std::vector<std::size_t> candidates;
  for (std::size_t i = 0; i < records.size(); ++i) {
    if (!records[i].ok() || !records[i].phash()) {
      continue;
    }
    if (!exact_of[i] || clusters[*exact_of[i]].representative == i) {
      candidates.push_back(i);
    }
  }

  std::vector<group_t> groups;
  for (auto &component :
       near_groups(records, candidates, config.similarity_threshold)) {
    group_t group;
    for (auto idx : component) {
      if (exact_of[idx]) {
        group.anchors.push_back(*exact_of[idx]);
      } else {
        group.members.push_back(idx);
      }
    }
    // exact clusters close to each other stay apart
    if (!group.members.empty()) {
      groups.push_back(std::move(group));
    }
  }
  append_clusters(records, std::move(groups), cluster_kind_t::near, clusters);
  return clusters;
}

std::vector<std::optional<std::size_t>> cluster_lookup(
    const cluster_vec &clusters, const std::size_t record_cnt) {
  std::vector<std::optional<std::size_t>> lookup(record_cnt);
  for (std::size_t c = 0; c < clusters.size(); ++c) {
    for (auto idx : clusters[c].members) {
      lookup[idx] = c;
    }
  }
  return lookup;
}

}  // namespace detail_v1

}  // namespace declutter
