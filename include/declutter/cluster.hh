#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

#include "declutter/config.hh"
#include "declutter/file_record.hh"

namespace declutter {

inline namespace detail_v1 {

enum class cluster_kind_t : uint8_t { exact, near };

std::string_view to_string(cluster_kind_t kind) noexcept;

/**
 * @brief files believed identical (exact) or visually similar (near)
 *
 * members and representative index into the record vector the cluster was
 * built from, members are in ascending path order
 *
 * a near cluster within the threshold of exact clusters lists them as
 * anchors: its representative is the first anchor's representative, which is
 * not a member, and one copy of it always survives
 */
struct duplicate_cluster_t {
  uint32_t id = 0;
  cluster_kind_t kind = cluster_kind_t::exact;
  std::vector<std::size_t> members;
  std::size_t representative = 0;
  std::vector<uint32_t> anchors;  // exact cluster ids, ascending
};

using cluster_vec = std::vector<duplicate_cluster_t>;

// union by size, path compression
class disjoint_set_t {
  std::vector<std::size_t> _parent;
  std::vector<std::size_t> _size;

 public:
  explicit disjoint_set_t(std::size_t n);

  std::size_t find(std::size_t x) noexcept;
  bool unite(std::size_t a, std::size_t b) noexcept;
  inline std::size_t size() const noexcept { return _parent.size(); }
};

/**
 * @brief preferred surviving copy: oldest, then shortest path, then
 * lexicographically smallest path
 */
std::size_t select_representative(const file_record_vec &records,
                                  const std::vector<std::size_t> &members);

/**
 * @brief partition records into exact and near duplicate clusters
 *
 * records with a scan error never join a cluster, singletons are not
 * returned, a record belongs to at most one cluster. exact clusters join
 * near clustering through their representative and end up as anchors
 *
 * @param records fingerprinted files
 * @param config similarity_threshold bounds the near duplicate distance
 * @return exact clusters then near clusters, id equals position
 */
cluster_vec build_clusters(const file_record_vec &records,
                           const config_t &config);

/**
 * @brief cluster position per record index, std::nullopt for singletons
 */
std::vector<std::optional<std::size_t>> cluster_lookup(
    const cluster_vec &clusters, std::size_t record_cnt);

}  // namespace detail_v1

}  // namespace declutter
