#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>

#define DECLUTTER_EXPORT __attribute__((visibility("default")))

namespace declutter {

inline namespace detail_v1 {

// 1MiB
constexpr auto buf_sz = 1024UL * 1024UL;

constexpr auto hash_seed = 0x178ee47c0190226cUL;

// difference hash grid, one extra column for the horizontal gradient
constexpr auto phash_cols = 9;
constexpr auto phash_rows = 8;

constexpr auto seconds_per_day = 86400.0;

/**
 * @brief tuning knobs for one engine run, passed explicitly to every stage
 */
struct config_t {
  // scoring
  double stale_days = 180.0;
  double stale_weight = 3.0;
  uint64_t large_file_bytes = 1024UL * 1024UL * 1024UL;

  // clustering, max hamming distance between perceptual digests
  uint32_t similarity_threshold = 8;

  // action costs
  double redundancy_penalty = 1.0;
  double archival_cost = 2.0;
  double archive_gain = 0.25;
  double deletion_cost = 3.0;
  double delete_gain = 0.5;

  // decision thresholds, compared with score total (strictly greater)
  double deletion_confidence = 6.0;
  double archive_threshold = 2.5;

  // rule-only recommendation reported beside the search, score at or above
  double rule_delete_score = 6.0;
  double rule_archive_score = 3.0;

  // a cluster search giving up past this many expansions keeps every member
  std::size_t max_expansions = 1000000;

  // "xxh128" or a digest name known to libcrypto
  std::string digest_algo = "xxh128";
  uint32_t max_thread = 4;

  // budget, unset means unbounded
  std::optional<std::size_t> max_files;
  std::optional<std::chrono::milliseconds> time_budget;

  // reference time for age, captured at the start of a run when unset
  std::optional<std::chrono::system_clock::time_point> now;

  std::ostream *log_stream = &std::cerr;
};

}  // namespace detail_v1

}  // namespace declutter
