#pragma once

#include "declutter/config.hh"
#include "declutter/file_entry.hh"
#include "declutter/file_record.hh"
#include "declutter/plan.hh"

namespace declutter {

inline namespace detail_v1 {

/**
 * @brief recommend keep / archive / delete for every entry, touches no file
 * except to read it
 *
 * entries are ordered by path and capped at config.max_files, then
 * fingerprinted, clustered, scored and searched. once config.time_budget is
 * spent the remaining clusters and singletons are left out and the plan is
 * marked truncated.
 *
 * @param entries walker output
 * @param config run configuration, now defaults to the current time
 * @throws std::invalid_argument if config.digest_algo is unknown
 */
DECLUTTER_EXPORT plan_t decide(file_entry_vec entries, const config_t &config);

/**
 * @brief same as decide, for records that are already fingerprinted
 */
DECLUTTER_EXPORT plan_t decide_records(const file_record_vec &records,
                                       const config_t &config);

}  // namespace detail_v1

}  // namespace declutter
