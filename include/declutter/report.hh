#pragma once

#include <ostream>

#include "declutter/plan.hh"

namespace declutter {

inline namespace detail_v1 {

/**
 * @brief write the plan as csv, highest score first, ties by path
 */
void write_csv(const plan_t &plan, std::ostream &os);

/**
 * @brief one line per action with file count and bytes, then the number of
 * files where rules and search disagree
 */
void write_summary(const plan_t &plan, std::ostream &os);

}  // namespace detail_v1

}  // namespace declutter
