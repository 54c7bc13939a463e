/**
 * @file IntervalMath.hpp
 * @brief Pure interval arithmetic over half-open time ranges.
 */

#pragma once

#include <optional>
#include <vector>
#include "domain/Schedule.hpp"

namespace moveslot::domain::scheduling {

/** @brief True when the ranges share any instant. Touching ranges do not overlap. */
bool Overlaps(const TimeInterval& a, const TimeInterval& b);

std::optional<TimeInterval> Intersect(const TimeInterval& a, const TimeInterval& b);

/** @brief Portion of `interval` inside `window`, nullopt when disjoint. */
std::optional<TimeInterval> ClampToWindow(const TimeInterval& interval, const TimeInterval& window);

/**
 * @brief Minutes from the end of the earlier range to the start of the later one.
 * @return 0 when the ranges overlap or touch.
 */
int GapMinutes(const TimeInterval& a, const TimeInterval& b);

/** @brief Sorts and coalesces overlapping or touching ranges. Invalid ranges are dropped. */
std::vector<TimeInterval> Merge(std::vector<TimeInterval> intervals);

/**
 * @brief Complement of `busy` inside `window`.
 * @param minMinutes Gaps shorter than this are discarded.
 */
std::vector<TimeInterval> Gaps(const TimeInterval& window,
                               const std::vector<TimeInterval>& busy,
                               int minMinutes);

/** @brief True if `candidate` overlaps none of `busy`. */
bool IsFree(const TimeInterval& candidate, const std::vector<TimeInterval>& busy);

} // namespace moveslot::domain::scheduling
