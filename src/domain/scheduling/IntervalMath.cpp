#include "domain/scheduling/IntervalMath.hpp"

#include <algorithm>

namespace moveslot::domain::scheduling {

bool Overlaps(const TimeInterval& a, const TimeInterval& b) {
    return a.start < b.end && b.start < a.end;
}

std::optional<TimeInterval> Intersect(const TimeInterval& a, const TimeInterval& b) {
    TimeInterval out{std::max(a.start, b.start), std::min(a.end, b.end)};
    if (!out.isValid()) return std::nullopt;
    return out;
}

std::optional<TimeInterval> ClampToWindow(const TimeInterval& interval, const TimeInterval& window) {
    if (!window.isValid()) return std::nullopt;
    return Intersect(interval, window);
}

int GapMinutes(const TimeInterval& a, const TimeInterval& b) {
    if (Overlaps(a, b)) return 0;
    const TimeInterval& first = a.start <= b.start ? a : b;
    const TimeInterval& second = a.start <= b.start ? b : a;
    return std::max(0, MinutesBetween(first.end, second.start));
}

std::vector<TimeInterval> Merge(std::vector<TimeInterval> intervals) {
    intervals.erase(std::remove_if(intervals.begin(), intervals.end(),
                                   [](const TimeInterval& i) { return !i.isValid(); }),
                    intervals.end());
    std::sort(intervals.begin(), intervals.end(), [](const TimeInterval& a, const TimeInterval& b) {
        if (a.start != b.start) return a.start < b.start;
        return a.end < b.end;
    });

    std::vector<TimeInterval> merged;
    for (const auto& i : intervals) {
        if (!merged.empty() && i.start <= merged.back().end) {
            merged.back().end = std::max(merged.back().end, i.end);
        } else {
            merged.push_back(i);
        }
    }
    return merged;
}

std::vector<TimeInterval> Gaps(const TimeInterval& window,
                               const std::vector<TimeInterval>& busy,
                               int minMinutes) {
    std::vector<TimeInterval> gaps;
    if (!window.isValid()) return gaps;

    Instant cursor = window.start;
    for (const auto& b : Merge(busy)) {
        auto clamped = ClampToWindow(b, window);
        if (!clamped) continue;
        if (clamped->start > cursor) {
            TimeInterval gap{cursor, clamped->start};
            if (gap.durationMinutes() >= minMinutes) gaps.push_back(gap);
        }
        cursor = std::max(cursor, clamped->end);
    }
    if (cursor < window.end) {
        TimeInterval tail{cursor, window.end};
        if (tail.durationMinutes() >= minMinutes) gaps.push_back(tail);
    }
    return gaps;
}

bool IsFree(const TimeInterval& candidate, const std::vector<TimeInterval>& busy) {
    return std::none_of(busy.begin(), busy.end(),
                        [&](const TimeInterval& b) { return Overlaps(candidate, b); });
}

} // namespace moveslot::domain::scheduling
