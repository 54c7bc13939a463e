#include "domain/scheduling/AutopilotSlotPicker.hpp"
#include "domain/scheduling/FreeSlotFinder.hpp"
#include "domain/scheduling/IntervalMath.hpp"

#include <algorithm>
#include <cstdlib>

namespace moveslot::domain::scheduling {

namespace {

bool FarFromAll(const Instant& start, const std::vector<PickedWalk>& picked, int spacingMinutes) {
    for (const auto& p : picked) {
        if (std::abs(MinutesBetween(p.start, start)) < spacingMinutes) return false;
    }
    return true;
}

} // namespace

std::vector<WalkCategory> DefaultWalkCategories() {
    return {
        {"morning", 8, 11, 2},
        {"midday", 11, 14, 1},
        {"afternoon", 14, 17, 3},
        {"evening", 17, 20, 2},
    };
}

AutopilotSlotPicker::AutopilotSlotPicker(AutopilotPickerConfig config, std::vector<WalkCategory> categories)
    : m_config(config), m_categories(std::move(categories)) {
    std::stable_sort(m_categories.begin(), m_categories.end(),
                     [](const WalkCategory& a, const WalkCategory& b) { return a.priority < b.priority; });
}

std::vector<PickedWalk> AutopilotSlotPicker::pick(const CivilDate& date,
                                                  const std::vector<TimeInterval>& busy,
                                                  const UserPreferences& prefs,
                                                  const AutopilotSettings& settings) const {
    std::vector<PickedWalk> picked;
    if (!prefs.hasValidDay() || settings.targetWalksPerDay <= 0) return picked;

    const TimeInterval window = ActiveWindowFor(date, prefs);
    if (!window.isValid()) return picked;

    std::vector<TimeInterval> gaps;
    for (const auto& gap : Gaps(window, busy, settings.minWalkDuration)) {
        if (!prefs.isDuringMeal(gap.start)) gaps.push_back(gap);
    }

    const auto target = static_cast<size_t>(settings.targetWalksPerDay);
    for (const auto& category : m_categories) {
        if (picked.size() >= target) break;

        const TimeInterval band{MakeInstant(date, category.startHour), MakeInstant(date, category.endHour)};
        for (const auto& gap : gaps) {
            auto overlap = Intersect(gap, band);
            if (!overlap) continue;

            // The walk starts inside the category and may run past its end within the gap.
            const Instant start = overlap->start;
            const int available = MinutesBetween(start, gap.end);
            if (available < settings.minWalkDuration) continue;
            if (!FarFromAll(start, picked, m_config.categorySpacingMinutes)) continue;

            const int duration = std::min(settings.maxWalkDuration, std::max(settings.minWalkDuration, available));
            picked.push_back(PickedWalk{start, duration, WalkTypeForDuration(duration), category.name});
            break;
        }
    }

    if (settings.includeMicroWalks && picked.size() < target) {
        for (const auto& gap : Gaps(window, busy, m_config.microMinMinutes)) {
            if (picked.size() >= target) break;
            const int d = gap.durationMinutes();
            if (d > m_config.microMaxGapMinutes) continue;
            if (prefs.isDuringMeal(gap.start)) continue;
            if (!FarFromAll(gap.start, picked, m_config.microSpacingMinutes)) continue;

            const int duration = std::min(d, m_config.microMaxDuration);
            picked.push_back(PickedWalk{gap.start, duration, WalkTypeForDuration(duration), "micro"});
        }
    }

    std::sort(picked.begin(), picked.end(), [](const PickedWalk& a, const PickedWalk& b) {
        return a.start < b.start;
    });
    return picked;
}

} // namespace moveslot::domain::scheduling
