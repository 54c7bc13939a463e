#include "domain/UserPreferences.hpp"

#include <cstdlib>

namespace moveslot::domain {

namespace {
constexpr int kMealBufferMinutes = 30;
}

HourBand BandFor(PreferredTime preference) {
    switch (preference) {
        case PreferredTime::Morning: return {6, 11};
        case PreferredTime::Afternoon: return {11, 17};
        case PreferredTime::Evening: return {17, 21};
        case PreferredTime::NoPreference: return {0, 24};
    }
    return {0, 24};
}

bool UserPreferences::isDuringMeal(const Instant& instant) const {
    const int minutes = MinutesSinceMidnight(instant);
    for (int meal : {breakfastMinutes, lunchMinutes, dinnerMinutes}) {
        if (std::abs(minutes - meal) < kMealBufferMinutes) return true;
    }
    return false;
}

bool UserPreferences::isPreferredWalkHour(int hour) const {
    HourBand band = BandFor(preferredWalkTime);
    return hour >= band.first && hour < band.last;
}

} // namespace moveslot::domain
