/**
 * @file Schedule.hpp
 * @brief Value objects describing occupied and free time within a day.
 */

#pragma once

#include <string>
#include "domain/time/LocalTime.hpp"

namespace moveslot::domain {

/**
 * @struct TimeInterval
 * @brief Half-open range [start, end). Valid only when start < end.
 */
struct TimeInterval {
    Instant start;
    Instant end;

    bool isValid() const { return start < end; }
    int durationMinutes() const { return MinutesBetween(start, end); }
    bool contains(const Instant& t) const { return start <= t && t < end; }
};

inline bool operator==(const TimeInterval& a, const TimeInterval& b) {
    return a.start == b.start && a.end == b.end;
}

/**
 * @enum BusySource
 * @brief What occupies a busy interval.
 */
enum class BusySource {
    Meeting,    ///< Calendar event.
    Activity    ///< Already-committed walk, workout or manual schedule entry.
};

inline std::string BusySourceToString(BusySource source) {
    switch (source) {
        case BusySource::Meeting: return "meeting";
        case BusySource::Activity: return "activity";
    }
    return "meeting";
}

struct BusyInterval {
    TimeInterval interval;
    BusySource source = BusySource::Meeting;
    std::string label;
};

/**
 * @enum SlotClass
 * @brief Duration bucket of a free slot.
 */
enum class SlotClass {
    Micro,      ///< <= 10 minutes
    Short,      ///< <= 20 minutes
    Standard,   ///< <= 40 minutes
    Extended    ///< > 40 minutes
};

inline SlotClass SlotClassFor(int durationMinutes) {
    if (durationMinutes <= 10) return SlotClass::Micro;
    if (durationMinutes <= 20) return SlotClass::Short;
    if (durationMinutes <= 40) return SlotClass::Standard;
    return SlotClass::Extended;
}

inline std::string SlotClassToString(SlotClass cls) {
    switch (cls) {
        case SlotClass::Micro: return "micro";
        case SlotClass::Short: return "short";
        case SlotClass::Standard: return "standard";
        case SlotClass::Extended: return "extended";
    }
    return "standard";
}

struct FreeSlot {
    TimeInterval interval;
    int durationMinutes = 0;
    SlotClass slotClass = SlotClass::Micro;
    bool isDuringMeal = false;
    bool isPreferredTime = false;

    int startHour() const { return HourOf(interval.start); }
};

} // namespace moveslot::domain
