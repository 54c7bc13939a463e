#include "domain/scheduling/WalkabilityClassifier.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace moveslot::domain::scheduling {

namespace {

const std::vector<std::string> kWalkFriendly = {
    "1:1", "one on one", "sync", "catch up", "check in", "chat", "coffee"
};

const std::vector<std::string> kNonWalkable = {
    "presentation", "demo", "workshop", "training", "all hands", "all-hands",
    "standup", "stand-up", "review", "interview", "onsite", "on-site"
};

std::string Normalize(const std::string& input) {
    std::string out;
    out.reserve(input.size());
    for (unsigned char c : input) {
        out.push_back(static_cast<char>(std::tolower(c)));
    }
    return out;
}

bool ContainsAny(const std::string& haystack, const std::vector<std::string>& needles) {
    const std::string norm = Normalize(haystack);
    for (const auto& needle : needles) {
        if (norm.find(needle) != std::string::npos) return true;
    }
    return false;
}

bool IsOneOnOne(const CalendarMeeting& m) {
    return m.attendeeCount <= 2;
}

} // namespace

bool WalkabilityClassifier::HasWalkFriendlyKeyword(const std::string& title) {
    return ContainsAny(title, kWalkFriendly);
}

bool WalkabilityClassifier::HasNonWalkableKeyword(const std::string& title) {
    return ContainsAny(title, kNonWalkable);
}

double WalkabilityClassifier::score(const CalendarMeeting& meeting) const {
    double s = 0.0;

    if (IsOneOnOne(meeting)) {
        s += 0.4;
    } else if (meeting.attendeeCount <= 3) {
        s += 0.2;
    }

    const int duration = meeting.durationMinutes();
    if (duration >= 30 && duration <= 60) {
        s += 0.3;
    } else if (duration >= 20 && duration < 90) {
        s += 0.2;
    }

    if (HasWalkFriendlyKeyword(meeting.title)) {
        s += 0.3;
    }
    if (HasNonWalkableKeyword(meeting.title)) {
        s = std::max(0.0, s - 0.5);
    }

    return std::clamp(s, 0.0, 1.0);
}

bool WalkabilityClassifier::IsWalkingOneOnOne(const WalkabilityAssessment& a, double threshold) {
    return a.score >= threshold && a.isOneOnOne;
}

WalkabilityAssessment WalkabilityClassifier::assess(const CalendarMeeting& meeting) const {
    WalkabilityAssessment a;
    a.meetingId = meeting.id;
    a.title = meeting.title;
    a.start = meeting.start;
    a.durationMinutes = meeting.durationMinutes();
    a.attendeeCount = meeting.attendeeCount;
    a.isOneOnOne = IsOneOnOne(meeting);
    a.score = score(meeting);
    a.isRecommended = meeting.isRealMeeting() && IsWalkingOneOnOne(a, m_config.recommendThreshold);
    a.estimatedSteps = a.isRecommended ? a.durationMinutes * m_config.stepsPerMinute : 0;

    if (a.isRecommended) {
        a.reason = "Perfect for a walking 1:1";
    } else if (meeting.attendeeCount > 2) {
        a.reason = "Too many attendees for walking";
    } else {
        a.reason = "Meeting type not ideal for walking";
    }
    return a;
}

WalkabilityVerdict WalkabilityClassifier::classify(const CalendarMeeting& meeting) const {
    WalkabilityAssessment a = assess(meeting);
    return WalkabilityVerdict{a.isRecommended, a.score, a.reason};
}

bool WalkabilityClassifier::isBackgroundListenable(const CalendarMeeting& meeting) const {
    if (!meeting.isRealMeeting()) return false;
    const int duration = meeting.durationMinutes();
    if (duration < m_config.listenMinDuration || duration > m_config.listenMaxDuration) return false;
    if (meeting.attendeeCount < m_config.listenMinAttendees) return false;
    if (meeting.isOrganizer) return false;
    return !HasNonWalkableKeyword(meeting.title);
}

std::vector<WalkabilityAssessment> WalkabilityClassifier::assessAll(const std::vector<CalendarMeeting>& meetings) const {
    std::vector<WalkabilityAssessment> out;
    for (const auto& m : meetings) {
        if (!m.isRealMeeting()) continue;
        out.push_back(assess(m));
    }
    std::stable_sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
        return a.start < b.start;
    });
    return out;
}

std::vector<WalkabilityAssessment> WalkabilityClassifier::recommended(const std::vector<CalendarMeeting>& meetings) const {
    std::vector<WalkabilityAssessment> all = assessAll(meetings);
    all.erase(std::remove_if(all.begin(), all.end(), [](const auto& a) { return !a.isRecommended; }),
              all.end());
    return all;
}

} // namespace moveslot::domain::scheduling
