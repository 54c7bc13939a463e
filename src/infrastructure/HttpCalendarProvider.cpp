#include "infrastructure/HttpCalendarProvider.hpp"
#include "infrastructure/StateCodec.hpp"

#include <httplib.h>
#include <iostream>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace moveslot::infrastructure {

using json = nlohmann::json;

namespace {
constexpr int kReadTimeoutSeconds = 10;
constexpr int kConnectTimeoutSeconds = 3;
}

HttpCalendarProvider::HttpCalendarProvider(const std::string& host, int port)
    : m_host(host), m_port(port) {}

std::vector<domain::CalendarMeeting> HttpCalendarProvider::fetchEvents(const domain::CivilDate& date) {
    httplib::Client cli(m_host, m_port);
    cli.set_connection_timeout(kConnectTimeoutSeconds);
    cli.set_read_timeout(kReadTimeoutSeconds);

    auto res = cli.Get("/events?date=" + date.toString());
    if (!res) {
        std::cerr << "[HttpCalendarProvider] Connection failed: " << static_cast<int>(res.error()) << std::endl;
        throw std::runtime_error("calendar bridge unreachable");
    }
    if (res->status != 200) {
        std::cerr << "[HttpCalendarProvider] HTTP Error " << res->status << ": " << res->body << std::endl;
        throw std::runtime_error("calendar bridge returned HTTP " + std::to_string(res->status));
    }

    std::vector<domain::CalendarMeeting> meetings;
    try {
        auto body = json::parse(res->body);
        const json& events = body.is_array() ? body : body.value("events", json::array());
        for (const auto& item : events) {
            meetings.push_back(StateCodec::MeetingFromJson(item));
        }
    } catch (const std::exception& e) {
        std::cerr << "[HttpCalendarProvider] JSON Parse Error: " << e.what() << std::endl;
        throw std::runtime_error(std::string("malformed calendar response: ") + e.what());
    }
    return meetings;
}

std::optional<std::string> HttpCalendarProvider::createEvent(const std::string& title,
                                                             const domain::Instant& start,
                                                             const domain::Instant& end,
                                                             const std::string& notes,
                                                             int alarmOffsetMinutes) {
    httplib::Client cli(m_host, m_port);
    cli.set_connection_timeout(kConnectTimeoutSeconds);
    cli.set_read_timeout(kReadTimeoutSeconds);

    json requestData = {
        {"title", title},
        {"start", domain::FormatLocalDateTime(start)},
        {"end", domain::FormatLocalDateTime(end)},
        {"notes", notes},
        {"alarm_offset_minutes", alarmOffsetMinutes}
    };

    auto res = cli.Post("/events", requestData.dump(), "application/json");
    if (res && (res->status == 200 || res->status == 201)) {
        try {
            auto body = json::parse(res->body);
            if (body.contains("id") && body["id"].is_string()) {
                return body["id"].get<std::string>();
            }
            std::cerr << "[HttpCalendarProvider] Create response without id" << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[HttpCalendarProvider] JSON Parse Error: " << e.what() << std::endl;
        }
    } else if (res) {
        std::cerr << "[HttpCalendarProvider] HTTP Error " << res->status << ": " << res->body << std::endl;
    } else {
        std::cerr << "[HttpCalendarProvider] Connection failed: " << static_cast<int>(res.error()) << std::endl;
    }
    return std::nullopt;
}

bool HttpCalendarProvider::deleteEvent(const std::string& eventId) {
    httplib::Client cli(m_host, m_port);
    cli.set_connection_timeout(kConnectTimeoutSeconds);
    cli.set_read_timeout(kReadTimeoutSeconds);

    auto res = cli.Delete("/events/" + eventId);
    if (res && (res->status == 200 || res->status == 204 || res->status == 404)) {
        return true;
    }
    if (res) {
        std::cerr << "[HttpCalendarProvider] Delete failed with HTTP " << res->status << std::endl;
    } else {
        std::cerr << "[HttpCalendarProvider] Connection failed: " << static_cast<int>(res.error()) << std::endl;
    }
    return false;
}

} // namespace moveslot::infrastructure
