#include "voice_gateway/agent/calendar.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <regex>
#include <sstream>
#include <utility>

#include "voice_gateway/errors.hpp"
#include "voice_gateway/http/client.hpp"
#include "voice_gateway/logging.hpp"
#include "voice_gateway/utils/http.hpp"
#include "voice_gateway/utils/text.hpp"

namespace voice_gateway::agent {

namespace {

constexpr size_t kMaxListedSlots = 6;

const std::array<const char*, 7> kWeekdays = {
    "monday", "tuesday", "wednesday", "thursday", "friday", "saturday", "sunday"};

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return value;
}

std::tm to_tm(const CalendarDate& date) {
    std::tm tm{};
    tm.tm_year = date.year - 1900;
    tm.tm_mon = date.month - 1;
    tm.tm_mday = date.day;
    tm.tm_hour = 12;
    tm.tm_isdst = -1;
    return tm;
}

CalendarDate from_tm(const std::tm& tm) {
    CalendarDate date;
    date.year = tm.tm_year + 1900;
    date.month = tm.tm_mon + 1;
    date.day = tm.tm_mday;
    date.weekday = (tm.tm_wday + 6) % 7;
    return date;
}

CalendarDate normalize(std::tm tm) {
    std::mktime(&tm);
    return from_tm(tm);
}

CalendarDate next_weekday(const CalendarDate& today, int target) {
    int ahead = target - today.weekday;
    if (ahead <= 0) {
        ahead += 7;
    }
    return add_days(today, ahead);
}

}

std::string CalendarDate::iso() const {
    std::ostringstream out;
    out << std::setfill('0') << std::setw(4) << year << '-' << std::setw(2) << month << '-'
        << std::setw(2) << day;
    return out.str();
}

std::string CalendarDate::display() const {
    auto tm = to_tm(*this);
    std::mktime(&tm);
    std::array<char, 64> buffer{};
    const auto size = std::strftime(buffer.data(), buffer.size(), "%A, %B %d", &tm);
    return std::string(buffer.data(), size);
}

std::string TimeOfDay::display() const {
    const int display_hour = hour % 12 == 0 ? 12 : hour % 12;
    std::ostringstream out;
    out << display_hour << ':' << std::setfill('0') << std::setw(2) << minute
        << (hour < 12 ? " AM" : " PM");
    return out.str();
}

CalendarDate today_local() {
    const std::time_t now = std::time(nullptr);
    std::tm tm{};
    localtime_r(&now, &tm);
    return from_tm(tm);
}

CalendarDate add_days(const CalendarDate& date, int days) {
    auto tm = to_tm(date);
    tm.tm_mday += days;
    return normalize(tm);
}

CalendarDate resolve_day(const std::string& day, const CalendarDate& today) {
    const auto trimmed = to_lower(utils::trim(day));
    if (trimmed == "today") {
        return today;
    }
    if (trimmed == "tomorrow") {
        return add_days(today, 1);
    }
    static const std::regex iso_date(R"((\d{4})-(\d{2})-(\d{2}))");
    std::smatch match;
    if (std::regex_search(trimmed, match, iso_date)) {
        std::tm tm{};
        tm.tm_year = std::stoi(match[1].str()) - 1900;
        tm.tm_mon = std::stoi(match[2].str()) - 1;
        tm.tm_mday = std::stoi(match[3].str());
        tm.tm_hour = 12;
        tm.tm_isdst = -1;
        return normalize(tm);
    }
    for (size_t i = 0; i < kWeekdays.size(); ++i) {
        if (trimmed.find(kWeekdays[i]) != std::string::npos) {
            return next_weekday(today, static_cast<int>(i));
        }
    }
    return add_days(today, 1);
}

TimeOfDay parse_time(const std::string& time) {
    std::string value;
    for (char ch : to_lower(time)) {
        if (ch != ' ' && ch != '.') {
            value.push_back(ch);
        }
    }
    TimeOfDay result;
    if (value.find("morning") != std::string::npos) {
        result.hour = 10;
        return result;
    }
    if (value.find("afternoon") != std::string::npos) {
        result.hour = 14;
        return result;
    }
    if (value.find("evening") != std::string::npos) {
        result.hour = 17;
        return result;
    }
    static const std::regex clock(R"((\d{1,2})(?::?(\d{2}))?)");
    std::smatch match;
    if (!std::regex_search(value, match, clock)) {
        return result;
    }
    result.hour = std::stoi(match[1].str());
    result.minute = match[2].matched ? std::stoi(match[2].str()) : 0;
    if (value.find("pm") != std::string::npos && result.hour < 12) {
        result.hour += 12;
    }
    if (value.find("am") != std::string::npos && result.hour == 12) {
        result.hour = 0;
    }
    result.hour = std::clamp(result.hour, 0, 23);
    result.minute = std::clamp(result.minute, 0, 59);
    return result;
}

Availability MockCalendarService::availability(const CalendarDate&, const pipeline::CancelToken&) {
    Availability result;
    result.available = {"9:00 AM", "10:30 AM", "2:00 PM", "3:30 PM"};
    result.busy.push_back({"12:00 PM", "1:00 PM", "Lunch"});
    return result;
}

std::string MockCalendarService::create_event(const MeetingRequest& request,
                                              const pipeline::CancelToken& cancel) {
    cancel.throw_if_cancelled("calendar event");
    logging::info("Mock calendar event created",
                  {kv("date", request.date.iso()),
                   kv("time", request.time.display()),
                   kv("attendee", request.attendee_email)});
    return "mock_event_123";
}

HttpCalendarService::HttpCalendarService(std::string base_url, std::chrono::seconds timeout)
    : base_url_(std::move(base_url)),
      timeout_(timeout) {}

Availability HttpCalendarService::availability(const CalendarDate& date,
                                               const pipeline::CancelToken& cancel) {
    HttpRequestOptions options;
    options.read_timeout = timeout_;
    options.request_timeout = timeout_;
    nlohmann::json response;
    try {
        HttpClient client(base_url_, options);
        client.set_cancel_token(cancel);
        response = client.get_json("/availability?" + utils::build_query({{"date", date.iso()}}));
    } catch (const HttpError& ex) {
        throw ToolError(std::string("Calendar availability failed: ") + ex.what());
    }
    Availability result;
    for (const auto& slot : response.value("available", nlohmann::json::array())) {
        if (slot.is_string()) {
            result.available.push_back(slot.get<std::string>());
        }
    }
    for (const auto& block : response.value("busy", nlohmann::json::array())) {
        result.busy.push_back({block.value("start", std::string()),
                               block.value("end", std::string()),
                               block.value("title", std::string("Busy"))});
    }
    return result;
}

std::string HttpCalendarService::create_event(const MeetingRequest& request,
                                              const pipeline::CancelToken& cancel) {
    HttpRequestOptions options;
    options.read_timeout = timeout_;
    options.request_timeout = timeout_;
    std::ostringstream start;
    start << request.date.iso() << 'T' << std::setfill('0') << std::setw(2) << request.time.hour
          << ':' << std::setw(2) << request.time.minute << ":00";
    const nlohmann::json body = {
        {"title", request.title},
        {"start", start.str()},
        {"duration_minutes", request.duration_minutes},
        {"attendee_name", request.attendee_name},
        {"attendee_email", request.attendee_email},
        {"description", request.description},
    };
    try {
        HttpClient client(base_url_, options);
        client.set_cancel_token(cancel);
        const auto response = client.post_json("/events", body);
        return response.value("id", std::string());
    } catch (const HttpError& ex) {
        throw ToolError(std::string("Calendar event creation failed: ") + ex.what());
    }
}

std::string format_availability(const CalendarDate& date, const Availability& availability) {
    const auto day_name = date.display();
    std::string busy;
    for (const auto& block : availability.busy) {
        if (!busy.empty()) {
            busy += ", ";
        }
        busy += block.start + "-" + block.end;
        if (!availability.available.empty()) {
            busy += " (" + block.title + ")";
        }
    }
    if (availability.available.empty()) {
        if (!busy.empty()) {
            return "No available slots on " + day_name + ". Already booked: " + busy +
                   ". Try another day.";
        }
        return "No available slots on " + day_name + ". Try another day.";
    }

    std::string slots;
    const size_t listed = std::min(kMaxListedSlots, availability.available.size());
    for (size_t i = 0; i < listed; ++i) {
        if (!slots.empty()) {
            slots += ", ";
        }
        slots += availability.available[i];
    }
    std::string response = "CALENDAR FOR " + day_name + ":\n";
    response += "BUSY: " + (busy.empty() ? std::string("Nothing scheduled") : busy) + "\n";
    response += "AVAILABLE: " + slots;
    if (availability.available.size() > kMaxListedSlots) {
        response += " (and " + std::to_string(availability.available.size() - kMaxListedSlots) +
                    " more slots)";
    }
    return response;
}

}
