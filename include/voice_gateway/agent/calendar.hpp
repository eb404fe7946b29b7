#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "voice_gateway/pipeline/cancellation.hpp"

namespace voice_gateway {
namespace agent {

struct CalendarDate {
    int year = 1970;
    int month = 1;
    int day = 1;
    int weekday = 3;  // 0 = Monday

    std::string iso() const;
    // "Tuesday, October 20"
    std::string display() const;
};

struct TimeOfDay {
    int hour = 10;
    int minute = 0;

    // "2:00 PM"
    std::string display() const;
};

CalendarDate today_local();
CalendarDate add_days(const CalendarDate& date, int days);

// today, tomorrow, weekday names (next occurrence, never today), YYYY-MM-DD, or
// any phrase containing a weekday name. Anything else means tomorrow.
CalendarDate resolve_day(const std::string& day, const CalendarDate& today);

// morning, afternoon, evening, or "2pm", "10:30am", "14:00". Defaults to 10:00.
TimeOfDay parse_time(const std::string& time);

struct BusyBlock {
    std::string start;
    std::string end;
    std::string title;
};

struct Availability {
    std::vector<std::string> available;
    std::vector<BusyBlock> busy;
};

struct MeetingRequest {
    CalendarDate date;
    TimeOfDay time;
    int duration_minutes = 15;
    std::string title;
    std::string attendee_name;
    std::string attendee_email;
    std::string description;
};

// Requests give up with pipeline::OperationCancelled once cancel is set.
class CalendarService {
public:
    virtual ~CalendarService() = default;

    virtual Availability availability(const CalendarDate& date, const pipeline::CancelToken& cancel) = 0;
    // Returns the event id.
    virtual std::string create_event(const MeetingRequest& request, const pipeline::CancelToken& cancel) = 0;
};

// Fixed slots, used when no calendar backend is configured.
class MockCalendarService : public CalendarService {
public:
    Availability availability(const CalendarDate& date, const pipeline::CancelToken& cancel) override;
    std::string create_event(const MeetingRequest& request, const pipeline::CancelToken& cancel) override;
};

// GET /availability?date=YYYY-MM-DD and POST /events.
class HttpCalendarService : public CalendarService {
public:
    HttpCalendarService(std::string base_url, std::chrono::seconds timeout);

    Availability availability(const CalendarDate& date, const pipeline::CancelToken& cancel) override;
    std::string create_event(const MeetingRequest& request, const pipeline::CancelToken& cancel) override;

private:
    std::string base_url_;
    std::chrono::seconds timeout_;
};

std::string format_availability(const CalendarDate& date, const Availability& availability);

}
}
