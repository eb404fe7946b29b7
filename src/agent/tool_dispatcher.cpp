#include "voice_gateway/agent/tool_dispatcher.hpp"

#include <utility>

#include "voice_gateway/errors.hpp"
#include "voice_gateway/logging.hpp"
#include "voice_gateway/utils/http.hpp"

namespace voice_gateway::agent {

namespace {

std::string parameter(const ToolContext& context, const std::string& key) {
    const auto it = context.parameters.find(key);
    return it == context.parameters.end() ? "" : it->second;
}

}

ToolDispatcher::ToolDispatcher(std::shared_ptr<CalendarService> calendar,
                               std::shared_ptr<telephony::MessagingService> messaging,
                               ToolDispatcherOptions options,
                               Clock clock)
    : calendar_(std::move(calendar)),
      messaging_(std::move(messaging)),
      options_(std::move(options)),
      clock_(std::move(clock)) {}

ToolOutcome ToolDispatcher::execute(const ToolCall& call, const ToolContext& context) {
    const auto tool = tools::parse_tool(call.name, call.arguments);
    logging::info("Executing tool",
                  {kv("session_id", context.session_id),
                   kv("tool", call.name),
                   kv("call_id", call.id)});
    return std::visit([&](const auto& typed) { return run(typed, context); }, tool);
}

ToolOutcome ToolDispatcher::run(const tools::CheckAvailability& tool, const ToolContext& context) {
    if (!calendar_) {
        throw ToolError("calendar is not configured");
    }
    const auto date = resolve_day(tool.day, clock_());
    ToolOutcome outcome;
    outcome.content = format_availability(date, calendar_->availability(date, context.cancel));
    return outcome;
}

ToolOutcome ToolDispatcher::run(const tools::BookMeeting& tool, const ToolContext& context) {
    if (!calendar_) {
        throw ToolError("calendar is not configured");
    }
    MeetingRequest request;
    request.date = resolve_day(tool.day, clock_());
    request.time = parse_time(tool.time);
    request.title = "Demo - " + tool.contact_name;
    request.attendee_name = tool.contact_name;
    request.attendee_email = tool.contact_email;
    const auto business = parameter(context, "business_name");
    request.description = "Discovery call with " + tool.contact_name +
                          (business.empty() ? "" : " from " + business) + ".";

    ToolOutcome outcome;
    outcome.outcome = "meeting_booked";
    outcome.notes.push_back("Meeting booked: " + tool.day + " at " + tool.time + " with " +
                            tool.contact_name + " (" + tool.contact_email + ")");
    context.cancel.throw_if_cancelled("book_meeting");
    const auto event_id = calendar_->create_event(request, context.cancel);
    if (!event_id.empty()) {
        outcome.notes.push_back("Calendar event created: " + event_id);
    }

    // The agent was already told this call failed; no confirmation for it.
    if (context.cancel.cancelled()) {
        logging::warn("Meeting booked after the tool call was abandoned",
                      {kv("session_id", context.session_id), kv("event_id", event_id)});
        context.cancel.throw_if_cancelled("book_meeting");
    }
    if (messaging_ && !context.caller.empty()) {
        try {
            messaging_->send_sms(context.caller,
                                 "Hi " + tool.contact_name + "! Your demo is confirmed for " +
                                     request.date.display() + " at " + request.time.display() +
                                     ". A calendar invite is on its way to " +
                                     tool.contact_email + ".");
            outcome.notes.push_back("SMS confirmation sent");
        } catch (const std::exception& ex) {
            logging::warn("Booking confirmation SMS failed",
                          {kv("session_id", context.session_id), kv("error", ex.what())});
        }
    }
    outcome.content = "Meeting successfully booked for " + tool.day + " at " + tool.time +
                      ". Calendar invite will be sent to " + tool.contact_email + ".";
    return outcome;
}

ToolOutcome ToolDispatcher::run(const tools::RequestCallback& tool, const ToolContext&) {
    const auto date = resolve_day(tool.day, clock_());
    const auto time = parse_time(tool.time);
    ToolOutcome outcome;
    outcome.outcome = "callback_requested";
    outcome.notes.push_back("Callback requested: " + tool.day + " at " + tool.time +
                            (tool.reason.empty() ? "" : " - " + tool.reason));
    logging::debug("Callback scheduled", {kv("date", date.iso()), kv("time", time.display())});
    outcome.content = "Callback scheduled for " + tool.day + " at " + tool.time + ".";
    return outcome;
}

ToolOutcome ToolDispatcher::run(const tools::SendBookingLink& tool, const ToolContext& context) {
    if (options_.booking_url.empty()) {
        throw ToolError("booking link is not configured");
    }
    const auto date = resolve_day(tool.day, clock_());
    const auto time = parse_time(tool.time);
    const auto separator = options_.booking_url.find('?') == std::string::npos ? "?" : "&";
    const auto link = options_.booking_url + separator +
                      utils::build_query({{"date", date.iso()},
                                          {"time", time.display()},
                                          {"name", tool.contact_name},
                                          {"phone", context.caller}});
    send_sms(context, "Hi " + tool.contact_name + "! Here's your booking link for our demo on " +
                          date.display() + " at " + time.display() + ": " + link +
                          "\n\nJust add your email and you're all set.");

    ToolOutcome outcome;
    outcome.outcome = "meeting_booked";
    outcome.notes.push_back("Booking link sent for " + date.iso() + " " + time.display());
    outcome.content = "Booking link sent! Tell them to check their phone, and remind them it "
                      "might land in spam or promotions on iPhone.";
    return outcome;
}

ToolOutcome ToolDispatcher::run(const tools::TransferCall& tool, const ToolContext& context) {
    if (!context.call_control) {
        throw ToolError("call transfer is not available on this call");
    }
    std::string target = tool.target;
    if (target.empty() && options_.transfer_number) {
        target = *options_.transfer_number;
    }
    if (target.empty()) {
        throw ToolError("no transfer target configured");
    }
    ToolOutcome outcome;
    outcome.ends_call = true;
    outcome.outcome = "transferred";
    outcome.transfer_target = target;
    if (!tool.reason.empty()) {
        outcome.notes.push_back("Transfer reason: " + tool.reason);
    }
    outcome.content = "Transferring the call now.";
    return outcome;
}

ToolOutcome ToolDispatcher::run(const tools::AddNote& tool, const ToolContext&) {
    ToolOutcome outcome;
    outcome.notes.push_back(tool.note);
    outcome.content = "Note recorded.";
    return outcome;
}

ToolOutcome ToolDispatcher::run(const tools::EndCall& tool, const ToolContext&) {
    ToolOutcome outcome;
    outcome.ends_call = true;
    outcome.outcome = tool.outcome;
    if (!tool.notes.empty()) {
        outcome.notes.push_back(tool.notes);
    }
    outcome.content = "Call ended with outcome: " + tool.outcome;
    return outcome;
}

void ToolDispatcher::send_sms(const ToolContext& context, const std::string& body) {
    if (!messaging_) {
        throw ToolError("SMS is not configured");
    }
    if (context.caller.empty()) {
        throw ToolError("caller number is unknown");
    }
    context.cancel.throw_if_cancelled("SMS");
    try {
        messaging_->send_sms(context.caller, body);
    } catch (const std::exception& ex) {
        throw ToolError(std::string("SMS failed: ") + ex.what());
    }
}

}
