#pragma once

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "voice_gateway/agent/agent_client.hpp"
#include "voice_gateway/agent/calendar.hpp"
#include "voice_gateway/agent/tools.hpp"
#include "voice_gateway/pipeline/cancellation.hpp"
#include "voice_gateway/telephony/twilio_client.hpp"
#include "voice_gateway/transport/media_transport.hpp"

namespace voice_gateway {
namespace agent {

// Everything a tool may know about the call it runs for.
struct ToolContext {
    std::string session_id;
    std::string call_id;
    std::string caller;
    std::string callee;
    std::map<std::string, std::string> parameters;
    std::shared_ptr<transport::CallControl> call_control;
    // Cancelled when the orchestrator stops waiting for the tool.
    pipeline::CancelToken cancel;
};

// Text for the agent plus the side effects the coordinator applies to the session.
struct ToolOutcome {
    std::string content;
    bool ends_call = false;
    std::optional<std::string> outcome;
    std::vector<std::string> notes;
    std::optional<std::string> transfer_target;
};

class ToolExecutor {
public:
    virtual ~ToolExecutor() = default;

    // Throws ToolError on failure.
    virtual ToolOutcome execute(const ToolCall& call, const ToolContext& context) = 0;
};

struct ToolDispatcherOptions {
    std::string booking_url;
    std::optional<std::string> transfer_number;
};

class ToolDispatcher : public ToolExecutor {
public:
    using Clock = std::function<CalendarDate()>;

    ToolDispatcher(std::shared_ptr<CalendarService> calendar,
                   std::shared_ptr<telephony::MessagingService> messaging,
                   ToolDispatcherOptions options,
                   Clock clock = today_local);

    ToolOutcome execute(const ToolCall& call, const ToolContext& context) override;

    ToolOutcome run(const tools::CheckAvailability& tool, const ToolContext& context);
    ToolOutcome run(const tools::BookMeeting& tool, const ToolContext& context);
    ToolOutcome run(const tools::RequestCallback& tool, const ToolContext& context);
    ToolOutcome run(const tools::SendBookingLink& tool, const ToolContext& context);
    ToolOutcome run(const tools::TransferCall& tool, const ToolContext& context);
    ToolOutcome run(const tools::AddNote& tool, const ToolContext& context);
    ToolOutcome run(const tools::EndCall& tool, const ToolContext& context);

private:
    void send_sms(const ToolContext& context, const std::string& body);

    std::shared_ptr<CalendarService> calendar_;
    std::shared_ptr<telephony::MessagingService> messaging_;
    ToolDispatcherOptions options_;
    Clock clock_;
};

}
}
