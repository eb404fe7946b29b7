#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "voice_gateway/pipeline/cancellation.hpp"

namespace voice_gateway {
namespace agent {

struct AgentContext {
    std::string session_id;
    std::string call_id;
    std::string caller;
    std::string callee;
    // "none", "completed", "interrupted" or "tool_error".
    std::string previous_turn = "none";
    std::map<std::string, std::string> parameters;
    // Cancelled once nobody waits for the request any more.
    pipeline::CancelToken cancel;

    nlohmann::json to_json() const;
};

struct ToolCall {
    std::string id;
    std::string name;
    nlohmann::json arguments = nlohmann::json::object();
};

struct AgentReply {
    std::string text;
    std::vector<ToolCall> tool_calls;
};

struct ToolResult {
    std::string call_id;
    std::string name;
    bool ok = true;
    std::string content;
};

// Remote conversational agent. Implementations throw AgentServiceError.
class AgentService {
public:
    virtual ~AgentService() = default;

    virtual std::string create_thread(const AgentContext& context) = 0;
    virtual AgentReply send_message(const std::string& thread_id,
                                    const std::string& text,
                                    const AgentContext& context) = 0;
    virtual AgentReply send_tool_results(const std::string& thread_id,
                                         const std::vector<ToolResult>& results,
                                         const AgentContext& context) = 0;
};

// LangGraph server API: threads plus blocking runs.
class HttpAgentClient : public AgentService {
public:
    HttpAgentClient(std::string base_url,
                    std::string assistant_id,
                    std::optional<std::string> api_key,
                    std::chrono::seconds timeout);

    std::string create_thread(const AgentContext& context) override;
    AgentReply send_message(const std::string& thread_id,
                            const std::string& text,
                            const AgentContext& context) override;
    AgentReply send_tool_results(const std::string& thread_id,
                                 const std::vector<ToolResult>& results,
                                 const AgentContext& context) override;

private:
    AgentReply run(const std::string& thread_id,
                   const nlohmann::json& messages,
                   const AgentContext& context);
    nlohmann::json post(const std::string& path,
                        const nlohmann::json& body,
                        const pipeline::CancelToken& cancel) const;

    std::string base_url_;
    std::string assistant_id_;
    std::optional<std::string> api_key_;
    std::chrono::seconds timeout_;
};

// Picks the reply out of a run result: the last "ai" message's text and tool calls.
AgentReply parse_agent_reply(const nlohmann::json& result);

}
}
