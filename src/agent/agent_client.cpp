#include "voice_gateway/agent/agent_client.hpp"

#include <utility>

#include "voice_gateway/errors.hpp"
#include "voice_gateway/http/client.hpp"
#include "voice_gateway/logging.hpp"
#include "voice_gateway/utils/http.hpp"

namespace voice_gateway::agent {

namespace {

std::string message_text(const nlohmann::json& content) {
    if (content.is_string()) {
        return content.get<std::string>();
    }
    if (!content.is_array()) {
        return "";
    }
    std::string text;
    for (const auto& block : content) {
        if (block.is_object() && block.value("type", std::string()) == "text") {
            if (!text.empty()) {
                text += ' ';
            }
            text += block.value("text", std::string());
        }
    }
    return text;
}

}

nlohmann::json AgentContext::to_json() const {
    nlohmann::json value = {
        {"session_id", session_id},
        {"call_sid", call_id},
        {"phone_number", caller},
        {"callee", callee},
        {"previous_turn", previous_turn},
    };
    for (const auto& [key, item] : parameters) {
        value[key] = item;
    }
    return value;
}

AgentReply parse_agent_reply(const nlohmann::json& result) {
    const auto messages = result.is_object() ? result.value("messages", nlohmann::json::array())
                                             : nlohmann::json::array();
    if (!messages.is_array()) {
        throw AgentServiceError("Agent response has no message list");
    }
    for (auto it = messages.rbegin(); it != messages.rend(); ++it) {
        if (!it->is_object() || it->value("type", std::string()) != "ai") {
            continue;
        }
        AgentReply reply;
        reply.text = message_text(it->value("content", nlohmann::json()));
        for (const auto& call : it->value("tool_calls", nlohmann::json::array())) {
            ToolCall tool;
            tool.id = call.value("id", std::string());
            tool.name = call.value("name", std::string());
            tool.arguments = call.value("args", nlohmann::json::object());
            if (tool.name.empty()) {
                throw AgentServiceError("Agent tool call without a name");
            }
            reply.tool_calls.push_back(std::move(tool));
        }
        return reply;
    }
    throw AgentServiceError("Agent response has no AI message");
}

HttpAgentClient::HttpAgentClient(std::string base_url,
                                 std::string assistant_id,
                                 std::optional<std::string> api_key,
                                 std::chrono::seconds timeout)
    : base_url_(std::move(base_url)),
      assistant_id_(std::move(assistant_id)),
      api_key_(std::move(api_key)),
      timeout_(timeout) {}

std::string HttpAgentClient::create_thread(const AgentContext& context) {
    const auto response = post("/threads",
                               {{"metadata", {{"phone", context.caller},
                                              {"session_id", context.session_id}}}},
                               context.cancel);
    const auto thread_id = response.value("thread_id", std::string());
    if (thread_id.empty()) {
        throw AgentServiceError("Agent thread response has no thread_id");
    }
    logging::info("Agent thread created",
                  {kv("session_id", context.session_id), kv("thread_id", thread_id)});
    return thread_id;
}

AgentReply HttpAgentClient::send_message(const std::string& thread_id,
                                         const std::string& text,
                                         const AgentContext& context) {
    return run(thread_id, nlohmann::json::array({{{"role", "human"}, {"content", text}}}), context);
}

AgentReply HttpAgentClient::send_tool_results(const std::string& thread_id,
                                              const std::vector<ToolResult>& results,
                                              const AgentContext& context) {
    auto messages = nlohmann::json::array();
    for (const auto& result : results) {
        messages.push_back({{"type", "tool"},
                            {"tool_call_id", result.call_id},
                            {"name", result.name},
                            {"status", result.ok ? "success" : "error"},
                            {"content", result.content}});
    }
    return run(thread_id, messages, context);
}

AgentReply HttpAgentClient::run(const std::string& thread_id,
                                const nlohmann::json& messages,
                                const AgentContext& context) {
    const nlohmann::json body = {
        {"assistant_id", assistant_id_},
        {"input", {{"messages", messages}}},
        {"config", {{"configurable", context.to_json()}}},
    };
    return parse_agent_reply(
        post("/threads/" + utils::url_encode(thread_id) + "/runs/wait", body, context.cancel));
}

nlohmann::json HttpAgentClient::post(const std::string& path,
                                     const nlohmann::json& body,
                                     const pipeline::CancelToken& cancel) const {
    HttpRequestOptions options;
    options.connect_timeout = std::chrono::seconds(5);
    options.read_timeout = timeout_;
    options.request_timeout = timeout_;
    try {
        HttpClient client(base_url_, options);
        client.set_cancel_token(cancel);
        if (api_key_) {
            client.set_header("x-api-key", *api_key_);
        }
        return client.post_json(path, body);
    } catch (const HttpError& ex) {
        throw AgentServiceError(std::string("Agent request failed: ") + ex.what());
    }
}

}
