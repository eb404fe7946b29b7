#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

#include "voice_gateway/agent/agent_client.hpp"
#include "voice_gateway/agent/tool_dispatcher.hpp"
#include "voice_gateway/logging.hpp"
#include "voice_gateway/pipeline/cancellation.hpp"
#include "voice_gateway/stt/stt_streamer.hpp"

namespace voice_gateway {
namespace agent {

enum class ConversationState {
    Idle,
    AwaitingAgent,
    Executing,
    Speaking,
    Terminated
};

const char* to_string(ConversationState state);

struct OrchestratorOptions {
    std::chrono::milliseconds agent_timeout{30000};
    std::chrono::milliseconds tool_timeout{10000};
    int agent_max_retries = 1;
    std::chrono::milliseconds retry_backoff{500};
    int max_tool_rounds = 5;
    // Spoken before ending the call when the agent cannot be reached. Empty means
    // end the call silently.
    std::string unavailable_message;
};

// Result of one turn. Side effects are set even when there is nothing to say.
struct Reply {
    std::string segment_id;
    std::string text;
    std::vector<ToolResult> tool_results;
    bool ends_call = false;
    std::optional<std::string> outcome;
    std::vector<std::string> notes;
    std::optional<std::string> transfer_target;
};

// Per-session turn state machine:
//   Idle -> AwaitingAgent -> [Executing] -> Speaking | Idle
//   Speaking -> Idle (completed or interrupted)
//   Idle -> Terminated once the agent ended the call.
// Turns run on a worker thread; callbacks are invoked from that thread, except
// those triggered by on_speaking_finished(), which run on the caller's thread.
class ConversationOrchestrator {
public:
    using ReplyHandler = std::function<void(const Reply&)>;
    using TerminatedHandler =
        std::function<void(const std::string& outcome, const std::optional<std::string>& transfer_target)>;
    using TransitionHandler = std::function<void(ConversationState from, ConversationState to)>;

    ConversationOrchestrator(std::shared_ptr<AgentService> agent,
                             std::shared_ptr<ToolExecutor> tools,
                             AgentContext agent_context,
                             ToolContext tool_context,
                             OrchestratorOptions options);
    ~ConversationOrchestrator();

    void set_on_reply(ReplyHandler handler);
    void set_on_terminated(TerminatedHandler handler);
    void set_on_transition(TransitionHandler handler);

    void start();

    // Queues a finalized segment. Returns false for a segment id seen before, an
    // empty transcript, or after termination.
    bool submit(const stt::TranscriptSegment& segment);

    // TTS for the current reply has finished or was cut off by barge-in.
    void on_speaking_finished(bool interrupted);

    void close();

    ConversationState state() const;
    std::string thread_id() const;

private:
    struct PendingTermination {
        std::string outcome;
        std::optional<std::string> transfer_target;
    };

    void worker_loop();
    void process(const stt::TranscriptSegment& segment);
    bool ensure_thread();
    std::vector<ToolResult> execute_tools(const std::vector<ToolCall>& calls, Reply& reply);
    void fail_turn(Reply reply);
    void finish_turn(Reply reply);
    void transition(ConversationState to);
    void terminate(const std::string& outcome, const std::optional<std::string>& transfer_target);
    AgentContext current_context() const;
    template <typename R>
    std::optional<R> call_agent(const std::string& what,
                                std::function<R(AgentService&, const pipeline::CancelToken&)> request);

    std::shared_ptr<AgentService> agent_;
    std::shared_ptr<ToolExecutor> tools_;
    AgentContext agent_context_;
    ToolContext tool_context_;
    OrchestratorOptions options_;
    logging::Context log_;
    pipeline::CancelToken cancel_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    ConversationState state_ = ConversationState::Idle;
    std::deque<stt::TranscriptSegment> queue_;
    std::unordered_set<std::string> seen_segments_;
    std::optional<PendingTermination> pending_termination_;
    std::string previous_turn_ = "none";
    std::string thread_id_;
    bool turn_tool_error_ = false;
    bool closing_ = false;

    ReplyHandler on_reply_;
    TerminatedHandler on_terminated_;
    TransitionHandler on_transition_;
    std::thread worker_;
};

}
}
