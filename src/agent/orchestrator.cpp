#include "voice_gateway/agent/orchestrator.hpp"

#include <utility>

#include "voice_gateway/metrics.hpp"
#include "voice_gateway/utils/text.hpp"

namespace voice_gateway::agent {

namespace {

double seconds_since(std::chrono::steady_clock::time_point started) {
    const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - started;
    return elapsed.count();
}

void apply(const ToolOutcome& outcome, Reply& reply) {
    reply.ends_call = reply.ends_call || outcome.ends_call;
    if (outcome.outcome) {
        reply.outcome = outcome.outcome;
    }
    if (outcome.transfer_target) {
        reply.transfer_target = outcome.transfer_target;
    }
    reply.notes.insert(reply.notes.end(), outcome.notes.begin(), outcome.notes.end());
}

}

const char* to_string(ConversationState state) {
    switch (state) {
        case ConversationState::Idle: return "idle";
        case ConversationState::AwaitingAgent: return "awaiting_agent";
        case ConversationState::Executing: return "executing";
        case ConversationState::Speaking: return "speaking";
        case ConversationState::Terminated: return "terminated";
    }
    return "unknown";
}

ConversationOrchestrator::ConversationOrchestrator(std::shared_ptr<AgentService> agent,
                                                   std::shared_ptr<ToolExecutor> tools,
                                                   AgentContext agent_context,
                                                   ToolContext tool_context,
                                                   OrchestratorOptions options)
    : agent_(std::move(agent)),
      tools_(std::move(tools)),
      agent_context_(std::move(agent_context)),
      tool_context_(std::move(tool_context)),
      options_(std::move(options)),
      log_({kv("session_id", agent_context_.session_id)}) {}

ConversationOrchestrator::~ConversationOrchestrator() {
    close();
}

void ConversationOrchestrator::set_on_reply(ReplyHandler handler) {
    on_reply_ = std::move(handler);
}

void ConversationOrchestrator::set_on_terminated(TerminatedHandler handler) {
    on_terminated_ = std::move(handler);
}

void ConversationOrchestrator::set_on_transition(TransitionHandler handler) {
    on_transition_ = std::move(handler);
}

void ConversationOrchestrator::start() {
    if (worker_.joinable()) {
        return;
    }
    worker_ = std::thread([this]() { worker_loop(); });
}

bool ConversationOrchestrator::submit(const stt::TranscriptSegment& segment) {
    if (utils::trim(segment.text).empty()) {
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closing_ || state_ == ConversationState::Terminated || pending_termination_) {
            return false;
        }
        if (!seen_segments_.insert(segment.id).second) {
            log_.debug("Duplicate segment ignored", {kv("segment_id", segment.id)});
            return false;
        }
        queue_.push_back(segment);
    }
    cv_.notify_all();
    return true;
}

void ConversationOrchestrator::on_speaking_finished(bool interrupted) {
    std::optional<PendingTermination> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != ConversationState::Speaking) {
            return;
        }
        if (interrupted) {
            previous_turn_ = "interrupted";
        } else {
            previous_turn_ = turn_tool_error_ ? "tool_error" : "completed";
        }
        turn_tool_error_ = false;
        pending = pending_termination_;
    }
    transition(ConversationState::Idle);
    if (pending) {
        terminate(pending->outcome, pending->transfer_target);
    }
}

void ConversationOrchestrator::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closing_ = true;
    }
    cancel_.cancel();
    cv_.notify_all();
    if (worker_.joinable()) {
        if (worker_.get_id() == std::this_thread::get_id()) {
            worker_.detach();
        } else {
            worker_.join();
        }
    }
}

ConversationState ConversationOrchestrator::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::string ConversationOrchestrator::thread_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return thread_id_;
}

void ConversationOrchestrator::worker_loop() {
    while (true) {
        stt::TranscriptSegment segment;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this]() {
                return closing_ || state_ == ConversationState::Terminated ||
                       (state_ == ConversationState::Idle && !queue_.empty() &&
                        !pending_termination_);
            });
            if (closing_ || state_ == ConversationState::Terminated) {
                return;
            }
            segment = std::move(queue_.front());
            queue_.pop_front();
        }
        try {
            process(segment);
        } catch (const pipeline::OperationCancelled&) {
            log_.debug("Turn cancelled", {kv("segment_id", segment.id)});
            return;
        } catch (const std::exception& ex) {
            log_.error("Turn failed", {kv("segment_id", segment.id), kv("error", ex.what())});
            const auto current = state();
            if (current == ConversationState::AwaitingAgent ||
                current == ConversationState::Executing) {
                transition(ConversationState::Idle);
            }
        }
    }
}

template <typename R>
std::optional<R> ConversationOrchestrator::call_agent(
    const std::string& what, std::function<R(AgentService&, const pipeline::CancelToken&)> request) {
    auto agent = agent_;
    for (int attempt = 0; attempt <= options_.agent_max_retries; ++attempt) {
        const auto started = std::chrono::steady_clock::now();
        try {
            R result = pipeline::run_with_deadline<R>(
                [agent, request](const pipeline::CancelToken& attempt) { return request(*agent, attempt); },
                options_.agent_timeout, cancel_, what);
            Metrics::instance().observe_latency("agent_request", seconds_since(started));
            return result;
        } catch (const pipeline::OperationCancelled&) {
            throw;
        } catch (const pipeline::DeadlineExceeded&) {
            Metrics::instance().increment("agent_error", "timeout");
            log_.warn("Agent request timed out", {kv("request", what), kv("attempt", attempt + 1)});
        } catch (const std::exception& ex) {
            Metrics::instance().increment("agent_error", "failure");
            log_.warn("Agent request failed",
                      {kv("request", what), kv("attempt", attempt + 1), kv("error", ex.what())});
        }
        if (attempt < options_.agent_max_retries) {
            std::unique_lock<std::mutex> lock(mutex_);
            if (cv_.wait_for(lock, options_.retry_backoff, [this]() { return closing_; })) {
                throw pipeline::OperationCancelled(what + " cancelled");
            }
        }
    }
    return std::nullopt;
}

void ConversationOrchestrator::process(const stt::TranscriptSegment& segment) {
    const auto started = std::chrono::steady_clock::now();
    transition(ConversationState::AwaitingAgent);
    log_.info("Agent turn started", {kv("segment_id", segment.id), kv("text", segment.text)});

    Reply reply;
    reply.segment_id = segment.id;
    if (!ensure_thread()) {
        fail_turn(std::move(reply));
        return;
    }
    const auto thread = thread_id();
    const auto text = segment.text;
    auto context = current_context();
    auto answer = call_agent<AgentReply>(
        "agent request",
        [thread, text, context](AgentService& agent, const pipeline::CancelToken& cancel) {
            auto scoped = context;
            scoped.cancel = cancel;
            return agent.send_message(thread, text, scoped);
        });
    if (!answer) {
        fail_turn(std::move(reply));
        return;
    }

    int rounds = 0;
    while (!answer->tool_calls.empty()) {
        if (rounds >= options_.max_tool_rounds) {
            log_.warn("Tool round limit reached",
                      {kv("segment_id", segment.id), kv("rounds", rounds)});
            break;
        }
        ++rounds;
        if (state() == ConversationState::AwaitingAgent) {
            transition(ConversationState::Executing);
        }
        const auto results = execute_tools(answer->tool_calls, reply);
        reply.tool_results.insert(reply.tool_results.end(), results.begin(), results.end());
        context = current_context();
        answer = call_agent<AgentReply>(
            "agent tool results",
            [thread, results, context](AgentService& agent, const pipeline::CancelToken& cancel) {
                auto scoped = context;
                scoped.cancel = cancel;
                return agent.send_tool_results(thread, results, scoped);
            });
        if (!answer) {
            fail_turn(std::move(reply));
            return;
        }
    }

    reply.text = utils::trim(answer->text);
    Metrics::instance().observe_latency("agent_turn", seconds_since(started));
    finish_turn(std::move(reply));
}

bool ConversationOrchestrator::ensure_thread() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!thread_id_.empty()) {
            return true;
        }
    }
    const auto context = current_context();
    auto id = call_agent<std::string>(
        "agent thread", [context](AgentService& agent, const pipeline::CancelToken& cancel) {
            auto scoped = context;
            scoped.cancel = cancel;
            return agent.create_thread(scoped);
        });
    if (!id) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    thread_id_ = *id;
    return true;
}

std::vector<ToolResult> ConversationOrchestrator::execute_tools(const std::vector<ToolCall>& calls,
                                                                Reply& reply) {
    std::vector<ToolResult> results;
    results.reserve(calls.size());
    bool failed = false;
    for (const auto& call : calls) {
        ToolResult result;
        result.call_id = call.id;
        result.name = call.name;
        if (failed) {
            result.ok = false;
            result.content = "Skipped: an earlier tool call in this turn failed.";
            results.push_back(std::move(result));
            continue;
        }
        const auto started = std::chrono::steady_clock::now();
        try {
            auto executor = tools_;
            auto context = tool_context_;
            const auto outcome = pipeline::run_with_deadline<ToolOutcome>(
                [executor, call, context](const pipeline::CancelToken& cancel) {
                    auto scoped = context;
                    scoped.cancel = cancel;
                    return executor->execute(call, scoped);
                },
                options_.tool_timeout, cancel_, "tool " + call.name);
            result.content = outcome.content;
            apply(outcome, reply);
            Metrics::instance().observe_latency("tool_call", seconds_since(started));
        } catch (const pipeline::OperationCancelled&) {
            throw;
        } catch (const std::exception& ex) {
            failed = true;
            result.ok = false;
            result.content = std::string("Error: ") + ex.what();
            Metrics::instance().increment("tool_error", call.name);
            log_.warn("Tool failed", {kv("tool", call.name), kv("call_id", call.id), kv("error", ex.what())});
        }
        results.push_back(std::move(result));
    }
    if (failed) {
        std::lock_guard<std::mutex> lock(mutex_);
        turn_tool_error_ = true;
    }
    return results;
}

void ConversationOrchestrator::fail_turn(Reply reply) {
    Metrics::instance().increment("agent_unavailable");
    log_.error("Agent unavailable, ending call", {kv("segment_id", reply.segment_id)});
    reply.ends_call = true;
    reply.outcome = "agent_unavailable";
    reply.transfer_target.reset();
    if (!options_.unavailable_message.empty()) {
        reply.text = options_.unavailable_message;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            pending_termination_ = PendingTermination{"agent_unavailable", std::nullopt};
        }
        transition(ConversationState::Speaking);
        if (on_reply_) {
            on_reply_(reply);
        }
        return;
    }
    transition(ConversationState::Idle);
    if (on_reply_) {
        on_reply_(reply);
    }
    terminate("agent_unavailable", std::nullopt);
}

void ConversationOrchestrator::finish_turn(Reply reply) {
    std::optional<PendingTermination> termination;
    if (reply.ends_call) {
        termination = PendingTermination{reply.outcome.value_or("completed"), reply.transfer_target};
        std::lock_guard<std::mutex> lock(mutex_);
        pending_termination_ = termination;
    }
    log_.info("Agent turn finished",
              {kv("segment_id", reply.segment_id),
               kv("tools", reply.tool_results.size()),
               kv("ends_call", reply.ends_call),
               kv("text", reply.text)});
    if (!reply.text.empty()) {
        transition(ConversationState::Speaking);
        if (on_reply_) {
            on_reply_(reply);
        }
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        previous_turn_ = turn_tool_error_ ? "tool_error" : "completed";
        turn_tool_error_ = false;
    }
    transition(ConversationState::Idle);
    if (on_reply_) {
        on_reply_(reply);
    }
    if (termination) {
        terminate(termination->outcome, termination->transfer_target);
    }
}

void ConversationOrchestrator::transition(ConversationState to) {
    ConversationState from;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        from = state_;
        if (from == to || from == ConversationState::Terminated) {
            return;
        }
        state_ = to;
    }
    cv_.notify_all();
    log_.debug("Conversation state changed", {kv("from", to_string(from)), kv("to", to_string(to))});
    if (on_transition_) {
        on_transition_(from, to);
    }
}

void ConversationOrchestrator::terminate(const std::string& outcome,
                                         const std::optional<std::string>& transfer_target) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == ConversationState::Terminated) {
            return;
        }
        pending_termination_.reset();
    }
    transition(ConversationState::Terminated);
    log_.info("Conversation terminated", {kv("outcome", outcome)});
    if (on_terminated_) {
        on_terminated_(outcome, transfer_target);
    }
}

AgentContext ConversationOrchestrator::current_context() const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto context = agent_context_;
    context.previous_turn = previous_turn_;
    return context;
}

}
