#include "voice_gateway/session/coordinator.hpp"

#include <utility>

#include "voice_gateway/errors.hpp"
#include "voice_gateway/metrics.hpp"

namespace voice_gateway::session {

SessionCoordinator::SessionCoordinator(std::string session_id,
                                       Components components,
                                       CoordinatorOptions options)
    : id_(std::move(session_id)),
      log_({kv("session_id", id_)}),
      session_(id_, components.transport->info()),
      components_(std::move(components)),
      options_(std::move(options)),
      events_(options_.event_queue_capacity) {
    components_.stt->set_on_speech_start([this](double start_sec) {
        post(SpeechStarted{start_sec});
    });
    components_.orchestrator->set_on_reply([this](const agent::Reply& reply) {
        post(AgentReplied{reply});
    });
    components_.orchestrator->set_on_terminated(
        [this](const std::string& outcome, const std::optional<std::string>& transfer_target) {
            post(AgentTerminated{outcome, transfer_target});
        });
    components_.tts->set_on_event([this](uint64_t utterance_id, tts::UtteranceEvent event) {
        post(UtteranceUpdate{utterance_id, event});
    });
}

SessionCoordinator::~SessionCoordinator() {
    stop("shutdown");
    if (loop_thread_.joinable()) {
        if (loop_thread_.get_id() == std::this_thread::get_id()) {
            loop_thread_.detach();
        } else {
            loop_thread_.join();
        }
    }
}

void SessionCoordinator::set_on_teardown(TeardownHandler handler) {
    on_teardown_ = std::move(handler);
}

void SessionCoordinator::set_on_turn(TurnHandler handler) {
    on_turn_ = std::move(handler);
}

void SessionCoordinator::start() {
    if (started_.exchange(true)) {
        return;
    }
    const auto& info = session_.info();
    log_.info("Session started",
              {kv("call_sid", info.call_id),
               kv("stream_sid", info.stream_id),
               kv("caller", info.caller),
               kv("callee", info.callee)});
    Metrics::instance().increment("session_started");
    Metrics::instance().add_active_sessions(1);

    components_.stt->start();
    components_.orchestrator->start();
    components_.tts->start();
    inbound_thread_ = std::thread([this]() { inbound_loop(); });
    segment_thread_ = std::thread([this]() { segment_loop(); });
    loop_thread_ = std::thread([this]() { event_loop(); });
}

void SessionCoordinator::stop(const std::string& outcome, bool hangup) {
    if (torn_down_.load()) {
        return;
    }
    if (!started_.load()) {
        teardown("stop", outcome, hangup ? EndAction::Hangup : EndAction::None, std::nullopt);
        return;
    }
    post(StopRequested{outcome, hangup});
}

bool SessionCoordinator::wait_until_finished(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(finished_mutex_);
    return finished_cv_.wait_for(lock, timeout, [this]() { return finished_; });
}

bool SessionCoordinator::finished() const {
    std::lock_guard<std::mutex> lock(finished_mutex_);
    return finished_;
}

transport::TransportInfo SessionCoordinator::info() const {
    return session_.info();
}

double SessionCoordinator::elapsed_sec() const {
    return session_.elapsed_sec();
}

void SessionCoordinator::post(Event event) {
    if (events_.try_push(std::move(event)) == pipeline::PushResult::DroppedOldest) {
        log_.warn("Session event queue full, oldest event dropped");
    }
}

void SessionCoordinator::event_loop() {
    if (!options_.greeting.empty()) {
        barge_in_allowed_after_ = std::chrono::steady_clock::now() + options_.greeting_cooldown;
        session_.add_transcript("agent", options_.greeting);
        speak(options_.greeting);
    }
    while (!torn_down_.load()) {
        auto event = events_.pop_for(options_.poll_interval);
        if (event) {
            try {
                std::visit([this](const auto& item) { handle(item); }, *event);
            } catch (const std::exception& ex) {
                log_.error("Session event failed", {kv("error", ex.what())});
            }
        } else if (events_.closed()) {
            break;
        }
        if (!torn_down_.load()) {
            check_no_input();
        }
    }
}

void SessionCoordinator::inbound_loop() {
    try {
        while (auto frame = components_.transport->receive()) {
            if (!options_.barge_in_enabled && turn_state_.load() == TurnState::Speaking) {
                continue;
            }
            components_.stt->push_audio(std::move(*frame));
        }
        post(TransportClosed{false});
    } catch (const std::exception& ex) {
        log_.error("Inbound audio failed", {kv("error", ex.what())});
        post(TransportClosed{true});
    }
}

void SessionCoordinator::segment_loop() {
    while (auto segment = components_.stt->segments().pop()) {
        post(TranscriptReady{std::move(*segment)});
    }
}

void SessionCoordinator::handle(const SpeechStarted& event) {
    no_input_deadline_.reset();
    if (session_.turn_state() != TurnState::Speaking || !options_.barge_in_enabled) {
        return;
    }
    if (std::chrono::steady_clock::now() < barge_in_allowed_after_) {
        log_.debug("Barge-in suppressed during greeting", {kv("at_sec", event.start_sec)});
        return;
    }
    barge_in();
}

void SessionCoordinator::handle(const TranscriptReady& event) {
    const auto& segment = event.segment;
    if (segment.text.empty()) {
        log_.debug("Empty transcript ignored",
                   {kv("segment_id", segment.id), kv("degraded", segment.degraded)});
        return;
    }
    session_.add_transcript("caller", segment.text);
    no_input_prompted_ = false;
    no_input_deadline_.reset();
    if (!components_.orchestrator->submit(segment)) {
        log_.debug("Transcript not submitted", {kv("segment_id", segment.id)});
        return;
    }
    if (session_.turn_state() == TurnState::Listening) {
        set_turn(TurnState::Thinking);
    }
}

void SessionCoordinator::handle(const AgentReplied& event) {
    const auto& reply = event.reply;
    session_.add_notes(reply.notes);
    if (reply.outcome) {
        session_.set_outcome(*reply.outcome);
    }
    if (reply.text.empty()) {
        if (session_.turn_state() == TurnState::Thinking) {
            set_turn(TurnState::Listening);
            if (options_.no_input_timeout.count() > 0 && !no_input_prompted_) {
                no_input_deadline_ = std::chrono::steady_clock::now() + options_.no_input_timeout;
            }
        }
        return;
    }
    // Only a barge-in or termination moves the orchestrator out of Speaking
    // before its reply has been queued.
    if (components_.orchestrator->state() != agent::ConversationState::Speaking) {
        log_.info("Stale agent reply dropped", {kv("segment_id", reply.segment_id)});
        return;
    }
    session_.add_transcript("agent", reply.text);
    // Queued behind a greeting or prompt that is still playing.
    reply_utterance_ = speak(reply.text);
    if (reply_utterance_ == 0) {
        components_.orchestrator->on_speaking_finished(false);
        if (session_.turn_state() == TurnState::Thinking) {
            set_turn(TurnState::Listening);
        }
    }
}

void SessionCoordinator::handle(const AgentTerminated& event) {
    teardown("agent",
             event.outcome,
             event.transfer_target ? EndAction::Transfer : EndAction::Hangup,
             event.transfer_target);
}

void SessionCoordinator::handle(const UtteranceUpdate& event) {
    if (event.event == tts::UtteranceEvent::Started) {
        log_.debug("Utterance playing", {kv("utterance", event.id)});
        return;
    }
    const bool finished = event.event == tts::UtteranceEvent::Finished;
    const bool reply_done = event.id == reply_utterance_;
    if (reply_done) {
        reply_utterance_ = 0;
    }
    if (event.id == current_utterance_) {
        current_utterance_ = 0;
        if (finished) {
            set_turn(TurnState::Listening);
            if (options_.no_input_timeout.count() > 0 && !no_input_prompted_) {
                no_input_deadline_ = std::chrono::steady_clock::now() + options_.no_input_timeout;
            }
        }
    }
    // Greetings and prompts are not agent turns.
    if (reply_done && finished) {
        components_.orchestrator->on_speaking_finished(false);
    }
}

void SessionCoordinator::handle(const TransportClosed& event) {
    transport_error_ = event.error;
    teardown(event.error ? "transport_error" : "disconnect", std::nullopt, EndAction::None, std::nullopt);
}

void SessionCoordinator::handle(const StopRequested& event) {
    teardown("stop", event.outcome, event.hangup ? EndAction::Hangup : EndAction::None, std::nullopt);
}

void SessionCoordinator::barge_in() {
    log_.info("Barge-in", {kv("utterance", current_utterance_)});
    Metrics::instance().increment("barge_in");
    components_.tts->cancel();
    components_.stt->interrupt();
    current_utterance_ = 0;
    set_turn(TurnState::Interrupted);
    if (reply_utterance_ != 0) {
        reply_utterance_ = 0;
        components_.orchestrator->on_speaking_finished(true);
    }
    set_turn(TurnState::Listening);
}

uint64_t SessionCoordinator::speak(const std::string& text) {
    const auto utterance = components_.tts->speak(text);
    if (utterance == 0) {
        log_.warn("Nothing to speak", {kv("text", text)});
        return 0;
    }
    current_utterance_ = utterance;
    no_input_deadline_.reset();
    set_turn(TurnState::Speaking);
    return utterance;
}

void SessionCoordinator::check_no_input() {
    if (!no_input_deadline_ || std::chrono::steady_clock::now() < *no_input_deadline_) {
        return;
    }
    no_input_deadline_.reset();
    if (session_.turn_state() != TurnState::Listening || no_input_prompted_ ||
        options_.no_input_prompt.empty()) {
        return;
    }
    if (components_.orchestrator->state() != agent::ConversationState::Idle) {
        return;
    }
    no_input_prompted_ = true;
    log_.info("No input from caller, prompting");
    session_.add_transcript("agent", options_.no_input_prompt);
    speak(options_.no_input_prompt);
}

void SessionCoordinator::set_turn(TurnState to) {
    const auto from = session_.turn_state();
    if (from == to) {
        return;
    }
    if (!session_.transition(to)) {
        log_.warn("Invalid turn transition", {kv("from", to_string(from)), kv("to", to_string(to))});
        return;
    }
    turn_state_.store(to);
    log_.debug("Turn state", {kv("from", to_string(from)), kv("to", to_string(to))});
    if (on_turn_) {
        on_turn_(from, to);
    }
}

void SessionCoordinator::teardown(const std::string& reason,
                                  std::optional<std::string> outcome,
                                  EndAction action,
                                  const std::optional<std::string>& transfer_target) {
    if (torn_down_.exchange(true)) {
        return;
    }
    log_.info("Session ending", {kv("reason", reason)});
    const auto step = [this](const char* name, const std::function<void()>& fn) {
        try {
            fn();
        } catch (const std::exception& ex) {
            log_.warn("Teardown step failed", {kv("step", name), kv("error", ex.what())});
        }
    };

    auto& transport = components_.transport;
    step("tts", [this]() { components_.tts->cancel(); });
    step("stt", [this]() { components_.stt->close(); });
    if (segment_thread_.joinable()) {
        segment_thread_.join();
    }
    while (auto event = events_.try_pop()) {
        if (const auto* ready = std::get_if<TranscriptReady>(&*event)) {
            if (!ready->segment.text.empty()) {
                session_.add_transcript("caller", ready->segment.text);
            }
        } else if (const auto* replied = std::get_if<AgentReplied>(&*event)) {
            session_.add_notes(replied->reply.notes);
            if (replied->reply.outcome) {
                session_.set_outcome(*replied->reply.outcome);
            }
        }
    }
    step("orchestrator", [this]() { components_.orchestrator->close(); });

    if (action == EndAction::Transfer && transfer_target) {
        try {
            transport->transfer(*transfer_target);
            log_.info("Call transferred", {kv("target", *transfer_target)});
        } catch (const std::exception& ex) {
            log_.error("Call transfer failed, hanging up", {kv("target", *transfer_target), kv("error", ex.what())});
            step("hangup", [&transport]() { transport->hangup(); });
        }
    } else if (action != EndAction::None) {
        step("hangup", [&transport]() { transport->hangup(); });
    }
    step("transport", [&transport]() { transport->close(); });
    if (inbound_thread_.joinable()) {
        inbound_thread_.join();
    }
    events_.close();

    const auto final_outcome = resolve_outcome(reason, outcome);
    const auto record = session_.to_record(final_outcome);
    if (components_.outcome_sink) {
        step("outcome", [this, &record]() { components_.outcome_sink->record(record); });
    }
    Metrics::instance().increment("session_ended", final_outcome);
    if (started_.load()) {
        Metrics::instance().add_active_sessions(-1);
    }
    log_.info("Session ended",
              {kv("outcome", final_outcome),
               kv("duration_sec", record.duration_sec),
               kv("transcript_entries", record.transcript.size()),
               kv("degraded_audio", transport->degraded())});
    step("tts close", [this]() { components_.tts->close(); });

    {
        std::lock_guard<std::mutex> lock(finished_mutex_);
        finished_ = true;
    }
    finished_cv_.notify_all();
    if (on_teardown_) {
        on_teardown_(record);
    }
}

std::string SessionCoordinator::resolve_outcome(const std::string& reason,
                                                const std::optional<std::string>& outcome) const {
    if (session_.outcome()) {
        return *session_.outcome();
    }
    if (outcome) {
        return *outcome;
    }
    if (transport_error_ || reason == "transport_error") {
        return "transport_error";
    }
    return session_.caller_spoke() ? "disconnected" : "no_answer";
}

}
