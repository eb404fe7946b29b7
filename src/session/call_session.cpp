#include "voice_gateway/session/call_session.hpp"

#include <utility>

namespace voice_gateway::session {

const char* to_string(TurnState state) {
    switch (state) {
        case TurnState::Listening: return "listening";
        case TurnState::Thinking: return "thinking";
        case TurnState::Speaking: return "speaking";
        case TurnState::Interrupted: return "interrupted";
    }
    return "unknown";
}

bool is_valid_transition(TurnState from, TurnState to) {
    switch (from) {
        case TurnState::Listening:
            return to == TurnState::Thinking || to == TurnState::Speaking;
        case TurnState::Thinking:
            return to == TurnState::Speaking || to == TurnState::Listening;
        case TurnState::Speaking:
            return to == TurnState::Listening || to == TurnState::Interrupted;
        case TurnState::Interrupted:
            return to == TurnState::Listening;
    }
    return false;
}

CallSession::CallSession(std::string session_id, transport::TransportInfo info)
    : id_(std::move(session_id)),
      info_(std::move(info)),
      started_at_(std::chrono::system_clock::now()),
      started_(std::chrono::steady_clock::now()) {}

bool CallSession::transition(TurnState to) {
    if (!is_valid_transition(turn_state_, to)) {
        return false;
    }
    turn_state_ = to;
    return true;
}

void CallSession::add_transcript(const std::string& speaker, const std::string& text) {
    if (speaker == "caller") {
        caller_spoke_ = true;
    }
    transcript_.push_back({speaker, text, elapsed_sec()});
}

void CallSession::add_notes(const std::vector<std::string>& notes) {
    notes_.insert(notes_.end(), notes.begin(), notes.end());
}

double CallSession::elapsed_sec() const {
    const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - started_;
    return elapsed.count();
}

outcome::OutcomeRecord CallSession::to_record(const std::string& final_outcome) const {
    outcome::OutcomeRecord record;
    record.session_id = id_;
    record.call_id = info_.call_id;
    record.caller = info_.caller;
    record.callee = info_.callee;
    record.started_at = started_at_;
    record.duration_sec = elapsed_sec();
    record.outcome = final_outcome;
    record.notes = notes_;
    record.transcript = transcript_;
    record.parameters = info_.parameters;
    return record;
}

}
