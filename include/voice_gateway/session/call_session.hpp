#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "voice_gateway/outcome/outcome_sink.hpp"
#include "voice_gateway/transport/media_transport.hpp"

namespace voice_gateway {
namespace session {

enum class TurnState {
    Listening,
    Thinking,
    Speaking,
    Interrupted
};

const char* to_string(TurnState state);

// Listening -> Thinking -> Speaking -> Listening, with Thinking -> Listening
// for turns that produce no speech, Listening -> Speaking for greetings and
// prompts, and Speaking -> Interrupted -> Listening for barge-in.
bool is_valid_transition(TurnState from, TurnState to);

// State of one call. Owned and mutated by a single coordinator thread.
class CallSession {
public:
    CallSession(std::string session_id, transport::TransportInfo info);

    const std::string& id() const { return id_; }
    const transport::TransportInfo& info() const { return info_; }
    TurnState turn_state() const { return turn_state_; }

    // Leaves the state unchanged and returns false for an edge outside the machine.
    bool transition(TurnState to);

    void add_transcript(const std::string& speaker, const std::string& text);
    const std::vector<outcome::TranscriptEntry>& transcript() const { return transcript_; }

    void add_notes(const std::vector<std::string>& notes);
    const std::vector<std::string>& notes() const { return notes_; }

    void set_outcome(const std::string& outcome) { outcome_ = outcome; }
    const std::optional<std::string>& outcome() const { return outcome_; }

    bool caller_spoke() const { return caller_spoke_; }
    double elapsed_sec() const;

    outcome::OutcomeRecord to_record(const std::string& final_outcome) const;

private:
    std::string id_;
    transport::TransportInfo info_;
    std::chrono::system_clock::time_point started_at_;
    std::chrono::steady_clock::time_point started_;
    TurnState turn_state_ = TurnState::Listening;
    std::vector<outcome::TranscriptEntry> transcript_;
    std::vector<std::string> notes_;
    std::optional<std::string> outcome_;
    bool caller_spoke_ = false;
};

}
}
