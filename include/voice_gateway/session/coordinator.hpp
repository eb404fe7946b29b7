#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <variant>

#include "voice_gateway/agent/orchestrator.hpp"
#include "voice_gateway/logging.hpp"
#include "voice_gateway/outcome/outcome_sink.hpp"
#include "voice_gateway/pipeline/bounded_queue.hpp"
#include "voice_gateway/session/call_session.hpp"
#include "voice_gateway/stt/stt_streamer.hpp"
#include "voice_gateway/transport/media_transport.hpp"
#include "voice_gateway/tts/tts_streamer.hpp"

namespace voice_gateway {
namespace session {

struct CoordinatorOptions {
    std::string greeting;
    // Barge-in is ignored for this long after the greeting starts.
    std::chrono::milliseconds greeting_cooldown{3000};
    bool barge_in_enabled = true;
    // Zero disables the no-input prompt.
    std::chrono::milliseconds no_input_timeout{5000};
    std::string no_input_prompt;
    std::chrono::milliseconds poll_interval{50};
    size_t event_queue_capacity = 1024;
};

struct Components {
    std::shared_ptr<transport::MediaTransport> transport;
    std::unique_ptr<stt::SpeechToTextStreamer> stt;
    std::unique_ptr<agent::ConversationOrchestrator> orchestrator;
    std::unique_ptr<tts::TextToSpeechStreamer> tts;
    std::shared_ptr<outcome::OutcomeSink> outcome_sink;
};

// Owns one call end to end. Relay threads move audio and transcripts into a
// single event loop; only that loop touches the CallSession.
class SessionCoordinator {
public:
    using TeardownHandler = std::function<void(const outcome::OutcomeRecord&)>;
    using TurnHandler = std::function<void(TurnState from, TurnState to)>;

    SessionCoordinator(std::string session_id, Components components, CoordinatorOptions options);
    ~SessionCoordinator();

    // Runs on the event loop thread after teardown has finished.
    void set_on_teardown(TeardownHandler handler);
    // Runs on the event loop thread for every turn change. Set before start().
    void set_on_turn(TurnHandler handler);

    void start();

    // Ends the call with the given outcome unless the agent already chose one.
    void stop(const std::string& outcome, bool hangup = true);

    bool wait_until_finished(std::chrono::milliseconds timeout);
    bool finished() const;

    const std::string& id() const { return id_; }
    TurnState turn_state() const { return turn_state_.load(); }
    transport::TransportInfo info() const;
    double elapsed_sec() const;

private:
    struct SpeechStarted {
        double start_sec = 0.0;
    };
    struct TranscriptReady {
        stt::TranscriptSegment segment;
    };
    struct AgentReplied {
        agent::Reply reply;
    };
    struct AgentTerminated {
        std::string outcome;
        std::optional<std::string> transfer_target;
    };
    struct UtteranceUpdate {
        uint64_t id = 0;
        tts::UtteranceEvent event = tts::UtteranceEvent::Finished;
    };
    struct TransportClosed {
        bool error = false;
    };
    struct StopRequested {
        std::string outcome;
        bool hangup = true;
    };
    using Event = std::variant<SpeechStarted,
                               TranscriptReady,
                               AgentReplied,
                               AgentTerminated,
                               UtteranceUpdate,
                               TransportClosed,
                               StopRequested>;

    enum class EndAction {
        None,
        Hangup,
        Transfer
    };

    void post(Event event);
    void event_loop();
    void inbound_loop();
    void segment_loop();

    void handle(const SpeechStarted& event);
    void handle(const TranscriptReady& event);
    void handle(const AgentReplied& event);
    void handle(const AgentTerminated& event);
    void handle(const UtteranceUpdate& event);
    void handle(const TransportClosed& event);
    void handle(const StopRequested& event);

    void barge_in();
    uint64_t speak(const std::string& text);
    void check_no_input();
    void set_turn(TurnState to);
    void teardown(const std::string& reason,
                  std::optional<std::string> outcome,
                  EndAction action,
                  const std::optional<std::string>& transfer_target);
    std::string resolve_outcome(const std::string& reason, const std::optional<std::string>& outcome) const;

    std::string id_;
    logging::Context log_;
    CallSession session_;
    Components components_;
    CoordinatorOptions options_;

    pipeline::BoundedQueue<Event> events_;
    std::atomic<TurnState> turn_state_{TurnState::Listening};
    // Last queued utterance of any kind.
    uint64_t current_utterance_ = 0;
    // Utterance carrying the orchestrator's current reply.
    uint64_t reply_utterance_ = 0;
    std::chrono::steady_clock::time_point barge_in_allowed_after_;
    std::optional<std::chrono::steady_clock::time_point> no_input_deadline_;
    bool no_input_prompted_ = false;
    bool transport_error_ = false;

    std::atomic<bool> started_{false};
    std::atomic<bool> torn_down_{false};
    mutable std::mutex finished_mutex_;
    std::condition_variable finished_cv_;
    bool finished_ = false;

    TeardownHandler on_teardown_;
    TurnHandler on_turn_;
    std::thread inbound_thread_;
    std::thread segment_thread_;
    std::thread loop_thread_;
};

}
}
