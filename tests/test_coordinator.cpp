#include <catch2/catch_test_macros.hpp>

#include "fakes.hpp"

#include "voice_gateway/session/coordinator.hpp"
#include "voice_gateway/vad/energy_detector.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace voice_gateway;
using namespace voice_gateway::session;
using testing::FakeAgent;
using testing::FakeOutcomeSink;
using testing::FakeRecognizer;
using testing::FakeSynthesizer;
using testing::FakeToolExecutor;
using testing::FakeTransport;
using testing::silence;
using testing::sine;
using testing::wait_until;

namespace {

struct Harness {
    explicit Harness(CoordinatorOptions options = {},
                     std::vector<std::string> texts = {"I need a meeting"})
        : transport(std::make_shared<FakeTransport>()),
          recognizer(std::make_shared<FakeRecognizer>(std::move(texts))),
          agent(std::make_shared<FakeAgent>()),
          tools(std::make_shared<FakeToolExecutor>()),
          synthesizer(std::make_shared<FakeSynthesizer>()),
          sink(std::make_shared<FakeOutcomeSink>()) {
        Components components;
        components.transport = transport;
        components.stt = std::make_unique<stt::SpeechToTextStreamer>(
            "s1",
            std::make_unique<vad::VadSegmenter>(std::make_shared<vad::EnergyDetector>(500.0, 16000, 20),
                                                vad::SegmenterOptions{}),
            recognizer);

        agent::AgentContext agent_context;
        agent_context.session_id = "s1";
        agent_context.call_id = "CA123";
        agent::ToolContext tool_context;
        tool_context.session_id = "s1";
        agent::OrchestratorOptions orchestrator_options;
        orchestrator_options.agent_timeout = std::chrono::milliseconds(500);
        orchestrator_options.tool_timeout = std::chrono::milliseconds(300);
        orchestrator_options.retry_backoff = std::chrono::milliseconds(10);
        components.orchestrator = std::make_unique<agent::ConversationOrchestrator>(
            agent, tools, agent_context, tool_context, orchestrator_options);
        // Holds the orchestrator thread between entering Speaking and handing over its reply.
        components.orchestrator->set_on_transition([this](agent::ConversationState, agent::ConversationState to) {
            const auto delay = reply_delay_ms.load();
            if (to == agent::ConversationState::Speaking && delay > 0) {
                std::this_thread::sleep_for(std::chrono::milliseconds(delay));
            }
        });

        components.tts = std::make_unique<tts::TextToSpeechStreamer>("s1", synthesizer, transport);
        components.outcome_sink = sink;

        coordinator = std::make_unique<SessionCoordinator>("s1", std::move(components), std::move(options));
        coordinator->set_on_teardown([this](const outcome::OutcomeRecord& record) {
            std::lock_guard<std::mutex> lock(mutex);
            torn_down = record;
        });
        coordinator->set_on_turn([this](TurnState, TurnState to) {
            std::lock_guard<std::mutex> lock(mutex);
            turns.push_back(to);
        });
    }

    ~Harness() { coordinator.reset(); }

    // One second of speech followed by enough silence to close the utterance.
    void caller_says() {
        transport->feed(sine(16000, 1000, 8000.0));
        transport->feed(silence(16000, 800));
    }

    bool speaking(const std::string& text) {
        return wait_until([&]() {
            const auto texts = synthesizer->texts();
            return std::find(texts.begin(), texts.end(), text) != texts.end();
        });
    }

    std::optional<outcome::OutcomeRecord> record() {
        std::lock_guard<std::mutex> lock(mutex);
        return torn_down;
    }

    std::vector<TurnState> turn_history() {
        std::lock_guard<std::mutex> lock(mutex);
        return turns;
    }

    std::shared_ptr<FakeTransport> transport;
    std::shared_ptr<FakeRecognizer> recognizer;
    std::shared_ptr<FakeAgent> agent;
    std::shared_ptr<FakeToolExecutor> tools;
    std::shared_ptr<FakeSynthesizer> synthesizer;
    std::shared_ptr<FakeOutcomeSink> sink;
    std::unique_ptr<SessionCoordinator> coordinator;

    std::atomic<int> reply_delay_ms{0};

    std::mutex mutex;
    std::optional<outcome::OutcomeRecord> torn_down;
    std::vector<TurnState> turns;
};

bool contains_sequence(const std::vector<TurnState>& history, const std::vector<TurnState>& sequence) {
    return std::search(history.begin(), history.end(), sequence.begin(), sequence.end()) != history.end();
}

agent::AgentReply call_tool(const std::string& name) {
    agent::AgentReply reply;
    agent::ToolCall call;
    call.id = "c1";
    call.name = name;
    reply.tool_calls.push_back(call);
    return reply;
}

agent::AgentReply say(const std::string& text) {
    agent::AgentReply reply;
    reply.text = text;
    return reply;
}

std::string long_reply() {
    return "Let me walk you through everything we offer, starting with the basics. " +
           std::string(240, 'a') + ".";
}

}

TEST_CASE("turn state transitions follow the call loop") {
    REQUIRE(is_valid_transition(TurnState::Listening, TurnState::Thinking));
    REQUIRE(is_valid_transition(TurnState::Listening, TurnState::Speaking));
    REQUIRE(is_valid_transition(TurnState::Thinking, TurnState::Listening));
    REQUIRE(is_valid_transition(TurnState::Speaking, TurnState::Interrupted));
    REQUIRE(is_valid_transition(TurnState::Interrupted, TurnState::Listening));
    REQUIRE_FALSE(is_valid_transition(TurnState::Listening, TurnState::Interrupted));
    REQUIRE_FALSE(is_valid_transition(TurnState::Interrupted, TurnState::Speaking));
    REQUIRE_FALSE(is_valid_transition(TurnState::Thinking, TurnState::Interrupted));

    CallSession session("s1", transport::TransportInfo{});
    REQUIRE_FALSE(session.transition(TurnState::Interrupted));
    REQUIRE(session.turn_state() == TurnState::Listening);
    REQUIRE(session.transition(TurnState::Thinking));
    REQUIRE(session.turn_state() == TurnState::Thinking);
}

TEST_CASE("the greeting is spoken before the caller says anything") {
    CoordinatorOptions options;
    options.greeting = "Hi, this is Ava.";
    Harness h(options);
    h.coordinator->start();

    REQUIRE(h.speaking("Hi, this is Ava."));
    REQUIRE(wait_until([&]() {
        return h.transport->sent_frames() == 8 && h.coordinator->turn_state() == TurnState::Listening;
    }));
    REQUIRE(h.agent->messages().empty());
}

TEST_CASE("a caller utterance is answered and recorded") {
    Harness h;
    h.coordinator->start();
    h.caller_says();

    REQUIRE(h.speaking("You said I need a meeting."));
    REQUIRE(h.agent->messages() == std::vector<std::string>{"I need a meeting"});
    REQUIRE(wait_until([&]() { return h.coordinator->turn_state() == TurnState::Listening; }));

    h.coordinator->stop("completed");
    REQUIRE(h.coordinator->wait_until_finished(std::chrono::milliseconds(3000)));
    REQUIRE(h.transport->hangups_ == 1);
    REQUIRE(h.transport->closes_ >= 1);

    const auto records = h.sink->records();
    REQUIRE(records.size() == 1);
    REQUIRE(records[0].outcome == "completed");
    REQUIRE(records[0].call_id == "CA123");
    REQUIRE(records[0].transcript.size() == 2);
    REQUIRE(records[0].transcript[0].speaker == "caller");
    REQUIRE(records[0].transcript[0].text == "I need a meeting");
    REQUIRE(records[0].transcript[1].speaker == "agent");
    REQUIRE(h.record());
}

TEST_CASE("a caller hanging up mid-reply tears the session down without a hangup") {
    Harness h;
    const auto reply = long_reply();
    h.agent->on_message = [reply](const std::string&) { return say(reply); };
    h.coordinator->start();
    h.caller_says();

    REQUIRE(wait_until([&]() { return h.coordinator->turn_state() == TurnState::Speaking; }));
    REQUIRE(wait_until([&]() { return h.transport->sent_frames() > 0; }));
    h.transport->end_stream();

    REQUIRE(h.coordinator->wait_until_finished(std::chrono::milliseconds(2000)));
    REQUIRE(h.transport->hangups_ == 0);
    REQUIRE(h.transport->clears_ >= 1);
    const auto sent = h.transport->sent_frames();
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    REQUIRE(h.transport->sent_frames() == sent);

    const auto records = h.sink->records();
    REQUIRE(records.size() == 1);
    REQUIRE(records[0].outcome == "disconnected");
    REQUIRE(records[0].transcript.front().text == "I need a meeting");
}

TEST_CASE("a call that ends before the caller speaks is recorded as no answer") {
    Harness h;
    h.coordinator->start();
    h.transport->end_stream();

    REQUIRE(h.coordinator->wait_until_finished(std::chrono::milliseconds(2000)));
    REQUIRE(h.transport->hangups_ == 0);
    REQUIRE(h.sink->records().at(0).outcome == "no_answer");
    REQUIRE(h.agent->messages().empty());
}

TEST_CASE("caller speech during playback interrupts the agent") {
    Harness h({}, {"first thing", "second thing"});
    const auto reply = long_reply();
    h.agent->on_message = [reply](const std::string& text) {
        return text == "first thing" ? say(reply) : say("Okay.");
    };
    h.coordinator->start();
    h.caller_says();

    REQUIRE(wait_until([&]() { return h.coordinator->turn_state() == TurnState::Speaking; }));
    REQUIRE(wait_until([&]() { return h.transport->sent_frames() > 0; }));
    h.caller_says();

    REQUIRE(wait_until([&]() { return h.transport->clears_ >= 1; }));
    REQUIRE(wait_until([&]() { return h.agent->messages().size() >= 2; }));
    REQUIRE(h.agent->messages()[1] == "second thing");
    REQUIRE(h.agent->contexts()[1].previous_turn == "interrupted");
    REQUIRE(h.speaking("Okay."));
    REQUIRE(wait_until([&]() { return h.coordinator->turn_state() == TurnState::Listening; }));
    REQUIRE(contains_sequence(h.turn_history(),
                              {TurnState::Speaking, TurnState::Interrupted, TurnState::Listening}));

    // Only the three frames of "Okay." follow the interrupt.
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    REQUIRE(h.transport->sent_frames() == h.transport->frames_at_first_clear() + 3);
}

TEST_CASE("a reply that becomes ready during the greeting is spoken after it") {
    CoordinatorOptions options;
    options.greeting = "Hello, this is Ava calling from Acme and " + std::string(58, 'a') + ".";
    Harness h(options);
    h.reply_delay_ms = 1500;
    h.coordinator->start();
    REQUIRE(h.speaking(options.greeting));
    h.caller_says();

    REQUIRE(wait_until([&]() { return h.agent->messages().size() == 1; }));
    REQUIRE(h.speaking("You said I need a meeting."));
    REQUIRE(wait_until(
        [&]() { return h.coordinator->turn_state() == TurnState::Listening; }, std::chrono::milliseconds(4000)));
    REQUIRE(h.agent->messages().size() == 1);
    REQUIRE(h.transport->clears_ == 0);

    h.coordinator->stop("completed");
    REQUIRE(h.coordinator->wait_until_finished(std::chrono::milliseconds(3000)));
    const auto transcript = h.sink->records().at(0).transcript;
    REQUIRE(transcript.size() == 3);
    REQUIRE(transcript[1].speaker == "caller");
    REQUIRE(transcript[2].speaker == "agent");
    REQUIRE(transcript[2].text == "You said I need a meeting.");
}

TEST_CASE("interrupting the no-input prompt is not an interrupted agent turn") {
    CoordinatorOptions options;
    options.greeting = "Hello.";
    options.greeting_cooldown = std::chrono::milliseconds(0);
    options.no_input_timeout = std::chrono::milliseconds(200);
    options.no_input_prompt = "Are you still there " + std::string(280, 'a') + "?";
    Harness h(options);
    h.coordinator->start();

    REQUIRE(h.speaking(options.no_input_prompt));
    REQUIRE(wait_until([&]() { return h.transport->sent_frames() > 0; }));
    h.caller_says();

    REQUIRE(wait_until([&]() { return h.transport->clears_ >= 1; }));
    REQUIRE(h.speaking("You said I need a meeting."));
    REQUIRE(h.agent->contexts().at(0).previous_turn == "none");
    REQUIRE(contains_sequence(h.turn_history(),
                              {TurnState::Speaking, TurnState::Interrupted, TurnState::Listening}));
}

TEST_CASE("barge-in can be switched off") {
    CoordinatorOptions options;
    options.barge_in_enabled = false;
    Harness h(options, {"first thing", "second thing"});
    h.agent->on_message = [](const std::string&) { return say("Sure, one moment please."); };
    h.coordinator->start();
    h.caller_says();

    REQUIRE(wait_until([&]() { return h.coordinator->turn_state() == TurnState::Speaking; }));
    h.caller_says();
    REQUIRE(wait_until([&]() { return h.coordinator->turn_state() == TurnState::Listening; }));
    REQUIRE(h.transport->clears_ == 0);
}

TEST_CASE("an agent that ends the call hangs up after the goodbye") {
    Harness h;
    h.tools->tools["end_call"] = [](const agent::ToolCall&) {
        agent::ToolOutcome outcome;
        outcome.content = "Call ended";
        outcome.ends_call = true;
        outcome.outcome = "not_interested";
        outcome.notes.push_back("has a vendor");
        return outcome;
    };
    h.agent->on_message = [](const std::string&) { return call_tool("end_call"); };
    h.agent->on_tool_results = [](const std::vector<agent::ToolResult>&) { return say("Have a great day!"); };
    h.coordinator->start();
    h.caller_says();

    REQUIRE(h.coordinator->wait_until_finished(std::chrono::milliseconds(3000)));
    REQUIRE(h.synthesizer->texts().back() == "Have a great day!");
    REQUIRE(h.transport->hangups_ == 1);
    const auto record = h.sink->records().at(0);
    REQUIRE(record.outcome == "not_interested");
    REQUIRE(record.notes == std::vector<std::string>{"has a vendor"});
}

TEST_CASE("an agent transfer moves the call instead of hanging up") {
    Harness h;
    h.tools->tools["transfer_call"] = [](const agent::ToolCall&) {
        agent::ToolOutcome outcome;
        outcome.content = "Transferring";
        outcome.ends_call = true;
        outcome.outcome = "transferred";
        outcome.transfer_target = "+15557770000";
        return outcome;
    };
    h.agent->on_message = [](const std::string&) { return call_tool("transfer_call"); };
    h.agent->on_tool_results = [](const std::vector<agent::ToolResult>&) { return say("Connecting you."); };
    h.coordinator->start();
    h.caller_says();

    REQUIRE(h.coordinator->wait_until_finished(std::chrono::milliseconds(3000)));
    REQUIRE(h.transport->transfers() == std::vector<std::string>{"+15557770000"});
    REQUIRE(h.transport->hangups_ == 0);
    REQUIRE(h.sink->records().at(0).outcome == "transferred");
}

TEST_CASE("a silent caller is prompted once") {
    CoordinatorOptions options;
    options.greeting = "Hello.";
    options.no_input_timeout = std::chrono::milliseconds(300);
    options.no_input_prompt = "Are you still there?";
    Harness h(options);
    h.coordinator->start();

    REQUIRE(h.speaking("Are you still there?"));
    std::this_thread::sleep_for(std::chrono::milliseconds(800));
    REQUIRE(h.synthesizer->texts() == std::vector<std::string>{"Hello.", "Are you still there?"});
}

TEST_CASE("the agent outcome wins over the stop reason") {
    Harness h;
    h.tools->tools["add_note"] = [](const agent::ToolCall&) {
        agent::ToolOutcome outcome;
        outcome.content = "Noted";
        outcome.outcome = "callback_requested";
        return outcome;
    };
    h.agent->on_message = [](const std::string&) { return call_tool("add_note"); };
    h.agent->on_tool_results = [](const std::vector<agent::ToolResult>&) { return say("Will do."); };
    h.coordinator->start();
    h.caller_says();

    REQUIRE(h.speaking("Will do."));
    REQUIRE(wait_until([&]() { return h.coordinator->turn_state() == TurnState::Listening; }));
    h.coordinator->stop("shutdown");
    REQUIRE(h.coordinator->wait_until_finished(std::chrono::milliseconds(3000)));
    REQUIRE(h.sink->records().at(0).outcome == "callback_requested");
}
