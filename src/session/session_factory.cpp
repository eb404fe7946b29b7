#include "voice_gateway/session/session_factory.hpp"

#include <chrono>
#include <iomanip>
#include <random>
#include <sstream>
#include <utility>

#include "voice_gateway/agent/orchestrator.hpp"
#include "voice_gateway/agent/tool_dispatcher.hpp"
#include "voice_gateway/logging.hpp"
#include "voice_gateway/vad/energy_detector.hpp"

namespace voice_gateway::session {

namespace {

std::chrono::seconds whole_seconds(double seconds) {
    return std::chrono::seconds(static_cast<int64_t>(seconds + 0.5));
}

std::chrono::milliseconds millis(double seconds) {
    return std::chrono::milliseconds(static_cast<int64_t>(seconds * 1000.0));
}

}

std::string new_session_id() {
    static thread_local std::mt19937_64 generator(std::random_device{}());
    std::ostringstream oss;
    oss << std::hex << std::setfill('0') << std::setw(16) << generator();
    return oss.str();
}

SharedServices build_services(const Config& config) {
    SharedServices services;
    services.recognizer = std::make_shared<stt::HttpRecognizer>(
        config.stt_url, config.stt_language, whole_seconds(config.stt_timeout_sec));
    services.agent = std::make_shared<agent::HttpAgentClient>(
        config.agent_url, config.agent_assistant_id, config.agent_api_key,
        whole_seconds(config.agent_timeout_sec));

    if (config.calendar_url) {
        services.calendar = std::make_shared<agent::HttpCalendarService>(
            *config.calendar_url, whole_seconds(config.tool_timeout_sec));
    } else {
        if (!config.mock_calendar) {
            logging::warn("No CALENDAR_URL configured, using the mock calendar");
        }
        services.calendar = std::make_shared<agent::MockCalendarService>();
    }

    if (config.twilio_configured()) {
        services.twilio = std::make_shared<telephony::TwilioClient>(
            *config.twilio_account_sid, *config.twilio_auth_token, config.twilio_api_url,
            config.twilio_from_number);
    } else {
        logging::warn("Twilio credentials not configured, hangup falls back to closing the stream and SMS is disabled");
    }

    services.synthesizer = std::make_shared<tts::HttpSynthesizer>(
        config.tts_url, config.tts_model, config.tts_voice, config.tts_sample_rate,
        whole_seconds(config.tts_timeout_sec));

    auto sinks = std::make_shared<outcome::CompositeOutcomeSink>();
    if (config.outcome_csv_path) {
        sinks->add(std::make_shared<outcome::CsvOutcomeSink>(*config.outcome_csv_path));
    }
    if (config.outcome_webhook_url) {
        HttpRequestOptions options;
        options.request_timeout = std::chrono::seconds(10);
        options.read_timeout = std::chrono::seconds(10);
        sinks->add(std::make_shared<outcome::HttpOutcomeSink>(*config.outcome_webhook_url, options));
    }
    services.outcome_sink = sinks;

    if (config.vad_engine == "silero") {
        services.vad_model =
            vad::SileroModel::load(config.vad_model_path, config.vad_model_url, config.stt_sample_rate);
    }
    logging::info("Shared services ready",
                  {kv("vad_engine", config.vad_engine),
                   kv("calendar", config.calendar_url ? "http" : "mock"),
                   kv("outcome_sinks", sinks->empty() ? "none" : "configured")});
    return services;
}

SessionFactory::SessionFactory(Config config, SharedServices services)
    : config_(std::move(config)), services_(std::move(services)) {}

std::unique_ptr<vad::VadSegmenter> SessionFactory::make_segmenter() const {
    vad::SegmenterOptions options;
    options.threshold = static_cast<float>(config_.vad_threshold);
    options.min_speech_ms = config_.vad_min_speech_duration_ms;
    options.silence_ms = config_.vad_silence_duration_ms;
    options.min_utterance_ms = config_.vad_min_utterance_ms;
    options.speech_pad_ms = config_.vad_speech_pad_ms;
    options.max_utterance_ms = config_.vad_max_utterance_ms;
    options.speech_prob_window = config_.vad_speech_prob_window;

    std::shared_ptr<vad::SpeechDetector> detector;
    if (services_.vad_model) {
        detector = std::make_shared<vad::SileroDetector>(services_.vad_model);
    } else {
        detector = std::make_shared<vad::EnergyDetector>(config_.vad_energy_threshold,
                                                         config_.stt_sample_rate,
                                                         config_.frame_duration_ms);
    }
    return std::make_unique<vad::VadSegmenter>(std::move(detector), options);
}

std::shared_ptr<SessionCoordinator> SessionFactory::create(
    std::shared_ptr<transport::MediaTransport> transport) {
    const auto session_id = new_session_id();
    const auto info = transport->info();

    stt::SttOptions stt_options;
    auto stt = std::make_unique<stt::SpeechToTextStreamer>(
        session_id, make_segmenter(), services_.recognizer, stt_options);

    agent::AgentContext agent_context;
    agent_context.session_id = session_id;
    agent_context.call_id = info.call_id;
    agent_context.caller = info.caller;
    agent_context.callee = info.callee;
    agent_context.parameters = info.parameters;

    agent::ToolContext tool_context;
    tool_context.session_id = session_id;
    tool_context.call_id = info.call_id;
    tool_context.caller = info.caller;
    tool_context.callee = info.callee;
    tool_context.parameters = info.parameters;
    tool_context.call_control = transport;

    agent::ToolDispatcherOptions tool_options;
    tool_options.booking_url = config_.booking_url;
    tool_options.transfer_number = config_.transfer_number;
    auto tools = std::make_shared<agent::ToolDispatcher>(services_.calendar, services_.twilio, tool_options);

    agent::OrchestratorOptions orchestrator_options;
    orchestrator_options.agent_timeout = millis(config_.agent_timeout_sec);
    orchestrator_options.tool_timeout = millis(config_.tool_timeout_sec);
    orchestrator_options.agent_max_retries = config_.agent_max_retries;
    orchestrator_options.retry_backoff = std::chrono::milliseconds(config_.agent_retry_backoff_ms);
    orchestrator_options.max_tool_rounds = config_.agent_max_tool_rounds;
    orchestrator_options.unavailable_message = config_.agent_unavailable_message;
    auto orchestrator = std::make_unique<agent::ConversationOrchestrator>(
        services_.agent, std::move(tools), std::move(agent_context), std::move(tool_context),
        orchestrator_options);

    tts::TtsOptions tts_options;
    tts_options.frame_ms = config_.frame_duration_ms;
    tts_options.pacing_lead = std::chrono::milliseconds(config_.tts_pacing_lead_ms);
    tts_options.fallback_audio = config_.tts_fallback_audio;
    auto tts = std::make_unique<tts::TextToSpeechStreamer>(
        session_id, services_.synthesizer, transport, tts_options);

    Components components;
    components.transport = std::move(transport);
    components.stt = std::move(stt);
    components.orchestrator = std::move(orchestrator);
    components.tts = std::move(tts);
    components.outcome_sink = services_.outcome_sink;

    CoordinatorOptions options;
    options.greeting = config_.greeting_text;
    options.greeting_cooldown = std::chrono::milliseconds(config_.greeting_cooldown_ms);
    options.barge_in_enabled = config_.barge_in_enabled;
    options.no_input_timeout = std::chrono::milliseconds(config_.no_input_timeout_ms);
    options.no_input_prompt = config_.no_input_prompt;
    return std::make_shared<SessionCoordinator>(session_id, std::move(components), options);
}

}
