#include "voice_gateway/config.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace voice_gateway {

namespace {

std::string get_env_str(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : fallback;
}

std::optional<std::string> get_env_optional(const char* name) {
    const char* value = std::getenv(name);
    if (!value) {
        return std::nullopt;
    }
    std::string result(value);
    if (result.empty()) {
        return std::nullopt;
    }
    return result;
}

bool get_env_bool(const char* name, bool fallback) {
    const char* value = std::getenv(name);
    if (!value) {
        return fallback;
    }
    std::string normalized(value);
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return normalized == "true" || normalized == "1" || normalized == "yes";
}

int get_env_int(const char* name, int fallback) {
    const char* value = std::getenv(name);
    if (!value || std::string(value).empty()) {
        return fallback;
    }
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        throw ConfigError(std::string(name) + " must be an integer");
    }
}

double get_env_double(const char* name, double fallback) {
    const char* value = std::getenv(name);
    if (!value || std::string(value).empty()) {
        return fallback;
    }
    try {
        return std::stod(value);
    } catch (const std::exception&) {
        throw ConfigError(std::string(name) + " must be a number");
    }
}

std::string trim(std::string value) {
    auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(),
                                            [&](unsigned char ch) { return !is_space(ch); }));
    value.erase(std::find_if(value.rbegin(), value.rend(),
                             [&](unsigned char ch) { return !is_space(ch); }).base(),
                value.end());
    return value;
}

std::string timestamp_suffix() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm_value{};
    localtime_r(&time_t, &tm_value);
    std::ostringstream stream;
    stream << std::put_time(&tm_value, "%Y%m%d_%H%M%S");
    return stream.str();
}

std::string strip_quotes(std::string value) {
    if (value.size() < 2) {
        return value;
    }
    if ((value.front() == '"' && value.back() == '"') ||
        (value.front() == '\'' && value.back() == '\'')) {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

void load_dotenv() {
    const std::filesystem::path dotenv_path = std::filesystem::current_path() / ".env";
    if (!std::filesystem::exists(dotenv_path)) {
        return;
    }

    std::ifstream stream(dotenv_path);
    if (!stream.is_open()) {
        return;
    }

    std::string line;
    while (std::getline(stream, line)) {
        line = trim(line);
        if (line.empty() || line.rfind("#", 0) == 0) {
            continue;
        }
        if (line.rfind("export ", 0) == 0) {
            line = trim(line.substr(7));
        }

        const auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = strip_quotes(trim(line.substr(eq_pos + 1)));
        if (key.empty()) {
            continue;
        }
        setenv(key.c_str(), value.c_str(), 1);
    }
}

void require_positive(int value, const char* name) {
    if (value <= 0) {
        throw ConfigError(std::string(name) + " must be positive");
    }
}

void require_positive(double value, const char* name) {
    if (value <= 0.0) {
        throw ConfigError(std::string(name) + " must be positive");
    }
}

}

Config Config::load() {
    load_dotenv();
    Config config;
    const auto cwd = std::filesystem::current_path();

    config.log_level = get_env_str("LOG_LEVEL", "INFO");
    const auto log_filename_raw = get_env_str("LOG_FILENAME", "");
    if (!log_filename_raw.empty()) {
        const std::filesystem::path log_path(log_filename_raw);
        const auto stamped = log_path.stem().string() + "_" + timestamp_suffix() +
                             log_path.extension().string();
        if (const auto log_dir = get_env_optional("LOGS_DIR")) {
            config.logs_dir = std::filesystem::path(*log_dir);
            config.log_filename = (std::filesystem::path(*log_dir) / stamped).string();
        } else {
            config.log_filename = stamped;
        }
    }
    config.log_name = get_env_str("LOG_NAME", "voice_gateway");

    config.transport_mode = get_env_str("TRANSPORT_MODE", "media_stream");
    config.media_stream_port = get_env_int("MEDIA_STREAM_PORT", 8080);
    config.media_stream_path = get_env_str("MEDIA_STREAM_PATH", "/media-stream");
    config.rest_api_port = get_env_int("REST_API_PORT", 8000);
    config.public_url = get_env_optional("PUBLIC_URL");
    config.authorization_token = get_env_optional("AUTHORIZATION_TOKEN");
    config.max_sessions = get_env_int("MAX_SESSIONS", 16);
    config.tls_verify = get_env_bool("TLS_VERIFY", true);

    config.sip_user = get_env_str("SIP_USER", "");
    config.sip_login = get_env_str("SIP_LOGIN", config.sip_user);
    config.sip_domain = get_env_str("SIP_DOMAIN", "");
    config.sip_password = get_env_str("SIP_PASSWORD", "");
    config.sip_port = get_env_int("SIP_PORT", 5060);
    config.sip_use_tcp = get_env_bool("SIP_USE_TCP", true);
    config.sip_null_device = get_env_bool("SIP_NULL_DEVICE", true);
    config.pjsip_log_level = get_env_int("PJSIP_LOG_LEVEL", 1);
    config.frame_time_usec = get_env_int("FRAME_TIME_USEC", 20000);

    config.telephony_sample_rate = get_env_int("TELEPHONY_SAMPLE_RATE", 8000);
    config.frame_duration_ms = get_env_int("FRAME_DURATION_MS", 20);
    config.stt_sample_rate = get_env_int("STT_SAMPLE_RATE", 16000);
    config.transport_send_queue_frames = get_env_int("TRANSPORT_SEND_QUEUE_FRAMES", 50);
    config.transport_receive_queue_frames =
        get_env_int("TRANSPORT_RECEIVE_QUEUE_FRAMES", 500);
    config.jitter_depth_frames = get_env_int("JITTER_DEPTH_FRAMES", 3);
    config.max_gap_fill_frames = get_env_int("MAX_GAP_FILL_FRAMES", 50);

    config.vad_engine = get_env_str("VAD_ENGINE", "energy");
    config.vad_model_path = std::filesystem::path(get_env_str("VAD_MODEL_PATH", cwd.string())) /
                            "silero_vad.onnx";
    config.vad_model_url = get_env_str(
        "VAD_MODEL_URL",
        "https://huggingface.co/onnx-community/silero-vad/resolve/main/onnx/model.onnx");
    config.vad_threshold = get_env_double("VAD_THRESHOLD", 0.5);
    config.vad_energy_threshold = get_env_double("VAD_ENERGY_THRESHOLD", 500.0);
    config.vad_min_speech_duration_ms = get_env_int("VAD_MIN_SPEECH_DURATION_MS", 200);
    config.vad_silence_duration_ms = get_env_int("VAD_SILENCE_DURATION_MS", 700);
    config.vad_min_utterance_ms = get_env_int("VAD_MIN_UTTERANCE_MS", 300);
    config.vad_speech_pad_ms = get_env_int("VAD_SPEECH_PAD_MS", 200);
    config.vad_max_utterance_ms = get_env_int("VAD_MAX_UTTERANCE_MS", 30000);
    config.vad_speech_prob_window = get_env_int("VAD_SPEECH_PROB_WINDOW", 3);

    config.stt_url = get_env_str("STT_URL", "");
    config.stt_language = get_env_str("STT_LANGUAGE", "en");
    config.stt_timeout_sec = get_env_double("STT_TIMEOUT_SEC", 15.0);

    config.agent_url = get_env_str("AGENT_URL", "");
    config.agent_assistant_id = get_env_str("AGENT_ASSISTANT_ID", "agent");
    config.agent_api_key = get_env_optional("AGENT_API_KEY");
    config.agent_timeout_sec = get_env_double("AGENT_TIMEOUT_SEC", 30.0);
    config.agent_retry_backoff_ms = get_env_int("AGENT_RETRY_BACKOFF_MS", 500);
    config.agent_max_retries = get_env_int("AGENT_MAX_RETRIES", 1);
    config.agent_max_tool_rounds = get_env_int("AGENT_MAX_TOOL_ROUNDS", 5);
    config.tool_timeout_sec = get_env_double("TOOL_TIMEOUT_SEC", 10.0);

    config.tts_url = get_env_str("TTS_URL", "");
    config.tts_model = get_env_str("TTS_MODEL", "kokoro");
    config.tts_voice = get_env_str("TTS_VOICE", "af_heart");
    config.tts_sample_rate = get_env_int("TTS_SAMPLE_RATE", 24000);
    config.tts_timeout_sec = get_env_double("TTS_TIMEOUT_SEC", 30.0);
    if (const auto fallback = get_env_optional("TTS_FALLBACK_AUDIO")) {
        config.tts_fallback_audio = std::filesystem::path(*fallback);
    }
    config.tts_pacing_lead_ms = get_env_int("TTS_PACING_LEAD_MS", 200);

    config.greeting_text = get_env_str("GREETING_TEXT", "");
    config.greeting_cooldown_ms = get_env_int("GREETING_COOLDOWN_MS", 3000);
    config.barge_in_enabled = get_env_bool("BARGE_IN_ENABLED", true);
    config.no_input_timeout_ms = get_env_int("NO_INPUT_TIMEOUT_MS", 5000);
    config.no_input_prompt = get_env_str("NO_INPUT_PROMPT", config.no_input_prompt);
    config.agent_unavailable_message =
        get_env_str("AGENT_UNAVAILABLE_MESSAGE", config.agent_unavailable_message);

    config.twilio_account_sid = get_env_optional("TWILIO_ACCOUNT_SID");
    config.twilio_auth_token = get_env_optional("TWILIO_AUTH_TOKEN");
    config.twilio_api_url = get_env_str("TWILIO_API_URL", "https://api.twilio.com");
    config.twilio_from_number = get_env_optional("TWILIO_FROM_NUMBER");

    config.calendar_url = get_env_optional("CALENDAR_URL");
    config.mock_calendar = get_env_bool("MOCK_CALENDAR", !config.calendar_url.has_value());
    config.booking_url = get_env_str("BOOKING_URL", "");
    config.transfer_number = get_env_optional("TRANSFER_NUMBER");

    if (const auto csv_path = get_env_optional("OUTCOME_CSV_PATH")) {
        config.outcome_csv_path = std::filesystem::path(*csv_path);
    }
    config.outcome_webhook_url = get_env_optional("OUTCOME_WEBHOOK_URL");

    return config;
}

void Config::validate() const {
    if (transport_mode != "media_stream" && transport_mode != "sip" &&
        transport_mode != "both") {
        throw ConfigError("TRANSPORT_MODE must be one of media_stream, sip, both");
    }
    if (sip_enabled()) {
        if (sip_user.empty()) {
            throw ConfigError("SIP_USER is required");
        }
        if (sip_domain.empty()) {
            throw ConfigError("SIP_DOMAIN is required");
        }
        if (sip_password.empty()) {
            throw ConfigError("SIP_PASSWORD is required");
        }
        require_positive(sip_port, "SIP_PORT");
        require_positive(frame_time_usec, "FRAME_TIME_USEC");
    }
    if (stt_url.empty()) {
        throw ConfigError("STT_URL is required");
    }
    if (agent_url.empty()) {
        throw ConfigError("AGENT_URL is required");
    }
    if (tts_url.empty()) {
        throw ConfigError("TTS_URL is required");
    }
    if (vad_engine != "energy" && vad_engine != "silero") {
        throw ConfigError("VAD_ENGINE must be energy or silero");
    }
    if (!mock_calendar && !calendar_url) {
        throw ConfigError("CALENDAR_URL is required when MOCK_CALENDAR is false");
    }
    if (twilio_account_sid.has_value() != twilio_auth_token.has_value()) {
        throw ConfigError(
            "TWILIO_ACCOUNT_SID and TWILIO_AUTH_TOKEN must be set together");
    }
    require_positive(media_stream_port, "MEDIA_STREAM_PORT");
    require_positive(rest_api_port, "REST_API_PORT");
    require_positive(max_sessions, "MAX_SESSIONS");
    require_positive(telephony_sample_rate, "TELEPHONY_SAMPLE_RATE");
    require_positive(frame_duration_ms, "FRAME_DURATION_MS");
    require_positive(stt_sample_rate, "STT_SAMPLE_RATE");
    require_positive(transport_send_queue_frames, "TRANSPORT_SEND_QUEUE_FRAMES");
    require_positive(transport_receive_queue_frames, "TRANSPORT_RECEIVE_QUEUE_FRAMES");
    require_positive(jitter_depth_frames, "JITTER_DEPTH_FRAMES");
    require_positive(vad_min_speech_duration_ms, "VAD_MIN_SPEECH_DURATION_MS");
    require_positive(vad_silence_duration_ms, "VAD_SILENCE_DURATION_MS");
    require_positive(vad_max_utterance_ms, "VAD_MAX_UTTERANCE_MS");
    require_positive(stt_timeout_sec, "STT_TIMEOUT_SEC");
    require_positive(agent_timeout_sec, "AGENT_TIMEOUT_SEC");
    require_positive(agent_max_tool_rounds, "AGENT_MAX_TOOL_ROUNDS");
    require_positive(tool_timeout_sec, "TOOL_TIMEOUT_SEC");
    require_positive(tts_sample_rate, "TTS_SAMPLE_RATE");
    require_positive(tts_timeout_sec, "TTS_TIMEOUT_SEC");
    if (agent_max_retries < 0) {
        throw ConfigError("AGENT_MAX_RETRIES must be zero or positive");
    }
    if (max_gap_fill_frames < 0) {
        throw ConfigError("MAX_GAP_FILL_FRAMES must be zero or positive");
    }
    if (vad_threshold <= 0.0 || vad_threshold >= 1.0) {
        throw ConfigError("VAD_THRESHOLD must be between 0 and 1");
    }
}

bool Config::media_stream_enabled() const {
    return transport_mode == "media_stream" || transport_mode == "both";
}

bool Config::sip_enabled() const {
    return transport_mode == "sip" || transport_mode == "both";
}

bool Config::twilio_configured() const {
    return twilio_account_sid.has_value() && twilio_auth_token.has_value();
}

}
