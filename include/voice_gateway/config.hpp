#pragma once

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>

namespace voice_gateway {

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

struct Config {
    std::string log_level = "INFO";
    std::optional<std::string> log_filename;
    std::optional<std::filesystem::path> logs_dir;
    std::string log_name = "voice_gateway";

    std::string transport_mode = "media_stream";
    int media_stream_port = 8080;
    std::string media_stream_path = "/media-stream";
    int rest_api_port = 8000;
    std::optional<std::string> public_url;
    std::optional<std::string> authorization_token;
    int max_sessions = 16;
    // Off only for test rigs with self-signed endpoints.
    bool tls_verify = true;

    std::string sip_user;
    std::string sip_login;
    std::string sip_domain;
    std::string sip_password;
    int sip_port = 5060;
    bool sip_use_tcp = true;
    bool sip_null_device = true;
    int pjsip_log_level = 1;
    int frame_time_usec = 20000;

    int telephony_sample_rate = 8000;
    int frame_duration_ms = 20;
    int stt_sample_rate = 16000;
    int transport_send_queue_frames = 50;
    int transport_receive_queue_frames = 500;
    int jitter_depth_frames = 3;
    int max_gap_fill_frames = 50;

    std::string vad_engine = "energy";
    std::filesystem::path vad_model_path;
    std::string vad_model_url;
    double vad_threshold = 0.5;
    double vad_energy_threshold = 500.0;
    int vad_min_speech_duration_ms = 200;
    int vad_silence_duration_ms = 700;
    int vad_min_utterance_ms = 300;
    int vad_speech_pad_ms = 200;
    int vad_max_utterance_ms = 30000;
    int vad_speech_prob_window = 3;

    std::string stt_url;
    std::string stt_language = "en";
    double stt_timeout_sec = 15.0;

    std::string agent_url;
    std::string agent_assistant_id = "agent";
    std::optional<std::string> agent_api_key;
    double agent_timeout_sec = 30.0;
    int agent_retry_backoff_ms = 500;
    int agent_max_retries = 1;
    int agent_max_tool_rounds = 5;
    double tool_timeout_sec = 10.0;

    std::string tts_url;
    std::string tts_model = "kokoro";
    std::string tts_voice = "af_heart";
    int tts_sample_rate = 24000;
    double tts_timeout_sec = 30.0;
    std::optional<std::filesystem::path> tts_fallback_audio;
    int tts_pacing_lead_ms = 200;

    std::string greeting_text;
    int greeting_cooldown_ms = 3000;
    bool barge_in_enabled = true;
    int no_input_timeout_ms = 5000;
    std::string no_input_prompt = "Hey, are you still there?";
    std::string agent_unavailable_message =
        "Sorry, I'm having some technical trouble. I'll have someone call you back.";

    std::optional<std::string> twilio_account_sid;
    std::optional<std::string> twilio_auth_token;
    std::string twilio_api_url = "https://api.twilio.com";
    std::optional<std::string> twilio_from_number;

    std::optional<std::string> calendar_url;
    bool mock_calendar = true;
    std::string booking_url;
    std::optional<std::string> transfer_number;

    std::optional<std::filesystem::path> outcome_csv_path;
    std::optional<std::string> outcome_webhook_url;

    static Config load();
    void validate() const;

    bool media_stream_enabled() const;
    bool sip_enabled() const;
    bool twilio_configured() const;
};

}
