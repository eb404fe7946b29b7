#pragma once

#include <memory>
#include <string>

#include "voice_gateway/agent/agent_client.hpp"
#include "voice_gateway/agent/calendar.hpp"
#include "voice_gateway/config.hpp"
#include "voice_gateway/outcome/outcome_sink.hpp"
#include "voice_gateway/session/coordinator.hpp"
#include "voice_gateway/stt/recognizer.hpp"
#include "voice_gateway/telephony/twilio_client.hpp"
#include "voice_gateway/transport/media_transport.hpp"
#include "voice_gateway/tts/synthesizer.hpp"
#include "voice_gateway/vad/model.hpp"

namespace voice_gateway {
namespace session {

// Process-wide collaborators shared by every session.
struct SharedServices {
    std::shared_ptr<stt::Recognizer> recognizer;
    std::shared_ptr<agent::AgentService> agent;
    std::shared_ptr<agent::CalendarService> calendar;
    std::shared_ptr<telephony::TwilioClient> twilio;
    std::shared_ptr<tts::Synthesizer> synthesizer;
    std::shared_ptr<outcome::OutcomeSink> outcome_sink;
    // Null selects the energy detector.
    std::shared_ptr<vad::SileroModel> vad_model;
};

SharedServices build_services(const Config& config);

class SessionFactory {
public:
    SessionFactory(Config config, SharedServices services);

    // Wires STT, orchestrator and TTS around a started transport.
    std::shared_ptr<SessionCoordinator> create(std::shared_ptr<transport::MediaTransport> transport);

    const Config& config() const { return config_; }
    const SharedServices& services() const { return services_; }

private:
    std::unique_ptr<vad::VadSegmenter> make_segmenter() const;

    Config config_;
    SharedServices services_;
};

std::string new_session_id();

}
}
