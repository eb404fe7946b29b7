#include "voice_gateway/config.hpp"
#include "voice_gateway/logging.hpp"
#include "voice_gateway/server/media_server.hpp"
#include "voice_gateway/server/rest_server.hpp"
#include "voice_gateway/session/session_factory.hpp"
#include "voice_gateway/session/session_manager.hpp"
#include "voice_gateway/utils/http.hpp"
#ifdef VOICEGATEWAY_HAS_SIP
#include "voice_gateway/sip/app.hpp"
#include "voice_gateway/sip/pj_thread.hpp"
#endif

#include <atomic>
#include <chrono>
#include <csignal>
#include <memory>
#include <string>
#include <thread>

namespace {

std::atomic<bool> stop_requested{false};

void handle_signal(int) {
    stop_requested = true;
}

void wait_for_stop() {
    while (!stop_requested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
}

}

int main() {
    namespace vg = voice_gateway;
    try {
        const auto config = vg::Config::load();
        config.validate();
        vg::logging::init(config);
        vg::utils::set_tls_verification(config.tls_verify);
        if (!config.tls_verify) {
            vg::logging::warn("TLS certificate verification disabled");
        }
        vg::logging::info(
            "Starting voice-gateway",
            {vg::kv("transport_mode", config.transport_mode),
             vg::kv("rest_port", config.rest_api_port),
             vg::kv("max_sessions", config.max_sessions),
             vg::kv("vad_engine", config.vad_engine),
             vg::kv("barge_in", config.barge_in_enabled)});

        std::signal(SIGINT, handle_signal);
        std::signal(SIGTERM, handle_signal);

        auto services = vg::session::build_services(config);
        auto telephony = services.twilio;
        auto factory = std::make_shared<vg::session::SessionFactory>(config, std::move(services));
        vg::session::SessionManager sessions(
            [factory](std::shared_ptr<vg::transport::MediaTransport> transport) {
                return factory->create(std::move(transport));
            },
            config.max_sessions);

        vg::RestServer rest(config, sessions);
        rest.start();

        std::unique_ptr<vg::MediaStreamServer> media;
        if (config.media_stream_enabled()) {
            media = std::make_unique<vg::MediaStreamServer>(config, telephony, sessions);
            media->start();
        }

#ifdef VOICEGATEWAY_HAS_SIP
        std::unique_ptr<vg::sip::SipApp> sip;
        if (config.sip_enabled()) {
            sip = std::make_unique<vg::sip::SipApp>(config, sessions);
            sip->init();
            vg::sip::install_async_thread_hook();
            std::thread watcher([&sip]() {
                wait_for_stop();
                sip->stop();
            });
            sip->run();
            stop_requested = true;
            watcher.join();
        } else {
            wait_for_stop();
        }
#else
        if (config.sip_enabled()) {
            vg::logging::warn("SIP transport requested but this build has no pjsua2 support");
        }
        wait_for_stop();
#endif

        vg::logging::info("Shutting down", {vg::kv("active_sessions", sessions.active_count())});
        sessions.shutdown(std::chrono::seconds(10));
#ifdef VOICEGATEWAY_HAS_SIP
        if (sip) {
            sip->shutdown();
        }
#endif
        if (media) {
            media->stop();
        }
        rest.stop();
    } catch (const std::exception& ex) {
        vg::logging::error(
            "Startup failed",
            {vg::kv("error", ex.what())});
        return 1;
    }
    return 0;
}
