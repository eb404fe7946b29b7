#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include <nlohmann/json.hpp>

#include "voice_gateway/session/coordinator.hpp"
#include "voice_gateway/transport/media_transport.hpp"

namespace voice_gateway {
namespace session {

// Builds the coordinator for a transport. SessionFactory::create in production.
using CoordinatorBuilder =
    std::function<std::shared_ptr<SessionCoordinator>(std::shared_ptr<transport::MediaTransport>)>;

class SessionManager {
public:
    SessionManager(CoordinatorBuilder builder, int max_sessions);
    ~SessionManager();

    // Throws SessionLimitError when the session limit is reached or the
    // connection already owns a session.
    std::string start_session(std::shared_ptr<transport::MediaTransport> transport);

    bool hangup(const std::string& session_id);
    nlohmann::json list() const;
    size_t active_count() const;

    // Stops every session and waits for their teardown.
    void shutdown(std::chrono::milliseconds timeout);

private:
    struct Entry {
        std::shared_ptr<SessionCoordinator> coordinator;
        std::string connection_id;
    };

    void reap(const std::string& session_id);

    CoordinatorBuilder builder_;
    int max_sessions_;

    mutable std::mutex mutex_;
    std::condition_variable empty_cv_;
    std::unordered_map<std::string, Entry> sessions_;
    std::unordered_map<std::string, std::string> connections_;
    size_t reaping_ = 0;
    bool shutting_down_ = false;
};

}
}
