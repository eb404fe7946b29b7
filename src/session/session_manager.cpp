#include "voice_gateway/session/session_manager.hpp"

#include <utility>
#include <vector>

#include "voice_gateway/errors.hpp"
#include "voice_gateway/logging.hpp"
#include "voice_gateway/utils/async.hpp"

namespace voice_gateway::session {

SessionManager::SessionManager(CoordinatorBuilder builder, int max_sessions)
    : builder_(std::move(builder)), max_sessions_(max_sessions) {}

SessionManager::~SessionManager() {
    shutdown(std::chrono::seconds(10));
}

std::string SessionManager::start_session(std::shared_ptr<transport::MediaTransport> transport) {
    const auto connection_id = transport->connection_id();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutting_down_) {
            throw SessionLimitError("Shutting down, session rejected");
        }
        if (connections_.count(connection_id) > 0) {
            throw SessionLimitError("Connection " + connection_id + " already has a session");
        }
        if (max_sessions_ > 0 && static_cast<int>(sessions_.size()) >= max_sessions_) {
            throw SessionLimitError("Session limit reached (" + std::to_string(max_sessions_) + ")");
        }
        // Reserve the connection while the session is built outside the lock.
        connections_.emplace(connection_id, std::string());
    }

    std::shared_ptr<SessionCoordinator> coordinator;
    try {
        coordinator = builder_(transport);
    } catch (const std::exception&) {
        std::lock_guard<std::mutex> lock(mutex_);
        connections_.erase(connection_id);
        throw;
    }

    const auto session_id = coordinator->id();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        connections_[connection_id] = session_id;
        sessions_.emplace(session_id, Entry{coordinator, connection_id});
    }
    coordinator->set_on_teardown([this, session_id](const outcome::OutcomeRecord&) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++reaping_;
        }
        utils::run_async([this, session_id]() { reap(session_id); });
    });
    coordinator->start();
    logging::info("Session registered",
                  {kv("session_id", session_id), kv("connection_id", connection_id),
                   kv("active", active_count())});
    return session_id;
}

bool SessionManager::hangup(const std::string& session_id) {
    std::shared_ptr<SessionCoordinator> coordinator;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = sessions_.find(session_id);
        if (it == sessions_.end()) {
            return false;
        }
        coordinator = it->second.coordinator;
    }
    logging::info("Hangup requested", {kv("session_id", session_id)});
    coordinator->stop("completed");
    return true;
}

nlohmann::json SessionManager::list() const {
    nlohmann::json result = nlohmann::json::array();
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& item : sessions_) {
        const auto& coordinator = item.second.coordinator;
        const auto info = coordinator->info();
        result.push_back({
            {"session_id", item.first},
            {"call_sid", info.call_id},
            {"stream_sid", info.stream_id},
            {"caller", info.caller},
            {"callee", info.callee},
            {"turn_state", to_string(coordinator->turn_state())},
            {"duration_sec", coordinator->elapsed_sec()},
        });
    }
    return result;
}

size_t SessionManager::active_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

void SessionManager::shutdown(std::chrono::milliseconds timeout) {
    std::vector<std::shared_ptr<SessionCoordinator>> running;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shutting_down_ = true;
        for (const auto& item : sessions_) {
            running.push_back(item.second.coordinator);
        }
    }
    if (!running.empty()) {
        logging::info("Stopping sessions", {kv("count", running.size())});
    }
    for (const auto& coordinator : running) {
        coordinator->stop("shutdown");
    }
    running.clear();

    std::unique_lock<std::mutex> lock(mutex_);
    if (!empty_cv_.wait_for(lock, timeout, [this]() { return sessions_.empty() && reaping_ == 0; })) {
        logging::warn("Sessions still running after shutdown timeout", {kv("count", sessions_.size())});
    }
}

void SessionManager::reap(const std::string& session_id) {
    std::shared_ptr<SessionCoordinator> coordinator;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = sessions_.find(session_id);
        if (it != sessions_.end()) {
            coordinator = std::move(it->second.coordinator);
            connections_.erase(it->second.connection_id);
            sessions_.erase(it);
        }
    }
    // Joins the coordinator's threads.
    coordinator.reset();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        --reaping_;
    }
    empty_cv_.notify_all();
    logging::debug("Session reaped", {kv("session_id", session_id)});
}

}
