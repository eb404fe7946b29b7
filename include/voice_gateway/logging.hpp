#pragma once

#include <initializer_list>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "spdlog/logger.h"
#include "voice_gateway/config.hpp"

namespace voice_gateway {
namespace logging {

struct KeyValue {
    std::string key;
    std::string value;
};

template <typename T>
inline KeyValue kv(const std::string& key, const T& value) {
    std::ostringstream oss;
    oss << std::boolalpha << value;
    return {key, oss.str()};
}

inline void append_kv(std::string& result, const KeyValue& item) {
    if (!result.empty()) {
        result += ", ";
    }
    const bool needs_quotes = item.value.find(' ') != std::string::npos ||
                              item.value.find(',') != std::string::npos;
    result += item.key;
    result += '=';
    if (needs_quotes) {
        result += '"';
        result += item.value;
        result += '"';
    } else {
        result += item.value;
    }
}

inline std::string with_kv(const std::string& message,
                           const std::vector<KeyValue>& base,
                           std::initializer_list<KeyValue> items) {
    std::string context;
    for (const auto& item : base) {
        append_kv(context, item);
    }
    for (const auto& item : items) {
        append_kv(context, item);
    }
    if (context.empty()) {
        return message;
    }
    return message + " [" + context + "]";
}

inline std::string with_kv(const std::string& message,
                           std::initializer_list<KeyValue> items) {
    static const std::vector<KeyValue> empty;
    return with_kv(message, empty, items);
}

void init(const Config& config);
std::shared_ptr<spdlog::logger> get_logger();

inline void log(spdlog::level::level_enum level,
                const std::string& message,
                std::initializer_list<KeyValue> items = {}) {
    auto logger = get_logger();
    if (logger && logger->should_log(level)) {
        logger->log(level, with_kv(message, items));
    }
}

inline void trace(const std::string& message,
                  std::initializer_list<KeyValue> items = {}) {
    log(spdlog::level::trace, message, items);
}

inline void debug(const std::string& message,
                  std::initializer_list<KeyValue> items = {}) {
    log(spdlog::level::debug, message, items);
}

inline void info(const std::string& message,
                 std::initializer_list<KeyValue> items = {}) {
    log(spdlog::level::info, message, items);
}

inline void warn(const std::string& message,
                 std::initializer_list<KeyValue> items = {}) {
    log(spdlog::level::warn, message, items);
}

inline void error(const std::string& message,
                  std::initializer_list<KeyValue> items = {}) {
    log(spdlog::level::err, message, items);
}

// Carries fixed context (session id, call id) into every line it writes.
class Context {
public:
    Context() = default;
    explicit Context(std::vector<KeyValue> base) : base_(std::move(base)) {}

    void add(KeyValue item) { base_.push_back(std::move(item)); }

    void debug(const std::string& message, std::initializer_list<KeyValue> items = {}) const {
        write(spdlog::level::debug, message, items);
    }
    void info(const std::string& message, std::initializer_list<KeyValue> items = {}) const {
        write(spdlog::level::info, message, items);
    }
    void warn(const std::string& message, std::initializer_list<KeyValue> items = {}) const {
        write(spdlog::level::warn, message, items);
    }
    void error(const std::string& message, std::initializer_list<KeyValue> items = {}) const {
        write(spdlog::level::err, message, items);
    }

private:
    void write(spdlog::level::level_enum level,
               const std::string& message,
               std::initializer_list<KeyValue> items) const {
        auto logger = get_logger();
        if (logger && logger->should_log(level)) {
            logger->log(level, with_kv(message, base_, items));
        }
    }

    std::vector<KeyValue> base_;
};

}

using logging::kv;
using logging::with_kv;
using logging::debug;
using logging::error;
using logging::info;
using logging::trace;
using logging::warn;

}
