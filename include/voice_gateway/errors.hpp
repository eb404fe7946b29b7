#pragma once

#include <stdexcept>
#include <string>

namespace voice_gateway {

class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& message) : std::runtime_error(message) {}
};

class RecognitionError : public std::runtime_error {
public:
    explicit RecognitionError(const std::string& message) : std::runtime_error(message) {}
};

class AgentServiceError : public std::runtime_error {
public:
    explicit AgentServiceError(const std::string& message) : std::runtime_error(message) {}
};

class AgentTimeoutError : public AgentServiceError {
public:
    explicit AgentTimeoutError(const std::string& message) : AgentServiceError(message) {}
};

class ToolError : public std::runtime_error {
public:
    explicit ToolError(const std::string& message) : std::runtime_error(message) {}
};

class SynthesisError : public std::runtime_error {
public:
    explicit SynthesisError(const std::string& message) : std::runtime_error(message) {}
};

class SessionLimitError : public std::runtime_error {
public:
    explicit SessionLimitError(const std::string& message) : std::runtime_error(message) {}
};

}
