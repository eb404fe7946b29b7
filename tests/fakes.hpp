#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "voice_gateway/agent/agent_client.hpp"
#include "voice_gateway/agent/tool_dispatcher.hpp"
#include "voice_gateway/errors.hpp"
#include "voice_gateway/outcome/outcome_sink.hpp"
#include "voice_gateway/pipeline/bounded_queue.hpp"
#include "voice_gateway/stt/recognizer.hpp"
#include "voice_gateway/telephony/twilio_client.hpp"
#include "voice_gateway/transport/media_transport.hpp"
#include "voice_gateway/tts/synthesizer.hpp"

namespace testing {

using namespace voice_gateway;

inline bool wait_until(const std::function<bool()>& predicate,
                       std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return predicate();
}

inline std::vector<int16_t> sine(int sample_rate, int duration_ms, double amplitude, double hz = 440.0) {
    const auto count = static_cast<size_t>(sample_rate) * static_cast<size_t>(duration_ms) / 1000;
    std::vector<int16_t> samples(count);
    const double pi = 3.14159265358979323846;
    for (size_t i = 0; i < count; ++i) {
        samples[i] = static_cast<int16_t>(
            amplitude * std::sin(2.0 * pi * hz * static_cast<double>(i) / sample_rate));
    }
    return samples;
}

inline std::vector<int16_t> silence(int sample_rate, int duration_ms) {
    return std::vector<int16_t>(static_cast<size_t>(sample_rate) * static_cast<size_t>(duration_ms) / 1000, 0);
}

class FakeTransport : public transport::MediaTransport {
public:
    explicit FakeTransport(int inbound_rate = 16000, int outbound_rate = 8000)
        : inbound_rate_(inbound_rate), outbound_rate_(outbound_rate), inbound_(100000) {
        info_.call_id = "CA123";
        info_.stream_id = "MZ456";
        info_.caller = "+15550001111";
        info_.callee = "+15550002222";
    }

    // Splits samples into 20 ms frames on the inbound queue.
    void feed(const std::vector<int16_t>& samples) {
        const size_t frame = static_cast<size_t>(inbound_rate_) / 50;
        for (size_t offset = 0; offset < samples.size(); offset += frame) {
            audio::AudioFrame item;
            item.sequence = next_sequence_++;
            item.sample_rate = inbound_rate_;
            const auto end = std::min(samples.size(), offset + frame);
            item.samples.assign(samples.begin() + static_cast<long>(offset),
                                samples.begin() + static_cast<long>(end));
            inbound_.try_push(std::move(item));
        }
    }

    // The far end hung up.
    void end_stream() { inbound_.close(); }

    std::optional<audio::AudioFrame> receive() override { return inbound_.pop(); }

    void send(audio::AudioFrame frame) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!open_) {
            return;
        }
        sent_samples_ += frame.samples.size();
        sent_.push_back(std::move(frame));
    }

    void clear() override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (clears_ == 0) {
            frames_at_first_clear_ = sent_.size();
        }
        ++clears_;
    }

    void close() override {
        open_ = false;
        inbound_.close();
        ++closes_;
    }

    bool is_open() const override { return open_; }
    bool degraded() const override { return false; }
    transport::TransportInfo info() const override { return info_; }
    int inbound_sample_rate() const override { return inbound_rate_; }
    int outbound_sample_rate() const override { return outbound_rate_; }
    std::string connection_id() const override { return connection_id_; }

    void hangup() override { ++hangups_; }

    void transfer(const std::string& target) override {
        std::lock_guard<std::mutex> lock(mutex_);
        transfers_.push_back(target);
    }

    size_t sent_frames() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sent_.size();
    }
    size_t sent_samples() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sent_samples_;
    }
    std::vector<audio::AudioFrame> sent() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sent_;
    }
    std::vector<std::string> transfers() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return transfers_;
    }
    size_t frames_at_first_clear() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return frames_at_first_clear_;
    }

    transport::TransportInfo info_;
    std::string connection_id_ = "fake-1";
    std::atomic<int> clears_{0};
    std::atomic<int> hangups_{0};
    std::atomic<int> closes_{0};

private:
    int inbound_rate_;
    int outbound_rate_;
    pipeline::BoundedQueue<audio::AudioFrame> inbound_;
    uint64_t next_sequence_ = 0;
    mutable std::mutex mutex_;
    std::vector<audio::AudioFrame> sent_;
    size_t sent_samples_ = 0;
    size_t frames_at_first_clear_ = 0;
    std::atomic<bool> open_{true};
    std::vector<std::string> transfers_;
};

class FakeRecognizer : public stt::Recognizer {
public:
    explicit FakeRecognizer(std::vector<std::string> texts = {"hello"}) : texts_(std::move(texts)) {}

    stt::RecognitionResult transcribe(const std::vector<int16_t>& samples, int sample_rate) override {
        std::lock_guard<std::mutex> lock(mutex_);
        durations_.push_back(static_cast<double>(samples.size()) / sample_rate);
        if (fail) {
            throw RecognitionError("recognizer offline");
        }
        stt::RecognitionResult result;
        result.text = texts_.empty() ? "" : texts_[std::min(calls_, texts_.size() - 1)];
        result.confidence = 0.9f;
        ++calls_;
        return result;
    }

    size_t calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }
    std::vector<double> durations() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return durations_;
    }

    std::atomic<bool> fail{false};

private:
    mutable std::mutex mutex_;
    std::vector<std::string> texts_;
    std::vector<double> durations_;
    size_t calls_ = 0;
};

class FakeAgent : public agent::AgentService {
public:
    using MessageFn = std::function<agent::AgentReply(const std::string& text)>;
    using ToolResultsFn = std::function<agent::AgentReply(const std::vector<agent::ToolResult>&)>;

    std::string create_thread(const agent::AgentContext&) override {
        ++threads_created;
        return "thread-1";
    }

    agent::AgentReply send_message(const std::string&,
                                   const std::string& text,
                                   const agent::AgentContext& context) override {
        MessageFn fn;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            messages_.push_back(text);
            contexts_.push_back(context);
            fn = on_message;
        }
        if (fn) {
            return fn(text);
        }
        agent::AgentReply reply;
        reply.text = "You said " + text + ".";
        return reply;
    }

    agent::AgentReply send_tool_results(const std::string&,
                                        const std::vector<agent::ToolResult>& results,
                                        const agent::AgentContext&) override {
        ToolResultsFn fn;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            tool_results_.push_back(results);
            fn = on_tool_results;
        }
        if (fn) {
            return fn(results);
        }
        agent::AgentReply reply;
        reply.text = "Done.";
        return reply;
    }

    std::vector<std::string> messages() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return messages_;
    }
    std::vector<agent::AgentContext> contexts() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return contexts_;
    }
    std::vector<std::vector<agent::ToolResult>> tool_results() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return tool_results_;
    }

    MessageFn on_message;
    ToolResultsFn on_tool_results;
    std::atomic<int> threads_created{0};

private:
    mutable std::mutex mutex_;
    std::vector<std::string> messages_;
    std::vector<agent::AgentContext> contexts_;
    std::vector<std::vector<agent::ToolResult>> tool_results_;
};

class FakeToolExecutor : public agent::ToolExecutor {
public:
    using ToolFn = std::function<agent::ToolOutcome(const agent::ToolCall&)>;

    agent::ToolOutcome execute(const agent::ToolCall& call, const agent::ToolContext&) override {
        ToolFn fn;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            executed_.push_back(call.name);
            const auto it = tools.find(call.name);
            if (it == tools.end()) {
                throw ToolError("Unknown tool: " + call.name);
            }
            fn = it->second;
        }
        return fn(call);
    }

    std::vector<std::string> executed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return executed_;
    }

    std::map<std::string, ToolFn> tools;

private:
    mutable std::mutex mutex_;
    std::vector<std::string> executed_;
};

// Produces samples_per_char samples of constant amplitude for every character.
class FakeSynthesizer : public tts::Synthesizer {
public:
    explicit FakeSynthesizer(int sample_rate = 8000, size_t samples_per_char = 80)
        : sample_rate_(sample_rate), samples_per_char_(samples_per_char) {}

    int sample_rate() const override { return sample_rate_; }

    bool synthesize(const std::string& text, const ChunkHandler& handler) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            texts_.push_back(text);
        }
        if (fail) {
            throw SynthesisError("synthesizer offline");
        }
        size_t remaining = text.size() * samples_per_char_;
        while (remaining > 0) {
            const auto count = std::min<size_t>(remaining, 400);
            if (!handler(std::vector<int16_t>(count, 1000))) {
                return false;
            }
            remaining -= count;
        }
        return true;
    }

    std::vector<std::string> texts() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return texts_;
    }

    std::atomic<bool> fail{false};

private:
    int sample_rate_;
    size_t samples_per_char_;
    mutable std::mutex mutex_;
    std::vector<std::string> texts_;
};

class FakeOutcomeSink : public outcome::OutcomeSink {
public:
    void record(const outcome::OutcomeRecord& record) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail) {
            throw std::runtime_error("sink offline");
        }
        records_.push_back(record);
    }

    std::vector<outcome::OutcomeRecord> records() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return records_;
    }

    bool fail = false;

private:
    mutable std::mutex mutex_;
    std::vector<outcome::OutcomeRecord> records_;
};

class FakeTelephony : public telephony::TelephonyService, public telephony::MessagingService {
public:
    void hangup_call(const std::string& call_sid) override {
        std::lock_guard<std::mutex> lock(mutex_);
        hangups.push_back(call_sid);
    }

    void transfer_call(const std::string& call_sid, const std::string& target) override {
        std::lock_guard<std::mutex> lock(mutex_);
        transfers.emplace_back(call_sid, target);
    }

    std::string send_sms(const std::string& to, const std::string& body) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail_sms) {
            throw std::runtime_error("sms rejected");
        }
        sms.emplace_back(to, body);
        return "SM1";
    }

    size_t sms_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sms.size();
    }

    std::vector<std::string> hangups;
    std::vector<std::pair<std::string, std::string>> transfers;
    std::vector<std::pair<std::string, std::string>> sms;
    bool fail_sms = false;

private:
    mutable std::mutex mutex_;
};

}
