#pragma once

#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "voice_gateway/http/client.hpp"

namespace voice_gateway {
namespace outcome {

struct TranscriptEntry {
    // "caller", "agent" or "system".
    std::string speaker;
    std::string text;
    double offset_sec = 0.0;
};

struct OutcomeRecord {
    std::string session_id;
    std::string call_id;
    std::string caller;
    std::string callee;
    std::chrono::system_clock::time_point started_at;
    double duration_sec = 0.0;
    std::string outcome;
    std::vector<std::string> notes;
    std::vector<TranscriptEntry> transcript;
    std::map<std::string, std::string> parameters;

    nlohmann::json to_json() const;
};

// UTC, e.g. 2024-05-01T14:03:22Z.
std::string format_timestamp(std::chrono::system_clock::time_point time);

// One line per entry: "caller: hello | agent: hi there".
std::string format_transcript(const std::vector<TranscriptEntry>& transcript);

std::string csv_escape(const std::string& value);

class OutcomeSink {
public:
    virtual ~OutcomeSink() = default;

    // Throws on delivery failure.
    virtual void record(const OutcomeRecord& record) = 0;
};

class CsvOutcomeSink : public OutcomeSink {
public:
    explicit CsvOutcomeSink(std::filesystem::path path);

    void record(const OutcomeRecord& record) override;

    static const std::vector<std::string>& columns();

private:
    std::filesystem::path path_;
    std::mutex mutex_;
};

class HttpOutcomeSink : public OutcomeSink {
public:
    HttpOutcomeSink(std::string url, HttpRequestOptions options);

    void record(const OutcomeRecord& record) override;

private:
    std::string base_url_;
    std::string path_;
    HttpRequestOptions options_;
};

// Delivers to every sink; one failing sink does not stop the others.
class CompositeOutcomeSink : public OutcomeSink {
public:
    void add(std::shared_ptr<OutcomeSink> sink);
    bool empty() const { return sinks_.empty(); }

    void record(const OutcomeRecord& record) override;

private:
    std::vector<std::shared_ptr<OutcomeSink>> sinks_;
};

}
}
