#include "voice_gateway/outcome/outcome_sink.hpp"

#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "voice_gateway/logging.hpp"
#include "voice_gateway/utils/http.hpp"

namespace voice_gateway::outcome {

nlohmann::json OutcomeRecord::to_json() const {
    nlohmann::json transcript_json = nlohmann::json::array();
    for (const auto& entry : transcript) {
        transcript_json.push_back({
            {"speaker", entry.speaker},
            {"text", entry.text},
            {"offset_sec", entry.offset_sec},
        });
    }
    return {
        {"session_id", session_id},
        {"call_sid", call_id},
        {"caller", caller},
        {"callee", callee},
        {"started_at", format_timestamp(started_at)},
        {"duration_sec", duration_sec},
        {"outcome", outcome},
        {"notes", notes},
        {"transcript", transcript_json},
        {"parameters", parameters},
    };
}

std::string format_timestamp(std::chrono::system_clock::time_point time) {
    const std::time_t raw = std::chrono::system_clock::to_time_t(time);
    std::tm utc{};
    gmtime_r(&raw, &utc);
    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

std::string format_transcript(const std::vector<TranscriptEntry>& transcript) {
    std::string result;
    for (const auto& entry : transcript) {
        if (!result.empty()) {
            result += " | ";
        }
        result += entry.speaker;
        result += ": ";
        result += entry.text;
    }
    return result;
}

std::string csv_escape(const std::string& value) {
    if (value.find_first_of(",\"\r\n") == std::string::npos) {
        return value;
    }
    std::string escaped = "\"";
    for (char ch : value) {
        if (ch == '"') {
            escaped += '"';
        }
        escaped += ch;
    }
    escaped += '"';
    return escaped;
}

CsvOutcomeSink::CsvOutcomeSink(std::filesystem::path path) : path_(std::move(path)) {}

const std::vector<std::string>& CsvOutcomeSink::columns() {
    static const std::vector<std::string> names = {
        "timestamp", "session_id", "call_sid", "caller", "callee",
        "duration_sec", "outcome", "notes", "transcript",
    };
    return names;
}

void CsvOutcomeSink::record(const OutcomeRecord& record) {
    std::ostringstream duration;
    duration << std::fixed << std::setprecision(1) << record.duration_sec;
    std::string notes;
    for (const auto& note : record.notes) {
        if (!notes.empty()) {
            notes += "; ";
        }
        notes += note;
    }
    const std::vector<std::string> row = {
        format_timestamp(record.started_at),
        record.session_id,
        record.call_id,
        record.caller,
        record.callee,
        duration.str(),
        record.outcome,
        notes,
        format_transcript(record.transcript),
    };

    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    const bool needs_header =
        !std::filesystem::exists(path_, ec) || std::filesystem::file_size(path_, ec) == 0;
    if (path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path(), ec);
    }
    std::ofstream out(path_, std::ios::app);
    if (!out) {
        throw std::runtime_error("Cannot open outcome log " + path_.string());
    }
    const auto write_row = [&out](const std::vector<std::string>& values) {
        for (size_t i = 0; i < values.size(); ++i) {
            if (i > 0) {
                out << ',';
            }
            out << csv_escape(values[i]);
        }
        out << '\n';
    };
    if (needs_header) {
        write_row(columns());
    }
    write_row(row);
    out.flush();
    if (!out) {
        throw std::runtime_error("Failed writing outcome log " + path_.string());
    }
}

HttpOutcomeSink::HttpOutcomeSink(std::string url, HttpRequestOptions options) : options_(options) {
    std::string scheme;
    std::string host;
    int port = 0;
    utils::parse_url(url, scheme, host, port, path_);
    if (host.empty()) {
        throw std::runtime_error("Invalid outcome webhook URL: " + url);
    }
    base_url_ = scheme + "://" + host + ":" + std::to_string(port);
}

void HttpOutcomeSink::record(const OutcomeRecord& record) {
    HttpClient client(base_url_, options_);
    client.post_json(path_, record.to_json());
    logging::debug("Outcome delivered to webhook",
                   {kv("session_id", record.session_id), kv("path", path_)});
}

void CompositeOutcomeSink::add(std::shared_ptr<OutcomeSink> sink) {
    if (sink) {
        sinks_.push_back(std::move(sink));
    }
}

void CompositeOutcomeSink::record(const OutcomeRecord& record) {
    for (const auto& sink : sinks_) {
        try {
            sink->record(record);
        } catch (const std::exception& ex) {
            logging::error("Outcome sink failed",
                           {kv("session_id", record.session_id), kv("error", ex.what())});
        }
    }
}

}
