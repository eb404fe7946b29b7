#include <catch2/catch_test_macros.hpp>

#include "fakes.hpp"

#include "voice_gateway/http/client.hpp"
#include "voice_gateway/outcome/outcome_sink.hpp"

#include <httplib.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace voice_gateway;
using namespace voice_gateway::outcome;
using testing::FakeOutcomeSink;
using testing::wait_until;

namespace {

OutcomeRecord sample_record() {
    OutcomeRecord record;
    record.session_id = "sess-1";
    record.call_id = "CA123";
    record.caller = "+15550001111";
    record.callee = "+15550002222";
    record.started_at = std::chrono::system_clock::time_point(std::chrono::seconds(1714572202));
    record.duration_sec = 42.0;
    record.outcome = "meeting_booked";
    record.notes = {"Meeting booked for Friday", "prefers \"afternoons\""};
    record.transcript = {{"agent", "Hi, this is Ava.", 0.1}, {"caller", "Hello, yes", 2.5}};
    record.parameters = {{"campaign", "spring"}};
    return record;
}

std::vector<std::string> read_lines(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

}

TEST_CASE("timestamps are formatted in UTC") {
    const std::chrono::system_clock::time_point time(std::chrono::seconds(1714572202));
    REQUIRE(format_timestamp(time) == "2024-05-01T14:03:22Z");
}

TEST_CASE("transcripts flatten to a single line") {
    REQUIRE(format_transcript(sample_record().transcript) == "agent: Hi, this is Ava. | caller: Hello, yes");
    REQUIRE(format_transcript({}).empty());
}

TEST_CASE("csv fields are quoted only when needed") {
    REQUIRE(csv_escape("plain") == "plain");
    REQUIRE(csv_escape("a,b") == "\"a,b\"");
    REQUIRE(csv_escape("say \"hi\"") == "\"say \"\"hi\"\"\"");
    REQUIRE(csv_escape("two\nlines") == "\"two\nlines\"");
}

TEST_CASE("records serialize with the call sid") {
    const auto json = sample_record().to_json();
    REQUIRE(json["call_sid"] == "CA123");
    REQUIRE(json["session_id"] == "sess-1");
    REQUIRE(json["outcome"] == "meeting_booked");
    REQUIRE(json["started_at"] == "2024-05-01T14:03:22Z");
    REQUIRE(json["notes"].size() == 2);
    REQUIRE(json["transcript"][1]["speaker"] == "caller");
    REQUIRE(json["parameters"]["campaign"] == "spring");
}

TEST_CASE("the csv log gets its header once") {
    const auto dir = std::filesystem::temp_directory_path() / "voice_gateway_outcomes_test";
    std::filesystem::remove_all(dir);
    const auto path = dir / "outcomes.csv";

    CsvOutcomeSink sink(path);
    sink.record(sample_record());
    auto second = sample_record();
    second.session_id = "sess-2";
    second.outcome = "not_interested";
    second.notes.clear();
    sink.record(second);

    const auto lines = read_lines(path);
    REQUIRE(lines.size() == 3);
    REQUIRE(lines[0] == "timestamp,session_id,call_sid,caller,callee,duration_sec,outcome,notes,transcript");
    REQUIRE(lines[1] ==
            "2024-05-01T14:03:22Z,sess-1,CA123,+15550001111,+15550002222,42.0,meeting_booked,"
            "\"Meeting booked for Friday; prefers \"\"afternoons\"\"\","
            "\"agent: Hi, this is Ava. | caller: Hello, yes\"");
    REQUIRE(lines[2].find("sess-2") != std::string::npos);
    REQUIRE(lines[2].find(",not_interested,,") != std::string::npos);
    std::filesystem::remove_all(dir);
}

TEST_CASE("one failing sink does not stop the others") {
    auto failing = std::make_shared<FakeOutcomeSink>();
    failing->fail = true;
    auto working = std::make_shared<FakeOutcomeSink>();

    CompositeOutcomeSink composite;
    REQUIRE(composite.empty());
    composite.add(failing);
    composite.add(nullptr);
    composite.add(working);
    REQUIRE_FALSE(composite.empty());

    REQUIRE_NOTHROW(composite.record(sample_record()));
    REQUIRE(working->records().size() == 1);
    REQUIRE(working->records()[0].session_id == "sess-1");
}

TEST_CASE("the webhook sink posts the record as json") {
    httplib::Server server;
    std::mutex mutex;
    std::string received;
    int status = 200;
    server.Post("/hooks/outcome", [&](const httplib::Request& request, httplib::Response& response) {
        std::lock_guard<std::mutex> lock(mutex);
        received = request.body;
        response.status = status;
        response.set_content("{}", "application/json");
    });
    const int port = server.bind_to_any_port("127.0.0.1");
    std::thread listener([&server]() { server.listen_after_bind(); });
    REQUIRE(wait_until([&server]() { return server.is_running(); }));

    HttpRequestOptions options;
    options.request_timeout = std::chrono::seconds(2);
    options.connect_timeout = std::chrono::seconds(2);
    options.read_timeout = std::chrono::seconds(2);
    HttpOutcomeSink sink("http://127.0.0.1:" + std::to_string(port) + "/hooks/outcome", options);

    sink.record(sample_record());
    {
        std::lock_guard<std::mutex> lock(mutex);
        const auto body = nlohmann::json::parse(received);
        REQUIRE(body["call_sid"] == "CA123");
        REQUIRE(body["transcript"].size() == 2);
        status = 500;
    }
    REQUIRE_THROWS_AS(sink.record(sample_record()), HttpError);

    server.stop();
    listener.join();
}
