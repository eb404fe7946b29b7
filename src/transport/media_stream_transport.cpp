#include "voice_gateway/transport/media_stream_transport.hpp"

#include <utility>

#include <websocketpp/base64/base64.hpp>

#include "voice_gateway/errors.hpp"
#include "voice_gateway/metrics.hpp"

namespace voice_gateway::transport {

namespace {

// Twilio sends sequence numbers and chunk counters as strings.
std::optional<uint64_t> read_counter(const nlohmann::json& object, const char* key) {
    const auto it = object.find(key);
    if (it == object.end()) {
        return std::nullopt;
    }
    if (it->is_number_unsigned() || it->is_number_integer()) {
        return it->get<uint64_t>();
    }
    if (it->is_string()) {
        try {
            return std::stoull(it->get<std::string>());
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

std::string string_field(const nlohmann::json& object, const char* key) {
    const auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

}

MediaStreamTransport::MediaStreamTransport(std::string connection_id,
                                           TextSender sender,
                                           EventHandler close_connection,
                                           std::shared_ptr<telephony::TelephonyService> telephony,
                                           MediaStreamOptions options)
    : connection_id_(std::move(connection_id)),
      sender_(std::move(sender)),
      close_connection_(std::move(close_connection)),
      telephony_(std::move(telephony)),
      options_(options),
      log_({kv("connection_id", connection_id_)}),
      jitter_(options.jitter_depth_frames,
              options.max_gap_fill_frames,
              audio::samples_per_frame(options.wire_sample_rate, options.frame_ms),
              options.wire_sample_rate),
      upsampler_(options.wire_sample_rate, options.pcm_sample_rate),
      inbound_(options.receive_queue_frames),
      outbound_(options.send_queue_frames, connection_id_) {}

MediaStreamTransport::~MediaStreamTransport() {
    close();
}

void MediaStreamTransport::set_on_start(EventHandler handler) {
    std::lock_guard<std::mutex> lock(info_mutex_);
    on_start_ = std::move(handler);
}

void MediaStreamTransport::handle_message(const std::string& text) {
    nlohmann::json message;
    try {
        message = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& ex) {
        log_.warn("Ignoring malformed media stream message", {kv("error", ex.what())});
        return;
    }
    const auto event = string_field(message, "event");
    try {
        if (event == "media") {
            on_media(message);
        } else if (event == "start") {
            on_start(message);
        } else if (event == "stop") {
            on_stop();
        } else if (event == "mark") {
            log_.debug("Playback mark reached",
                       {kv("name", message.value("mark", nlohmann::json::object())
                                       .value("name", std::string()))});
        } else if (event == "connected") {
            log_.debug("Media stream connected",
                       {kv("protocol", string_field(message, "protocol"))});
        } else {
            log_.debug("Ignoring media stream event", {kv("event", event)});
        }
    } catch (const nlohmann::json::exception& ex) {
        log_.warn("Invalid media stream event", {kv("event", event), kv("error", ex.what())});
    }
}

void MediaStreamTransport::handle_close() {
    finish_inbound();
    open_ = false;
    outbound_.close();
}

void MediaStreamTransport::on_start(const nlohmann::json& message) {
    if (started_.exchange(true)) {
        log_.warn("Duplicate media stream start ignored");
        return;
    }
    const auto start = message.value("start", nlohmann::json::object());
    EventHandler handler;
    {
        std::lock_guard<std::mutex> lock(info_mutex_);
        info_.stream_id = string_field(start, "streamSid");
        if (info_.stream_id.empty()) {
            info_.stream_id = string_field(message, "streamSid");
        }
        info_.call_id = string_field(start, "callSid");
        const auto params = start.value("customParameters", nlohmann::json::object());
        for (const auto& [key, value] : params.items()) {
            info_.parameters[key] = value.is_string() ? value.get<std::string>() : value.dump();
        }
        const auto from = info_.parameters.find("From");
        info_.caller = from != info_.parameters.end() ? from->second : "";
        const auto to = info_.parameters.find("To");
        info_.callee = to != info_.parameters.end() ? to->second : "";
        handler = on_start_;
    }
    log_.info("Media stream started",
              {kv("stream_sid", stream_sid()), kv("call_sid", string_field(start, "callSid"))});
    writer_ = std::thread([this]() { writer_loop(); });
    if (handler) {
        handler();
    }
}

void MediaStreamTransport::on_media(const nlohmann::json& message) {
    const auto media = message.at("media");
    const auto track = string_field(media, "track");
    if (!track.empty() && track != "inbound") {
        return;
    }
    const auto payload = websocketpp::base64_decode(media.at("payload").get<std::string>());

    audio::AudioFrame frame;
    frame.direction = audio::Direction::Inbound;
    frame.sample_rate = options_.wire_sample_rate;
    frame.samples = audio::decode_ulaw(payload);

    std::lock_guard<std::mutex> lock(inbound_mutex_);
    if (inbound_finished_) {
        return;
    }
    auto sequence = read_counter(media, "chunk");
    if (!sequence) {
        sequence = read_counter(message, "sequenceNumber");
    }
    frame.sequence = sequence ? *sequence : next_local_sequence_;
    next_local_sequence_ = frame.sequence + 1;

    for (auto& ready : jitter_.push(std::move(frame))) {
        audio::AudioFrame pcm;
        pcm.sequence = ready.sequence;
        pcm.direction = audio::Direction::Inbound;
        pcm.sample_rate = options_.pcm_sample_rate;
        pcm.samples = upsampler_.process(ready.samples);
        if (inbound_.try_push(std::move(pcm)) == pipeline::PushResult::DroppedOldest &&
            !inbound_overflow_.exchange(true)) {
            log_.warn("Inbound audio queue overflow, dropping oldest frames");
            Metrics::instance().increment("inbound_overflow");
        }
    }
}

void MediaStreamTransport::on_stop() {
    log_.info("Media stream stopped",
              {kv("late_frames", jitter_.late_frames()),
               kv("filled_frames", jitter_.filled_frames())});
    finish_inbound();
}

void MediaStreamTransport::finish_inbound() {
    std::lock_guard<std::mutex> lock(inbound_mutex_);
    if (inbound_finished_) {
        return;
    }
    inbound_finished_ = true;
    for (auto& ready : jitter_.flush()) {
        audio::AudioFrame pcm;
        pcm.sequence = ready.sequence;
        pcm.sample_rate = options_.pcm_sample_rate;
        pcm.samples = upsampler_.process(ready.samples);
        inbound_.try_push(std::move(pcm));
    }
    inbound_.close();
}

std::optional<audio::AudioFrame> MediaStreamTransport::receive() {
    return inbound_.pop();
}

void MediaStreamTransport::send(audio::AudioFrame frame) {
    if (!open_) {
        return;
    }
    outbound_.push(std::move(frame));
}

void MediaStreamTransport::clear() {
    std::lock_guard<std::mutex> lock(write_mutex_);
    ++clear_generation_;
    const auto removed = outbound_.clear();
    if (!open_ || !started_) {
        return;
    }
    send_json({{"event", "clear"}, {"streamSid", stream_sid()}});
    log_.debug("Outbound audio cleared", {kv("frames", removed)});
}

void MediaStreamTransport::close() {
    if (closed_.exchange(true)) {
        return;
    }
    open_ = false;
    finish_inbound();
    outbound_.close();
    if (writer_.joinable()) {
        if (writer_.get_id() == std::this_thread::get_id()) {
            writer_.detach();
        } else {
            writer_.join();
        }
    }
    if (close_connection_) {
        close_connection_();
    }
    log_.info("Media stream transport closed", {kv("dropped_frames", outbound_.dropped())});
}

bool MediaStreamTransport::is_open() const {
    return open_;
}

bool MediaStreamTransport::degraded() const {
    return outbound_.degraded();
}

TransportInfo MediaStreamTransport::info() const {
    std::lock_guard<std::mutex> lock(info_mutex_);
    return info_;
}

void MediaStreamTransport::hangup() {
    const auto call_sid = info().call_id;
    if (telephony_ && !call_sid.empty()) {
        telephony_->hangup_call(call_sid);
        return;
    }
    log_.info("No telephony client, closing stream to end the call");
    close();
}

void MediaStreamTransport::transfer(const std::string& target) {
    const auto call_sid = info().call_id;
    if (!telephony_ || call_sid.empty()) {
        throw TransportError("Call transfer requires a configured telephony client");
    }
    telephony_->transfer_call(call_sid, target);
}

void MediaStreamTransport::writer_loop() {
    const auto sid = stream_sid();
    while (true) {
        const auto generation = clear_generation_.load();
        auto frame = outbound_.pop();
        if (!frame) {
            break;
        }
        const auto encoded = audio::encode_ulaw(frame->samples);
        const auto payload = websocketpp::base64_encode(
            reinterpret_cast<const unsigned char*>(encoded.data()), encoded.size());
        std::lock_guard<std::mutex> lock(write_mutex_);
        if (generation != clear_generation_.load()) {
            continue;
        }
        if (!send_json({{"event", "media"},
                        {"streamSid", sid},
                        {"media", {{"payload", payload}}}})) {
            break;
        }
    }
}

bool MediaStreamTransport::send_json(const nlohmann::json& message) {
    if (!sender_) {
        return false;
    }
    if (!sender_(message.dump())) {
        if (open_.exchange(false)) {
            log_.warn("Media stream send failed, connection lost");
        }
        return false;
    }
    return true;
}

std::string MediaStreamTransport::stream_sid() const {
    std::lock_guard<std::mutex> lock(info_mutex_);
    return info_.stream_id;
}

}
