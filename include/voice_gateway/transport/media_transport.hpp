#pragma once

#include <map>
#include <optional>
#include <string>

#include "voice_gateway/audio/frame.hpp"

namespace voice_gateway {
namespace transport {

class CallControl {
public:
    virtual ~CallControl() = default;

    virtual void hangup() = 0;
    virtual void transfer(const std::string& target) = 0;
};

struct TransportInfo {
    std::string call_id;
    std::string stream_id;
    std::string caller;
    std::string callee;
    std::map<std::string, std::string> parameters;
};

// One bidirectional call audio stream. Inbound frames are PCM at
// inbound_sample_rate(); outbound frames must be at outbound_sample_rate().
class MediaTransport : public CallControl {
public:
    // Blocks until a frame arrives. Returns nullopt once the stream is closed and
    // every buffered frame has been delivered.
    virtual std::optional<audio::AudioFrame> receive() = 0;

    // Never blocks. Under sustained overflow the oldest queued frame is dropped and
    // the transport reports degraded().
    virtual void send(audio::AudioFrame frame) = 0;

    // Drops queued outbound audio and asks the far end to flush its playback buffer.
    virtual void clear() = 0;

    virtual void close() = 0;
    virtual bool is_open() const = 0;
    virtual bool degraded() const = 0;

    virtual TransportInfo info() const = 0;
    virtual int inbound_sample_rate() const = 0;
    virtual int outbound_sample_rate() const = 0;
    virtual std::string connection_id() const = 0;
};

}
}
