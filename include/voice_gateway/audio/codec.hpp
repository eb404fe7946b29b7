#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace voice_gateway {
namespace audio {

uint8_t linear_to_ulaw(int16_t sample);
int16_t ulaw_to_linear(uint8_t value);

// Payload bytes are raw G.711 mu-law, one byte per sample.
std::vector<int16_t> decode_ulaw(const std::string& payload);
std::string encode_ulaw(const std::vector<int16_t>& samples);

std::vector<float> to_float(const std::vector<int16_t>& samples);
double rms(const std::vector<int16_t>& samples);

// Linear-interpolation resampler that keeps phase across calls, so a stream can be
// converted chunk by chunk without clicks at chunk boundaries.
class Resampler {
public:
    Resampler(int from_rate, int to_rate);

    std::vector<int16_t> process(const std::vector<int16_t>& input);
    void reset();

    int from_rate() const { return from_rate_; }
    int to_rate() const { return to_rate_; }

private:
    int from_rate_;
    int to_rate_;
    double step_;
    double position_ = 0.0;
    int16_t previous_ = 0;
    bool has_previous_ = false;
};

}
}
