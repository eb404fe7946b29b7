#include "voice_gateway/vad/model.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <stdexcept>

#include "voice_gateway/logging.hpp"
#include "voice_gateway/utils/http.hpp"

#ifdef VOICEGATEWAY_HAS_ONNX
#include <onnxruntime_cxx_api.h>
#endif

namespace voice_gateway::vad {

namespace {

std::vector<float> normalize_window(const std::vector<int16_t>& window) {
    std::vector<float> audio;
    audio.reserve(window.size());
    float peak = 0.0f;
    for (auto sample : window) {
        const float value = static_cast<float>(sample) / 32768.0f;
        peak = std::max(peak, std::abs(value));
        audio.push_back(value);
    }
    // Very quiet lines are scaled up so the model sees a usable level.
    if (peak > 0.0f && peak < 0.01f) {
        for (auto& value : audio) {
            value /= peak;
        }
    }
    return audio;
}

}

#ifdef VOICEGATEWAY_HAS_ONNX

namespace {

Ort::Env& ort_env() {
    static Ort::Env env(ORT_LOGGING_LEVEL_WARNING, "voice_gateway_vad");
    return env;
}

std::vector<std::string> node_names(const Ort::Session& session, bool inputs) {
    Ort::AllocatorWithDefaultOptions allocator;
    const size_t count = inputs ? session.GetInputCount() : session.GetOutputCount();
    std::vector<std::string> names;
    names.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        auto name = inputs ? session.GetInputNameAllocated(i, allocator)
                           : session.GetOutputNameAllocated(i, allocator);
        names.emplace_back(name ? name.get() : "");
    }
    return names;
}

bool contains(const std::vector<std::string>& names, const std::string& needle) {
    return std::find(names.begin(), names.end(), needle) != names.end();
}

}

struct SileroModel::Impl {
    Ort::Session session;
    int sampling_rate;
    bool has_sr;
    bool has_state;
    bool has_state_out;

    Impl(const std::filesystem::path& model_path, int rate)
        : session(ort_env(), model_path.string().c_str(), Ort::SessionOptions{}),
          sampling_rate(rate) {
        const auto inputs = node_names(session, true);
        const auto outputs = node_names(session, false);
        if (!contains(inputs, "input") || !contains(outputs, "output")) {
            throw std::runtime_error("Silero model is missing its input/output nodes");
        }
        has_sr = contains(inputs, "sr");
        has_state = contains(inputs, "state");
        has_state_out = contains(outputs, "stateN");
    }
};

SileroModel::SileroModel(const std::filesystem::path& model_path, int sampling_rate)
    : impl_(std::make_unique<Impl>(model_path, sampling_rate)) {
    if (sampling_rate != 8000 && sampling_rate != 16000) {
        throw std::runtime_error("Silero VAD supports 8000 or 16000 Hz only");
    }
}

SileroModel::~SileroModel() = default;

int SileroModel::sampling_rate() const {
    return impl_->sampling_rate;
}

std::vector<float> SileroModel::initialize_state() const {
    if (!impl_->has_state) {
        return {};
    }
    return std::vector<float>(2 * 1 * 128, 0.0f);
}

float SileroModel::get_speech_prob(const std::vector<float>& audio,
                                   std::vector<float>* state) const {
    if (audio.empty()) {
        return 0.0f;
    }
    auto mem_info = Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);

    std::vector<const char*> input_names{"input"};
    std::vector<Ort::Value> inputs;
    std::array<int64_t, 2> input_shape{1, static_cast<int64_t>(audio.size())};
    inputs.emplace_back(Ort::Value::CreateTensor<float>(
        mem_info, const_cast<float*>(audio.data()), audio.size(),
        input_shape.data(), input_shape.size()));

    std::array<int64_t, 1> sr_shape{1};
    std::array<int64_t, 1> sr_value{impl_->sampling_rate};
    if (impl_->has_sr) {
        input_names.push_back("sr");
        inputs.emplace_back(Ort::Value::CreateTensor<int64_t>(
            mem_info, sr_value.data(), sr_value.size(), sr_shape.data(), sr_shape.size()));
    }

    std::array<int64_t, 3> state_shape{2, 1, 128};
    std::vector<float> local_state;
    if (impl_->has_state) {
        local_state = (state && !state->empty()) ? *state : initialize_state();
        input_names.push_back("state");
        inputs.emplace_back(Ort::Value::CreateTensor<float>(
            mem_info, local_state.data(), local_state.size(),
            state_shape.data(), state_shape.size()));
    }

    std::vector<const char*> output_names{"output"};
    if (impl_->has_state_out) {
        output_names.push_back("stateN");
    }

    auto outputs = impl_->session.Run(Ort::RunOptions{nullptr},
                                      input_names.data(), inputs.data(), inputs.size(),
                                      output_names.data(), output_names.size());

    float prob = 0.0f;
    if (!outputs.empty() && outputs[0].IsTensor()) {
        const auto* data = outputs[0].GetTensorData<float>();
        prob = data ? data[0] : 0.0f;
    }
    if (state && impl_->has_state_out && outputs.size() > 1 && outputs[1].IsTensor()) {
        const auto* data = outputs[1].GetTensorData<float>();
        const auto count = outputs[1].GetTensorTypeAndShapeInfo().GetElementCount();
        if (data && count > 0) {
            state->assign(data, data + count);
        }
    }
    return prob;
}

#else

struct SileroModel::Impl {
    int sampling_rate = 16000;
};

SileroModel::SileroModel(const std::filesystem::path&, int) {
    throw std::runtime_error("Silero VAD requires a build with ONNX Runtime");
}

SileroModel::~SileroModel() = default;

int SileroModel::sampling_rate() const {
    return impl_->sampling_rate;
}

std::vector<float> SileroModel::initialize_state() const {
    return {};
}

float SileroModel::get_speech_prob(const std::vector<float>&, std::vector<float>*) const {
    return 0.0f;
}

#endif

size_t SileroModel::window_samples() const {
    return sampling_rate() == 8000 ? 256 : 512;
}

std::shared_ptr<SileroModel> SileroModel::load(const std::filesystem::path& model_path,
                                               const std::string& model_url,
                                               int sampling_rate) {
    if (!std::filesystem::exists(model_path)) {
        if (model_url.empty()) {
            throw std::runtime_error("VAD model not found: " + model_path.string());
        }
        logging::info("Downloading VAD model",
                      {kv("url", model_url), kv("path", model_path.string())});
        if (!utils::download_file(model_url, model_path)) {
            throw std::runtime_error("Failed to download VAD model from " + model_url);
        }
    }
    auto model = std::make_shared<SileroModel>(model_path, sampling_rate);
    logging::info("VAD model loaded",
                  {kv("path", model_path.string()), kv("sampling_rate", sampling_rate)});
    return model;
}

SileroDetector::SileroDetector(std::shared_ptr<SileroModel> model)
    : model_(std::move(model)),
      state_(model_->initialize_state()) {}

float SileroDetector::speech_probability(const std::vector<int16_t>& window) {
    return model_->get_speech_prob(normalize_window(window), &state_);
}

void SileroDetector::reset() {
    state_ = model_->initialize_state();
}

size_t SileroDetector::window_samples() const {
    return model_->window_samples();
}

int SileroDetector::sampling_rate() const {
    return model_->sampling_rate();
}

}
