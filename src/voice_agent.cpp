#include "voice_api.hpp"

#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "internal/assets/asset_downloader.hpp"
#include "internal/audio/audio_processor.hpp"
#include "internal/capabilities/capability.hpp"
#include "internal/pipeline/resource_arbiter.hpp"
#include "internal/pipeline/session_orchestrator.hpp"
#include "internal/runtime/onnx_session.hpp"
#include "internal/synthesis/voice_style_store.hpp"
#include "internal/voice_config.hpp"
#include "internal/voice_types.hpp"

namespace Parley {

const char* AgentStateToString(AgentState state) {
    switch (state) {
        case AgentState::IDLE:         return "idle";
        case AgentState::TRANSCRIBING: return "transcribing";
        case AgentState::GENERATING:   return "generating";
        case AgentState::SYNTHESIZING: return "synthesizing";
        case AgentState::ERROR:        return "error";
        default:                       return "unknown";
    }
}

namespace {

AgentState convertState(voice::TurnState state) {
    switch (state) {
        case voice::TurnState::TRANSCRIBING: return AgentState::TRANSCRIBING;
        case voice::TurnState::GENERATING:   return AgentState::GENERATING;
        case voice::TurnState::SYNTHESIZING: return AgentState::SYNTHESIZING;
        case voice::TurnState::ERROR:        return AgentState::ERROR;
        case voice::TurnState::IDLE:
        default:                             return AgentState::IDLE;
    }
}

voice::AgentConfig convertConfig(const VoiceAgentConfig& cfg) {
    voice::AgentConfig config;
    config.model_dir = cfg.model_dir;
    config.auto_download = cfg.auto_download;
    config.mirror_base_url = cfg.mirror_url;
    config.transcription_language = cfg.transcription_language;
    config.system_prompt = cfg.system_prompt;
    config.max_new_tokens = cfg.max_new_tokens;

    config.synthesis.voice = cfg.voice;
    config.synthesis.language = cfg.language;
    config.synthesis.rate_factor = cfg.speech_rate;
    config.synthesis.total_steps = cfg.total_steps;
    config.synthesis.seed = cfg.seed;

    config.runtime = cfg.low_memory ? voice::RuntimeConfig::LowMemory() : voice::RuntimeConfig::Default();
    config.runtime = config.runtime.withThreads(cfg.num_threads);
    return config;
}

}  // namespace

// =============================================================================
// CallbackAdapter - 内部事件 -> 公共回调
// =============================================================================

class CallbackAdapter : public voice::IVoiceCallback {
public:
    void setCallback(std::shared_ptr<VoiceAgentCallback> callback) {
        std::lock_guard<std::mutex> lock(mutex_);
        callback_ = std::move(callback);
    }

    std::string lastError() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_error_;
    }

    void recordError(const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex_);
        last_error_ = message;
    }

    void onProgress(const std::string& file, float percent) override {
        if (auto cb = get()) cb->OnProgress(file, percent);
    }

    void onPartial(const std::string& text) override {
        if (auto cb = get()) cb->OnPartial(text);
    }

    void onAudioChunk(const voice::AudioChunk& chunk) override {
        if (auto cb = get()) cb->OnAudioChunk(chunk.samples, chunk.sample_rate);
    }

    void onComplete(const std::string& payload) override {
        if (auto cb = get()) cb->OnComplete(payload);
    }

    void onError(const voice::ErrorInfo& error) override {
        recordError(error.message);
        if (auto cb = get()) cb->OnError(voice::errorCodeToString(error.code), error.message);
    }

    void onStatus(voice::TurnState state) override {
        if (auto cb = get()) cb->OnStatus(convertState(state));
    }

private:
    std::shared_ptr<VoiceAgentCallback> get() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return callback_;
    }

    std::shared_ptr<VoiceAgentCallback> callback_;
    std::string last_error_;
    mutable std::mutex mutex_;
};

// =============================================================================
// VoiceAgent::Impl
// =============================================================================

struct VoiceAgent::Impl {
    VoiceAgentConfig public_config;
    voice::AgentConfig config;

    voice::OnnxRuntime runtime;
    voice::ResourceArbiter arbiter;
    CallbackAdapter adapter;
    std::unique_ptr<voice::SessionOrchestrator> orchestrator;
    bool ready = false;
    std::string init_error;

    bool init(const VoiceAgentConfig& cfg, const AgentProviders& providers) {
        public_config = cfg;
        config = convertConfig(cfg);

        auto err = config.validate();
        if (!err.isOk()) {
            init_error = err.message;
            fail(err);
            return false;
        }

        err = runtime.initialize(config.runtime);
        if (!err.isOk()) {
            init_error = err.message;
            fail(err);
            return false;
        }

        voice::RuntimeProviders runtime_providers;
        if (providers.recognizer) {
            auto make = providers.recognizer;
            runtime_providers.recognizer = [make](const voice::AgentConfig&,
                                                  const voice::ProgressCallback&,
                                                  std::unique_ptr<voice::ISpeechRecognizer>& out) {
                out = make();
                return voice::ErrorInfo::ok();
            };
        }
        if (providers.generator) {
            auto make = providers.generator;
            runtime_providers.generator = [make](const voice::AgentConfig&,
                                                 const voice::ProgressCallback&,
                                                 std::unique_ptr<voice::ITextGenerator>& out) {
                out = make();
                return voice::ErrorInfo::ok();
            };
        }
        runtime_providers.sessions = runtime.sessionFactory();

        CallbackAdapter* sink = &adapter;
        voice::ProgressCallback progress = [sink](const std::string& file, float percent) {
            sink->onProgress(file, percent);
        };

        auto setups = voice::CapabilitySetups::fromProviders(config, runtime_providers, progress);
        if (config.auto_download) {
            auto load_synthesis = setups.synthesis;
            voice::AgentConfig cfg_copy = config;
            setups.synthesis = [load_synthesis, cfg_copy, progress](
                    std::unique_ptr<voice::ICapability>& out) {
                voice::AssetDownloader downloader(cfg_copy.getExpandedModelDir(),
                                                  cfg_copy.mirror_base_url);
                auto dl_err = downloader.ensureAssets(cfg_copy.synthesis.voice, progress);
                if (!dl_err.isOk()) {
                    return dl_err;
                }
                return load_synthesis(out);
            };
        }

        orchestrator = std::make_unique<voice::SessionOrchestrator>(arbiter, std::move(setups), config);
        orchestrator->setCallback(&adapter);

        std::cout << "[VoiceAgent] Ready (model_dir=" << config.getExpandedModelDir()
                  << ", voice=" << config.synthesis.voice << ")" << std::endl;
        ready = true;
        return true;
    }

    void fail(const voice::ErrorInfo& err) {
        std::cerr << "[VoiceAgent] " << voice::errorCodeToString(err.code) << ": "
                  << err.message << std::endl;
        adapter.onError(err);
    }

    bool checkReady() {
        if (!ready) {
            fail(voice::ErrorInfo::error(voice::ErrorCode::NOT_INITIALIZED,
                "Voice agent failed to initialize: " + init_error));
            return false;
        }
        return true;
    }
};

// =============================================================================
// VoiceAgent
// =============================================================================

VoiceAgent::VoiceAgent(const VoiceAgentConfig& config, const AgentProviders& providers)
    : impl_(std::make_unique<Impl>()) {
    impl_->init(config, providers);
}

VoiceAgent::~VoiceAgent() {
    if (impl_->orchestrator) {
        impl_->orchestrator->interrupt();
        impl_->orchestrator->waitIdle();
    }
}

void VoiceAgent::SetCallback(std::shared_ptr<VoiceAgentCallback> callback) {
    impl_->adapter.setCallback(std::move(callback));
}

bool VoiceAgent::IsReady() const {
    return impl_->ready;
}

bool VoiceAgent::Transcribe(const std::vector<float>& audio, int sample_rate,
                            const std::string& language, std::string* text) {
    if (!impl_->checkReady()) return false;

    std::string result;
    auto err = impl_->orchestrator->transcribe(audio, sample_rate, language, result);
    if (!err.isOk()) return false;
    if (text) *text = result;
    return true;
}

bool VoiceAgent::Generate(const std::vector<Message>& conversation, std::string* reply) {
    if (!impl_->checkReady()) return false;

    voice::Conversation messages;
    messages.reserve(conversation.size());
    for (const auto& m : conversation) {
        messages.push_back({m.role, m.content});
    }

    std::string result;
    auto err = impl_->orchestrator->generate(messages, result);
    if (!err.isOk()) return false;
    if (reply) *reply = result;
    return true;
}

bool VoiceAgent::Synthesize(const std::string& text, const std::string& voice) {
    if (!impl_->checkReady()) return false;

    voice::SpeakResult result;
    auto err = impl_->orchestrator->synthesize(text, voice, result);
    return err.isOk();
}

bool VoiceAgent::SynthesizeToFile(const std::string& text, const std::string& file_path,
                                  const std::string& voice) {
    if (!impl_->checkReady()) return false;

    std::vector<float> samples;
    voice::SpeakResult result;
    auto err = impl_->orchestrator->synthesize(text, voice, result,
        [&samples](const voice::AudioChunk& chunk) {
            samples.insert(samples.end(), chunk.samples.begin(), chunk.samples.end());
        });
    if (!err.isOk()) return false;

    if (!result.spoken) {
        impl_->adapter.recordError(result.message);
        return false;
    }

    err = voice::audio::writeWav(file_path, samples, result.sample_rate);
    if (!err.isOk()) {
        impl_->fail(err);
        return false;
    }
    std::cout << "[VoiceAgent] Wrote " << samples.size() << " samples to " << file_path << std::endl;
    return true;
}

void VoiceAgent::Preload() {
    if (!impl_->checkReady()) return;
    auto err = impl_->orchestrator->preload();
    if (!err.isOk()) {
        impl_->fail(err);
    }
}

void VoiceAgent::Interrupt() {
    if (impl_->orchestrator) impl_->orchestrator->interrupt();
}

void VoiceAgent::Reset() {
    if (impl_->orchestrator) impl_->orchestrator->reset();
}

bool VoiceAgent::ProcessAudio(const std::vector<float>& audio, int sample_rate) {
    if (!impl_->checkReady()) return false;
    return impl_->orchestrator->submitAudio(audio, sample_rate);
}

void VoiceAgent::WaitIdle() {
    if (impl_->orchestrator) impl_->orchestrator->waitIdle();
}

AgentState VoiceAgent::GetState() const {
    if (!impl_->orchestrator) return AgentState::ERROR;
    return convertState(impl_->orchestrator->getState());
}

std::vector<Message> VoiceAgent::GetHistory() const {
    std::vector<Message> out;
    if (!impl_->orchestrator) return out;
    for (const auto& m : impl_->orchestrator->getHistory()) {
        out.push_back({m.role, m.content});
    }
    return out;
}

std::vector<std::string> VoiceAgent::ListVoices() const {
    voice::VoiceStyleStore store(impl_->config.getVoiceStyleDir());
    return store.listVoices();
}

std::string VoiceAgent::GetLastError() const {
    return impl_->adapter.lastError();
}

VoiceAgentConfig VoiceAgent::GetConfig() const {
    return impl_->public_config;
}

}  // namespace Parley
