#include "internal/pipeline/session_orchestrator.hpp"

#include <exception>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace voice {

// =============================================================================
// CapabilitySetups
// =============================================================================

const CapabilitySetup& CapabilitySetups::forKind(CapabilityKind kind) const {
    switch (kind) {
        case CapabilityKind::TRANSCRIPTION: return transcription;
        case CapabilityKind::GENERATION:    return generation;
        case CapabilityKind::SYNTHESIS:
        default:                            return synthesis;
    }
}

CapabilitySetups CapabilitySetups::fromProviders(const AgentConfig& config,
                                                 const RuntimeProviders& providers,
                                                 const ProgressCallback& progress) {
    CapabilitySetups setups;

    setups.transcription = [config, providers, progress](std::unique_ptr<ICapability>& out) {
        std::unique_ptr<TranscriptionCapability> cap;
        auto err = TranscriptionCapability::create(config, providers.recognizer, progress, cap);
        if (err.isOk()) out = std::move(cap);
        return err;
    };

    setups.generation = [config, providers, progress](std::unique_ptr<ICapability>& out) {
        std::unique_ptr<GenerationCapability> cap;
        auto err = GenerationCapability::create(config, providers.generator, progress, cap);
        if (err.isOk()) out = std::move(cap);
        return err;
    };

    setups.synthesis = [config, providers, progress](std::unique_ptr<ICapability>& out) {
        std::unique_ptr<SynthesisCapability> cap;
        auto err = SynthesisCapability::create(config, providers.sessions, progress, cap);
        if (err.isOk()) out = std::move(cap);
        return err;
    };

    return setups;
}

// =============================================================================
// SessionOrchestrator
// =============================================================================

SessionOrchestrator::SessionOrchestrator(ResourceArbiter& arbiter,
                                         CapabilitySetups setups,
                                         const AgentConfig& config)
    : arbiter_(arbiter),
      setups_(std::move(setups)),
      config_(config) {
}

SessionOrchestrator::~SessionOrchestrator() {
    interrupt();
    waitIdle();
}

void SessionOrchestrator::setCallback(IVoiceCallback* callback) {
    callback_ = callback;
}

template <typename T>
ErrorInfo SessionOrchestrator::acquireAs(CapabilityKind kind, T*& out) {
    ICapability* cap = nullptr;
    auto err = arbiter_.acquire(kind, setups_.forKind(kind), cap);
    if (!err.isOk()) {
        return err;
    }
    out = dynamic_cast<T*>(cap);
    if (!out) {
        return ErrorInfo::error(ErrorCode::INTERNAL_ERROR,
            std::string("Resident capability has unexpected type: ") + capabilityKindToString(kind));
    }
    return ErrorInfo::ok();
}

// -----------------------------------------------------------------------------
// 完整轮次
// -----------------------------------------------------------------------------

bool SessionOrchestrator::submitAudio(std::vector<float> audio, int sample_rate) {
    if (!turn_mutex_.tryLock()) {
        std::cout << "[Orchestrator] Busy, dropping " << audio.size() << " samples" << std::endl;
        return false;
    }

    std::lock_guard<std::mutex> lock(worker_mutex_);
    if (worker_.joinable()) {
        worker_.join();
    }
    worker_ = std::thread([this, audio = std::move(audio), sample_rate]() {
        try {
            auto err = executeTurn(audio, sample_rate);
            if (!err.isOk()) {
                std::cerr << "[Orchestrator] Turn ended: " << err.message << std::endl;
            }
        } catch (const std::exception& e) {
            reportFailure(ErrorInfo::error(ErrorCode::INTERNAL_ERROR, e.what()));
        }
        turn_mutex_.unlock();
    });
    return true;
}

ErrorInfo SessionOrchestrator::runTurn(const std::vector<float>& audio, int sample_rate) {
    return turn_mutex_.runExclusive([&]() { return executeTurn(audio, sample_rate); });
}

void SessionOrchestrator::waitIdle() {
    std::lock_guard<std::mutex> lock(worker_mutex_);
    if (worker_.joinable()) {
        worker_.join();
    }
}

ErrorInfo SessionOrchestrator::executeTurn(const std::vector<float>& audio, int sample_rate) {
    std::string transcript;
    auto err = transcribeStage(audio, sample_rate, config_.transcription_language, transcript);
    if (!err.isOk()) {
        reportFailure(err);
        return err;
    }

    Conversation conversation = getHistory();
    conversation.push_back(ChatMessage::user(transcript));

    std::string reply;
    err = generateStage(conversation, reply);
    if (!err.isOk()) {
        reportFailure(err);
        return err;
    }

    SpeakResult spoken;
    err = synthesizeStage(reply, config_.synthesis.voice, spoken, nullptr);
    if (!err.isOk()) {
        reportFailure(err);
        return err;
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        history_.push_back(ChatMessage::user(transcript));
        history_.push_back(ChatMessage::assistant(reply));
    }
    if (callback_) callback_->onComplete(reply);
    setState(TurnState::IDLE);
    return ErrorInfo::ok();
}

// -----------------------------------------------------------------------------
// 阶段
// -----------------------------------------------------------------------------

ErrorInfo SessionOrchestrator::transcribeStage(const std::vector<float>& audio, int sample_rate,
                                               const std::string& language, std::string& text) {
    setState(TurnState::TRANSCRIBING);

    TranscriptionCapability* stt = nullptr;
    auto err = acquireAs(CapabilityKind::TRANSCRIPTION, stt);
    if (!err.isOk()) {
        return err;
    }

    TextCallback on_update;
    if (callback_) {
        on_update = [this](const std::string& partial) { callback_->onPartial(partial); };
    }
    err = stt->transcribe(audio, sample_rate, language, on_update, text);
    if (err.isOk()) {
        std::cout << "[Orchestrator] Heard: \"" << text << "\"" << std::endl;
    }
    return err;
}

ErrorInfo SessionOrchestrator::generateStage(const Conversation& conversation, std::string& reply) {
    setState(TurnState::GENERATING);

    GenerationCapability* llm = nullptr;
    auto err = acquireAs(CapabilityKind::GENERATION, llm);
    if (!err.isOk()) {
        return err;
    }

    TextCallback on_token;
    if (callback_) {
        on_token = [this](const std::string& fragment) { callback_->onPartial(fragment); };
    }

    {
        std::lock_guard<std::mutex> lock(active_mutex_);
        active_generation_ = llm;
    }
    err = llm->generate(conversation, on_token, reply);
    {
        std::lock_guard<std::mutex> lock(active_mutex_);
        active_generation_ = nullptr;
    }
    return err;
}

ErrorInfo SessionOrchestrator::synthesizeStage(const std::string& text, const std::string& voice,
                                               SpeakResult& result, const AudioCallback& extra_sink) {
    setState(TurnState::SYNTHESIZING);

    SynthesisCapability* tts = nullptr;
    auto err = acquireAs(CapabilityKind::SYNTHESIS, tts);
    if (!err.isOk()) {
        return err;
    }

    AudioCallback on_chunk = [this, &extra_sink](const AudioChunk& chunk) {
        if (callback_) callback_->onAudioChunk(chunk);
        if (extra_sink) extra_sink(chunk);
    };
    return tts->speak(text, voice, on_chunk, result);
}

// -----------------------------------------------------------------------------
// 单步命令
// -----------------------------------------------------------------------------

ErrorInfo SessionOrchestrator::transcribe(const std::vector<float>& audio, int sample_rate,
                                          const std::string& language, std::string& text) {
    return turn_mutex_.runExclusive([&]() {
        auto err = transcribeStage(audio, sample_rate, language, text);
        if (!err.isOk()) {
            reportFailure(err);
            return err;
        }
        if (callback_) callback_->onComplete(text);
        setState(TurnState::IDLE);
        return err;
    });
}

ErrorInfo SessionOrchestrator::generate(const Conversation& conversation, std::string& reply) {
    return turn_mutex_.runExclusive([&]() {
        auto err = generateStage(conversation, reply);
        if (!err.isOk()) {
            reportFailure(err);
            return err;
        }
        if (callback_) callback_->onComplete(reply);
        setState(TurnState::IDLE);
        return err;
    });
}

ErrorInfo SessionOrchestrator::synthesize(const std::string& text, const std::string& voice,
                                          SpeakResult& result, const AudioCallback& on_chunk) {
    return turn_mutex_.runExclusive([&]() {
        auto err = synthesizeStage(text, voice, result, on_chunk);
        if (!err.isOk()) {
            reportFailure(err);
            return err;
        }
        if (callback_) callback_->onComplete(result.message);
        setState(TurnState::IDLE);
        return err;
    });
}

ErrorInfo SessionOrchestrator::preload() {
    return turn_mutex_.runExclusive([&]() {
        const CapabilityKind kinds[] = {
            CapabilityKind::TRANSCRIPTION,
            CapabilityKind::GENERATION,
            CapabilityKind::SYNTHESIS,
        };
        int loaded = 0;
        for (CapabilityKind kind : kinds) {
            ICapability* cap = nullptr;
            auto err = arbiter_.acquire(kind, setups_.forKind(kind), cap);
            if (err.isOk()) {
                ++loaded;
            } else {
                std::cerr << "[Orchestrator] Preload of " << capabilityKindToString(kind)
                          << " failed: " << err.message << std::endl;
            }
            arbiter_.release();
        }

        std::cout << "[Orchestrator] Preloaded " << loaded << "/3 capabilities" << std::endl;
        if (callback_) callback_->onComplete("All models preloaded");
        return ErrorInfo::ok();
    });
}

void SessionOrchestrator::interrupt() {
    std::lock_guard<std::mutex> lock(active_mutex_);
    if (active_generation_) {
        active_generation_->interrupt();
    }
}

void SessionOrchestrator::reset() {
    turn_mutex_.runExclusive([&]() {
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            history_.clear();
        }

        CapabilityKind kind;
        if (arbiter_.residentKind(kind) && kind == CapabilityKind::GENERATION) {
            GenerationCapability* llm = nullptr;
            auto err = acquireAs(CapabilityKind::GENERATION, llm);
            if (err.isOk()) {
                llm->reset();
            } else {
                std::cerr << "[Orchestrator] Reset could not reach generation: "
                          << err.message << std::endl;
            }
        }
        setState(TurnState::IDLE);
    });
    std::cout << "[Orchestrator] Conversation reset" << std::endl;
}

// -----------------------------------------------------------------------------
// 状态
// -----------------------------------------------------------------------------

TurnState SessionOrchestrator::getState() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

Conversation SessionOrchestrator::getHistory() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return history_;
}

void SessionOrchestrator::setState(TurnState state) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ == state) return;
        state_ = state;
    }
    if (callback_) callback_->onStatus(state);
}

void SessionOrchestrator::reportFailure(const ErrorInfo& error) {
    std::cerr << "[Orchestrator] " << errorCodeToString(error.code) << ": " << error.message << std::endl;
    if (callback_) callback_->onError(error);
    bool benign = error.code == ErrorCode::NO_SPEECH || error.code == ErrorCode::INTERRUPTED;
    setState(benign ? TurnState::IDLE : TurnState::ERROR);
}

}  // namespace voice
