#include "internal/capabilities/synthesis_capability.hpp"

#include <iostream>
#include <memory>
#include <string>
#include <utility>

#include "internal/text/text_utils.hpp"

namespace voice {

ErrorInfo SynthesisCapability::create(const AgentConfig& config,
                                      const SessionFactory& factory,
                                      const ProgressCallback& progress,
                                      std::unique_ptr<SynthesisCapability>& out) {
    const std::string onnx_dir = config.getOnnxDir();
    std::cout << "[Synthesis] Loading models from " << onnx_dir << std::endl;

    ModelConfig model_config;
    auto err = ModelConfig::load(onnx_dir + "/tts.json", model_config);
    if (!err.isOk()) {
        return err;
    }
    if (progress) progress("tts.json", 100.0f);

    text::TextIndexer indexer;
    err = indexer.load(onnx_dir + "/unicode_indexer.json");
    if (!err.isOk()) {
        return err;
    }
    if (progress) progress("unicode_indexer.json", 100.0f);

    SynthesisSessions sessions;
    err = SynthesisSessions::load(factory, onnx_dir, progress, sessions);
    if (!err.isOk()) {
        return err;
    }

    auto synthesizer = std::make_unique<SpeechSynthesizer>(
        std::move(sessions), model_config, std::move(indexer));
    out = std::make_unique<SynthesisCapability>(
        std::move(synthesizer), config.getVoiceStyleDir(), config.synthesis);

    std::cout << "[Synthesis] Ready, sample rate " << model_config.sample_rate
              << "Hz, default voice " << config.synthesis.voice << std::endl;
    return ErrorInfo::ok();
}

SynthesisCapability::SynthesisCapability(std::unique_ptr<SpeechSynthesizer> synthesizer,
                                         const std::string& style_dir,
                                         const SynthesisOptions& defaults)
    : synthesizer_(std::move(synthesizer)),
      voices_(style_dir),
      defaults_(defaults) {
}

SynthesisCapability::~SynthesisCapability() {
    dispose();
}

bool SynthesisCapability::isValid() const {
    return synthesizer_ && synthesizer_->isReady();
}

ErrorInfo SynthesisCapability::dispose() {
    if (synthesizer_) {
        synthesizer_->release();
        synthesizer_.reset();
    }
    voices_.clear();
    return ErrorInfo::ok();
}

int SynthesisCapability::getSampleRate() const {
    return synthesizer_ ? synthesizer_->getSampleRate() : 0;
}

ErrorInfo SynthesisCapability::speak(const std::string& reply,
                                     const std::string& voice,
                                     const AudioCallback& on_chunk,
                                     SpeakResult& result) {
    SynthesisOptions options = defaults_;
    if (!voice.empty()) {
        options.voice = voice;
    }
    return speak(reply, options, on_chunk, result);
}

ErrorInfo SynthesisCapability::speak(const std::string& reply,
                                     const SynthesisOptions& options,
                                     const AudioCallback& on_chunk,
                                     SpeakResult& result) {
    if (!synthesizer_) {
        return ErrorInfo::error(ErrorCode::NOT_INITIALIZED, "Synthesis capability was disposed");
    }

    result = SpeakResult();
    result.sample_rate = synthesizer_->getSampleRate();

    std::string speakable = text::stripThinkBlocks(reply);
    if (speakable.empty()) {
        result.message = NOTHING_TO_SAY;
        std::cout << "[Synthesis] " << NOTHING_TO_SAY << std::endl;
        return ErrorInfo::ok();
    }

    std::shared_ptr<const VoiceStyle> style;
    auto err = voices_.get(options.voice, style);
    if (!err.isOk()) {
        return err;
    }

    err = synthesizer_->synthesize(speakable, *style, options, on_chunk, &result.diagnostics);
    if (!err.isOk()) {
        return err;
    }
    result.spoken = true;
    return ErrorInfo::ok();
}

}  // namespace voice
