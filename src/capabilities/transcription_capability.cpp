#include "internal/capabilities/transcription_capability.hpp"

#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "internal/audio/audio_processor.hpp"
#include "internal/text/text_utils.hpp"

namespace voice {

namespace {

const char* const NO_SPEECH_MESSAGE = "No meaningful speech detected.";

// Removes every (...) and [...] group; unbalanced openers drop the rest of the text
std::string stripAnnotations(const std::string& text) {
    std::string out;
    char closing = 0;
    for (char c : text) {
        if (closing) {
            if (c == closing) closing = 0;
            continue;
        }
        if (c == '(') {
            closing = ')';
        } else if (c == '[') {
            closing = ']';
        } else {
            out += c;
        }
    }
    return out;
}

}  // namespace

ErrorInfo TranscriptionCapability::create(const AgentConfig& config,
                                          const RecognizerFactory& factory,
                                          const ProgressCallback& progress,
                                          std::unique_ptr<TranscriptionCapability>& out) {
    if (!factory) {
        return ErrorInfo::error(ErrorCode::NOT_INITIALIZED,
            "No speech recognizer provider configured");
    }

    std::cout << "[Transcription] Loading " << config.transcription_model << std::endl;

    std::unique_ptr<ISpeechRecognizer> recognizer;
    auto err = factory(config, progress, recognizer);
    if (!err.isOk()) {
        return err;
    }
    if (!recognizer) {
        return ErrorInfo::error(ErrorCode::MODEL_NOT_FOUND,
            "Recognizer provider returned no engine for " + config.transcription_model);
    }

    out = std::make_unique<TranscriptionCapability>(std::move(recognizer), config);
    return ErrorInfo::ok();
}

TranscriptionCapability::TranscriptionCapability(std::unique_ptr<ISpeechRecognizer> recognizer,
                                                 const AgentConfig& config)
    : recognizer_(std::move(recognizer)),
      default_language_(config.transcription_language),
      target_sample_rate_(config.transcription_sample_rate),
      min_chars_(config.min_transcript_chars) {
}

TranscriptionCapability::~TranscriptionCapability() {
    dispose();
}

bool TranscriptionCapability::isValid() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return recognizer_ != nullptr;
}

ErrorInfo TranscriptionCapability::dispose() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (recognizer_) {
        recognizer_->release();
        recognizer_.reset();
    }
    return ErrorInfo::ok();
}

ErrorInfo TranscriptionCapability::transcribe(const std::vector<float>& audio,
                                              int sample_rate,
                                              const std::string& language,
                                              const TextCallback& on_update,
                                              std::string& text) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!recognizer_) {
        return ErrorInfo::error(ErrorCode::NOT_INITIALIZED, "Transcription capability was disposed");
    }
    if (sample_rate <= 0) {
        return ErrorInfo::error(ErrorCode::INVALID_CONFIG,
            "Invalid input sample rate: " + std::to_string(sample_rate));
    }
    if (audio.empty()) {
        return ErrorInfo::error(ErrorCode::NO_SPEECH, NO_SPEECH_MESSAGE);
    }

    std::vector<float> input = audio::resampleAudio(audio, sample_rate, target_sample_rate_);
    std::cout << "[Transcription] " << input.size() << " samples @ " << target_sample_rate_
              << "Hz, rms=" << audio::calculateRMS(input) << std::endl;

    std::string raw;
    auto err = recognizer_->transcribe(input,
                                       language.empty() ? default_language_ : language,
                                       on_update, raw);
    if (!err.isOk()) {
        return err;
    }

    std::string result = text::trim(raw);
    if (isNoSpeech(result, min_chars_)) {
        std::cout << "[Transcription] Discarded: \"" << result << "\"" << std::endl;
        return ErrorInfo::error(ErrorCode::NO_SPEECH, NO_SPEECH_MESSAGE);
    }

    text = result;
    return ErrorInfo::ok();
}

bool TranscriptionCapability::isNoSpeech(const std::string& text, int min_chars) {
    std::string trimmed = text::trim(text);
    if (trimmed.empty()) {
        return true;
    }
    if (static_cast<int>(text::decodeUtf8(trimmed).size()) < min_chars) {
        return true;
    }
    return text::trim(stripAnnotations(trimmed)).empty();
}

}  // namespace voice
