#include "internal/synthesis/speech_synthesizer.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "internal/text/text_chunker.hpp"

namespace voice {

// =============================================================================
// SynthesisSessions
// =============================================================================

ErrorInfo SynthesisSessions::load(const SessionFactory& factory,
                                  const std::string& onnx_dir,
                                  const ProgressCallback& progress,
                                  SynthesisSessions& out) {
    if (!factory) {
        return ErrorInfo::error(ErrorCode::NOT_INITIALIZED, "No session factory");
    }

    struct Slot {
        const char* file;
        std::unique_ptr<IInferenceSession>* target;
    };
    SynthesisSessions loaded;
    const Slot slots[] = {
        {DURATION_PREDICTOR, &loaded.duration_predictor},
        {TEXT_ENCODER, &loaded.text_encoder},
        {VECTOR_ESTIMATOR, &loaded.vector_estimator},
        {VOCODER, &loaded.vocoder},
    };
    const size_t total = sizeof(slots) / sizeof(slots[0]);

    for (size_t i = 0; i < total; ++i) {
        std::string path = onnx_dir + "/" + slots[i].file;
        auto err = factory(path, *slots[i].target);
        if (!err.isOk()) {
            loaded.releaseAll();
            return err;
        }
        if (progress) {
            progress(slots[i].file, 100.0f * static_cast<float>(i + 1) / total);
        }
    }

    out = std::move(loaded);
    return ErrorInfo::ok();
}

void SynthesisSessions::releaseAll() {
    for (auto* s : {&duration_predictor, &text_encoder, &vector_estimator, &vocoder}) {
        if (*s) {
            (*s)->release();
            s->reset();
        }
    }
}

void SynthesisDiagnostics::mergeUnsupported(const std::vector<std::string>& chars) {
    for (const auto& c : chars) {
        if (std::find(unsupported_chars.begin(), unsupported_chars.end(), c) == unsupported_chars.end()) {
            unsupported_chars.push_back(c);
        }
    }
}

// =============================================================================
// SpeechSynthesizer
// =============================================================================

SpeechSynthesizer::SpeechSynthesizer(SynthesisSessions sessions,
                                     const ModelConfig& config,
                                     text::TextIndexer indexer)
    : sessions_(std::move(sessions)),
      config_(config),
      indexer_(std::move(indexer)) {
}

SpeechSynthesizer::~SpeechSynthesizer() {
    release();
}

void SpeechSynthesizer::release() {
    std::lock_guard<std::mutex> lock(synth_mutex_);
    sessions_.releaseAll();
}

bool SpeechSynthesizer::isReady() const {
    std::lock_guard<std::mutex> lock(synth_mutex_);
    return sessions_.complete() && indexer_.isLoaded();
}

ErrorInfo SpeechSynthesizer::synthesize(const std::string& text,
                                        const VoiceStyle& style,
                                        const SynthesisOptions& options,
                                        const AudioCallback& on_chunk,
                                        SynthesisDiagnostics* diagnostics) {
    auto err = options.validate();
    if (!err.isOk()) {
        return err;
    }
    if (style.batchSize() != 1) {
        return ErrorInfo::error(ErrorCode::INVALID_CONFIG,
            "Voice style must hold a single speaker for streaming synthesis");
    }

    std::lock_guard<std::mutex> lock(synth_mutex_);
    if (!sessions_.complete() || !indexer_.isLoaded()) {
        return ErrorInfo::error(ErrorCode::NOT_INITIALIZED, "Synthesizer is not loaded");
    }
    if (options.seed != 0) {
        sampler_.reseed(options.seed);
    }

    SynthesisDiagnostics local;
    SynthesisDiagnostics& diag = diagnostics ? *diagnostics : local;

    // Segments that normalize to nothing (emoji-only lines, stray symbols) are skipped
    std::vector<std::string> segments;
    for (const auto& piece : text::chunkText(text, options.max_chunk_chars)) {
        if (!preprocessor_.normalize(piece).empty()) {
            segments.push_back(piece);
        }
    }
    if (segments.empty()) {
        return ErrorInfo::error(ErrorCode::EMPTY_UTTERANCE, "empty utterance after normalization");
    }

    const size_t silence_len = static_cast<size_t>(options.silence_seconds * config_.sample_rate);
    int64_t position_samples = 0;

    for (size_t i = 0; i < segments.size(); ++i) {
        std::vector<std::vector<float>> wavs;
        std::vector<float> durations;
        err = infer({segments[i]}, style, options, wavs, durations, diag);
        if (!err.isOk()) {
            return err;
        }

        AudioChunk chunk;
        chunk.sample_rate = config_.sample_rate;
        chunk.segment_index = static_cast<int>(i);
        chunk.is_final = (i + 1 == segments.size());
        if (i > 0 && silence_len > 0) {
            chunk.samples.assign(silence_len, 0.0f);
        }
        chunk.timestamp_ms = position_samples * 1000 / config_.sample_rate;
        chunk.samples.insert(chunk.samples.end(), wavs[0].begin(), wavs[0].end());
        position_samples += static_cast<int64_t>(chunk.samples.size());

        diag.segments++;
        if (on_chunk) {
            on_chunk(chunk);
        }
    }
    return ErrorInfo::ok();
}

ErrorInfo SpeechSynthesizer::batch(const std::vector<std::string>& texts,
                                   const VoiceStyle& style,
                                   const SynthesisOptions& options,
                                   std::vector<AudioChunk>& out,
                                   SynthesisDiagnostics* diagnostics) {
    auto err = options.validate();
    if (!err.isOk()) {
        return err;
    }
    if (texts.empty()) {
        return ErrorInfo::error(ErrorCode::INVALID_TEXT, "No texts to synthesize");
    }

    const int64_t n = static_cast<int64_t>(texts.size());
    VoiceStyle batch_style;
    if (style.batchSize() == n) {
        batch_style = style;
    } else if (style.batchSize() == 1) {
        batch_style = style.repeated(n);
    } else {
        return ErrorInfo::error(ErrorCode::INVALID_CONFIG,
            "Voice style batch " + std::to_string(style.batchSize()) +
            " does not match " + std::to_string(n) + " texts");
    }

    std::lock_guard<std::mutex> lock(synth_mutex_);
    if (!sessions_.complete() || !indexer_.isLoaded()) {
        return ErrorInfo::error(ErrorCode::NOT_INITIALIZED, "Synthesizer is not loaded");
    }
    if (options.seed != 0) {
        sampler_.reseed(options.seed);
    }

    SynthesisDiagnostics local;
    SynthesisDiagnostics& diag = diagnostics ? *diagnostics : local;

    std::vector<std::vector<float>> wavs;
    std::vector<float> durations;
    err = infer(texts, batch_style, options, wavs, durations, diag);
    if (!err.isOk()) {
        return err;
    }

    out.clear();
    for (size_t i = 0; i < wavs.size(); ++i) {
        AudioChunk chunk = AudioChunk::fromFloat(std::move(wavs[i]), config_.sample_rate, true);
        chunk.segment_index = static_cast<int>(i);
        chunk.timestamp_ms = 0;
        out.push_back(std::move(chunk));
    }
    diag.segments += static_cast<int>(out.size());
    return ErrorInfo::ok();
}

// =============================================================================
// Pipeline stages
// =============================================================================

ErrorInfo SpeechSynthesizer::infer(const std::vector<std::string>& texts,
                                   const VoiceStyle& style,
                                   const SynthesisOptions& options,
                                   std::vector<std::vector<float>>& wavs,
                                   std::vector<float>& durations,
                                   SynthesisDiagnostics& diag) {
    const size_t bsz = texts.size();

    // 1. Preprocess + index
    std::vector<std::string> tagged;
    tagged.reserve(bsz);
    for (const auto& t : texts) {
        auto pre = preprocessor_.process(t, options.language);
        if (pre.isEmpty()) {
            return ErrorInfo::error(ErrorCode::EMPTY_UTTERANCE, "empty utterance after normalization");
        }
        if (!pre.language_supported) {
            diag.language_supported = false;
        }
        tagged.push_back(pre.text);
    }

    text::TextEncoding encoding = indexer_.encode(tagged);
    if (!encoding.unsupported_chars.empty()) {
        std::ostringstream oss;
        for (const auto& c : encoding.unsupported_chars) oss << " '" << c << "'";
        std::cerr << "[Synthesis] Warning: unsupported characters encoded as 0:" << oss.str() << std::endl;
        diag.mergeUnsupported(encoding.unsupported_chars);
    }

    TensorMap text_inputs;
    text_inputs["text_ids"] = encoding.idsTensor();
    text_inputs["text_mask"] = encoding.maskTensor();

    // 2. Duration
    auto err = predictDuration(text_inputs, style.style_dp, bsz, options, durations, diag);
    if (!err.isOk()) {
        return err;
    }

    // 3. Text encoder
    TensorMap enc_inputs = text_inputs;
    enc_inputs["style_ttl"] = style.style_ttl;
    TensorMap enc_outputs;
    err = sessions_.text_encoder->run(enc_inputs, {"text_emb"}, enc_outputs);
    if (!err.isOk()) {
        return err;
    }
    auto emb_it = enc_outputs.find("text_emb");
    if (emb_it == enc_outputs.end() || emb_it->second.empty()) {
        return ErrorInfo::error(ErrorCode::SYNTHESIS_FAILED, "Text encoder produced no text_emb");
    }

    // 4. Iterative refinement of the noisy latent
    LatentBatch latent = sampler_.sample(durations, config_);
    err = refineLatent(latent, emb_it->second, style.style_ttl, text_inputs["text_mask"],
                       options.total_steps);
    if (!err.isOk()) {
        return err;
    }

    // 5. Vocoder
    TensorMap voc_inputs;
    voc_inputs["latent"] = latent.latentTensor();
    TensorMap voc_outputs;
    err = sessions_.vocoder->run(voc_inputs, {"wav_tts"}, voc_outputs);
    if (!err.isOk()) {
        return err;
    }
    auto wav_it = voc_outputs.find("wav_tts");
    if (wav_it == voc_outputs.end() || wav_it->second.f32.empty()) {
        return ErrorInfo::error(ErrorCode::SYNTHESIS_FAILED, "Vocoder produced no audio");
    }

    const auto& wav = wav_it->second.f32;
    const size_t stride = wav.size() / bsz;
    wavs.assign(bsz, std::vector<float>());
    for (size_t b = 0; b < bsz; ++b) {
        size_t keep = static_cast<size_t>(std::floor(
            static_cast<double>(config_.sample_rate) * durations[b]));
        keep = std::min(keep, stride);
        auto begin = wav.begin() + static_cast<std::ptrdiff_t>(b * stride);
        wavs[b].assign(begin, begin + static_cast<std::ptrdiff_t>(keep));
    }
    return ErrorInfo::ok();
}

ErrorInfo SpeechSynthesizer::predictDuration(const TensorMap& text_inputs,
                                             const Tensor& style_dp,
                                             size_t batch,
                                             const SynthesisOptions& options,
                                             std::vector<float>& durations,
                                             SynthesisDiagnostics& diag) {
    TensorMap inputs = text_inputs;
    inputs["style_dp"] = style_dp;

    TensorMap outputs;
    auto err = sessions_.duration_predictor->run(inputs, {"duration"}, outputs);
    if (!err.isOk()) {
        return err;
    }
    auto it = outputs.find("duration");
    if (it == outputs.end() || it->second.f32.size() < batch) {
        return ErrorInfo::error(ErrorCode::SYNTHESIS_FAILED,
            "Duration predictor returned " +
            std::to_string(it == outputs.end() ? 0 : it->second.f32.size()) +
            " values for batch " + std::to_string(batch));
    }

    const float min_duration = static_cast<float>(config_.chunkSize()) / config_.sample_rate;
    durations.resize(batch);
    for (size_t b = 0; b < batch; ++b) {
        float d = it->second.f32[b] * options.rate_factor;
        if (!std::isfinite(d) || d <= 0.0f) {
            std::cerr << "[Synthesis] Warning: non-positive duration " << d
                      << "s, using one latent frame" << std::endl;
            d = min_duration;
            diag.duration_clipped = true;
        } else if (d > options.max_duration_seconds) {
            std::cerr << "[Synthesis] Warning: duration " << d << "s clipped to "
                      << options.max_duration_seconds << "s" << std::endl;
            d = options.max_duration_seconds;
            diag.duration_clipped = true;
        }
        durations[b] = d;
        diag.durations.push_back(d);
    }
    return ErrorInfo::ok();
}

ErrorInfo SpeechSynthesizer::refineLatent(LatentBatch& latent,
                                          const Tensor& text_emb,
                                          const Tensor& style_ttl,
                                          const Tensor& text_mask,
                                          int total_steps) {
    const size_t bsz = static_cast<size_t>(latent.batch);
    const std::vector<int64_t> latent_shape = {latent.batch, latent.channels, latent.length};

    TensorMap inputs;
    inputs["text_emb"] = text_emb;
    inputs["style_ttl"] = style_ttl;
    inputs["text_mask"] = text_mask;
    inputs["latent_mask"] = latent.maskTensor();
    inputs["total_step"] = Tensor::ofFloat(
        std::vector<float>(bsz, static_cast<float>(total_steps)), {latent.batch});

    for (int step = 0; step < total_steps; ++step) {
        inputs["noisy_latent"] = Tensor::ofFloat(std::move(latent.data), latent_shape);
        inputs["current_step"] = Tensor::ofFloat(
            std::vector<float>(bsz, static_cast<float>(step)), {latent.batch});

        TensorMap outputs;
        auto err = sessions_.vector_estimator->run(inputs, {"denoised_latent"}, outputs);
        if (!err.isOk()) {
            return err;
        }
        auto it = outputs.find("denoised_latent");
        if (it == outputs.end() || it->second.f32.size() != Tensor::countElements(latent_shape)) {
            return ErrorInfo::error(ErrorCode::SYNTHESIS_FAILED,
                "Vector estimator output shape mismatch at step " + std::to_string(step));
        }
        latent.data = std::move(it->second.f32);
    }
    return ErrorInfo::ok();
}

}  // namespace voice
