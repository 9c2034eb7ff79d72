#ifndef SPEECH_SYNTHESIZER_HPP
#define SPEECH_SYNTHESIZER_HPP

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "internal/runtime/inference_session.hpp"
#include "internal/synthesis/latent_sampler.hpp"
#include "internal/synthesis/synthesis_config.hpp"
#include "internal/synthesis/voice_style_store.hpp"
#include "internal/text/text_indexer.hpp"
#include "internal/text/text_preprocessor.hpp"
#include "internal/voice_config.hpp"
#include "internal/voice_types.hpp"

namespace voice {

// =============================================================================
// SynthesisSessions - the four graphs of the flow-matching TTS model
// =============================================================================

struct SynthesisSessions {
    static constexpr const char* DURATION_PREDICTOR = "duration_predictor.onnx";
    static constexpr const char* TEXT_ENCODER = "text_encoder.onnx";
    static constexpr const char* VECTOR_ESTIMATOR = "vector_estimator.onnx";
    static constexpr const char* VOCODER = "vocoder.onnx";

    std::unique_ptr<IInferenceSession> duration_predictor;
    std::unique_ptr<IInferenceSession> text_encoder;
    std::unique_ptr<IInferenceSession> vector_estimator;
    std::unique_ptr<IInferenceSession> vocoder;

    bool complete() const {
        return duration_predictor && text_encoder && vector_estimator && vocoder;
    }

    /// @brief Load all four graphs from onnx_dir
    /// @param factory Session factory (runtime-owned)
    /// @param onnx_dir Directory holding the .onnx files
    /// @param progress Called after each graph, percent of the four loaded
    /// @param out [out] Loaded sessions
    static ErrorInfo load(const SessionFactory& factory,
                          const std::string& onnx_dir,
                          const ProgressCallback& progress,
                          SynthesisSessions& out);

    /// @brief Release every session
    void releaseAll();
};

// =============================================================================
// SynthesisDiagnostics - non-fatal conditions observed during a call
// =============================================================================

struct SynthesisDiagnostics {
    std::vector<std::string> unsupported_chars;     // 码表中没有的字符
    bool duration_clipped = false;                  // 预测时长被截断
    bool language_supported = true;
    int segments = 0;                               // 实际合成的分段数
    std::vector<float> durations;                   // 每段时长 (秒, 已乘倍率)

    void mergeUnsupported(const std::vector<std::string>& chars);
};

// =============================================================================
// SpeechSynthesizer - text -> waveform
// =============================================================================
//
// Pipeline per segment:
//   1. preprocess + index        -> text_ids, text_mask
//   2. duration_predictor         -> duration (seconds) * rate_factor
//   3. text_encoder               -> text_emb
//   4. vector_estimator x steps   -> refined latent
//   5. vocoder                    -> waveform, truncated to duration
//

class SpeechSynthesizer {
public:
    SpeechSynthesizer(SynthesisSessions sessions,
                      const ModelConfig& config,
                      text::TextIndexer indexer);
    ~SpeechSynthesizer();

    SpeechSynthesizer(const SpeechSynthesizer&) = delete;
    SpeechSynthesizer& operator=(const SpeechSynthesizer&) = delete;

    /**
     * @brief Synthesize one reply, emitting an AudioChunk per text segment
     *
     * Long text is split at sentence boundaries; segments after the first
     * start with options.silence_seconds of silence.
     *
     * @param text Reply text
     * @param style Single-speaker voice style
     * @param options Rate, steps, seed, language
     * @param on_chunk Receives chunks in order
     * @param diagnostics [out] Optional non-fatal findings
     * @return EMPTY_UTTERANCE if nothing speakable remains after normalization
     */
    ErrorInfo synthesize(const std::string& text,
                         const VoiceStyle& style,
                         const SynthesisOptions& options,
                         const AudioCallback& on_chunk,
                         SynthesisDiagnostics* diagnostics = nullptr);

    /**
     * @brief Synthesize several texts in one pass (batch > 1)
     * @param texts One utterance per row, no segmentation
     * @param style Single-speaker style (tiled) or one row per text
     * @param options Rate, steps, seed, language
     * @param out [out] One chunk per text, same order
     * @param diagnostics [out] Optional non-fatal findings
     */
    ErrorInfo batch(const std::vector<std::string>& texts,
                    const VoiceStyle& style,
                    const SynthesisOptions& options,
                    std::vector<AudioChunk>& out,
                    SynthesisDiagnostics* diagnostics = nullptr);

    /// @brief Release all sessions; the synthesizer is unusable afterwards
    void release();

    bool isReady() const;

    const ModelConfig& getConfig() const { return config_; }

    int getSampleRate() const { return config_.sample_rate; }

private:
    ErrorInfo infer(const std::vector<std::string>& texts,
                    const VoiceStyle& style,
                    const SynthesisOptions& options,
                    std::vector<std::vector<float>>& wavs,
                    std::vector<float>& durations,
                    SynthesisDiagnostics& diag);

    ErrorInfo predictDuration(const TensorMap& text_inputs,
                              const Tensor& style_dp,
                              size_t batch,
                              const SynthesisOptions& options,
                              std::vector<float>& durations,
                              SynthesisDiagnostics& diag);

    ErrorInfo refineLatent(LatentBatch& latent,
                           const Tensor& text_emb,
                           const Tensor& style_ttl,
                           const Tensor& text_mask,
                           int total_steps);

    SynthesisSessions sessions_;
    ModelConfig config_;
    text::TextIndexer indexer_;
    text::TextPreprocessor preprocessor_;
    LatentSampler sampler_;

    mutable std::mutex synth_mutex_;
};

}  // namespace voice

#endif  // SPEECH_SYNTHESIZER_HPP
