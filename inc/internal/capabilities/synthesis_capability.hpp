#ifndef SYNTHESIS_CAPABILITY_HPP
#define SYNTHESIS_CAPABILITY_HPP

#include <memory>
#include <string>

#include "internal/capabilities/capability.hpp"
#include "internal/synthesis/speech_synthesizer.hpp"
#include "internal/synthesis/voice_style_store.hpp"

namespace voice {

// =============================================================================
// SpeakResult (单次合成结果)
// =============================================================================

struct SpeakResult {
    bool spoken = false;                ///< 是否产生了音频
    std::string message;                ///< 未产生音频时的说明
    int sample_rate = 0;
    SynthesisDiagnostics diagnostics;
};

// =============================================================================
// SynthesisCapability - 语音合成
// =============================================================================
//
// 资源布局 (model_dir):
//   onnx/tts.json
//   onnx/unicode_indexer.json
//   onnx/{duration_predictor,text_encoder,vector_estimator,vocoder}.onnx
//   voice_styles/<voice>.json
//

class SynthesisCapability : public ICapability {
public:
    static constexpr const char* NOTHING_TO_SAY = "No speakable text after filtering.";

    /// @brief 加载配置、码表和四个模型会话
    /// @param config 模型目录和默认合成参数
    /// @param factory 会话工厂
    /// @param progress 每加载一个文件回调一次
    /// @param out [out] 创建的能力
    static ErrorInfo create(const AgentConfig& config,
                            const SessionFactory& factory,
                            const ProgressCallback& progress,
                            std::unique_ptr<SynthesisCapability>& out);

    SynthesisCapability(std::unique_ptr<SpeechSynthesizer> synthesizer,
                        const std::string& style_dir,
                        const SynthesisOptions& defaults);
    ~SynthesisCapability() override;

    CapabilityKind kind() const override { return CapabilityKind::SYNTHESIS; }
    bool isValid() const override;
    ErrorInfo dispose() override;
    std::string getName() const override { return "synthesis"; }

    /**
     * @brief 朗读一段回复
     *
     * 先去掉 <think>...</think> 推理片段; 剩余为空时不合成,
     * result.message 为 NOTHING_TO_SAY 并返回 OK。
     *
     * @param reply 回复文本
     * @param voice 音色, 空则使用默认音色
     * @param on_chunk 音频块回调
     * @param result [out] 结果
     */
    ErrorInfo speak(const std::string& reply,
                    const std::string& voice,
                    const AudioCallback& on_chunk,
                    SpeakResult& result);

    /// @brief 使用完整参数朗读
    ErrorInfo speak(const std::string& reply,
                    const SynthesisOptions& options,
                    const AudioCallback& on_chunk,
                    SpeakResult& result);

    VoiceStyleStore& voices() { return voices_; }

    const SynthesisOptions& getDefaults() const { return defaults_; }

    int getSampleRate() const;

private:
    std::unique_ptr<SpeechSynthesizer> synthesizer_;
    VoiceStyleStore voices_;
    SynthesisOptions defaults_;
};

}  // namespace voice

#endif  // SYNTHESIS_CAPABILITY_HPP
