#ifndef TRANSCRIPTION_CAPABILITY_HPP
#define TRANSCRIPTION_CAPABILITY_HPP

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "internal/capabilities/capability.hpp"

namespace voice {

// =============================================================================
// TranscriptionCapability - 语音识别
// =============================================================================
//
// 输入任意采样率的单声道音频, 重采样到 16kHz 后交给识别引擎。
// 结果为空、过短或只包含 "(inaudible)" / "[BLANK_AUDIO]" 之类标注时
// 视为无语音, 返回 NO_SPEECH。
//

class TranscriptionCapability : public ICapability {
public:
    /// @brief 通过工厂创建识别引擎
    /// @param config 语言、采样率、最短长度
    /// @param factory 识别引擎工厂
    /// @param progress 加载进度
    /// @param out [out] 创建的能力
    static ErrorInfo create(const AgentConfig& config,
                            const RecognizerFactory& factory,
                            const ProgressCallback& progress,
                            std::unique_ptr<TranscriptionCapability>& out);

    TranscriptionCapability(std::unique_ptr<ISpeechRecognizer> recognizer,
                            const AgentConfig& config);
    ~TranscriptionCapability() override;

    CapabilityKind kind() const override { return CapabilityKind::TRANSCRIPTION; }
    bool isValid() const override;
    ErrorInfo dispose() override;
    std::string getName() const override { return "transcription"; }

    /**
     * @brief 转写一段音频
     * @param audio float32 单声道样本
     * @param sample_rate 输入采样率, 不等于 16kHz 时先重采样
     * @param language 语言名称, 空则使用配置中的默认值
     * @param on_update 中间结果回调 (可为空)
     * @param text [out] 去除首尾空白后的转写文本
     * @return NO_SPEECH 表示没有有效语音
     */
    ErrorInfo transcribe(const std::vector<float>& audio,
                         int sample_rate,
                         const std::string& language,
                         const TextCallback& on_update,
                         std::string& text);

    /// @brief 转写结果是否应视为无语音
    /// @param text 转写文本
    /// @param min_chars 最短有效长度 (按码点计)
    static bool isNoSpeech(const std::string& text, int min_chars = 2);

private:
    std::unique_ptr<ISpeechRecognizer> recognizer_;
    std::string default_language_;
    int target_sample_rate_;
    int min_chars_;

    mutable std::mutex mutex_;
};

}  // namespace voice

#endif  // TRANSCRIPTION_CAPABILITY_HPP
