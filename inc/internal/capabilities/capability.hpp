#ifndef CAPABILITY_HPP
#define CAPABILITY_HPP

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "internal/runtime/inference_session.hpp"
#include "internal/voice_config.hpp"
#include "internal/voice_types.hpp"

namespace voice {

// =============================================================================
// Capability Interface (推理能力抽象接口)
// =============================================================================
//
// 每种推理能力 (识别 / 生成 / 合成) 持有自己的模型会话和处理器状态。
// 同一时刻只有一个能力驻留在加速器上, 由 ResourceArbiter 负责切换。
//
// 实现:
// - TranscriptionCapability: 语音识别, 包装 ISpeechRecognizer
// - GenerationCapability:    对话生成, 包装 ITextGenerator
// - SynthesisCapability:     语音合成, 持有四个 ONNX 会话
//

class ICapability {
public:
    virtual ~ICapability() = default;

    /// @brief 能力类型
    virtual CapabilityKind kind() const = 0;

    /// @brief 是否仍可使用 (未释放且会话完整)
    virtual bool isValid() const = 0;

    /// @brief 释放所有会话和缓冲区, 返回前完成
    /// @return 错误信息 (仅用于日志, 调用方不会传播)
    virtual ErrorInfo dispose() = 0;

    /// @brief 名称 (用于日志)
    virtual std::string getName() const = 0;
};

// =============================================================================
// External engines (外部推理引擎接口)
// =============================================================================
//
// 识别和生成模型由预编译的推理运行时提供, 这里只定义调用边界。
// 调用方通过 RuntimeProviders 中的工厂函数注入具体实现。
//

class ISpeechRecognizer {
public:
    virtual ~ISpeechRecognizer() = default;

    /// @brief 转写一段 16kHz 单声道音频
    /// @param audio float32 样本 [-1, 1]
    /// @param language 语言名称, 如 "english"
    /// @param on_update 中间结果回调 (可为空)
    /// @param text [out] 转写文本
    virtual ErrorInfo transcribe(const std::vector<float>& audio,
                                 const std::string& language,
                                 const TextCallback& on_update,
                                 std::string& text) = 0;

    virtual void release() = 0;
};

struct GenerationParams {
    int max_new_tokens = 512;
    bool do_sample = true;
    int top_k = 20;
    float temperature = 0.7f;
};

class ITextGenerator {
public:
    virtual ~ITextGenerator() = default;

    /**
     * @brief 生成回复, 逐片段回调
     * @param conversation 完整对话 (首条为 system)
     * @param params 采样参数
     * @param on_token 每个新片段按顺序回调一次
     * @param cancel 每步之间检查, 置位后尽快返回 INTERRUPTED
     * @param reply [out] 完整回复
     */
    virtual ErrorInfo generate(const Conversation& conversation,
                               const GenerationParams& params,
                               const TextCallback& on_token,
                               const std::atomic<bool>& cancel,
                               std::string& reply) = 0;

    /// @brief 清除跨轮次保留的生成状态 (KV cache 等)
    virtual void resetState() = 0;

    virtual void release() = 0;
};

using RecognizerFactory = std::function<ErrorInfo(const AgentConfig& config,
                                                  const ProgressCallback& progress,
                                                  std::unique_ptr<ISpeechRecognizer>& out)>;

using GeneratorFactory = std::function<ErrorInfo(const AgentConfig& config,
                                                 const ProgressCallback& progress,
                                                 std::unique_ptr<ITextGenerator>& out)>;

/// @brief Everything a capability needs to open its models
struct RuntimeProviders {
    RecognizerFactory recognizer;
    GeneratorFactory generator;
    SessionFactory sessions;
};

}  // namespace voice

#endif  // CAPABILITY_HPP
