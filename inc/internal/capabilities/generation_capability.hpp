#ifndef GENERATION_CAPABILITY_HPP
#define GENERATION_CAPABILITY_HPP

#include <atomic>
#include <memory>
#include <mutex>
#include <string>

#include "internal/capabilities/capability.hpp"

namespace voice {

// =============================================================================
// GenerationCapability - 对话生成
// =============================================================================

class GenerationCapability : public ICapability {
public:
    /// @brief 通过工厂创建生成引擎
    /// @param config 系统提示词与采样参数
    /// @param factory 生成引擎工厂
    /// @param progress 加载进度
    /// @param out [out] 创建的能力
    static ErrorInfo create(const AgentConfig& config,
                            const GeneratorFactory& factory,
                            const ProgressCallback& progress,
                            std::unique_ptr<GenerationCapability>& out);

    GenerationCapability(std::unique_ptr<ITextGenerator> generator,
                         const AgentConfig& config);
    ~GenerationCapability() override;

    CapabilityKind kind() const override { return CapabilityKind::GENERATION; }
    bool isValid() const override;
    ErrorInfo dispose() override;
    std::string getName() const override { return "generation"; }

    /**
     * @brief 生成回复
     *
     * 对话中没有 system 消息时自动在开头插入系统提示词。
     * 片段按产生顺序回调, 每个片段一次。
     *
     * @param conversation 对话历史 (最后一条通常为 user)
     * @param on_token 增量片段回调
     * @param reply [out] 完整回复
     * @return INTERRUPTED 表示被 interrupt() 取消
     */
    ErrorInfo generate(const Conversation& conversation,
                       const TextCallback& on_token,
                       std::string& reply);

    /// @brief 请求取消当前生成 (可从任意线程调用)
    void interrupt();

    /// @brief 清除取消标志和引擎保留的上下文状态
    void reset();

    bool isInterrupted() const { return cancel_.load(); }

    /// @brief 确保对话以 system 消息开头
    static Conversation normalizeConversation(const Conversation& conversation,
                                              const std::string& system_prompt);

    const GenerationParams& getParams() const { return params_; }

private:
    std::unique_ptr<ITextGenerator> generator_;
    std::string system_prompt_;
    GenerationParams params_;
    std::atomic<bool> cancel_{false};

    mutable std::mutex mutex_;
};

}  // namespace voice

#endif  // GENERATION_CAPABILITY_HPP
