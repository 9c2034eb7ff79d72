#ifndef SESSION_ORCHESTRATOR_HPP
#define SESSION_ORCHESTRATOR_HPP

#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "internal/capabilities/capability.hpp"
#include "internal/capabilities/generation_capability.hpp"
#include "internal/capabilities/synthesis_capability.hpp"
#include "internal/capabilities/transcription_capability.hpp"
#include "internal/pipeline/resource_arbiter.hpp"
#include "internal/pipeline/turn_mutex.hpp"
#include "internal/voice_config.hpp"
#include "internal/voice_types.hpp"

namespace voice {

// =============================================================================
// CapabilitySetups - 每种能力的创建函数
// =============================================================================

struct CapabilitySetups {
    CapabilitySetup transcription;
    CapabilitySetup generation;
    CapabilitySetup synthesis;

    const CapabilitySetup& forKind(CapabilityKind kind) const;

    /// @brief 由运行时工厂构建三种能力的创建函数
    /// @param config 助手配置 (按值捕获)
    /// @param providers 识别/生成/会话工厂
    /// @param progress 加载进度
    static CapabilitySetups fromProviders(const AgentConfig& config,
                                          const RuntimeProviders& providers,
                                          const ProgressCallback& progress);
};

// =============================================================================
// SessionOrchestrator - 对话轮次状态机
// =============================================================================
//
//   IDLE -> TRANSCRIBING -> GENERATING -> SYNTHESIZING -> IDLE
//                 |               |              |
//                 +---------------+--------------+--> ERROR (直到下一轮)
//
// - 同一时刻只执行一轮; 忙时 submitAudio() 直接丢弃音频
// - 每个阶段通过 ResourceArbiter 获取能力, 阶段之间严格串行
// - NO_SPEECH / INTERRUPTED 上报错误事件后回到 IDLE, 其他失败进入 ERROR
// - 任何情况下轮次结束都会释放轮次锁
//
// 回调在执行轮次的线程上调用; 不要在回调中调用 waitIdle()。
//

class SessionOrchestrator {
public:
    SessionOrchestrator(ResourceArbiter& arbiter,
                        CapabilitySetups setups,
                        const AgentConfig& config);
    ~SessionOrchestrator();

    SessionOrchestrator(const SessionOrchestrator&) = delete;
    SessionOrchestrator& operator=(const SessionOrchestrator&) = delete;

    /// @brief 设置事件回调 (生命周期由调用者管理)
    void setCallback(IVoiceCallback* callback);

    // -------------------------------------------------------------------------
    // 完整轮次
    // -------------------------------------------------------------------------

    /**
     * @brief 提交一段语音, 在后台线程执行完整轮次
     * @param audio 单声道 float32 样本
     * @param sample_rate 采样率
     * @return false 表示已有轮次在执行, 音频被丢弃
     */
    bool submitAudio(std::vector<float> audio, int sample_rate);

    /// @brief 在当前线程执行完整轮次 (等待轮次锁)
    ErrorInfo runTurn(const std::vector<float>& audio, int sample_rate);

    /// @brief 等待后台轮次结束
    void waitIdle();

    // -------------------------------------------------------------------------
    // 单步命令 (同样持有轮次锁)
    // -------------------------------------------------------------------------

    ErrorInfo transcribe(const std::vector<float>& audio, int sample_rate,
                         const std::string& language, std::string& text);

    ErrorInfo generate(const Conversation& conversation, std::string& reply);

    /// @param on_chunk 额外的音频接收者 (在事件回调之后调用, 可为空)
    ErrorInfo synthesize(const std::string& text, const std::string& voice, SpeakResult& result,
                         const AudioCallback& on_chunk = nullptr);

    /// @brief 依次加载并释放三种能力; 单个失败只记录日志
    ErrorInfo preload();

    /// @brief 取消正在进行的生成 (不等待轮次锁)
    void interrupt();

    /// @brief 清空对话历史和生成状态
    void reset();

    // -------------------------------------------------------------------------
    // 状态查询
    // -------------------------------------------------------------------------

    TurnState getState() const;

    Conversation getHistory() const;

    bool isBusy() const { return turn_mutex_.isLocked(); }

private:
    // 以下方法要求调用者已持有轮次锁
    ErrorInfo executeTurn(const std::vector<float>& audio, int sample_rate);
    ErrorInfo transcribeStage(const std::vector<float>& audio, int sample_rate,
                              const std::string& language, std::string& text);
    ErrorInfo generateStage(const Conversation& conversation, std::string& reply);
    ErrorInfo synthesizeStage(const std::string& text, const std::string& voice, SpeakResult& result,
                              const AudioCallback& extra_sink);

    template <typename T>
    ErrorInfo acquireAs(CapabilityKind kind, T*& out);

    void setState(TurnState state);
    void reportFailure(const ErrorInfo& error);

    ResourceArbiter& arbiter_;
    CapabilitySetups setups_;
    AgentConfig config_;

    IVoiceCallback* callback_ = nullptr;

    TurnMutex turn_mutex_;

    mutable std::mutex state_mutex_;
    TurnState state_ = TurnState::IDLE;
    Conversation history_;

    std::mutex active_mutex_;
    GenerationCapability* active_generation_ = nullptr;

    std::mutex worker_mutex_;
    std::thread worker_;
};

}  // namespace voice

#endif  // SESSION_ORCHESTRATOR_HPP
