#ifndef VOICE_API_HPP
#define VOICE_API_HPP

/**
 * Parley - on-device voice assistant engine
 *
 * 语音识别 -> 对话生成 -> 语音合成, 三种能力共享一个加速器,
 * 同一时刻只有一个能力驻留。
 *
 * 使用示例 1 - 文本合成:
 *
 *   Parley::VoiceAgent agent(Parley::VoiceAgentConfig::Default());
 *   agent.SetCallback(std::make_shared<MyCallback>());
 *   agent.Synthesize("Hello there.");
 *
 * 使用示例 2 - 完整对话轮次:
 *
 *   Parley::AgentProviders providers;
 *   providers.recognizer = [] { return makeWhisper(); };
 *   providers.generator = [] { return makeQwen(); };
 *   Parley::VoiceAgent agent(config, providers);
 *   agent.ProcessAudio(segment, 16000);   // 忙时返回 false 并丢弃
 *   agent.WaitIdle();
 */

#include <cstdint>

#include <functional>
#include <memory>
#include <string>
#include <vector>

// Forward declaration of internal types
namespace voice {
    class ISpeechRecognizer;
    class ITextGenerator;
}  // namespace voice

namespace Parley {

// =============================================================================
// AgentState - 会话状态
// =============================================================================

enum class AgentState {
    IDLE,
    TRANSCRIBING,
    GENERATING,
    SYNTHESIZING,
    ERROR,
};

const char* AgentStateToString(AgentState state);

// =============================================================================
// Message - 对话消息
// =============================================================================

struct Message {
    std::string role;       ///< "system" | "user" | "assistant"
    std::string content;
};

// =============================================================================
// VoiceAgentConfig - 助手配置
// =============================================================================

struct VoiceAgentConfig {
    // -------------------------------------------------------------------------
    // 模型配置
    // -------------------------------------------------------------------------

    std::string model_dir = "~/.cache/supertonic";  ///< 合成模型目录
    bool auto_download = true;          ///< 缺失时自动下载合成模型
    std::string mirror_url;             ///< 下载源, 空则使用 HuggingFace

    // -------------------------------------------------------------------------
    // 合成参数
    // -------------------------------------------------------------------------

    std::string voice = "M3";           ///< 音色名称
    std::string language = "en";        ///< 合成语言 (en, ko, es, pt, fr)
    float speech_rate = 1.0f;           ///< 时长倍率 (>1.0慢, <1.0快)
    int total_steps = 10;               ///< 去噪迭代步数
    uint32_t seed = 0;                  ///< 噪声种子, 0=随机

    // -------------------------------------------------------------------------
    // 识别 / 生成
    // -------------------------------------------------------------------------

    std::string transcription_language = "english";
    std::string system_prompt = "You are a helpful AI assistant.";
    int max_new_tokens = 512;

    // -------------------------------------------------------------------------
    // 性能配置
    // -------------------------------------------------------------------------

    int num_threads = 2;                ///< 推理线程数
    bool low_memory = false;            ///< 关闭内存池 (小内存设备)

    // -------------------------------------------------------------------------
    // 便捷构建方法
    // -------------------------------------------------------------------------

    static VoiceAgentConfig Default() {
        return VoiceAgentConfig();
    }

    /// @brief 离线配置 (不下载, 资源必须已存在)
    static VoiceAgentConfig Offline(const std::string& model_dir) {
        VoiceAgentConfig config;
        config.model_dir = model_dir;
        config.auto_download = false;
        return config;
    }

    VoiceAgentConfig withVoice(const std::string& v) const {
        auto c = *this;
        c.voice = v;
        return c;
    }

    VoiceAgentConfig withSpeed(float rate) const {
        auto c = *this;
        c.speech_rate = rate;
        return c;
    }

    VoiceAgentConfig withSteps(int steps) const {
        auto c = *this;
        c.total_steps = steps;
        return c;
    }
};

// =============================================================================
// AgentProviders - 外部推理引擎
// =============================================================================
//
// 识别和生成模型由调用方提供。未提供时对应命令返回错误。
//

struct AgentProviders {
    std::function<std::unique_ptr<voice::ISpeechRecognizer>()> recognizer;
    std::function<std::unique_ptr<voice::ITextGenerator>()> generator;
};

// =============================================================================
// VoiceAgentCallback - 事件回调
// =============================================================================

/**
 * @brief 助手事件回调接口
 *
 * 回调在执行命令的线程上调用 (ProcessAudio 为内部工作线程)。
 * 不要在回调中调用 WaitIdle()。
 */
class VoiceAgentCallback {
public:
    virtual ~VoiceAgentCallback() = default;

    /// @brief 模型加载/下载进度
    /// @param file 文件名
    /// @param percent 百分比 [0, 100]
    virtual void OnProgress(const std::string& file, float percent) {}

    /// @brief 增量文本 (生成片段或中间转写结果)
    virtual void OnPartial(const std::string& text) {}

    /// @brief 合成音频块, 按顺序每块一次
    virtual void OnAudioChunk(const std::vector<float>& samples, int sample_rate) {}

    /// @brief 命令完成
    /// @param payload 转写文本 / 回复 / 提示信息
    virtual void OnComplete(const std::string& payload) {}

    /// @brief 发生错误
    /// @param kind 错误类型, 如 "OUT_OF_MEMORY", "NO_SPEECH"
    /// @param message 错误描述
    virtual void OnError(const std::string& kind, const std::string& message) {}

    /// @brief 状态切换
    virtual void OnStatus(AgentState state) {}
};

// =============================================================================
// VoiceAgent - 语音助手
// =============================================================================

class VoiceAgent {
public:
    explicit VoiceAgent(const VoiceAgentConfig& config = VoiceAgentConfig(),
                        const AgentProviders& providers = AgentProviders());
    ~VoiceAgent();

    VoiceAgent(const VoiceAgent&) = delete;
    VoiceAgent& operator=(const VoiceAgent&) = delete;

    /// @brief 设置事件回调
    void SetCallback(std::shared_ptr<VoiceAgentCallback> callback);

    /// @brief 初始化是否成功 (配置有效且运行时可用)
    bool IsReady() const;

    // =========================================================================
    // 命令
    // =========================================================================

    /// @brief 转写一段音频
    /// @param audio 单声道 float32 样本
    /// @param sample_rate 采样率
    /// @param language 语言名称, 空则使用配置
    /// @param text [out] 转写结果 (可为空)
    bool Transcribe(const std::vector<float>& audio, int sample_rate,
                    const std::string& language = "", std::string* text = nullptr);

    /// @brief 生成回复 (不修改内部对话历史)
    bool Generate(const std::vector<Message>& conversation, std::string* reply = nullptr);

    /// @brief 合成文本, 音频通过 OnAudioChunk 输出
    /// @param voice 音色, 空则使用配置
    bool Synthesize(const std::string& text, const std::string& voice = "");

    /// @brief 合成文本并保存为 WAV
    bool SynthesizeToFile(const std::string& text, const std::string& file_path,
                          const std::string& voice = "");

    /// @brief 依次预热三种能力
    void Preload();

    /// @brief 取消正在进行的生成
    void Interrupt();

    /// @brief 清空对话历史
    void Reset();

    /// @brief 后台执行完整轮次; 已有轮次时丢弃并返回 false
    bool ProcessAudio(const std::vector<float>& audio, int sample_rate);

    /// @brief 等待后台轮次完成
    void WaitIdle();

    // =========================================================================
    // 查询
    // =========================================================================

    AgentState GetState() const;

    std::vector<Message> GetHistory() const;

    /// @brief 模型目录中可用的音色
    std::vector<std::string> ListVoices() const;

    /// @brief 最近一次失败的描述
    std::string GetLastError() const;

    VoiceAgentConfig GetConfig() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace Parley

#endif  // VOICE_API_HPP
