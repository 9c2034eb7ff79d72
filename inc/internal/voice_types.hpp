#ifndef VOICE_TYPES_HPP
#define VOICE_TYPES_HPP

#include <cstdint>

#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace voice {

// =============================================================================
// Capability Kind (推理能力类型)
// =============================================================================

enum class CapabilityKind {
    TRANSCRIPTION,      // 语音识别 (16kHz mono -> text)
    GENERATION,         // 对话生成 (conversation -> streamed reply)
    SYNTHESIS,          // 语音合成 (text -> waveform)
};

inline const char* capabilityKindToString(CapabilityKind kind) {
    switch (kind) {
        case CapabilityKind::TRANSCRIPTION: return "transcription";
        case CapabilityKind::GENERATION:    return "generation";
        case CapabilityKind::SYNTHESIS:     return "synthesis";
        default:                            return "unknown";
    }
}

// =============================================================================
// Turn State (会话状态)
// =============================================================================

enum class TurnState {
    IDLE,
    TRANSCRIBING,
    GENERATING,
    SYNTHESIZING,
    ERROR,
};

inline const char* turnStateToString(TurnState state) {
    switch (state) {
        case TurnState::IDLE:         return "idle";
        case TurnState::TRANSCRIBING: return "transcribing";
        case TurnState::GENERATING:   return "generating";
        case TurnState::SYNTHESIZING: return "synthesizing";
        case TurnState::ERROR:        return "error";
        default:                      return "unknown";
    }
}

// =============================================================================
// Error Code (错误码)
// =============================================================================

enum class ErrorCode {
    OK = 0,

    // 配置错误 (1xx)
    INVALID_CONFIG = 100,
    MODEL_NOT_FOUND = 101,
    VOICE_NOT_FOUND = 102,
    INVALID_TEXT = 104,

    // 运行时错误 (2xx)
    NOT_INITIALIZED = 200,
    SYNTHESIS_FAILED = 203,
    TRANSCRIPTION_FAILED = 204,
    GENERATION_FAILED = 205,
    INTERRUPTED = 206,
    NO_SPEECH = 207,
    EMPTY_UTTERANCE = 208,

    // 网络错误 (3xx) - 模型下载
    NETWORK_ERROR = 300,
    DOWNLOAD_FAILED = 301,

    // 内部错误 (4xx)
    INTERNAL_ERROR = 400,
    OUT_OF_MEMORY = 401,
    FILE_WRITE_ERROR = 402,
};

inline const char* errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK:                   return "OK";
        case ErrorCode::INVALID_CONFIG:       return "INVALID_CONFIG";
        case ErrorCode::MODEL_NOT_FOUND:      return "MODEL_NOT_FOUND";
        case ErrorCode::VOICE_NOT_FOUND:      return "VOICE_NOT_FOUND";
        case ErrorCode::INVALID_TEXT:         return "INVALID_TEXT";
        case ErrorCode::NOT_INITIALIZED:      return "NOT_INITIALIZED";
        case ErrorCode::SYNTHESIS_FAILED:     return "SYNTHESIS_FAILED";
        case ErrorCode::TRANSCRIPTION_FAILED: return "TRANSCRIPTION_FAILED";
        case ErrorCode::GENERATION_FAILED:    return "GENERATION_FAILED";
        case ErrorCode::INTERRUPTED:          return "INTERRUPTED";
        case ErrorCode::NO_SPEECH:            return "NO_SPEECH";
        case ErrorCode::EMPTY_UTTERANCE:      return "EMPTY_UTTERANCE";
        case ErrorCode::NETWORK_ERROR:        return "NETWORK_ERROR";
        case ErrorCode::DOWNLOAD_FAILED:      return "DOWNLOAD_FAILED";
        case ErrorCode::INTERNAL_ERROR:       return "INTERNAL_ERROR";
        case ErrorCode::OUT_OF_MEMORY:        return "OUT_OF_MEMORY";
        case ErrorCode::FILE_WRITE_ERROR:     return "FILE_WRITE_ERROR";
        default:                              return "UNKNOWN";
    }
}

// =============================================================================
// Error Info (错误信息)
// =============================================================================

struct ErrorInfo {
    ErrorCode code;
    std::string message;
    std::string detail;  // 详细信息(调试用)

    bool isOk() const { return code == ErrorCode::OK; }

    static ErrorInfo ok() {
        return {ErrorCode::OK, "", ""};
    }

    static ErrorInfo error(ErrorCode code, const std::string& msg, const std::string& detail = "") {
        return {code, msg, detail};
    }
};

/// @brief Whether a runtime failure message carries an allocation signature
///        (ONNX Runtime arena/BFC failures, std::bad_alloc, device OOM).
bool isAllocationFailure(const std::string& message);

// =============================================================================
// Audio Chunk (音频块 - 用于流式输出)
// =============================================================================

struct AudioChunk {
    std::vector<float> samples;     // 音频样本 (float32, [-1.0, 1.0])
    int sample_rate = 0;            // 采样率 (Hz)
    int channels = 1;               // 声道数 (默认单声道)
    bool is_final = true;           // 是否为最后一段
    int segment_index = 0;          // 文本分段索引
    int64_t timestamp_ms = -1;      // 段起始时间 (毫秒, -1表示未知)

    int getDurationMs() const {
        if (samples.empty() || sample_rate <= 0) return 0;
        return static_cast<int>(samples.size() * 1000 / sample_rate);
    }

    size_t getNumSamples() const {
        return samples.size();
    }

    bool isEmpty() const {
        return samples.empty();
    }

    std::vector<int16_t> toInt16() const {
        std::vector<int16_t> result(samples.size());
        for (size_t i = 0; i < samples.size(); ++i) {
            float s = samples[i];
            if (s > 1.0f) s = 1.0f;
            if (s < -1.0f) s = -1.0f;
            result[i] = static_cast<int16_t>(s * 32767.0f);
        }
        return result;
    }

    static AudioChunk fromFloat(std::vector<float> data, int sample_rate, bool is_final = true) {
        AudioChunk chunk;
        chunk.samples = std::move(data);
        chunk.sample_rate = sample_rate;
        chunk.is_final = is_final;
        return chunk;
    }
};

// =============================================================================
// Conversation (对话消息)
// =============================================================================

struct ChatMessage {
    std::string role;       // "system" | "user" | "assistant"
    std::string content;

    static ChatMessage system(const std::string& text) { return {"system", text}; }
    static ChatMessage user(const std::string& text) { return {"user", text}; }
    static ChatMessage assistant(const std::string& text) { return {"assistant", text}; }
};

using Conversation = std::vector<ChatMessage>;

// =============================================================================
// Callbacks (回调接口 - 内部使用)
// =============================================================================

/// @brief Asset/session loading progress, percent in [0, 100]
using ProgressCallback = std::function<void(const std::string& file, float percent)>;

/// @brief Streamed text fragment (generation) or interim transcript
using TextCallback = std::function<void(const std::string& text)>;

/// @brief Synthesized audio, delivered in order, once each
using AudioCallback = std::function<void(const AudioChunk& chunk)>;

class IVoiceCallback {
public:
    virtual ~IVoiceCallback() = default;

    /// @brief 模型/资源加载进度
    virtual void onProgress(const std::string& file, float percent) {}

    /// @brief 生成过程中的增量文本
    virtual void onPartial(const std::string& text) {}

    /// @brief 收到音频块
    virtual void onAudioChunk(const AudioChunk& chunk) {}

    /// @brief 命令完成
    /// @param payload 结果文本 (转写结果 / 回复 / 提示信息)
    virtual void onComplete(const std::string& payload) {}

    /// @brief 发生错误
    virtual void onError(const ErrorInfo& error) {}

    /// @brief 会话状态切换
    virtual void onStatus(TurnState state) {}
};

}  // namespace voice

#endif  // VOICE_TYPES_HPP
