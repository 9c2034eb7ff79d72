#ifndef VOICE_CONFIG_HPP
#define VOICE_CONFIG_HPP

#include <cstdint>
#include <cstdlib>

#include <string>

#include "voice_types.hpp"

namespace voice {

// =============================================================================
// Runtime Config (推理运行时配置)
// =============================================================================
//
// Passed once to OnnxRuntime at startup. Nothing else in the engine touches
// process-wide runtime flags.
//

enum class GraphOptimization {
    DISABLED,
    BASIC,
    EXTENDED,
    ALL,
};

struct RuntimeConfig {
    int intra_op_threads = 2;               ///< 算子内线程数
    int inter_op_threads = 1;               ///< 算子间线程数
    GraphOptimization graph_optimization = GraphOptimization::ALL;
    bool sequential_execution = true;       ///< 顺序执行模式
    int log_severity = 3;                   ///< 0=verbose 1=info 2=warning 3=error 4=fatal
    bool enable_mem_pattern = true;
    bool enable_cpu_mem_arena = true;
    std::string log_id = "parley";

    static RuntimeConfig Default() {
        return RuntimeConfig();
    }

    /// @brief Small-footprint profile for boards with little RAM
    static RuntimeConfig LowMemory() {
        RuntimeConfig config;
        config.intra_op_threads = 1;
        config.enable_mem_pattern = false;
        config.enable_cpu_mem_arena = false;
        return config;
    }

    RuntimeConfig withThreads(int threads) const {
        auto c = *this;
        c.intra_op_threads = threads;
        return c;
    }

    RuntimeConfig withLogSeverity(int severity) const {
        auto c = *this;
        c.log_severity = severity;
        return c;
    }

    ErrorInfo validate() const {
        if (intra_op_threads < 0 || inter_op_threads < 0) {
            return ErrorInfo::error(ErrorCode::INVALID_CONFIG, "Thread count must be >= 0");
        }
        if (log_severity < 0 || log_severity > 4) {
            return ErrorInfo::error(ErrorCode::INVALID_CONFIG, "Log severity must be 0-4");
        }
        return ErrorInfo::ok();
    }
};

// =============================================================================
// Synthesis Options (合成参数)
// =============================================================================

struct SynthesisOptions {
    std::string voice = "M3";               ///< 音色名称 (voice_styles/<voice>.json)
    std::string language = "en";            ///< 语言标签, 空则使用 <na>
    float rate_factor = 1.0f;               ///< 时长倍率 (>1.0慢, <1.0快)
    int total_steps = 10;                   ///< 去噪迭代步数
    uint32_t seed = 0;                      ///< 噪声种子, 0=随机
    float silence_seconds = 0.3f;           ///< 分段之间的静音
    int max_chunk_chars = 300;              ///< 单段最大字符数
    float max_duration_seconds = 30.0f;     ///< 单段最大时长, 超出截断

    static SynthesisOptions Default() {
        return SynthesisOptions();
    }

    SynthesisOptions withVoice(const std::string& v) const {
        auto c = *this;
        c.voice = v;
        return c;
    }

    SynthesisOptions withLanguage(const std::string& lang) const {
        auto c = *this;
        c.language = lang;
        return c;
    }

    SynthesisOptions withRate(float rate) const {
        auto c = *this;
        c.rate_factor = rate;
        return c;
    }

    SynthesisOptions withSteps(int steps) const {
        auto c = *this;
        c.total_steps = steps;
        return c;
    }

    SynthesisOptions withSeed(uint32_t s) const {
        auto c = *this;
        c.seed = s;
        return c;
    }

    ErrorInfo validate() const {
        if (voice.empty()) {
            return ErrorInfo::error(ErrorCode::INVALID_CONFIG, "Voice name is empty");
        }
        if (rate_factor <= 0.0f || rate_factor > 10.0f) {
            return ErrorInfo::error(ErrorCode::INVALID_CONFIG, "Rate factor must be in (0, 10]");
        }
        if (total_steps <= 0) {
            return ErrorInfo::error(ErrorCode::INVALID_CONFIG, "Total steps must be > 0");
        }
        if (silence_seconds < 0.0f) {
            return ErrorInfo::error(ErrorCode::INVALID_CONFIG, "Silence must be >= 0");
        }
        if (max_chunk_chars <= 0) {
            return ErrorInfo::error(ErrorCode::INVALID_CONFIG, "Max chunk length must be > 0");
        }
        if (max_duration_seconds <= 0.0f) {
            return ErrorInfo::error(ErrorCode::INVALID_CONFIG, "Max duration must be > 0");
        }
        return ErrorInfo::ok();
    }
};

// =============================================================================
// Agent Config (语音助手配置 - 内部使用)
// =============================================================================

struct AgentConfig {
    // -------------------------------------------------------------------------
    // 模型配置
    // -------------------------------------------------------------------------

    std::string model_dir = "~/.cache/supertonic";  ///< 合成模型目录 (onnx/, voice_styles/)
    std::string transcription_model = "onnx-community/whisper-large-v3-turbo";
    std::string generation_model = "onnx-community/Qwen3-0.6B-ONNX";
    bool auto_download = true;              ///< 缺失时自动下载合成模型
    std::string mirror_base_url;            ///< 下载源, 空则使用默认 (PARLEY_MIRROR 覆盖)

    // -------------------------------------------------------------------------
    // 识别配置
    // -------------------------------------------------------------------------

    std::string transcription_language = "english";
    int transcription_sample_rate = 16000;  ///< 识别输入采样率
    int min_transcript_chars = 2;           ///< 少于此长度视为无语音

    // -------------------------------------------------------------------------
    // 生成配置
    // -------------------------------------------------------------------------

    std::string system_prompt = "You are a helpful AI assistant.";
    int max_new_tokens = 512;
    bool do_sample = true;
    int top_k = 20;
    float temperature = 0.7f;

    // -------------------------------------------------------------------------
    // 合成 / 运行时
    // -------------------------------------------------------------------------

    SynthesisOptions synthesis;
    RuntimeConfig runtime;

    // -------------------------------------------------------------------------
    // 便捷构建方法
    // -------------------------------------------------------------------------

    static AgentConfig Default() {
        return AgentConfig();
    }

    /// @brief Offline profile: assets must already be on disk
    static AgentConfig Offline(const std::string& model_dir) {
        AgentConfig config;
        config.model_dir = model_dir;
        config.auto_download = false;
        return config;
    }

    AgentConfig withModelDir(const std::string& dir) const {
        auto c = *this;
        c.model_dir = dir;
        return c;
    }

    AgentConfig withVoice(const std::string& voice) const {
        auto c = *this;
        c.synthesis.voice = voice;
        return c;
    }

    AgentConfig withSystemPrompt(const std::string& prompt) const {
        auto c = *this;
        c.system_prompt = prompt;
        return c;
    }

    AgentConfig withRuntime(const RuntimeConfig& rt) const {
        auto c = *this;
        c.runtime = rt;
        return c;
    }

    // -------------------------------------------------------------------------
    // 工具方法
    // -------------------------------------------------------------------------

    /// @brief 获取模型目录的完整路径 (展开 ~)
    std::string getExpandedModelDir() const {
        if (model_dir.empty()) {
            return expandHome("~/.cache/supertonic");
        }
        return expandHome(model_dir);
    }

    std::string getOnnxDir() const {
        return getExpandedModelDir() + "/onnx";
    }

    std::string getVoiceStyleDir() const {
        return getExpandedModelDir() + "/voice_styles";
    }

    ErrorInfo validate() const {
        if (transcription_sample_rate <= 0) {
            return ErrorInfo::error(ErrorCode::INVALID_CONFIG, "Invalid transcription sample rate");
        }
        if (min_transcript_chars < 0) {
            return ErrorInfo::error(ErrorCode::INVALID_CONFIG, "Invalid minimum transcript length");
        }
        if (max_new_tokens <= 0) {
            return ErrorInfo::error(ErrorCode::INVALID_CONFIG, "max_new_tokens must be > 0");
        }
        if (temperature < 0.0f) {
            return ErrorInfo::error(ErrorCode::INVALID_CONFIG, "Temperature must be >= 0");
        }
        auto err = synthesis.validate();
        if (!err.isOk()) {
            return err;
        }
        return runtime.validate();
    }

private:
    static std::string expandHome(const std::string& path) {
        if (!path.empty() && path[0] == '~') {
            const char* home = getenv("HOME");
            if (home) {
                return std::string(home) + path.substr(1);
            }
        }
        return path;
    }
};

}  // namespace voice

#endif  // VOICE_CONFIG_HPP
