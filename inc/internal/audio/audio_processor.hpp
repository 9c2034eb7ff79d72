#ifndef AUDIO_PROCESSOR_HPP
#define AUDIO_PROCESSOR_HPP

/**
 * AudioProcessor - 音频工具函数
 *
 * 识别前的重采样、电平统计、PCM 转换以及 WAV 文件写出。
 */

#include <cstdint>

#include <string>
#include <vector>

#include "internal/voice_types.hpp"

namespace voice {
namespace audio {

/**
 * @brief 计算音频的 RMS (Root Mean Square)
 * @param audio 音频样本
 * @return RMS 值, 空输入为 0
 */
float calculateRMS(const std::vector<float>& audio);

/**
 * @brief 重采样音频 (线性插值)
 * @param audio 输入音频
 * @param src_rate 源采样率
 * @param dst_rate 目标采样率
 * @return 重采样后的音频; 采样率相同时原样返回
 */
std::vector<float> resampleAudio(
        const std::vector<float>& audio,
        int src_rate,
        int dst_rate);

/**
 * @brief float 转 int16 (先截断到 [-1.0, 1.0])
 */
std::vector<int16_t> floatToInt16(const std::vector<float>& audio);

/**
 * @brief 写出 16-bit PCM 单声道 WAV 文件
 * @param file_path 输出路径
 * @param audio float 音频
 * @param sample_rate 采样率
 * @return FILE_WRITE_ERROR 表示无法打开或写入
 */
ErrorInfo writeWav(const std::string& file_path,
                   const std::vector<float>& audio,
                   int sample_rate);

}  // namespace audio
}  // namespace voice

#endif  // AUDIO_PROCESSOR_HPP
