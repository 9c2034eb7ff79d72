#include "internal/audio/audio_processor.hpp"

#include <cmath>
#include <cstdint>

#include <fstream>
#include <string>
#include <vector>

namespace voice {
namespace audio {

// =============================================================================
// RMS 计算
// =============================================================================

float calculateRMS(const std::vector<float>& audio) {
    if (audio.empty()) return 0.0f;

    double sum_squares = 0.0;
    for (float sample : audio) {
        sum_squares += static_cast<double>(sample) * sample;
    }
    return static_cast<float>(std::sqrt(sum_squares / audio.size()));
}

// =============================================================================
// 重采样
// =============================================================================

std::vector<float> resampleAudio(const std::vector<float>& audio,
    int src_rate,
    int dst_rate) {
    if (audio.empty() || src_rate == dst_rate || src_rate <= 0 || dst_rate <= 0) {
        return audio;
    }

    double ratio = static_cast<double>(dst_rate) / src_rate;
    size_t output_size = static_cast<size_t>(
        static_cast<uint64_t>(audio.size()) * dst_rate / src_rate);
    std::vector<float> resampled(output_size);

    for (size_t i = 0; i < output_size; ++i) {
        double src_pos = i / ratio;
        size_t src_idx = static_cast<size_t>(src_pos);
        double frac = src_pos - src_idx;

        if (src_idx + 1 < audio.size()) {
            resampled[i] = static_cast<float>(
                audio[src_idx] * (1.0 - frac) + audio[src_idx + 1] * frac);
        } else if (src_idx < audio.size()) {
            resampled[i] = audio[src_idx];
        }
    }

    return resampled;
}

// =============================================================================
// 格式转换
// =============================================================================

std::vector<int16_t> floatToInt16(const std::vector<float>& audio) {
    std::vector<int16_t> result(audio.size());
    for (size_t i = 0; i < audio.size(); ++i) {
        float sample = audio[i];
        if (sample > 1.0f) sample = 1.0f;
        if (sample < -1.0f) sample = -1.0f;
        result[i] = static_cast<int16_t>(sample * 32767.0f);
    }
    return result;
}

// =============================================================================
// WAV 写出
// =============================================================================

namespace {

void writeLE32(std::ofstream& file, uint32_t value) {
    char bytes[4] = {
        static_cast<char>(value & 0xFF),
        static_cast<char>((value >> 8) & 0xFF),
        static_cast<char>((value >> 16) & 0xFF),
        static_cast<char>((value >> 24) & 0xFF),
    };
    file.write(bytes, 4);
}

void writeLE16(std::ofstream& file, uint16_t value) {
    char bytes[2] = {
        static_cast<char>(value & 0xFF),
        static_cast<char>((value >> 8) & 0xFF),
    };
    file.write(bytes, 2);
}

}  // namespace

ErrorInfo writeWav(const std::string& file_path,
                   const std::vector<float>& audio,
                   int sample_rate) {
    if (sample_rate <= 0) {
        return ErrorInfo::error(ErrorCode::INVALID_CONFIG, "Invalid sample rate for WAV output");
    }

    std::ofstream file(file_path, std::ios::binary);
    if (!file) {
        return ErrorInfo::error(ErrorCode::FILE_WRITE_ERROR, "Failed to open file: " + file_path);
    }

    const uint16_t num_channels = 1;
    const uint16_t bits_per_sample = 16;
    const uint32_t byte_rate = static_cast<uint32_t>(sample_rate) * num_channels * bits_per_sample / 8;
    const uint16_t block_align = num_channels * bits_per_sample / 8;
    auto pcm = floatToInt16(audio);
    const uint32_t data_size = static_cast<uint32_t>(pcm.size() * 2);

    file.write("RIFF", 4);
    writeLE32(file, 36 + data_size);
    file.write("WAVE", 4);
    file.write("fmt ", 4);
    writeLE32(file, 16);
    writeLE16(file, 1);  // PCM
    writeLE16(file, num_channels);
    writeLE32(file, static_cast<uint32_t>(sample_rate));
    writeLE32(file, byte_rate);
    writeLE16(file, block_align);
    writeLE16(file, bits_per_sample);
    file.write("data", 4);
    writeLE32(file, data_size);

    for (int16_t s : pcm) {
        writeLE16(file, static_cast<uint16_t>(s));
    }

    if (!file.good()) {
        return ErrorInfo::error(ErrorCode::FILE_WRITE_ERROR, "Failed to write file: " + file_path);
    }
    return ErrorInfo::ok();
}

}  // namespace audio
}  // namespace voice
