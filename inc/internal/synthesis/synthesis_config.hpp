#ifndef SYNTHESIS_CONFIG_HPP
#define SYNTHESIS_CONFIG_HPP

#include <cstdint>

#include <string>

#include "internal/voice_types.hpp"

namespace voice {

// =============================================================================
// ModelConfig - tts.json
// =============================================================================
//
//   {
//     "ae":  { "sample_rate": 44100, "base_chunk_size": 512, ... },
//     "ttl": { "chunk_compress_factor": 6, "latent_dim": 24, ... }
//   }
//
// Only the four fields the pipeline shapes depend on are read.
//

struct ModelConfig {
    int sample_rate = 44100;
    int base_chunk_size = 512;
    int chunk_compress_factor = 6;
    int latent_dim = 24;

    /// @brief Waveform samples covered by one latent frame
    int64_t chunkSize() const {
        return static_cast<int64_t>(base_chunk_size) * chunk_compress_factor;
    }

    /// @brief Channel count of the latent buffer
    int64_t latentChannels() const {
        return static_cast<int64_t>(latent_dim) * chunk_compress_factor;
    }

    ErrorInfo validate() const {
        if (sample_rate <= 0 || base_chunk_size <= 0 ||
            chunk_compress_factor <= 0 || latent_dim <= 0) {
            return ErrorInfo::error(ErrorCode::INVALID_CONFIG,
                "tts.json values must all be positive");
        }
        return ErrorInfo::ok();
    }

    /// @brief Load from tts.json
    /// @param path File path
    /// @param out [out] Parsed config
    static ErrorInfo load(const std::string& path, ModelConfig& out);
};

}  // namespace voice

#endif  // SYNTHESIS_CONFIG_HPP
