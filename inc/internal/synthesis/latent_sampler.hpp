#ifndef LATENT_SAMPLER_HPP
#define LATENT_SAMPLER_HPP

#include <cstdint>

#include <random>
#include <vector>

#include "internal/runtime/tensor.hpp"
#include "internal/synthesis/synthesis_config.hpp"

namespace voice {

// =============================================================================
// LatentBatch - initial noisy latent and its presence mask
// =============================================================================

struct LatentBatch {
    int64_t batch = 0;
    int64_t channels = 0;           // latent_dim * chunk_compress_factor
    int64_t length = 0;             // ceil(max_wav_len / chunk_size)

    std::vector<float> data;                    // [batch, channels, length]
    std::vector<std::vector<float>> mask;       // [batch][length]
    std::vector<int64_t> wav_lengths;           // floor(duration * sample_rate)
    std::vector<int64_t> latent_lengths;        // ceil(wav_length / chunk_size)

    /// @brief noisy_latent input, float32 [batch, channels, length]
    Tensor latentTensor() const;

    /// @brief latent_mask input, float32 [batch, 1, length]
    Tensor maskTensor() const;
};

// =============================================================================
// LatentSampler
// =============================================================================
//
// Standard-normal noise via Box–Muller over two uniform draws, zeroed past
// each row's true latent length. A non-zero seed makes the sequence
// reproducible; seed 0 draws from std::random_device.
//

class LatentSampler {
public:
    explicit LatentSampler(uint32_t seed = 0);

    /// @brief Restart the generator (0 = nondeterministic)
    void reseed(uint32_t seed);

    /// @brief One standard-normal draw
    float nextGaussian();

    /**
     * @brief Build the initial latent for a batch of predicted durations
     * @param durations Seconds per batch row, already rate-scaled
     * @param config Model shape parameters
     * @return Masked noise buffer
     */
    LatentBatch sample(const std::vector<float>& durations, const ModelConfig& config);

private:
    std::mt19937 rng_;
    std::uniform_real_distribution<double> uniform_{0.0, 1.0};
};

/// @brief Latent frames needed for each waveform length (ceiling division)
std::vector<int64_t> latentLengths(const std::vector<int64_t>& wav_lengths, int64_t chunk_size);

}  // namespace voice

#endif  // LATENT_SAMPLER_HPP
