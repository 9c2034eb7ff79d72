#include "internal/synthesis/latent_sampler.hpp"

#include <algorithm>
#include <cmath>
#include <random>
#include <utility>
#include <vector>

#include "internal/text/text_indexer.hpp"

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace voice {

// =============================================================================
// LatentBatch
// =============================================================================

Tensor LatentBatch::latentTensor() const {
    return Tensor::ofFloat(data, {batch, channels, length});
}

Tensor LatentBatch::maskTensor() const {
    return text::maskToTensor(mask);
}

// =============================================================================
// LatentSampler
// =============================================================================

LatentSampler::LatentSampler(uint32_t seed) {
    reseed(seed);
}

void LatentSampler::reseed(uint32_t seed) {
    if (seed == 0) {
        std::random_device rd;
        rng_.seed(rd());
    } else {
        rng_.seed(seed);
    }
    uniform_.reset();
}

float LatentSampler::nextGaussian() {
    // u1 in (0, 1] keeps log() finite
    double u1 = 1.0 - uniform_(rng_);
    double u2 = uniform_(rng_);
    return static_cast<float>(std::sqrt(-2.0 * std::log(u1)) * std::cos(2.0 * M_PI * u2));
}

LatentBatch LatentSampler::sample(const std::vector<float>& durations, const ModelConfig& config) {
    LatentBatch out;
    out.batch = static_cast<int64_t>(durations.size());
    out.channels = config.latentChannels();

    const int64_t chunk_size = config.chunkSize();
    double wav_len_max = 0.0;
    for (float d : durations) {
        double wav_len = static_cast<double>(d) * config.sample_rate;
        wav_len_max = std::max(wav_len_max, wav_len);
        out.wav_lengths.push_back(static_cast<int64_t>(std::floor(wav_len)));
    }
    out.length = static_cast<int64_t>(std::floor((wav_len_max + chunk_size - 1) / chunk_size));
    out.latent_lengths = latentLengths(out.wav_lengths, chunk_size);
    out.mask = text::lengthToMask(out.latent_lengths, out.length);

    out.data.resize(static_cast<size_t>(out.batch * out.channels * out.length));
    size_t idx = 0;
    for (int64_t b = 0; b < out.batch; ++b) {
        const auto& row_mask = out.mask[static_cast<size_t>(b)];
        for (int64_t c = 0; c < out.channels; ++c) {
            for (int64_t t = 0; t < out.length; ++t) {
                out.data[idx++] = nextGaussian() * row_mask[static_cast<size_t>(t)];
            }
        }
    }
    return out;
}

std::vector<int64_t> latentLengths(const std::vector<int64_t>& wav_lengths, int64_t chunk_size) {
    std::vector<int64_t> lengths;
    lengths.reserve(wav_lengths.size());
    for (auto len : wav_lengths) {
        lengths.push_back((len + chunk_size - 1) / chunk_size);
    }
    return lengths;
}

}  // namespace voice
