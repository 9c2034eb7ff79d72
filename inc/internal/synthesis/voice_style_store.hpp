#ifndef VOICE_STYLE_STORE_HPP
#define VOICE_STYLE_STORE_HPP

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "internal/runtime/tensor.hpp"
#include "internal/voice_types.hpp"

namespace voice {

// =============================================================================
// VoiceStyle - a speaker's pair of conditioning tensors
// =============================================================================
//
// Loaded from voice_styles/<name>.json:
//
//   { "style_ttl": { "data": [[[...]]], "dims": [1, 50, 256], "type": "float32" },
//     "style_dp":  { "data": [[[...]]], "dims": [1, 8, 16],   "type": "float32" } }
//
// style_dp conditions the duration predictor, style_ttl the text encoder and
// the vector estimator. Immutable once loaded.
//

struct VoiceStyle {
    std::string name;
    Tensor style_ttl;
    Tensor style_dp;

    /// @brief Batch dimension (dims[0]) of the style tensors
    int64_t batchSize() const {
        return style_ttl.shape.empty() ? 0 : style_ttl.shape[0];
    }

    /// @brief Tile a single-speaker style along the batch axis
    VoiceStyle repeated(int64_t batch) const;

    /// @brief Parse a voice style file
    /// @param path JSON file path
    /// @param name Voice name recorded on the style
    /// @param out [out] Parsed style
    static ErrorInfo loadFile(const std::string& path, const std::string& name, VoiceStyle& out);
};

// =============================================================================
// VoiceStyleStore - named, cached voice styles
// =============================================================================

class VoiceStyleStore {
public:
    explicit VoiceStyleStore(const std::string& style_dir = "");
    ~VoiceStyleStore() = default;

    /// @brief Directory containing <name>.json files
    void setStyleDir(const std::string& style_dir);
    std::string getStyleDir() const;

    /// @brief Look up a voice, loading it on first use
    /// @param name Voice name, e.g. "M3"
    /// @param out [out] Shared immutable style
    /// @return VOICE_NOT_FOUND if the file is missing or the name is invalid
    ErrorInfo get(const std::string& name, std::shared_ptr<const VoiceStyle>& out);

    /// @brief Register an already-built style (used when styles come from memory)
    void put(const VoiceStyle& style);

    /// @brief Names of the voices available in the style directory
    std::vector<std::string> listVoices() const;

    /// @brief Drop all cached styles
    void clear();

    size_t cachedCount() const;

private:
    std::string pathFor(const std::string& name) const;

    std::string style_dir_;
    std::map<std::string, std::shared_ptr<const VoiceStyle>> cache_;
    mutable std::mutex mutex_;
};

}  // namespace voice

#endif  // VOICE_STYLE_STORE_HPP
