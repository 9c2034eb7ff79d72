#ifndef ASSET_DOWNLOADER_HPP
#define ASSET_DOWNLOADER_HPP

#include <string>
#include <vector>

#include "internal/voice_types.hpp"

namespace voice {

// =============================================================================
// AssetDownloader - synthesis model auto-downloader
// =============================================================================
//
// Fetches the flow-matching TTS assets into model_dir:
//   onnx/{duration_predictor,text_encoder,vector_estimator,vocoder}.onnx
//   onnx/tts.json, onnx/unicode_indexer.json
//   voice_styles/<voice>.json
//
// Default source: HuggingFace. A configured mirror URL replaces it, and the
// PARLEY_MIRROR environment variable overrides both.
//

class AssetDownloader {
public:
    static constexpr const char* HF_BASE_URL =
        "https://huggingface.co/Supertone/supertonic/resolve/main";
    static constexpr const char* MIRROR_ENV = "PARLEY_MIRROR";

    /// @param model_dir Local asset root (already ~-expanded)
    /// @param base_url Mirror root, empty for the default
    explicit AssetDownloader(const std::string& model_dir, const std::string& base_url = "");
    ~AssetDownloader() = default;

    /// @brief Download whatever is missing for the given voice
    /// @param voice Voice name (without .json)
    /// @param progress Per-file progress, percent in [0, 100]
    /// @return DOWNLOAD_FAILED / NETWORK_ERROR / FILE_WRITE_ERROR on failure
    ErrorInfo ensureAssets(const std::string& voice, const ProgressCallback& progress);

    /// @brief Relative paths that are absent or truncated on disk
    std::vector<std::string> missingAssets(const std::string& voice) const;

    /// @brief All relative paths the synthesizer needs for one voice
    static std::vector<std::string> requiredAssets(const std::string& voice);

    std::string getBaseUrl() const;

    std::string getModelDir() const { return model_dir_; }

private:
    ErrorInfo downloadFile(const std::string& url,
                           const std::string& dest_path,
                           const std::string& label,
                           const ProgressCallback& progress);

    std::string model_dir_;
    std::string base_url_;
};

}  // namespace voice

#endif  // ASSET_DOWNLOADER_HPP
