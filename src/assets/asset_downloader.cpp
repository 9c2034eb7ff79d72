#include "internal/assets/asset_downloader.hpp"

#include <curl/curl.h>

#include <cstdlib>
#include <filesystem>  // NOLINT(build/c++17)
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace voice {

namespace {

// Files at or below this size are leftovers of an interrupted download
constexpr uintmax_t MIN_ASSET_BYTES = 16;

struct TransferState {
    const ProgressCallback* progress;
    const std::string* label;
    int last_percent;
};

size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    std::ofstream* file = static_cast<std::ofstream*>(userp);
    size_t total_size = size * nmemb;
    file->write(static_cast<const char*>(contents), total_size);
    return file->good() ? total_size : 0;
}

int progressCallback(void* clientp, curl_off_t dltotal, curl_off_t dlnow,
                     curl_off_t ultotal, curl_off_t ulnow) {
    (void)ultotal;
    (void)ulnow;
    auto* state = static_cast<TransferState*>(clientp);
    if (dltotal > 0 && state->progress && *state->progress) {
        int percent = static_cast<int>(dlnow * 100 / dltotal);
        if (percent != state->last_percent) {
            state->last_percent = percent;
            (*state->progress)(*state->label, static_cast<float>(percent));
        }
    }
    return 0;
}

bool isPresent(const std::string& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec) && fs::file_size(path, ec) > MIN_ASSET_BYTES;
}

}  // namespace

AssetDownloader::AssetDownloader(const std::string& model_dir, const std::string& base_url)
    : model_dir_(model_dir),
      base_url_(base_url) {
}

std::string AssetDownloader::getBaseUrl() const {
    const char* mirror = std::getenv(MIRROR_ENV);
    if (mirror && mirror[0] != '\0') {
        return mirror;
    }
    if (!base_url_.empty()) {
        return base_url_;
    }
    return HF_BASE_URL;
}

std::vector<std::string> AssetDownloader::requiredAssets(const std::string& voice) {
    return {
        "onnx/tts.json",
        "onnx/unicode_indexer.json",
        "onnx/duration_predictor.onnx",
        "onnx/text_encoder.onnx",
        "onnx/vector_estimator.onnx",
        "onnx/vocoder.onnx",
        "voice_styles/" + voice + ".json",
    };
}

std::vector<std::string> AssetDownloader::missingAssets(const std::string& voice) const {
    std::vector<std::string> missing;
    for (const auto& rel : requiredAssets(voice)) {
        if (!isPresent(model_dir_ + "/" + rel)) {
            missing.push_back(rel);
        }
    }
    return missing;
}

ErrorInfo AssetDownloader::ensureAssets(const std::string& voice, const ProgressCallback& progress) {
    auto missing = missingAssets(voice);
    if (missing.empty()) {
        return ErrorInfo::ok();
    }

    try {
        fs::create_directories(model_dir_ + "/onnx");
        fs::create_directories(model_dir_ + "/voice_styles");
    } catch (const std::exception& e) {
        return ErrorInfo::error(ErrorCode::FILE_WRITE_ERROR,
            "Failed to create model directory: " + model_dir_, e.what());
    }

    const std::string base = getBaseUrl();
    for (const auto& rel : missing) {
        std::string url = base + "/" + rel;
        std::cout << "[Downloader] Downloading " << rel << " from " << url << " ..." << std::endl;
        auto err = downloadFile(url, model_dir_ + "/" + rel, rel, progress);
        if (!err.isOk()) {
            return err;
        }
    }

    std::cout << "[Downloader] All synthesis assets are ready" << std::endl;
    return ErrorInfo::ok();
}

ErrorInfo AssetDownloader::downloadFile(const std::string& url,
                                        const std::string& dest_path,
                                        const std::string& label,
                                        const ProgressCallback& progress) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return ErrorInfo::error(ErrorCode::NETWORK_ERROR, "Failed to initialize CURL");
    }

    const std::string part_path = dest_path + ".part";
    std::ofstream file(part_path, std::ios::binary);
    if (!file) {
        curl_easy_cleanup(curl);
        return ErrorInfo::error(ErrorCode::FILE_WRITE_ERROR,
            "Failed to open file for writing: " + part_path);
    }

    TransferState state{&progress, &label, -1};

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &file);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progressCallback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &state);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "parley/1.0");
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);

    CURLcode res = curl_easy_perform(curl);

    long http_code = 0;  // NOLINT(runtime/int)
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);

    curl_easy_cleanup(curl);
    file.close();

    std::error_code ec;
    if (res != CURLE_OK) {
        fs::remove(part_path, ec);
        return ErrorInfo::error(ErrorCode::NETWORK_ERROR,
            "Download failed for " + label + ": " + curl_easy_strerror(res), url);
    }
    if (http_code != 200) {
        fs::remove(part_path, ec);
        return ErrorInfo::error(ErrorCode::DOWNLOAD_FAILED,
            "HTTP error " + std::to_string(http_code) + " for " + label, url);
    }

    fs::rename(part_path, dest_path, ec);
    if (ec) {
        fs::remove(part_path, ec);
        return ErrorInfo::error(ErrorCode::FILE_WRITE_ERROR,
            "Failed to move download into place: " + dest_path);
    }

    if (progress) {
        progress(label, 100.0f);
    }
    return ErrorInfo::ok();
}

}  // namespace voice
