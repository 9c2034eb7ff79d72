#include "tests/test_common.h"

#include <stdlib.h>

#include <algorithm>
#include <string>
#include <vector>

#include "internal/assets/asset_downloader.hpp"
#include "tests/test_fakes.h"

using namespace voice;

static bool contains(const std::vector<std::string>& list, const std::string& item) {
    return std::find(list.begin(), list.end(), item) != list.end();
}

// ── Test: asset layout ──

static void testRequiredAssets() {
    section("requiredAssets");

    auto assets = AssetDownloader::requiredAssets("F1");
    check(assets.size() == 7, "four graphs, two configs, one voice");
    check(contains(assets, "onnx/vector_estimator.onnx"), "estimator graph listed");
    check(contains(assets, "onnx/unicode_indexer.json"), "indexer listed");
    check(contains(assets, "voice_styles/F1.json"), "voice style follows the voice name");
    check(!contains(assets, "voice_styles/M3.json"), "other voices not required");
}

static void testMissingAssets() {
    section("missingAssets");

    std::string dir = makeTempDir("assets");
    AssetDownloader downloader(dir);
    check(downloader.missingAssets("M3").size() == 7, "empty directory misses everything");

    fakes::writeSynthesisAssets(dir, "M3");
    auto missing = downloader.missingAssets("M3");
    check(missing.size() == 4, "only graphs missing after configs written");
    check(!contains(missing, "onnx/tts.json"), "written config present");

    const char* graphs[] = {"duration_predictor", "text_encoder", "vector_estimator", "vocoder"};
    for (const char* g : graphs) {
        fakes::writeText(dir + "/onnx/" + g + ".onnx", std::string(64, 'x'));
    }
    check(downloader.missingAssets("M3").empty(), "complete layout");
    check(downloader.missingAssets("F2").size() == 1, "other voice still missing");

    // Interrupted downloads leave stubs behind
    fakes::writeText(dir + "/onnx/vocoder.onnx", "stub");
    missing = downloader.missingAssets("M3");
    check(missing.size() == 1 && missing[0] == "onnx/vocoder.onnx", "truncated file counts as missing");

    fakes::writeText(dir + "/onnx/vocoder.onnx", std::string(64, 'x'));
    check(downloader.ensureAssets("M3", nullptr).isOk(), "nothing to fetch when complete");
}

static void testBaseUrl() {
    section("getBaseUrl");

    unsetenv(AssetDownloader::MIRROR_ENV);
    check(AssetDownloader("/tmp/m").getBaseUrl() == AssetDownloader::HF_BASE_URL, "default source");
    check(AssetDownloader("/tmp/m", "http://mirror.local/tts").getBaseUrl() ==
          "http://mirror.local/tts", "configured mirror");

    setenv(AssetDownloader::MIRROR_ENV, "http://env.local", 1);
    check(AssetDownloader("/tmp/m", "http://mirror.local/tts").getBaseUrl() == "http://env.local",
          "environment overrides configuration");

    setenv(AssetDownloader::MIRROR_ENV, "", 1);
    check(AssetDownloader("/tmp/m").getBaseUrl() == AssetDownloader::HF_BASE_URL,
          "empty environment value ignored");
    unsetenv(AssetDownloader::MIRROR_ENV);
}

int main() {
    testRequiredAssets();
    testMissingAssets();
    testBaseUrl();
    return finish();
}
