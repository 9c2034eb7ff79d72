#include "internal/synthesis/voice_style_store.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <filesystem>  // NOLINT(build/c++17)
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace voice {

namespace {

// Depth-first flatten of arbitrarily nested numeric arrays
void flattenInto(const json& node, std::vector<float>& out) {
    if (node.is_array()) {
        for (const auto& child : node) {
            flattenInto(child, out);
        }
    } else if (node.is_number()) {
        out.push_back(node.get<float>());
    } else {
        throw std::runtime_error("non-numeric value in style data");
    }
}

ErrorInfo parseStyleTensor(const json& root, const char* key, const std::string& path, Tensor& out) {
    if (!root.contains(key)) {
        return ErrorInfo::error(ErrorCode::INVALID_CONFIG,
            std::string("Voice style is missing '") + key + "': " + path);
    }
    const json& node = root.at(key);

    std::string type = node.value("type", std::string("float32"));
    if (type != "float32") {
        return ErrorInfo::error(ErrorCode::INVALID_CONFIG,
            std::string("Unsupported element type '") + type + "' for " + key + " in " + path);
    }

    std::vector<int64_t> dims = node.at("dims").get<std::vector<int64_t>>();
    std::vector<float> data;
    flattenInto(node.at("data"), data);

    Tensor tensor = Tensor::ofFloat(std::move(data), std::move(dims));
    if (!tensor.isConsistent()) {
        return ErrorInfo::error(ErrorCode::INVALID_CONFIG,
            std::string("Shape/data mismatch for ") + key + " in " + path);
    }
    out = std::move(tensor);
    return ErrorInfo::ok();
}

Tensor tileBatch(const Tensor& t, int64_t batch) {
    if (t.shape.empty()) return t;

    std::vector<float> data;
    data.reserve(t.f32.size() * static_cast<size_t>(batch));
    for (int64_t b = 0; b < batch; ++b) {
        data.insert(data.end(), t.f32.begin(), t.f32.end());
    }
    std::vector<int64_t> shape = t.shape;
    shape[0] = shape[0] * batch;
    return Tensor::ofFloat(std::move(data), std::move(shape));
}

bool isValidVoiceName(const std::string& name) {
    if (name.empty() || name == "." || name == "..") return false;
    return name.find('/') == std::string::npos && name.find('\\') == std::string::npos;
}

}  // namespace

// =============================================================================
// VoiceStyle
// =============================================================================

VoiceStyle VoiceStyle::repeated(int64_t batch) const {
    VoiceStyle v;
    v.name = name;
    v.style_ttl = tileBatch(style_ttl, batch);
    v.style_dp = tileBatch(style_dp, batch);
    return v;
}

ErrorInfo VoiceStyle::loadFile(const std::string& path, const std::string& name, VoiceStyle& out) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return ErrorInfo::error(ErrorCode::VOICE_NOT_FOUND, "Failed to open voice style file: " + path);
    }

    VoiceStyle style;
    style.name = name;
    try {
        json j;
        file >> j;

        auto err = parseStyleTensor(j, "style_ttl", path, style.style_ttl);
        if (!err.isOk()) return err;
        err = parseStyleTensor(j, "style_dp", path, style.style_dp);
        if (!err.isOk()) return err;
    } catch (const std::exception& e) {
        return ErrorInfo::error(ErrorCode::INVALID_CONFIG,
            "Failed to parse voice style " + path + ": " + e.what());
    }

    if (style.style_ttl.shape.empty() || style.style_dp.shape.empty() ||
        style.style_ttl.shape[0] != style.style_dp.shape[0]) {
        return ErrorInfo::error(ErrorCode::INVALID_CONFIG,
            "style_ttl and style_dp batch sizes differ in " + path);
    }

    out = std::move(style);
    return ErrorInfo::ok();
}

// =============================================================================
// VoiceStyleStore
// =============================================================================

VoiceStyleStore::VoiceStyleStore(const std::string& style_dir)
    : style_dir_(style_dir) {
}

void VoiceStyleStore::setStyleDir(const std::string& style_dir) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (style_dir != style_dir_) {
        style_dir_ = style_dir;
        cache_.clear();
    }
}

std::string VoiceStyleStore::getStyleDir() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return style_dir_;
}

std::string VoiceStyleStore::pathFor(const std::string& name) const {
    return style_dir_ + "/" + name + ".json";
}

ErrorInfo VoiceStyleStore::get(const std::string& name, std::shared_ptr<const VoiceStyle>& out) {
    if (!isValidVoiceName(name)) {
        return ErrorInfo::error(ErrorCode::VOICE_NOT_FOUND, "Invalid voice name: '" + name + "'");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = cache_.find(name);
    if (it != cache_.end()) {
        out = it->second;
        return ErrorInfo::ok();
    }

    std::string path = pathFor(name);
    if (!fs::exists(path)) {
        return ErrorInfo::error(ErrorCode::VOICE_NOT_FOUND,
            "Voice '" + name + "' not found at: " + path);
    }

    VoiceStyle style;
    auto err = VoiceStyle::loadFile(path, name, style);
    if (!err.isOk()) {
        return err;
    }

    auto shared = std::make_shared<const VoiceStyle>(std::move(style));
    cache_[name] = shared;
    out = shared;

    std::cout << "[VoiceStyle] Loaded voice: " << name << " (ttl "
        << shared->style_ttl.f32.size() << ", dp " << shared->style_dp.f32.size()
        << " values)" << std::endl;
    return ErrorInfo::ok();
}

void VoiceStyleStore::put(const VoiceStyle& style) {
    std::lock_guard<std::mutex> lock(mutex_);
    cache_[style.name] = std::make_shared<const VoiceStyle>(style);
}

std::vector<std::string> VoiceStyleStore::listVoices() const {
    std::vector<std::string> names;
    std::string dir = getStyleDir();

    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return names;
    }
    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        if (entry.path().extension() == ".json") {
            names.push_back(entry.path().stem().string());
        }
    }
    std::sort(names.begin(), names.end());
    return names;
}

void VoiceStyleStore::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    cache_.clear();
}

size_t VoiceStyleStore::cachedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_.size();
}

}  // namespace voice
