#include "internal/synthesis/synthesis_config.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <iostream>
#include <string>

using json = nlohmann::json;

namespace voice {

ErrorInfo ModelConfig::load(const std::string& path, ModelConfig& out) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return ErrorInfo::error(ErrorCode::MODEL_NOT_FOUND, "Failed to open config file: " + path);
    }

    ModelConfig cfg;
    try {
        json j;
        file >> j;
        cfg.sample_rate = j.at("ae").at("sample_rate").get<int>();
        cfg.base_chunk_size = j.at("ae").at("base_chunk_size").get<int>();
        cfg.chunk_compress_factor = j.at("ttl").at("chunk_compress_factor").get<int>();
        cfg.latent_dim = j.at("ttl").at("latent_dim").get<int>();
    } catch (const json::exception& e) {
        return ErrorInfo::error(ErrorCode::INVALID_CONFIG,
            "Invalid config file " + path + ": " + e.what());
    }

    auto err = cfg.validate();
    if (!err.isOk()) {
        return err;
    }

    out = cfg;
    std::cout << "[Synthesis] Config: sample_rate=" << cfg.sample_rate
        << " chunk=" << cfg.chunkSize()
        << " latent_channels=" << cfg.latentChannels() << std::endl;
    return ErrorInfo::ok();
}

}  // namespace voice
