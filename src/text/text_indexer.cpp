#include "internal/text/text_indexer.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "internal/text/text_utils.hpp"

using json = nlohmann::json;

namespace voice {
namespace text {

// =============================================================================
// TextEncoding
// =============================================================================

Tensor TextEncoding::idsTensor() const {
    int64_t batch = static_cast<int64_t>(ids.size());
    int64_t len = maxLength();

    std::vector<int64_t> flat;
    flat.reserve(static_cast<size_t>(batch * len));
    for (const auto& row : ids) {
        flat.insert(flat.end(), row.begin(), row.end());
    }
    return Tensor::ofInt64(std::move(flat), {batch, len});
}

Tensor TextEncoding::maskTensor() const {
    return maskToTensor(lengthToMask(lengths, maxLength()));
}

// =============================================================================
// Mask helpers
// =============================================================================

std::vector<std::vector<float>> lengthToMask(const std::vector<int64_t>& lengths,
    int64_t max_len) {
    if (max_len < 0) {
        max_len = lengths.empty() ? 0 : *std::max_element(lengths.begin(), lengths.end());
    }

    std::vector<std::vector<float>> mask;
    mask.reserve(lengths.size());
    for (auto len : lengths) {
        std::vector<float> row(static_cast<size_t>(max_len), 0.0f);
        for (int64_t j = 0; j < max_len && j < len; ++j) {
            row[static_cast<size_t>(j)] = 1.0f;
        }
        mask.push_back(std::move(row));
    }
    return mask;
}

Tensor maskToTensor(const std::vector<std::vector<float>>& mask) {
    int64_t batch = static_cast<int64_t>(mask.size());
    int64_t len = mask.empty() ? 0 : static_cast<int64_t>(mask[0].size());

    std::vector<float> flat;
    flat.reserve(static_cast<size_t>(batch * len));
    for (const auto& row : mask) {
        flat.insert(flat.end(), row.begin(), row.end());
    }
    return Tensor::ofFloat(std::move(flat), {batch, 1, len});
}

// =============================================================================
// TextIndexer
// =============================================================================

ErrorInfo TextIndexer::load(const std::string& indexer_path) {
    std::ifstream file(indexer_path);
    if (!file.is_open()) {
        return ErrorInfo::error(ErrorCode::MODEL_NOT_FOUND,
            "Failed to open unicode indexer: " + indexer_path);
    }

    try {
        json j;
        file >> j;
        if (!j.is_array()) {
            return ErrorInfo::error(ErrorCode::INVALID_CONFIG,
                "Unicode indexer must be a JSON array: " + indexer_path);
        }
        table_ = j.get<std::vector<int64_t>>();
    } catch (const json::exception& e) {
        return ErrorInfo::error(ErrorCode::INVALID_CONFIG,
            "Failed to parse unicode indexer " + indexer_path + ": " + e.what());
    }

    std::cout << "[TextIndexer] Loaded " << table_.size() << " code points from "
        << indexer_path << std::endl;
    return ErrorInfo::ok();
}

void TextIndexer::setTable(std::vector<int64_t> table) {
    table_ = std::move(table);
}

int64_t TextIndexer::lookup(char32_t codepoint) const {
    if (codepoint >= table_.size()) {
        return -1;
    }
    return table_[codepoint];
}

TextEncoding TextIndexer::encode(const std::vector<std::string>& texts) const {
    TextEncoding encoding;

    std::vector<std::u32string> decoded;
    decoded.reserve(texts.size());
    for (const auto& t : texts) {
        decoded.push_back(decodeUtf8(t));
        encoding.lengths.push_back(static_cast<int64_t>(decoded.back().size()));
    }

    int64_t max_len = encoding.lengths.empty()
        ? 0 : *std::max_element(encoding.lengths.begin(), encoding.lengths.end());

    for (const auto& cps : decoded) {
        std::vector<int64_t> row(static_cast<size_t>(max_len), 0);
        for (size_t j = 0; j < cps.size(); ++j) {
            int64_t id = lookup(cps[j]);
            if (id < 0) {
                std::string ch = encodeUtf8(cps[j]);
                auto& seen = encoding.unsupported_chars;
                if (std::find(seen.begin(), seen.end(), ch) == seen.end()) {
                    seen.push_back(ch);
                }
                id = 0;
            }
            row[j] = id;
        }
        encoding.ids.push_back(std::move(row));
    }
    return encoding;
}

}  // namespace text
}  // namespace voice
