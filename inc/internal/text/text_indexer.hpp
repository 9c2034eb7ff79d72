#ifndef TEXT_INDEXER_HPP
#define TEXT_INDEXER_HPP

/**
 * TextIndexer - 字符到模型编码的映射
 *
 * 读取 unicode_indexer.json (按码点下标的整数表, -1 表示不支持),
 * 将一批预处理后的文本转换为等长的 int64 编码矩阵和存在掩码。
 */

#include <cstdint>

#include <string>
#include <vector>

#include "internal/runtime/tensor.hpp"
#include "internal/voice_types.hpp"

namespace voice {
namespace text {

// =============================================================================
// TextEncoding (编码结果)
// =============================================================================

struct TextEncoding {
    std::vector<std::vector<int64_t>> ids;          // [batch][max_len], 右侧补 0
    std::vector<int64_t> lengths;                   // 每行真实长度 (码点数)
    std::vector<std::string> unsupported_chars;     // 表中没有的字符 (去重, 按出现顺序)

    size_t batchSize() const { return ids.size(); }

    int64_t maxLength() const {
        return ids.empty() ? 0 : static_cast<int64_t>(ids[0].size());
    }

    /// @brief text_ids 输入, int64 [batch, max_len]
    Tensor idsTensor() const;

    /// @brief text_mask 输入, float32 [batch, 1, max_len]
    Tensor maskTensor() const;
};

// =============================================================================
// Mask helpers
// =============================================================================

/**
 * @brief 长度转掩码: mask[i][j] = 1 当且仅当 j < lengths[i]
 * @param lengths 每行长度
 * @param max_len 列数, <0 时取 lengths 的最大值
 * @return [batch][max_len] 掩码
 */
std::vector<std::vector<float>> lengthToMask(const std::vector<int64_t>& lengths,
                                             int64_t max_len = -1);

/// @brief 将 [batch][len] 掩码展平为 [batch, 1, len] 张量
Tensor maskToTensor(const std::vector<std::vector<float>>& mask);

// =============================================================================
// TextIndexer
// =============================================================================

class TextIndexer {
public:
    TextIndexer() = default;
    ~TextIndexer() = default;

    /// @brief 从 JSON 文件加载码表
    /// @param indexer_path unicode_indexer.json 路径
    ErrorInfo load(const std::string& indexer_path);

    /// @brief 直接设置码表 (table[codepoint] = id, -1 不支持)
    void setTable(std::vector<int64_t> table);

    bool isLoaded() const { return !table_.empty(); }

    size_t tableSize() const { return table_.size(); }

    /// @brief 查询码点编码, 不支持返回 -1
    int64_t lookup(char32_t codepoint) const;

    /**
     * @brief 编码一批文本
     *
     * 不支持的字符编码为 0 并记入 unsupported_chars, 不视为错误。
     *
     * @param texts 预处理后的文本 (UTF-8)
     * @return 编码结果
     */
    TextEncoding encode(const std::vector<std::string>& texts) const;

private:
    std::vector<int64_t> table_;
};

}  // namespace text
}  // namespace voice

#endif  // TEXT_INDEXER_HPP
