#ifndef TEXT_UTILS_HPP
#define TEXT_UTILS_HPP

/**
 * TextUtils - 文本处理工具模块
 *
 * UTF-8 编解码、空白处理、标签清理等辅助函数。
 */

#include <cstdint>

#include <string>

namespace voice {
namespace text {

// =============================================================================
// UTF-8 字符串处理
// =============================================================================

/**
 * @brief 解码 UTF-8 为 Unicode 码点
 *
 * 非法字节序列被替换为 U+FFFD。
 *
 * @param str UTF-8 编码的字符串
 * @return 码点序列
 */
std::u32string decodeUtf8(const std::string& str);

/**
 * @brief 将单个码点编码为 UTF-8
 */
std::string encodeUtf8(char32_t cp);

/**
 * @brief 将码点序列编码为 UTF-8
 */
std::string encodeUtf8(const std::u32string& str);

// =============================================================================
// 空白与替换
// =============================================================================

/// @brief 去除首尾 ASCII 空白
std::string trim(const std::string& str);

/// @brief 将连续空白 (含换行、制表符) 合并为单个空格
std::string collapseWhitespace(const std::string& str);

/// @brief 替换全部出现的子串
std::string replaceAll(const std::string& str, const std::string& from, const std::string& to);

// =============================================================================
// 标签清理
// =============================================================================

/**
 * @brief 删除 <think>...</think> 推理块及其内容, 并去除首尾空白
 *
 * 未闭合的 <think> 会删除到文本末尾。
 */
std::string stripThinkBlocks(const std::string& str);

}  // namespace text
}  // namespace voice

#endif  // TEXT_UTILS_HPP
