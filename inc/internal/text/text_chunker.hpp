#ifndef TEXT_CHUNKER_HPP
#define TEXT_CHUNKER_HPP

/**
 * TextChunker - 长文本分段
 *
 * 按段落和句子边界切分回复文本, 每段不超过 max_chars 个字符,
 * 以便逐段合成、逐段输出音频。
 */

#include <string>
#include <vector>

namespace voice {
namespace text {

/**
 * @brief 将文本切分为适合单次合成的片段
 *
 * 1. 按空行切分段落
 * 2. 段内按句末标点 (. ! ?) 后的空白切分句子, 跳过常见缩写 (Mr. Dr. e.g. ...)
 * 3. 贪心合并相邻句子直到超过 max_chars
 * 4. 单句超长时在逗号或空格处继续切分
 *
 * @param text 原始文本
 * @param max_chars 每段最大字符数 (按码点计)
 * @return 非空片段列表; 输入全为空白时返回空列表
 */
std::vector<std::string> chunkText(const std::string& text, int max_chars = 300);

}  // namespace text
}  // namespace voice

#endif  // TEXT_CHUNKER_HPP
