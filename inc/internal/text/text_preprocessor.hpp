#ifndef TEXT_PREPROCESSOR_HPP
#define TEXT_PREPROCESSOR_HPP

/**
 * TextPreprocessor - 合成前文本预处理
 *
 * NFKD 规范化 (uni-algo)、去除表情和不可发音符号、统一破折号与引号、
 * 合并空白、补全句末标点, 最后加上语言标签 <en>...</en>。
 */

#include <string>
#include <vector>

namespace voice {
namespace text {

// =============================================================================
// PreprocessedText (预处理结果)
// =============================================================================

struct PreprocessedText {
    std::string body;               // 规范化后的正文 (不含语言标签)
    std::string text;               // 送入索引器的最终文本 (含语言标签)
    std::string language;           // 实际使用的标签, 空语言为 "na"
    bool language_supported = true;

    /// @brief 正文为空 (规范化后无可合成内容)
    bool isEmpty() const { return body.empty(); }
};

// =============================================================================
// TextPreprocessor (文本预处理器)
// =============================================================================

class TextPreprocessor {
public:
    TextPreprocessor();
    ~TextPreprocessor();

    /**
     * @brief 完整预处理流程
     * @param raw 原始文本 (UTF-8)
     * @param lang 语言代码, 空则使用 <na>
     * @return 预处理结果; body 为空时 text 也为空
     */
    PreprocessedText process(const std::string& raw, const std::string& lang) const;

    /**
     * @brief 仅规范化正文 (NFKD + 符号清理 + 空白合并 + 句末标点)
     * @param raw 原始文本
     * @return 正文, 无可发音内容时返回空串
     */
    std::string normalize(const std::string& raw) const;

    /// @brief 语言标签是否在模型支持列表中
    static bool isSupportedLanguage(const std::string& lang);

    /// @brief 模型支持的语言标签
    static const std::vector<std::string>& availableLanguages();

private:
    std::string applyNfkd(const std::string& input) const;
    std::string stripUnspeakable(const std::string& input) const;
    std::string applyReplacements(const std::string& input) const;
    static bool endsWithTerminalPunctuation(const std::string& text);
};

}  // namespace text
}  // namespace voice

#endif  // TEXT_PREPROCESSOR_HPP
