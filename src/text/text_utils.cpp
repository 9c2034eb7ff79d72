#include "internal/text/text_utils.hpp"

#include <cctype>
#include <cstdint>

#include <string>

namespace voice {
namespace text {

// =============================================================================
// UTF-8 字符串处理
// =============================================================================

namespace {

// Byte length of the sequence introduced by a lead byte, 0 if not a lead byte
int utf8SequenceLength(unsigned char c) {
    if ((c & 0x80) == 0) return 1;     // ASCII
    if ((c & 0xE0) == 0xC0) return 2;
    if ((c & 0xF0) == 0xE0) return 3;
    if ((c & 0xF8) == 0xF0) return 4;
    return 0;
}

}  // namespace

std::u32string decodeUtf8(const std::string& str) {
    std::u32string result;
    result.reserve(str.size());

    size_t i = 0;
    while (i < str.size()) {
        unsigned char c = static_cast<unsigned char>(str[i]);
        int len = utf8SequenceLength(c);
        if (len == 0 || i + len > str.size()) {
            result.push_back(U'\uFFFD');
            ++i;
            continue;
        }

        char32_t cp = 0;
        switch (len) {
            case 1: cp = c; break;
            case 2: cp = c & 0x1F; break;
            case 3: cp = c & 0x0F; break;
            case 4: cp = c & 0x07; break;
        }

        bool valid = true;
        for (int k = 1; k < len; ++k) {
            unsigned char cc = static_cast<unsigned char>(str[i + k]);
            if ((cc & 0xC0) != 0x80) {
                valid = false;
                break;
            }
            cp = (cp << 6) | (cc & 0x3F);
        }

        if (!valid) {
            result.push_back(U'\uFFFD');
            ++i;
            continue;
        }
        result.push_back(cp);
        i += len;
    }
    return result;
}

std::string encodeUtf8(char32_t cp) {
    std::string out;
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp <= 0x10FFFF) {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
    return out;
}

std::string encodeUtf8(const std::u32string& str) {
    std::string out;
    out.reserve(str.size());
    for (char32_t cp : str) {
        out += encodeUtf8(cp);
    }
    return out;
}

// =============================================================================
// 空白与替换
// =============================================================================

std::string trim(const std::string& str) {
    size_t start = 0;
    while (start < str.size() && std::isspace(static_cast<unsigned char>(str[start]))) {
        start++;
    }

    size_t end = str.size();
    while (end > start && std::isspace(static_cast<unsigned char>(str[end - 1]))) {
        end--;
    }

    return str.substr(start, end - start);
}

std::string collapseWhitespace(const std::string& str) {
    std::string out;
    out.reserve(str.size());
    bool in_space = false;
    for (char ch : str) {
        if (std::isspace(static_cast<unsigned char>(ch))) {
            if (!in_space) {
                out += ' ';
                in_space = true;
            }
        } else {
            out += ch;
            in_space = false;
        }
    }
    return out;
}

std::string replaceAll(const std::string& str, const std::string& from, const std::string& to) {
    if (from.empty()) return str;

    std::string result = str;
    size_t pos = 0;
    while ((pos = result.find(from, pos)) != std::string::npos) {
        result.replace(pos, from.length(), to);
        pos += to.length();
    }
    return result;
}

// =============================================================================
// 标签清理
// =============================================================================

std::string stripThinkBlocks(const std::string& str) {
    static const std::string kOpen = "<think>";
    static const std::string kClose = "</think>";

    std::string result;
    size_t pos = 0;
    while (pos < str.size()) {
        size_t open = str.find(kOpen, pos);
        if (open == std::string::npos) {
            result.append(str, pos, std::string::npos);
            break;
        }
        result.append(str, pos, open - pos);

        size_t close = str.find(kClose, open + kOpen.size());
        if (close == std::string::npos) {
            break;  // unterminated block runs to the end
        }
        pos = close + kClose.size();
    }
    return trim(result);
}

}  // namespace text
}  // namespace voice
