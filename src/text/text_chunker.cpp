#include "internal/text/text_chunker.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <vector>

#include "internal/text/text_utils.hpp"

namespace voice {
namespace text {

namespace {

bool isSpace(char32_t c) {
    return c == U' ' || c == U'\t' || c == U'\n' || c == U'\r' || c == U'\f' || c == U'\v';
}

std::u32string trimU32(const std::u32string& s) {
    size_t start = 0;
    while (start < s.size() && isSpace(s[start])) ++start;
    size_t end = s.size();
    while (end > start && isSpace(s[end - 1])) --end;
    return s.substr(start, end - start);
}

bool isAbbreviation(const std::u32string& para, size_t dot_pos) {
    static const std::vector<std::string> kAbbreviations = {
        "mr.", "mrs.", "ms.", "dr.", "prof.", "sr.", "jr.", "st.",
        "vs.", "etc.", "e.g.", "i.e.", "inc.", "ltd.", "a.m.", "p.m.",
    };

    size_t start = dot_pos;
    while (start > 0 && !isSpace(para[start - 1])) --start;

    std::string word = encodeUtf8(para.substr(start, dot_pos - start + 1));
    std::transform(word.begin(), word.end(), word.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return std::find(kAbbreviations.begin(), kAbbreviations.end(), word) != kAbbreviations.end();
}

std::vector<std::u32string> splitParagraphs(const std::u32string& text) {
    std::vector<std::u32string> paragraphs;
    std::u32string current;
    std::u32string line;

    auto flushLine = [&]() {
        std::u32string trimmed = trimU32(line);
        line.clear();
        if (trimmed.empty()) {
            if (!current.empty()) {
                paragraphs.push_back(current);
                current.clear();
            }
            return;
        }
        if (!current.empty()) current += U' ';
        current += trimmed;
    };

    for (char32_t c : text) {
        if (c == U'\n') {
            flushLine();
        } else {
            line += c;
        }
    }
    flushLine();
    if (!current.empty()) {
        paragraphs.push_back(current);
    }
    return paragraphs;
}

std::vector<std::u32string> splitSentences(const std::u32string& para) {
    std::vector<std::u32string> sentences;
    size_t start = 0;
    for (size_t i = 0; i < para.size(); ++i) {
        char32_t c = para[i];
        if (c != U'.' && c != U'!' && c != U'?') continue;
        if (i + 1 < para.size() && !isSpace(para[i + 1])) continue;
        if (c == U'.' && isAbbreviation(para, i)) continue;

        std::u32string s = trimU32(para.substr(start, i + 1 - start));
        if (!s.empty()) sentences.push_back(s);
        start = i + 1;
    }
    if (start < para.size()) {
        std::u32string s = trimU32(para.substr(start));
        if (!s.empty()) sentences.push_back(s);
    }
    return sentences;
}

// Break a single over-long sentence at commas, then spaces, then hard
std::vector<std::u32string> splitLong(const std::u32string& sentence, size_t max_chars) {
    std::vector<std::u32string> parts;
    std::u32string rest = sentence;
    while (rest.size() > max_chars) {
        size_t cut = std::u32string::npos;
        size_t comma = rest.rfind(U',', max_chars - 1);
        if (comma != std::u32string::npos && comma > 0) {
            cut = comma + 1;
        } else {
            size_t space = rest.rfind(U' ', max_chars);
            if (space != std::u32string::npos && space > 0) {
                cut = space;
            }
        }
        if (cut == std::u32string::npos) {
            cut = max_chars;
        }
        std::u32string head = trimU32(rest.substr(0, cut));
        if (!head.empty()) parts.push_back(head);
        rest = trimU32(rest.substr(cut));
    }
    if (!rest.empty()) parts.push_back(rest);
    return parts;
}

}  // namespace

std::vector<std::string> chunkText(const std::string& text, int max_chars) {
    size_t limit = static_cast<size_t>(max_chars > 0 ? max_chars : 300);
    std::vector<std::string> chunks;

    for (const auto& para : splitParagraphs(decodeUtf8(text))) {
        std::u32string current;
        for (const auto& sentence : splitSentences(para)) {
            for (const auto& piece : splitLong(sentence, limit)) {
                if (current.empty()) {
                    current = piece;
                } else if (current.size() + 1 + piece.size() <= limit) {
                    current += U' ';
                    current += piece;
                } else {
                    chunks.push_back(encodeUtf8(current));
                    current = piece;
                }
            }
        }
        if (!current.empty()) {
            chunks.push_back(encodeUtf8(current));
        }
    }
    return chunks;
}

}  // namespace text
}  // namespace voice
