#include "internal/text/text_preprocessor.hpp"

#include <uni_algo/norm.h>

#include <algorithm>
#include <iostream>
#include <string>
#include <vector>

#include "internal/text/text_utils.hpp"

namespace voice {
namespace text {

namespace {

struct Replacement {
    const char* from;
    const char* to;
};

// Dashes, quotes and separators the indexer has no code for
const Replacement kSymbolReplacements[] = {
    {u8"–", "-"},      // en dash
    {u8"‑", "-"},      // non-breaking hyphen
    {u8"—", "-"},      // em dash
    {u8"¯", " "},      // macron
    {"_", " "},
    {u8"“", "\""},     // left double quote
    {u8"”", "\""},     // right double quote
    {u8"‘", "'"},      // left single quote
    {u8"’", "'"},      // right single quote
    {u8"´", "'"},      // acute accent
    {"`", "'"},
    {"[", " "},
    {"]", " "},
    {"|", " "},
    {"/", " "},
    {"#", " "},
    {u8"→", " "},      // right arrow
    {u8"←", " "},      // left arrow
};

const char* const kDroppedSymbols[] = {
    u8"♥",     // heart suit
    u8"☆",     // white star
    u8"♡",     // white heart suit
    u8"©",     // copyright
    "\\",
};

const Replacement kExpressionReplacements[] = {
    {"@", " at "},
    {"e.g.,", "for example, "},
    {"i.e.,", "that is, "},
};

const Replacement kSpacingFixes[] = {
    {" ,", ","},
    {" .", "."},
    {" !", "!"},
    {" ?", "?"},
    {" ;", ";"},
    {" :", ":"},
    {" '", "'"},
};

bool isEmojiOrPictograph(char32_t cp) {
    if (cp >= 0x1F000 && cp <= 0x1FAFF) return true;   // emoticons, pictographs, flags
    if (cp >= 0x2600 && cp <= 0x27BF) return true;     // misc symbols, dingbats
    if (cp >= 0x2B00 && cp <= 0x2BFF) return true;     // arrows and stars
    if (cp >= 0xFE00 && cp <= 0xFE0F) return true;     // variation selectors
    if (cp == 0x200D || cp == 0x20E3) return true;     // ZWJ, keycap
    if (cp >= 0xE0020 && cp <= 0xE007F) return true;   // tag sequence
    return cp == 0x231A || cp == 0x231B || cp == 0x23F0 || cp == 0x23F3;  // watch, hourglass, alarm
}

}  // namespace

// =============================================================================
// Construction
// =============================================================================

TextPreprocessor::TextPreprocessor() = default;

TextPreprocessor::~TextPreprocessor() = default;

// =============================================================================
// Languages
// =============================================================================

const std::vector<std::string>& TextPreprocessor::availableLanguages() {
    static const std::vector<std::string> kLangs = {"en", "ko", "es", "pt", "fr"};
    return kLangs;
}

bool TextPreprocessor::isSupportedLanguage(const std::string& lang) {
    const auto& langs = availableLanguages();
    return std::find(langs.begin(), langs.end(), lang) != langs.end();
}

// =============================================================================
// Pipeline
// =============================================================================

PreprocessedText TextPreprocessor::process(const std::string& raw, const std::string& lang) const {
    PreprocessedText result;
    result.body = normalize(raw);
    result.language = lang.empty() ? "na" : lang;
    result.language_supported = lang.empty() || isSupportedLanguage(lang);

    if (!result.language_supported) {
        std::cerr << "[TextPreprocessor] Language '" << lang
            << "' is not in the model's language list, tagging anyway" << std::endl;
    }

    if (!result.body.empty()) {
        result.text = "<" + result.language + ">" + result.body + "</" + result.language + ">";
    }
    return result;
}

std::string TextPreprocessor::normalize(const std::string& raw) const {
    std::string result = applyNfkd(raw);
    result = stripUnspeakable(result);
    result = applyReplacements(result);
    result = trim(collapseWhitespace(result));

    if (result.empty()) {
        return result;
    }

    if (!endsWithTerminalPunctuation(result)) {
        result += ".";
    }
    return result;
}

// =============================================================================
// Steps
// =============================================================================

std::string TextPreprocessor::applyNfkd(const std::string& input) const {
    // Ill-formed sequences come back as U+FFFD and are reported by the indexer
    return una::norm::to_nfkd_utf8(input);
}

std::string TextPreprocessor::stripUnspeakable(const std::string& input) const {
    std::u32string cps = decodeUtf8(input);
    std::u32string kept;
    kept.reserve(cps.size());
    for (char32_t cp : cps) {
        if (!isEmojiOrPictograph(cp)) {
            kept.push_back(cp);
        }
    }

    std::string result = encodeUtf8(kept);
    for (const char* symbol : kDroppedSymbols) {
        result = replaceAll(result, symbol, "");
    }
    return result;
}

std::string TextPreprocessor::applyReplacements(const std::string& input) const {
    std::string result = input;

    for (const auto& repl : kSymbolReplacements) {
        result = replaceAll(result, repl.from, repl.to);
    }
    for (const auto& repl : kExpressionReplacements) {
        result = replaceAll(result, repl.from, repl.to);
    }

    result = collapseWhitespace(result);
    for (const auto& repl : kSpacingFixes) {
        result = replaceAll(result, repl.from, repl.to);
    }

    // Collapse doubled quotes
    for (const char* doubled : {"\"\"", "''"}) {
        std::string single(1, doubled[0]);
        while (result.find(doubled) != std::string::npos) {
            result = replaceAll(result, doubled, single);
        }
    }
    return result;
}

bool TextPreprocessor::endsWithTerminalPunctuation(const std::string& text) {
    static const std::u32string kTerminals =
        U".!?;:,'\")]}…。」』】〉》›»";

    std::u32string cps = decodeUtf8(text);
    if (cps.empty()) return false;
    return kTerminals.find(cps.back()) != std::u32string::npos;
}

}  // namespace text
}  // namespace voice
