// ============================================================
// 命名スタイル定義 - 実装
// ============================================================

#include "case_style.hpp"

#include "common/utf8.hpp"

#include <cctype>

namespace refmt {
namespace naming {

namespace {

std::string to_lower(std::string s) {
    for (char& c : s) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return s;
}

std::string to_upper(std::string s) {
    for (char& c : s) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return s;
}

/// 先頭文字のみ大文字化（残りはそのまま）
std::string capitalize(const std::string& word) {
    if (word.empty())
        return word;
    std::string result = word;
    result[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(result[0])));
    return result;
}

/// 区切り文字で分割（空のセグメントは捨てる）
std::vector<std::string> split_on(const std::string& text, char separator) {
    std::vector<std::string> words;
    std::string current;
    for (char c : text) {
        if (c == separator) {
            if (!current.empty()) {
                words.push_back(to_lower(current));
                current.clear();
            }
        } else {
            current += c;
        }
    }
    if (!current.empty()) {
        words.push_back(to_lower(current));
    }
    return words;
}

/// camelCase / PascalCase の分割
/// 大文字は、現在の単語が空でなければ新しい単語を開始する
std::vector<std::string> split_humps(const std::string& text) {
    std::vector<std::string> words;
    std::string current;
    for (char c : text) {
        if (std::isupper(static_cast<unsigned char>(c)) && !current.empty()) {
            words.push_back(to_lower(current));
            current.clear();
        }
        current += c;
    }
    if (!current.empty()) {
        words.push_back(to_lower(current));
    }
    return words;
}

std::string join_with(const std::vector<std::string>& words, char separator, bool upper) {
    std::string result;
    for (size_t i = 0; i < words.size(); ++i) {
        if (i > 0)
            result += separator;
        result += upper ? to_upper(words[i]) : to_lower(words[i]);
    }
    return result;
}

}  // namespace

namespace {

bool is_lower(char c) {
    return c >= 'a' && c <= 'z';
}
bool is_upper(char c) {
    return c >= 'A' && c <= 'Z';
}
bool is_digit(char c) {
    return c >= '0' && c <= '9';
}
bool is_lower_or_digit(char c) {
    return is_lower(c) || is_digit(c);
}
bool is_upper_or_digit(char c) {
    return is_upper(c) || is_digit(c);
}

/// 識別子文字とみなさない非ASCII範囲（記号・句読点・空白・絵文字・私用領域）
/// 範囲外の文字（各言語の文字、結合文字、ZWJ/ZWNJ など）は識別子文字
constexpr utf8::CodeRange kNonWordRanges[] = {
    {0x0080, 0x00A9}, {0x00AB, 0x00B4}, {0x00B6, 0x00B9}, {0x00BB, 0x00BF},
    {0x00D7, 0x00D7}, {0x00F7, 0x00F7},
    {0x2000, 0x200B}, {0x200E, 0x203E}, {0x2041, 0x2053}, {0x2055, 0x206F},
    {0x20A0, 0x20CF},
    {0x2190, 0x24B5}, {0x24EA, 0x2BFF}, {0x2E00, 0x2E7F},
    {0x3000, 0x3004}, {0x3008, 0x3020}, {0x3030, 0x3030}, {0x3036, 0x3037},
    {0x303D, 0x303F},
    {0xE000, 0xF8FF},
    {0xFE10, 0xFE19}, {0xFE30, 0xFE32}, {0xFE35, 0xFE4C}, {0xFE50, 0xFE6F},
    {0xFEFF, 0xFEFF},
    {0xFF01, 0xFF0F}, {0xFF1A, 0xFF20}, {0xFF3B, 0xFF3E}, {0xFF40, 0xFF40},
    {0xFF5B, 0xFF65}, {0xFFF0, 0xFFFF},
    {0x1F000, 0x1F12F}, {0x1F14A, 0x1F14F}, {0x1F16A, 0x1F16F}, {0x1F18A, 0x1FAFF},
};

/// pos の1文字が識別子文字か（len に文字のバイト数を設定）
bool is_word_char_at(std::string_view text, size_t pos, size_t& len) {
    char c = text[pos];
    if (static_cast<unsigned char>(c) < 0x80) {
        len = 1;
        return is_lower(c) || is_upper(c) || is_digit(c) || c == '_';
    }
    char32_t cp = utf8::decode(text, pos, len);
    if (len == 0) {
        // 不正なバイトは識別子の一部とみなす
        len = 1;
        return true;
    }
    return !utf8::in_ranges(cp, kNonWordRanges);
}

/// pos から続く識別子文字の終端（pos が識別子文字でなければ pos）
size_t word_run_end(std::string_view text, size_t pos) {
    size_t len;
    while (pos < text.size() && is_word_char_at(text, pos, len)) {
        pos += len;
    }
    return pos;
}

bool all_of(std::string_view s, bool (*pred)(char)) {
    if (s.empty())
        return false;
    for (char c : s) {
        if (!pred(c))
            return false;
    }
    return true;
}

/// first+ (sep rest+)+
bool is_separated(std::string_view token, char sep, bool (*first)(char), bool (*rest)(char)) {
    size_t segments = 0;
    size_t start = 0;
    while (true) {
        size_t end = token.find(sep, start);
        auto segment = token.substr(start, end == std::string_view::npos ? end : end - start);
        if (!all_of(segment, segments == 0 ? first : rest))
            return false;
        ++segments;
        if (end == std::string_view::npos)
            break;
        start = end + 1;
    }
    return segments >= 2;
}

/// camel: [a-z]+ ([A-Z][a-z0-9]*)+
/// pascal: [A-Z][a-z0-9]+ ([A-Z][a-z0-9]*)+
bool is_humped(std::string_view token, bool pascal) {
    size_t i = 0;
    if (pascal) {
        if (token.empty() || !is_upper(token[0]))
            return false;
        i = 1;
        while (i < token.size() && is_lower_or_digit(token[i]))
            ++i;
        if (i == 1)
            return false;
    } else {
        while (i < token.size() && is_lower(token[i]))
            ++i;
        if (i == 0)
            return false;
    }
    if (i >= token.size() || !is_upper(token[i]))
        return false;
    for (; i < token.size(); ++i) {
        if (!is_upper(token[i]) && !is_lower_or_digit(token[i]))
            return false;
    }
    return true;
}

}  // namespace

const char* pattern(CaseStyle style) {
    switch (style) {
        case CaseStyle::Camel:
            return R"(\b[a-z]+(?:[A-Z][a-z0-9]*)+\b)";
        case CaseStyle::Pascal:
            return R"(\b[A-Z][a-z0-9]+(?:[A-Z][a-z0-9]*)+\b)";
        case CaseStyle::Snake:
            return R"(\b[a-z]+(?:_[a-z0-9]+)+\b)";
        case CaseStyle::ScreamingSnake:
            return R"(\b[A-Z]+(?:_[A-Z0-9]+)+\b)";
        case CaseStyle::Kebab:
            return R"(\b[a-z]+(?:-[a-z0-9]+)+\b)";
        case CaseStyle::ScreamingKebab:
            return R"(\b[A-Z]+(?:-[A-Z0-9]+)+\b)";
    }
    return "";
}

bool is_token(CaseStyle style, std::string_view token) {
    switch (style) {
        case CaseStyle::Camel:
            return is_humped(token, false);
        case CaseStyle::Pascal:
            return is_humped(token, true);
        case CaseStyle::Snake:
            return is_separated(token, '_', is_lower, is_lower_or_digit);
        case CaseStyle::ScreamingSnake:
            return is_separated(token, '_', is_upper, is_upper_or_digit);
        case CaseStyle::Kebab:
            return is_separated(token, '-', is_lower, is_lower_or_digit);
        case CaseStyle::ScreamingKebab:
            return is_separated(token, '-', is_upper, is_upper_or_digit);
    }
    return false;
}

std::vector<TokenSpan> find_tokens(CaseStyle style, std::string_view text) {
    std::vector<TokenSpan> spans;
    bool kebab = (style == CaseStyle::Kebab || style == CaseStyle::ScreamingKebab);
    auto first = (style == CaseStyle::Kebab) ? is_lower : is_upper;
    auto rest = (style == CaseStyle::Kebab) ? is_lower_or_digit : is_upper_or_digit;

    size_t pos = 0;
    while (pos < text.size()) {
        size_t len;
        if (!is_word_char_at(text, pos, len)) {
            pos += len;
            continue;
        }

        // 単語境界から単語境界まで（識別子文字の連続）が候補
        size_t begin = pos;
        size_t end = word_run_end(text, pos);
        pos = end;

        if (!kebab) {
            if (is_token(style, text.substr(begin, end - begin))) {
                spans.push_back({begin, end - begin});
            }
            continue;
        }

        // '-' は識別子文字ではないため、"-語" を貪欲に連結する
        if (!all_of(text.substr(begin, end - begin), first)) {
            continue;
        }
        size_t groups = 0;
        while (end + 1 < text.size() && text[end] == '-') {
            size_t next_end = word_run_end(text, end + 1);
            if (!all_of(text.substr(end + 1, next_end - end - 1), rest)) {
                break;
            }
            end = next_end;
            ++groups;
        }
        if (groups > 0) {
            spans.push_back({begin, end - begin});
            pos = end;
        }
    }
    return spans;
}

std::vector<std::string> split_words(CaseStyle style, const std::string& text) {
    switch (style) {
        case CaseStyle::Camel:
        case CaseStyle::Pascal:
            return split_humps(text);
        case CaseStyle::Snake:
        case CaseStyle::ScreamingSnake:
            return split_on(text, '_');
        case CaseStyle::Kebab:
        case CaseStyle::ScreamingKebab:
            return split_on(text, '-');
    }
    return {};
}

std::string join_words(CaseStyle style, const std::vector<std::string>& words,
                       const std::string& prefix, const std::string& suffix) {
    if (words.empty()) {
        return "";
    }

    std::string body;
    switch (style) {
        case CaseStyle::Camel:
            body = to_lower(words[0]);
            for (size_t i = 1; i < words.size(); ++i) {
                body += capitalize(words[i]);
            }
            break;
        case CaseStyle::Pascal:
            for (const auto& word : words) {
                body += capitalize(word);
            }
            break;
        case CaseStyle::Snake:
            body = join_with(words, '_', false);
            break;
        case CaseStyle::ScreamingSnake:
            body = join_with(words, '_', true);
            break;
        case CaseStyle::Kebab:
            body = join_with(words, '-', false);
            break;
        case CaseStyle::ScreamingKebab:
            body = join_with(words, '-', true);
            break;
    }

    return prefix + body + suffix;
}

const char* to_string(CaseStyle style) {
    switch (style) {
        case CaseStyle::Camel:
            return "camelCase";
        case CaseStyle::Pascal:
            return "PascalCase";
        case CaseStyle::Snake:
            return "snake_case";
        case CaseStyle::ScreamingSnake:
            return "SCREAMING_SNAKE_CASE";
        case CaseStyle::Kebab:
            return "kebab-case";
        case CaseStyle::ScreamingKebab:
            return "SCREAMING-KEBAB-CASE";
    }
    return "unknown";
}

const char* flag_name(CaseStyle style) {
    switch (style) {
        case CaseStyle::Camel:
            return "camel";
        case CaseStyle::Pascal:
            return "pascal";
        case CaseStyle::Snake:
            return "snake";
        case CaseStyle::ScreamingSnake:
            return "screaming-snake";
        case CaseStyle::Kebab:
            return "kebab";
        case CaseStyle::ScreamingKebab:
            return "screaming-kebab";
    }
    return "unknown";
}

std::optional<CaseStyle> parse_case_style(const std::string& name) {
    for (CaseStyle style : kAllCaseStyles) {
        if (name == flag_name(style)) {
            return style;
        }
    }
    return std::nullopt;
}

}  // namespace naming
}  // namespace refmt
