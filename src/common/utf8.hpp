#pragma once

// ============================================================
// UTF-8 ユーティリティ
// ============================================================

#include <cstddef>
#include <string_view>

namespace refmt::utf8 {

/// コードポイントの閉区間
struct CodeRange {
    char32_t first;
    char32_t last;
};

/// pos から1文字デコード
/// 不正なバイト列の場合は len=0 を設定し 0 を返す
inline char32_t decode(std::string_view s, size_t pos, size_t& len) {
    unsigned char c = static_cast<unsigned char>(s[pos]);
    len = 0;
    char32_t cp;
    size_t need;
    if (c < 0x80) {
        len = 1;
        return c;
    } else if ((c & 0xE0) == 0xC0) {
        cp = c & 0x1F;
        need = 1;
    } else if ((c & 0xF0) == 0xE0) {
        cp = c & 0x0F;
        need = 2;
    } else if ((c & 0xF8) == 0xF0) {
        cp = c & 0x07;
        need = 3;
    } else {
        return 0;
    }
    if (pos + need >= s.size()) {
        return 0;
    }
    for (size_t i = 1; i <= need; ++i) {
        unsigned char cc = static_cast<unsigned char>(s[pos + i]);
        if ((cc & 0xC0) != 0x80) {
            return 0;
        }
        cp = (cp << 6) | (cc & 0x3F);
    }
    len = need + 1;
    return cp;
}

/// 区間テーブルに含まれるか
template <size_t N>
bool in_ranges(char32_t cp, const CodeRange (&ranges)[N]) {
    for (const auto& r : ranges) {
        if (cp >= r.first && cp <= r.last)
            return true;
    }
    return false;
}

/// Unicode の White_Space 属性を持つか
inline bool is_whitespace(char32_t cp) {
    static constexpr CodeRange kWhitespace[] = {
        {0x0009, 0x000D}, {0x0020, 0x0020}, {0x0085, 0x0085}, {0x00A0, 0x00A0},
        {0x1680, 0x1680}, {0x2000, 0x200A}, {0x2028, 0x2029}, {0x202F, 0x202F},
        {0x205F, 0x205F}, {0x3000, 0x3000},
    };
    return in_ranges(cp, kWhitespace);
}

}  // namespace refmt::utf8
