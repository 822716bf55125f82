// ============================================================
// Globパターン - 実装
// ============================================================

#include "glob.hpp"

#include "common/error.hpp"

#include <fmt/format.h>

namespace refmt {
namespace fs {

GlobPattern GlobPattern::compile(const std::string& pattern) {
    std::vector<Token> tokens;
    size_t i = 0;

    auto fail = [&](size_t pos, const char* reason) {
        throw ConfigError(
            fmt::format("invalid glob pattern '{}' at position {}: {}", pattern, pos, reason));
    };

    while (i < pattern.size()) {
        char c = pattern[i];

        if (c == '*') {
            size_t run = 1;
            while (i + run < pattern.size() && pattern[i + run] == '*') {
                ++run;
            }
            if (run == 1) {
                tokens.push_back({Token::Kind::Star});
                ++i;
                continue;
            }
            if (run > 2) {
                fail(i, "wildcards are either regular `*` or recursive `**`");
            }

            // ** はパス要素全体でなければならない
            bool at_start = (i == 0 || pattern[i - 1] == '/');
            size_t after = i + 2;
            if (!at_start || (after < pattern.size() && pattern[after] != '/')) {
                fail(i, "recursive wildcards must form a single path component");
            }
            if (after < pattern.size()) {
                // "**/" → 0個以上のディレクトリ
                tokens.push_back({Token::Kind::RecursiveDirs});
                i = after + 1;
            } else {
                // 末尾の "**" → 残り全て
                tokens.push_back({Token::Kind::Star});
                i = after;
            }
            continue;
        }

        if (c == '?') {
            tokens.push_back({Token::Kind::AnyChar});
            ++i;
            continue;
        }

        if (c == '[') {
            Token token{Token::Kind::Class};
            size_t j = i + 1;
            if (j < pattern.size() && pattern[j] == '!') {
                token.negated = true;
                ++j;
            }
            // 先頭の ']' はリテラルとして扱う
            bool first = true;
            bool closed = false;
            while (j < pattern.size()) {
                char lo = pattern[j];
                if (lo == ']' && !first) {
                    closed = true;
                    break;
                }
                first = false;
                if (j + 2 < pattern.size() && pattern[j + 1] == '-' && pattern[j + 2] != ']') {
                    char hi = pattern[j + 2];
                    if (hi < lo) {
                        fail(j, "invalid character range");
                    }
                    token.ranges.emplace_back(lo, hi);
                    j += 3;
                } else {
                    token.ranges.emplace_back(lo, lo);
                    ++j;
                }
            }
            if (!closed) {
                fail(i, "unterminated character class");
            }
            tokens.push_back(std::move(token));
            i = j + 1;
            continue;
        }

        Token literal{Token::Kind::Literal};
        literal.literal = c;
        tokens.push_back(std::move(literal));
        ++i;
    }

    return GlobPattern(pattern, std::move(tokens));
}

bool GlobPattern::class_matches(const Token& token, char c) {
    bool in_class = false;
    for (const auto& [lo, hi] : token.ranges) {
        if (c >= lo && c <= hi) {
            in_class = true;
            break;
        }
    }
    return in_class != token.negated;
}

bool GlobPattern::match_from(size_t ti, const std::string& text, size_t si) const {
    while (ti < tokens_.size()) {
        const Token& token = tokens_[ti];
        switch (token.kind) {
            case Token::Kind::Literal:
                if (si >= text.size() || text[si] != token.literal)
                    return false;
                ++si;
                ++ti;
                break;

            case Token::Kind::AnyChar:
                if (si >= text.size())
                    return false;
                ++si;
                ++ti;
                break;

            case Token::Kind::Class:
                if (si >= text.size() || !class_matches(token, text[si]))
                    return false;
                ++si;
                ++ti;
                break;

            case Token::Kind::Star:
                for (size_t k = si; k <= text.size(); ++k) {
                    if (match_from(ti + 1, text, k))
                        return true;
                }
                return false;

            case Token::Kind::RecursiveDirs:
                // 空、または '/' で終わる任意の文字列
                if (match_from(ti + 1, text, si))
                    return true;
                for (size_t k = si + 1; k <= text.size(); ++k) {
                    if (text[k - 1] == '/' && match_from(ti + 1, text, k))
                        return true;
                }
                return false;
        }
    }
    return si == text.size();
}

bool GlobPattern::matches(const std::string& text) const {
    return match_from(0, text, 0);
}

bool GlobPattern::matches_file(const std::filesystem::path& file,
                               const std::filesystem::path& root) const {
    if (matches(file.filename().string())) {
        return true;
    }

    std::error_code ec;
    auto relative = std::filesystem::relative(file, root, ec);
    if (ec || relative.empty() || relative.native().starts_with("..")) {
        return false;
    }
    return matches(relative.generic_string());
}

}  // namespace fs
}  // namespace refmt
