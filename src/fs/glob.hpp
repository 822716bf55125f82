#pragma once

// ============================================================
// Globパターン
// ============================================================
// サポート: ?  *  **  [abc]  [a-z]  [!abc]
// * は区切り文字 '/' も含めて任意の文字列にマッチする
// **/ は0個以上のディレクトリにマッチする

#include <filesystem>
#include <string>
#include <vector>

namespace refmt {
namespace fs {

class GlobPattern {
   public:
    /// パターンを検証してコンパイル（不正な場合は ConfigError）
    static GlobPattern compile(const std::string& pattern);

    /// 文字列全体がマッチするか
    bool matches(const std::string& text) const;

    /// ファイル名、またはルートからの相対パスがマッチするか
    bool matches_file(const std::filesystem::path& file, const std::filesystem::path& root) const;

    const std::string& str() const { return source_; }

   private:
    struct Token {
        enum class Kind { Literal, AnyChar, Star, RecursiveDirs, Class };

        Kind kind;
        char literal = 0;
        bool negated = false;
        std::vector<std::pair<char, char>> ranges;  // Class用
    };

    GlobPattern(std::string source, std::vector<Token> tokens)
        : source_(std::move(source)), tokens_(std::move(tokens)) {}

    bool match_from(size_t ti, const std::string& text, size_t si) const;
    static bool class_matches(const Token& token, char c);

    std::string source_;
    std::vector<Token> tokens_;
};

}  // namespace fs
}  // namespace refmt
