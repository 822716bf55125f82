// ============================================================
// 命名スタイル定義
// ============================================================
// 6種類の命名スタイルについて、認識パターン・単語分割・単語結合を提供

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace refmt {
namespace naming {

/// 対応する命名スタイル
enum class CaseStyle {
    Camel,           // firstName
    Pascal,          // FirstName
    Snake,           // first_name
    ScreamingSnake,  // FIRST_NAME
    Kebab,           // first-name
    ScreamingKebab   // FIRST-NAME
};

/// 全スタイル（列挙順）
inline constexpr CaseStyle kAllCaseStyles[] = {
    CaseStyle::Camel, CaseStyle::Pascal,         CaseStyle::Snake,
    CaseStyle::ScreamingSnake, CaseStyle::Kebab, CaseStyle::ScreamingKebab,
};

/// テキスト中でこのスタイルのトークンを認識する正規表現（ECMAScript）
/// 単語境界 \b で区切られ、2語以上のものだけにマッチする
/// 書き換えでは find_tokens が同じ言語を走査で認識する
const char* pattern(CaseStyle style);

/// token 全体がこのスタイルの識別子か（境界は見ない）
bool is_token(CaseStyle style, std::string_view token);

/// テキスト中のトークン位置（バイト単位）
struct TokenSpan {
    size_t offset;
    size_t length;
};

/// テキストからこのスタイルのトークンを左から重ならずに列挙する
/// 識別子文字 [A-Za-z0-9_] に加え、非ASCIIの文字・数字も識別子の一部とみなし、
/// その隣ではトークンを認識しない。入力長に対して線形で、再帰しない
std::vector<TokenSpan> find_tokens(CaseStyle style, std::string_view text);

/// パターンにマッチした文字列を小文字の単語列に分割
/// firstName → [first, name]
/// FIRST_NAME → [first, name]
std::vector<std::string> split_words(CaseStyle style, const std::string& text);

/// 単語列をこのスタイルで結合し、prefix + 本体 + suffix を返す
/// 空の単語列は空文字列（prefix/suffix も付けない）
std::string join_words(CaseStyle style, const std::vector<std::string>& words,
                       const std::string& prefix = "", const std::string& suffix = "");

/// 表示名（camelCase, SCREAMING_SNAKE_CASE など）
const char* to_string(CaseStyle style);

/// CLIでのスタイル名（camel, screaming-snake など）
const char* flag_name(CaseStyle style);

/// CLIでのスタイル名から解析
std::optional<CaseStyle> parse_case_style(const std::string& name);

}  // namespace naming
}  // namespace refmt
