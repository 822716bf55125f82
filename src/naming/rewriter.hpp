#pragma once

// ============================================================
// IdentifierRewriter - 識別子の命名スタイル書き換え
// ============================================================
// 変換元スタイルのトークン（find_tokens）それぞれに対して
//   1. strip-prefix    2. strip-suffix
//   3. replace-prefix  4. replace-suffix
//   5. ワードフィルタ   6. 分割   7. 結合（prefix/suffix 付加）
// を順に適用し、テキスト全体を1パスで置換する

#include "case_style.hpp"

#include <re2/re2.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace refmt {
namespace naming {

/// 書き換えジョブの設定（1回の実行中は不変）
struct RewriteJob {
    CaseStyle source = CaseStyle::Camel;
    CaseStyle target = CaseStyle::Snake;

    // 変換後に付加する文字列
    std::string prefix;
    std::string suffix;

    // 変換前に取り除く文字列
    std::optional<std::string> strip_prefix;
    std::optional<std::string> strip_suffix;

    // 変換前に置き換える文字列（to には対応する from が必須）
    std::optional<std::string> replace_prefix_from;
    std::optional<std::string> replace_prefix_to;
    std::optional<std::string> replace_suffix_from;
    std::optional<std::string> replace_suffix_to;

    // 前処理後の識別子に対して部分一致で検索する正規表現（RE2 構文）
    std::optional<std::string> word_filter;
};

/// テキスト1つ分の書き換え結果
struct MatchOutcome {
    bool changed = false;
    std::string text;
    size_t replacements = 0;  // 元と異なる文字列に置換されたトークン数
};

/// 先頭/末尾の固定文字列を置き換える前処理ステージ
/// to が空なら単純な除去になる
struct AffixTransform {
    enum class Anchor { Prefix, Suffix };

    Anchor anchor;
    std::string from;
    std::string to;

    /// 適用した場合 true
    bool apply(std::string& name) const;
};

class IdentifierRewriter {
   public:
    /// ワードフィルタをコンパイル（不正な設定は ConfigError）
    explicit IdentifierRewriter(RewriteJob job);

    /// テキスト全体を書き換える
    MatchOutcome rewrite(const std::string& text) const;

    /// 単一トークンを変換（フィルタで除外された場合は元のまま）
    std::string convert(const std::string& token) const;

    /// ステージ1-4のみを適用した結果
    std::string preprocess(const std::string& token) const;

    const RewriteJob& job() const { return job_; }

    /// 有効な前処理ステージ（適用順）
    const std::vector<AffixTransform>& stages() const { return stages_; }

   private:
    static void validate(const RewriteJob& job);

    RewriteJob job_;
    std::shared_ptr<const RE2> word_filter_;
    std::vector<AffixTransform> stages_;
};

}  // namespace naming
}  // namespace refmt
