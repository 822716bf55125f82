// ============================================================
// コマンドラインオプション
// ============================================================

#pragma once

#include "naming/rewriter.hpp"
#include "transform/rename.hpp"

#include <optional>
#include <string>
#include <vector>

namespace refmt {
namespace cli {

// サブコマンド
enum class Command { None, Combined, Convert, Clean, Emojis, RenameFiles, Help, Version };

struct Options {
    Command command = Command::None;
    std::string path;

    // 共通
    bool recursive = false;  // -r 指定の有無
    bool dry_run = false;
    std::optional<std::vector<std::string>> extensions;

    // ログ
    int verbose = 0;
    bool quiet = false;
    std::optional<std::string> log_file;
    bool lang_ja = false;

    // convert
    std::vector<naming::CaseStyle> from_styles;
    std::vector<naming::CaseStyle> to_styles;
    std::string prefix;
    std::string suffix;
    std::optional<std::string> strip_prefix;
    std::optional<std::string> strip_suffix;
    std::optional<std::string> replace_prefix_from;
    std::optional<std::string> replace_prefix_to;
    std::optional<std::string> replace_suffix_from;
    std::optional<std::string> replace_suffix_to;
    std::optional<std::string> glob;
    std::optional<std::string> word_filter;

    // emojis（未指定なら設定ファイルの値）
    std::optional<bool> replace_task;
    std::optional<bool> remove_other;

    // rename_files
    transform::CaseTransform case_transform = transform::CaseTransform::None;
    transform::SpaceReplace space_replace = transform::SpaceReplace::None;
    transform::TimestampFormat timestamp = transform::TimestampFormat::None;
    std::optional<std::string> add_prefix;
    std::optional<std::string> rm_prefix;
    std::optional<std::string> add_suffix;
    std::optional<std::string> rm_suffix;
};

// コマンド名（ヘルプ・エラー表示用）
const char* command_name(Command command);

// 引数（プログラム名を除く）を解析。不正な指定は ConfigError
Options parse_options(const std::vector<std::string>& args);

// convert のオプションから書き換えジョブを組み立てる
// 変換元・変換先スタイルはそれぞれちょうど1つ必要
naming::RewriteJob make_rewrite_job(const Options& opts);

// ヘルプ
std::string help_text(const char* program_name);

}  // namespace cli
}  // namespace refmt
