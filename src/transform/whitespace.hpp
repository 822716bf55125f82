#pragma once

// ============================================================
// WhitespaceCleaner - 行末の空白を削除
// ============================================================

#include "fs/reporter.hpp"
#include "fs/walker.hpp"

#include <filesystem>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace refmt {
namespace transform {

/// デフォルト拡張子
const std::vector<std::string>& default_whitespace_extensions();

struct WhitespaceOptions {
    bool remove_trailing = true;
    std::vector<std::string> file_extensions = default_whitespace_extensions();
    bool recursive = true;
    bool dry_run = false;
};

/// テキスト単位の結果
struct CleanResult {
    std::string text;
    size_t lines_cleaned = 0;
};

/// 各行の末尾空白（全角スペース・NBSP を含む）を削除
/// 元が改行で終わっていれば改行を残す
CleanResult clean_trailing_whitespace(const std::string& content);

class WhitespaceCleaner {
   public:
    explicit WhitespaceCleaner(WhitespaceOptions options, std::ostream& out = std::cout,
                               std::ostream& err = std::cerr);

    /// 単一ファイルを処理し、修正した行数を返す（対象外なら0）
    /// root は除外判定の基準ディレクトリ（省略時は親ディレクトリ）
    size_t clean_file(const std::filesystem::path& path,
                      const std::filesystem::path& root = {}) const;

    /// ファイルまたはディレクトリを処理し (ファイル数, 行数) を返す
    std::pair<size_t, size_t> process(const std::filesystem::path& path) const;

   private:
    WhitespaceOptions options_;
    fs::TreeWalker walker_;
    fs::FileMutationReporter reporter_;
    std::ostream& err_;
};

}  // namespace transform
}  // namespace refmt
