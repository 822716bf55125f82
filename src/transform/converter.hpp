#pragma once

// ============================================================
// CaseConverter - ファイルツリーに対する命名スタイル変換
// ============================================================

#include "fs/reporter.hpp"
#include "fs/walker.hpp"
#include "naming/rewriter.hpp"

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace refmt {
namespace transform {

/// 変換オプション（CLI/設定ファイルから組み立てる）
struct ConvertOptions {
    naming::RewriteJob job;
    std::optional<std::vector<std::string>> extensions;  // 未指定ならデフォルト
    std::optional<std::string> glob;
    bool recursive = false;
    bool dry_run = false;
};

/// 変換結果の集計
struct ConvertStats {
    size_t files_scanned = 0;
    size_t files_changed = 0;
    size_t replacements = 0;
    size_t files_failed = 0;
};

class CaseConverter {
   public:
    /// ジョブとglobをコンパイル（不正な設定は ConfigError）
    explicit CaseConverter(const ConvertOptions& options, std::ostream& out = std::cout,
                           std::ostream& err = std::cerr);

    /// ファイルまたはディレクトリを処理
    ConvertStats process(const std::filesystem::path& path) const;

    /// 単一ファイルを処理（I/Oエラーは FileError）
    /// 変更があった（または dry-run で変更予定の）場合 true
    bool process_file(const std::filesystem::path& path, ConvertStats& stats) const;

    const naming::IdentifierRewriter& rewriter() const { return rewriter_; }

   private:
    naming::IdentifierRewriter rewriter_;
    fs::TreeWalker walker_;
    fs::FileMutationReporter reporter_;
    std::ostream& err_;
};

}  // namespace transform
}  // namespace refmt
