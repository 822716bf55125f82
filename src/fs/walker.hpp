#pragma once

// ============================================================
// TreeWalker - 処理対象ファイルの列挙
// ============================================================

#include "glob.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace refmt {
namespace fs {

/// 列挙オプション
struct WalkOptions {
    bool recursive = false;
    std::vector<std::string> extensions;  // ".py" 形式。空なら全ファイル
    std::optional<GlobPattern> glob;      // ファイル名または相対パスに対して判定
    bool skip_hidden = false;             // '.' で始まるパス要素を除外
    std::vector<std::string> skip_dirs;   // 除外するディレクトリ名
};

/// convert のデフォルト拡張子
const std::vector<std::string>& default_convert_extensions();

/// clean / emojis で除外するディレクトリ名
const std::vector<std::string>& default_skip_dirs();

class TreeWalker {
   public:
    explicit TreeWalker(WalkOptions options) : options_(std::move(options)) {}

    /// ルートから対象ファイルを列挙する（ソート済み）
    /// ルートがファイルならそのファイルのみ（フィルタは適用する）
    /// ルートが存在しない場合は FileError
    std::vector<std::filesystem::path> collect(const std::filesystem::path& root) const;

    /// ファイルがフィルタを通過するか
    bool accepts(const std::filesystem::path& file, const std::filesystem::path& root) const;

    const WalkOptions& options() const { return options_; }

   private:
    bool has_accepted_extension(const std::filesystem::path& file) const;
    bool is_excluded_component(const std::string& name) const;

    WalkOptions options_;
};

}  // namespace fs
}  // namespace refmt
