#pragma once

// ============================================================
// FileRenamer - ファイル名の書き換え
// ============================================================

#include "fs/walker.hpp"

#include <ctime>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

namespace refmt {
namespace transform {

enum class CaseTransform { None, Lowercase, Uppercase, Capitalize };

enum class SpaceReplace {
    None,
    Underscore,  // ' ', '-' → '_'
    Hyphen,      // ' ', '_' → '-'
};

enum class TimestampFormat {
    None,
    Long,   // YYYYMMDD_
    Short,  // YYMMDD_
};

struct RenameOptions {
    CaseTransform case_transform = CaseTransform::None;
    SpaceReplace space_replace = SpaceReplace::None;
    TimestampFormat timestamp = TimestampFormat::None;
    std::optional<std::string> add_prefix;
    std::optional<std::string> remove_prefix;
    std::optional<std::string> add_suffix;     // 拡張子の前に付加
    std::optional<std::string> remove_suffix;  // 拡張子の前から削除
    bool recursive = true;
    bool dry_run = false;
};

/// ローカル日付のプレフィックス（None なら空文字列）
std::string timestamp_prefix(TimestampFormat format, std::time_t now);

class FileRenamer {
   public:
    explicit FileRenamer(RenameOptions options, std::ostream& out = std::cout,
                         std::ostream& err = std::cerr);

    /// ファイル名（拡張子込み）に変換規則を適用
    std::string transform_name(const std::string& file_name, std::time_t now) const;

    /// 単一ファイルをリネーム。リネームした（dry-run では予定の）新パスを返す
    /// 変更不要・対象外なら nullopt。既存ファイルとの衝突は FileError
    std::optional<std::filesystem::path> rename_file(const std::filesystem::path& path,
                                                     const std::filesystem::path& root = {}) const;

    /// ファイルまたはディレクトリを処理し、リネーム数を返す
    /// 再帰時は深い階層のファイルから処理する
    size_t process(const std::filesystem::path& path) const;

   private:
    RenameOptions options_;
    fs::TreeWalker walker_;
    std::ostream& out_;
    std::ostream& err_;
};

}  // namespace transform
}  // namespace refmt
