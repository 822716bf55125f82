#pragma once

// ============================================================
// FileMutationReporter - 変更の書き込みと報告
// ============================================================
// dry-run ではファイルを一切変更しない

#include <filesystem>
#include <iostream>
#include <string>

namespace refmt {
namespace fs {

/// 報告文言（"Would convert" / "Converted" など）
struct ReportVerbs {
    std::string would;  // dry-run 時: "Would <would> '<path>'"
    std::string done;   // 実行時:    "<done> '<path>'"
};

inline const ReportVerbs kConvertVerbs{"convert", "Converted"};
inline const ReportVerbs kEmojiVerbs{"transform emojis in", "Transformed emojis in"};

class FileMutationReporter {
   public:
    explicit FileMutationReporter(bool dry_run, std::ostream& out = std::cout)
        : dry_run_(dry_run), out_(out) {}

    /// 内容が変わっていれば書き込み（dry-run では報告のみ）して true を返す
    /// 書き込み失敗は FileError
    bool report(const std::filesystem::path& path, const std::string& original,
                const std::string& updated, const ReportVerbs& verbs) const;

    /// 変更なしの報告（dry-run では何も出さない）
    void report_unchanged(const std::filesystem::path& path) const;

    bool dry_run() const { return dry_run_; }
    std::ostream& out() const { return out_; }

   private:
    bool dry_run_;
    std::ostream& out_;
};

}  // namespace fs
}  // namespace refmt
