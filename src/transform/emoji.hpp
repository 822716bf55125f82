#pragma once

// ============================================================
// EmojiTransformer - タスク絵文字のテキスト化とその他絵文字の削除
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

const std::vector<std::string>& default_emoji_extensions();

struct EmojiOptions {
    bool replace_task_emojis = true;
    bool remove_other_emojis = true;
    std::vector<std::string> file_extensions = default_emoji_extensions();
    bool recursive = true;
    bool dry_run = false;
};

struct EmojiResult {
    std::string text;
    size_t replaced = 0;  // テキスト化したタスク絵文字
    size_t removed = 0;   // 削除した絵文字
};

/// タスク絵文字の置換文字列（対象外なら nullptr）
const char* task_emoji_replacement(char32_t cp);

/// 削除対象の絵文字範囲に含まれるか
bool is_removable_emoji(char32_t cp);

/// テキストを変換（不正なUTF-8バイトはそのまま残す）
EmojiResult transform_emojis(const std::string& content, bool replace_task, bool remove_other);

class EmojiTransformer {
   public:
    explicit EmojiTransformer(EmojiOptions options, std::ostream& out = std::cout,
                              std::ostream& err = std::cerr);

    /// 単一ファイルを変換し、変更数を返す（変更があれば最低1）
    size_t transform_file(const std::filesystem::path& path,
                          const std::filesystem::path& root = {}) const;

    /// (ファイル数, 変更数)
    std::pair<size_t, size_t> process(const std::filesystem::path& path) const;

   private:
    EmojiOptions options_;
    fs::TreeWalker walker_;
    fs::FileMutationReporter reporter_;
    std::ostream& err_;
};

}  // namespace transform
}  // namespace refmt
