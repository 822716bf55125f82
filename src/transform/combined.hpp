#pragma once

// ============================================================
// CombinedProcessor - リネーム(小文字化) → 絵文字 → 空白 の一括処理
// ============================================================

#include "emoji.hpp"
#include "rename.hpp"
#include "whitespace.hpp"

#include <filesystem>
#include <iostream>

namespace refmt {
namespace transform {

struct CombinedOptions {
    bool recursive = true;
    bool dry_run = false;
};

struct CombinedStats {
    size_t files_renamed = 0;
    size_t files_emoji_transformed = 0;
    size_t emoji_changes = 0;
    size_t files_whitespace_cleaned = 0;
    size_t whitespace_lines_cleaned = 0;
    size_t files_failed = 0;
};

class CombinedProcessor {
   public:
    explicit CombinedProcessor(CombinedOptions options, std::ostream& out = std::cout,
                               std::ostream& err = std::cerr);

    CombinedStats process(const std::filesystem::path& path) const;

   private:
    void process_file(const std::filesystem::path& path, const std::filesystem::path& root,
                      CombinedStats& stats) const;

    CombinedOptions options_;
    fs::TreeWalker walker_;
    FileRenamer renamer_;
    EmojiTransformer emoji_;
    WhitespaceCleaner whitespace_;
    std::ostream& err_;
};

}  // namespace transform
}  // namespace refmt
