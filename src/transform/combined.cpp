// ============================================================
// CombinedProcessor - 実装
// ============================================================

#include "combined.hpp"

#include "common/debug_messages.hpp"
#include "common/error.hpp"

#include <algorithm>
#include <fmt/format.h>
#include <vector>

namespace refmt {
namespace transform {

namespace stdfs = std::filesystem;

namespace {

RenameOptions lowercase_rename(const CombinedOptions& options) {
    RenameOptions rename;
    rename.case_transform = CaseTransform::Lowercase;
    rename.recursive = options.recursive;
    rename.dry_run = options.dry_run;
    return rename;
}

EmojiOptions emoji_defaults(const CombinedOptions& options) {
    EmojiOptions emoji;
    emoji.recursive = options.recursive;
    emoji.dry_run = options.dry_run;
    return emoji;
}

WhitespaceOptions whitespace_defaults(const CombinedOptions& options) {
    WhitespaceOptions ws;
    ws.recursive = options.recursive;
    ws.dry_run = options.dry_run;
    return ws;
}

}  // namespace

CombinedProcessor::CombinedProcessor(CombinedOptions options, std::ostream& out,
                                     std::ostream& err)
    : options_(options),
      walker_(fs::WalkOptions{options.recursive, {}, std::nullopt, true, fs::default_skip_dirs()}),
      renamer_(lowercase_rename(options), out, err),
      emoji_(emoji_defaults(options), out, err),
      whitespace_(whitespace_defaults(options), out, err),
      err_(err) {}

void CombinedProcessor::process_file(const stdfs::path& path, const stdfs::path& root,
                                     CombinedStats& stats) const {
    debug::xform::log(debug::Stage::Combined, debug::xform::Id::FileStart, path.string());

    auto renamed = renamer_.rename_file(path, root);
    if (renamed) {
        ++stats.files_renamed;
    }

    // dry-run ではファイルは元の名前のまま
    stdfs::path current = (renamed && !options_.dry_run) ? *renamed : path;

    size_t emoji_changes = emoji_.transform_file(current, root);
    if (emoji_changes > 0) {
        ++stats.files_emoji_transformed;
        stats.emoji_changes += emoji_changes;
    }

    size_t lines = whitespace_.clean_file(current, root);
    if (lines > 0) {
        ++stats.files_whitespace_cleaned;
        stats.whitespace_lines_cleaned += lines;
    }
}

CombinedStats CombinedProcessor::process(const stdfs::path& path) const {
    CombinedStats stats;
    debug::xform::log(debug::Stage::Combined, debug::xform::Id::Start, path.string(),
                      debug::Level::Info);

    std::vector<stdfs::path> files;
    try {
        files = walker_.collect(path);
    } catch (const FileError& e) {
        err_ << e.what() << "\n";
        return stats;
    }

    // 深い階層から処理する
    if (options_.recursive) {
        std::stable_sort(files.begin(), files.end(),
                         [](const stdfs::path& a, const stdfs::path& b) {
                             return std::distance(a.begin(), a.end()) >
                                    std::distance(b.begin(), b.end());
                         });
    }

    stdfs::path root = stdfs::is_directory(path) ? path : path.parent_path();
    for (const auto& file : files) {
        try {
            process_file(file, root, stats);
        } catch (const FileError& e) {
            ++stats.files_failed;
            debug::xform::log(debug::Stage::Combined, debug::xform::Id::FileError, e.what());
            err_ << fmt::format("Error processing file '{}': {}\n", file.string(), e.what());
        }
    }

    debug::xform::log(debug::Stage::Combined, debug::xform::Id::End,
                      fmt::format("{} renamed, {} emoji file(s), {} whitespace file(s)",
                                  stats.files_renamed, stats.files_emoji_transformed,
                                  stats.files_whitespace_cleaned),
                      debug::Level::Info);
    return stats;
}

}  // namespace transform
}  // namespace refmt
