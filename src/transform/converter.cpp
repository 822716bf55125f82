// ============================================================
// CaseConverter - 実装
// ============================================================

#include "converter.hpp"

#include "common/debug_messages.hpp"
#include "common/error.hpp"
#include "fs/file_io.hpp"

#include <fmt/format.h>

namespace refmt {
namespace transform {

namespace {

fs::WalkOptions make_walk_options(const ConvertOptions& options) {
    fs::WalkOptions walk;
    walk.recursive = options.recursive;
    walk.extensions = options.extensions.value_or(fs::default_convert_extensions());
    if (options.glob) {
        walk.glob = fs::GlobPattern::compile(*options.glob);
    }
    return walk;
}

}  // namespace

CaseConverter::CaseConverter(const ConvertOptions& options, std::ostream& out, std::ostream& err)
    : rewriter_(options.job),
      walker_(make_walk_options(options)),
      reporter_(options.dry_run, out),
      err_(err) {}

bool CaseConverter::process_file(const std::filesystem::path& path, ConvertStats& stats) const {
    debug::conv::log(debug::conv::Id::FileStart, path.string());
    ++stats.files_scanned;

    std::string content = fs::read_file(path);
    auto outcome = rewriter_.rewrite(content);

    if (!outcome.changed) {
        debug::conv::log(debug::conv::Id::Unchanged, path.string());
        reporter_.report_unchanged(path);
        return false;
    }

    reporter_.report(path, content, outcome.text, fs::kConvertVerbs);
    ++stats.files_changed;
    stats.replacements += outcome.replacements;
    debug::conv::log(debug::conv::Id::Changed,
                     fmt::format("{} ({} replacement(s))", path.string(), outcome.replacements));
    return true;
}

ConvertStats CaseConverter::process(const std::filesystem::path& path) const {
    ConvertStats stats;
    debug::conv::log(debug::conv::Id::Start, path.string(), debug::Level::Info);

    std::vector<std::filesystem::path> files;
    try {
        files = walker_.collect(path);
    } catch (const FileError& e) {
        err_ << e.what() << "\n";
        return stats;
    }

    for (const auto& file : files) {
        try {
            process_file(file, stats);
        } catch (const FileError& e) {
            ++stats.files_failed;
            debug::conv::log(debug::conv::Id::FileError, e.what(), debug::Level::Debug);
            err_ << fmt::format("Error processing file '{}': {}\n", file.string(), e.what());
        }
    }

    debug::conv::log(debug::conv::Id::End,
                     fmt::format("{} scanned, {} changed, {} failed", stats.files_scanned,
                                 stats.files_changed, stats.files_failed),
                     debug::Level::Info);
    return stats;
}

}  // namespace transform
}  // namespace refmt
