// ============================================================
// WhitespaceCleaner - 実装
// ============================================================

#include "whitespace.hpp"

#include "common/debug_messages.hpp"
#include "common/error.hpp"
#include "common/utf8.hpp"
#include "fs/file_io.hpp"

#include <fmt/format.h>
#include <string_view>

namespace refmt {
namespace transform {

const std::vector<std::string>& default_whitespace_extensions() {
    static const std::vector<std::string> extensions = {
        ".py", ".pyx", ".pxd", ".pxi", ".c",   ".h",  ".cpp", ".hpp", ".rs",
        ".go", ".java", ".js", ".ts",  ".jsx", ".tsx", ".md", ".qmd", ".txt",
    };
    return extensions;
}

namespace {

/// 行末の空白（Unicode White_Space）を除いた長さ
size_t content_end(std::string_view line) {
    size_t end = 0;
    size_t pos = 0;
    while (pos < line.size()) {
        size_t len;
        char32_t cp = utf8::decode(line, pos, len);
        if (len == 0) {
            // 不正なバイトは空白ではない文字として扱う
            end = ++pos;
            continue;
        }
        pos += len;
        if (!utf8::is_whitespace(cp)) {
            end = pos;
        }
    }
    return end;
}

}  // namespace

CleanResult clean_trailing_whitespace(const std::string& content) {
    CleanResult result;
    std::string_view rest(content);
    bool ends_with_newline = !content.empty() && content.back() == '\n';
    bool first = true;

    while (!rest.empty()) {
        size_t nl = rest.find('\n');
        std::string_view line = rest.substr(0, nl);
        rest = (nl == std::string_view::npos) ? std::string_view() : rest.substr(nl + 1);

        // "\r\n" の '\r' は改行の一部
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }

        std::string_view cleaned = line.substr(0, content_end(line));
        if (cleaned.size() != line.size()) {
            ++result.lines_cleaned;
        }

        if (!first)
            result.text += '\n';
        result.text += cleaned;
        first = false;
    }

    if (ends_with_newline) {
        result.text += '\n';
    }
    return result;
}

WhitespaceCleaner::WhitespaceCleaner(WhitespaceOptions options, std::ostream& out,
                                     std::ostream& err)
    : options_(std::move(options)),
      walker_(fs::WalkOptions{options_.recursive, options_.file_extensions, std::nullopt, true,
                              fs::default_skip_dirs()}),
      reporter_(options_.dry_run, out),
      err_(err) {}

size_t WhitespaceCleaner::clean_file(const std::filesystem::path& path,
                                     const std::filesystem::path& root) const {
    std::filesystem::path base = root.empty() ? path.parent_path() : root;
    if (!std::filesystem::is_regular_file(path) || !walker_.accepts(path, base)) {
        debug::xform::log(debug::Stage::Clean, debug::xform::Id::Skipped, path.string(),
                          debug::Level::Trace);
        return 0;
    }
    if (!options_.remove_trailing) {
        return 0;
    }

    debug::xform::log(debug::Stage::Clean, debug::xform::Id::FileStart, path.string());
    std::string content = fs::read_file(path);
    auto result = clean_trailing_whitespace(content);
    if (result.lines_cleaned == 0) {
        return 0;
    }

    reporter_.report(path, content, result.text,
                     {fmt::format("clean {} lines in", result.lines_cleaned),
                      fmt::format("Cleaned {} lines in", result.lines_cleaned)});
    debug::xform::log(debug::Stage::Clean, debug::xform::Id::LinesCleaned,
                      fmt::format("{} ({})", path.string(), result.lines_cleaned));
    return result.lines_cleaned;
}

std::pair<size_t, size_t> WhitespaceCleaner::process(const std::filesystem::path& path) const {
    size_t total_files = 0;
    size_t total_lines = 0;
    debug::xform::log(debug::Stage::Clean, debug::xform::Id::Start, path.string(),
                      debug::Level::Info);

    std::vector<std::filesystem::path> files;
    try {
        files = walker_.collect(path);
    } catch (const FileError& e) {
        err_ << e.what() << "\n";
        return {0, 0};
    }

    std::filesystem::path root =
        std::filesystem::is_directory(path) ? path : path.parent_path();
    for (const auto& file : files) {
        try {
            size_t lines = clean_file(file, root);
            if (lines > 0) {
                ++total_files;
                total_lines += lines;
            }
        } catch (const FileError& e) {
            debug::xform::log(debug::Stage::Clean, debug::xform::Id::FileError, e.what());
            err_ << fmt::format("Error processing file '{}': {}\n", file.string(), e.what());
        }
    }

    debug::xform::log(debug::Stage::Clean, debug::xform::Id::End,
                      fmt::format("{} file(s), {} line(s)", total_files, total_lines),
                      debug::Level::Info);
    return {total_files, total_lines};
}

}  // namespace transform
}  // namespace refmt
