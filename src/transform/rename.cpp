// ============================================================
// FileRenamer - 実装
// ============================================================

#include "rename.hpp"

#include "common/debug_messages.hpp"
#include "common/error.hpp"

#include <algorithm>
#include <cctype>
#include <fmt/chrono.h>
#include <fmt/format.h>
#include <system_error>
#include <vector>

namespace refmt {
namespace transform {

namespace stdfs = std::filesystem;

namespace {

void replace_all(std::string& s, char from, char to) {
    std::replace(s.begin(), s.end(), from, to);
}

std::string to_lower(std::string s) {
    for (auto& c : s) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return s;
}

std::string to_upper(std::string s) {
    for (auto& c : s) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return s;
}

size_t depth(const stdfs::path& p) {
    return static_cast<size_t>(std::distance(p.begin(), p.end()));
}

bool same_file(const stdfs::path& a, const stdfs::path& b) {
    std::error_code ec;
    bool same = stdfs::equivalent(a, b, ec);
    return !ec && same;
}

}  // namespace

std::string timestamp_prefix(TimestampFormat format, std::time_t now) {
    switch (format) {
        case TimestampFormat::Long:
            return fmt::format("{:%Y%m%d}_", fmt::localtime(now));
        case TimestampFormat::Short:
            return fmt::format("{:%y%m%d}_", fmt::localtime(now));
        case TimestampFormat::None:
            break;
    }
    return "";
}

FileRenamer::FileRenamer(RenameOptions options, std::ostream& out, std::ostream& err)
    : options_(std::move(options)),
      walker_(fs::WalkOptions{options_.recursive, {}, std::nullopt, true, {}}),
      out_(out),
      err_(err) {}

std::string FileRenamer::transform_name(const std::string& file_name, std::time_t now) const {
    // 最後の '.' で語幹と拡張子に分割
    std::string stem = file_name;
    std::optional<std::string> extension;
    size_t dot = file_name.rfind('.');
    if (dot != std::string::npos) {
        stem = file_name.substr(0, dot);
        extension = file_name.substr(dot + 1);
    }

    if (options_.remove_prefix && stem.starts_with(*options_.remove_prefix)) {
        stem.erase(0, options_.remove_prefix->size());
    }
    if (options_.remove_suffix && stem.ends_with(*options_.remove_suffix)) {
        stem.erase(stem.size() - options_.remove_suffix->size());
    }

    switch (options_.space_replace) {
        case SpaceReplace::Underscore:
            replace_all(stem, ' ', '_');
            replace_all(stem, '-', '_');
            break;
        case SpaceReplace::Hyphen:
            replace_all(stem, ' ', '-');
            replace_all(stem, '_', '-');
            break;
        case SpaceReplace::None:
            break;
    }

    switch (options_.case_transform) {
        case CaseTransform::Lowercase:
            stem = to_lower(stem);
            break;
        case CaseTransform::Uppercase:
            stem = to_upper(stem);
            break;
        case CaseTransform::Capitalize:
            if (!stem.empty()) {
                stem = to_lower(stem);
                stem[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(stem[0])));
            }
            break;
        case CaseTransform::None:
            break;
    }

    std::string result = timestamp_prefix(options_.timestamp, now) + stem;
    if (options_.add_prefix) {
        result = *options_.add_prefix + result;
    }
    if (options_.add_suffix) {
        result += *options_.add_suffix;
    }
    // 拡張子は変換しない
    if (extension) {
        result += "." + *extension;
    }
    return result;
}

std::optional<stdfs::path> FileRenamer::rename_file(const stdfs::path& path,
                                                    const stdfs::path& root) const {
    stdfs::path base = root.empty() ? path.parent_path() : root;
    if (!stdfs::is_regular_file(path) || !walker_.accepts(path, base)) {
        return std::nullopt;
    }

    std::string file_name = path.filename().string();
    std::string new_name = transform_name(file_name, std::time(nullptr));
    if (new_name == file_name) {
        return std::nullopt;
    }

    stdfs::path new_path = path.parent_path() / new_name;
    std::error_code ec;
    if (stdfs::exists(new_path, ec) && !same_file(path, new_path)) {
        debug::xform::log(debug::Stage::Rename, debug::xform::Id::RenameConflict,
                          new_path.string(), debug::Level::Warn);
        throw FileError(new_path,
                        fmt::format("Target file already exists: '{}'", new_path.string()));
    }

    debug::xform::log(debug::Stage::Rename, debug::xform::Id::RenamePlanned,
                      fmt::format("{} -> {}", path.string(), new_path.string()));
    if (options_.dry_run) {
        out_ << fmt::format("Would rename '{}' -> '{}'\n", path.string(), new_path.string());
    } else {
        stdfs::rename(path, new_path, ec);
        if (ec) {
            throw FileError(path, fmt::format("cannot rename to '{}': {}", new_path.string(),
                                              ec.message()));
        }
        out_ << fmt::format("Renamed '{}' -> '{}'\n", path.string(), new_path.string());
    }
    return new_path;
}

size_t FileRenamer::process(const stdfs::path& path) const {
    size_t renamed = 0;
    debug::xform::log(debug::Stage::Rename, debug::xform::Id::Start, path.string(),
                      debug::Level::Info);

    std::vector<stdfs::path> files;
    try {
        files = walker_.collect(path);
    } catch (const FileError& e) {
        err_ << e.what() << "\n";
        return 0;
    }

    if (options_.recursive) {
        std::stable_sort(files.begin(), files.end(),
                         [](const stdfs::path& a, const stdfs::path& b) {
                             return depth(a) > depth(b);
                         });
    }

    stdfs::path root = stdfs::is_directory(path) ? path : path.parent_path();
    for (const auto& file : files) {
        try {
            if (rename_file(file, root)) {
                ++renamed;
            }
        } catch (const FileError& e) {
            debug::xform::log(debug::Stage::Rename, debug::xform::Id::FileError, e.what());
            err_ << fmt::format("Error processing file '{}': {}\n", file.string(), e.what());
        }
    }

    debug::xform::log(debug::Stage::Rename, debug::xform::Id::End,
                      fmt::format("{} renamed", renamed), debug::Level::Info);
    return renamed;
}

}  // namespace transform
}  // namespace refmt
