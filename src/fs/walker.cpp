// ============================================================
// TreeWalker - 実装
// ============================================================

#include "walker.hpp"

#include "common/debug_messages.hpp"
#include "common/error.hpp"

#include <algorithm>
#include <fmt/format.h>

namespace stdfs = std::filesystem;

namespace refmt {
namespace fs {

const std::vector<std::string>& default_convert_extensions() {
    static const std::vector<std::string> extensions = {
        ".c", ".h", ".py", ".md", ".js", ".ts", ".java", ".cpp", ".hpp",
    };
    return extensions;
}

const std::vector<std::string>& default_skip_dirs() {
    static const std::vector<std::string> dirs = {
        "build", "__pycache__", ".git", "node_modules", "venv", ".venv", "target",
    };
    return dirs;
}

bool TreeWalker::has_accepted_extension(const stdfs::path& file) const {
    if (options_.extensions.empty()) {
        return true;
    }
    // 拡張子なし（".hidden" を含む）は対象外
    std::string ext = file.extension().string();
    if (ext.empty()) {
        return false;
    }
    return std::find(options_.extensions.begin(), options_.extensions.end(), ext) !=
           options_.extensions.end();
}

bool TreeWalker::is_excluded_component(const std::string& name) const {
    if (name.empty() || name == "." || name == "..") {
        return false;
    }
    if (options_.skip_hidden && name[0] == '.') {
        return true;
    }
    return std::find(options_.skip_dirs.begin(), options_.skip_dirs.end(), name) !=
           options_.skip_dirs.end();
}

bool TreeWalker::accepts(const stdfs::path& file, const stdfs::path& root) const {
    // ルートからの相対パス要素（ファイル名を含む）を検査
    std::error_code ec;
    stdfs::path relative = stdfs::relative(file, root, ec);
    if (ec || relative.empty()) {
        relative = file.filename();
    }
    for (const auto& part : relative) {
        if (is_excluded_component(part.string())) {
            debug::walk::log(debug::walk::Id::SkipExcluded, file.string(), debug::Level::Trace);
            return false;
        }
    }

    if (!has_accepted_extension(file)) {
        debug::walk::log(debug::walk::Id::SkipExtension, file.string(), debug::Level::Trace);
        return false;
    }

    if (options_.glob && !options_.glob->matches_file(file, root)) {
        debug::walk::log(debug::walk::Id::SkipGlob, file.string(), debug::Level::Trace);
        return false;
    }

    return true;
}

std::vector<stdfs::path> TreeWalker::collect(const stdfs::path& root) const {
    std::vector<stdfs::path> files;
    std::error_code ec;

    if (!stdfs::exists(root, ec)) {
        throw FileError(root, fmt::format("Path '{}' does not exist.", root.string()));
    }

    debug::walk::log(debug::walk::Id::Start, root.string());

    if (stdfs::is_regular_file(root, ec)) {
        debug::walk::log(debug::walk::Id::RootIsFile, root.string());
        stdfs::path base = root.has_parent_path() ? root.parent_path() : stdfs::path(".");
        if (accepts(root, base)) {
            files.push_back(root);
        }
        return files;
    }

    if (!stdfs::is_directory(root, ec)) {
        throw FileError(root,
                        fmt::format("Path '{}' is not a directory or file.", root.string()));
    }

    if (options_.recursive) {
        auto it = stdfs::recursive_directory_iterator(
            root, stdfs::directory_options::skip_permission_denied, ec);
        if (ec) {
            throw FileError(root, fmt::format("cannot read directory: {}", ec.message()));
        }
        for (auto end = stdfs::recursive_directory_iterator(); it != end; it.increment(ec)) {
            if (ec) {
                debug::walk::log(debug::walk::Id::DirError, ec.message(), debug::Level::Warn);
                break;
            }
            const auto& entry = *it;
            if (entry.is_symlink(ec)) {
                continue;
            }
            if (entry.is_directory(ec)) {
                // 除外ディレクトリには降りない
                if (is_excluded_component(entry.path().filename().string())) {
                    debug::walk::log(debug::walk::Id::SkipDir, entry.path().string(),
                                     debug::Level::Trace);
                    it.disable_recursion_pending();
                } else {
                    debug::walk::log(debug::walk::Id::EnterDir, entry.path().string(),
                                     debug::Level::Trace);
                }
                continue;
            }
            if (entry.is_regular_file(ec) && accepts(entry.path(), root)) {
                files.push_back(entry.path());
            }
        }
    } else {
        auto it = stdfs::directory_iterator(root, ec);
        if (ec) {
            throw FileError(root, fmt::format("cannot read directory: {}", ec.message()));
        }
        for (auto end = stdfs::directory_iterator(); it != end; it.increment(ec)) {
            if (ec) {
                debug::walk::log(debug::walk::Id::DirError, ec.message(), debug::Level::Warn);
                break;
            }
            const auto& entry = *it;
            if (entry.is_regular_file(ec) && accepts(entry.path(), root)) {
                files.push_back(entry.path());
            }
        }
    }

    std::sort(files.begin(), files.end());

    for (const auto& file : files) {
        debug::walk::log(debug::walk::Id::Candidate, file.string(), debug::Level::Trace);
    }
    debug::walk::log(debug::walk::Id::End, fmt::format("{} file(s)", files.size()));
    return files;
}

}  // namespace fs
}  // namespace refmt
