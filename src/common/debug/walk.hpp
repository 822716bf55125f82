#pragma once

#include "../debug.hpp"

#include <string>

namespace refmt::debug::walk {

/// TreeWalker メッセージID
enum class Id {
    Start,
    End,
    RootIsFile,
    EnterDir,
    Candidate,
    SkipExtension,
    SkipGlob,
    SkipExcluded,
    SkipDir,
    DirError,
};

/// メッセージテーブル [en, ja]
inline const char* messages[][2] = {
    {"Collecting candidate files", "対象ファイルを収集"},
    {"Collected candidate files", "対象ファイルの収集を完了"},
    {"Root is a single file", "ルートは単一ファイル"},
    {"Entering directory", "ディレクトリに入る"},
    {"Candidate file", "対象ファイル"},
    {"Skipped by extension", "拡張子により除外"},
    {"Skipped by glob", "globにより除外"},
    {"Skipped excluded path", "除外パスをスキップ"},
    {"Skipped directory", "ディレクトリを除外"},
    {"Cannot read directory", "ディレクトリを読めません"},
};

inline const char* get(Id id) {
    return messages[static_cast<int>(id)][::refmt::debug::g_lang];
}

inline void log(Id id, ::refmt::debug::Level level = ::refmt::debug::Level::Debug) {
    if (!::refmt::debug::enabled(level))
        return;
    ::refmt::debug::log(::refmt::debug::Stage::Walk, level, get(id));
}

inline void log(Id id, const std::string& detail,
                ::refmt::debug::Level level = ::refmt::debug::Level::Debug) {
    if (!::refmt::debug::enabled(level))
        return;
    ::refmt::debug::log(::refmt::debug::Stage::Walk, level, std::string(get(id)) + ": " + detail);
}

}  // namespace refmt::debug::walk
