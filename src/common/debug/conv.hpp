#pragma once

#include "../debug.hpp"

#include <string>

namespace refmt::debug::conv {

/// 命名スタイル変換メッセージID
enum class Id {
    // 基本フロー
    Start,
    End,
    JobCompiled,
    FileStart,

    // 変換処理
    TokenMatched,
    TokenRewritten,
    StageApplied,
    FilterRejected,

    // 結果
    Changed,
    Unchanged,
    FileError,
};

/// メッセージテーブル [en, ja]
inline const char* messages[][2] = {
    // 基本フロー
    {"Starting case conversion", "命名スタイル変換を開始"},
    {"Completed case conversion", "命名スタイル変換を完了"},
    {"Rewrite job compiled", "変換ジョブをコンパイル"},
    {"Processing file", "ファイルを処理"},

    // 変換処理
    {"Token matched", "トークンを検出"},
    {"Token rewritten", "トークンを書き換え"},
    {"Affix stage applied", "接頭辞/接尾辞ステージを適用"},
    {"Rejected by word filter", "ワードフィルタで除外"},

    // 結果
    {"Content changed", "内容が変更されました"},
    {"Content unchanged", "内容に変更はありません"},
    {"File error", "ファイルエラー"},
};

inline const char* get(Id id) {
    return messages[static_cast<int>(id)][::refmt::debug::g_lang];
}

inline void log(Id id, ::refmt::debug::Level level = ::refmt::debug::Level::Debug) {
    if (!::refmt::debug::enabled(level))
        return;
    ::refmt::debug::log(::refmt::debug::Stage::Convert, level, get(id));
}

inline void log(Id id, const std::string& detail,
                ::refmt::debug::Level level = ::refmt::debug::Level::Debug) {
    if (!::refmt::debug::enabled(level))
        return;
    ::refmt::debug::log(::refmt::debug::Stage::Convert, level,
                        std::string(get(id)) + ": " + detail);
}

}  // namespace refmt::debug::conv
