#pragma once

#include "../debug.hpp"

#include <string>

namespace refmt::debug::xform {

/// clean / emojis / rename_files / 複合処理 共通のメッセージID
enum class Id {
    Start,
    End,
    FileStart,
    LinesCleaned,
    EmojiReplaced,
    EmojiRemoved,
    RenamePlanned,
    RenameConflict,
    Skipped,
    FileError,
};

/// メッセージテーブル [en, ja]
inline const char* messages[][2] = {
    {"Starting pass", "処理を開始"},
    {"Completed pass", "処理を完了"},
    {"Processing file", "ファイルを処理"},
    {"Trailing whitespace removed", "行末の空白を削除"},
    {"Task emoji replaced", "タスク絵文字を置換"},
    {"Emoji removed", "絵文字を削除"},
    {"Rename planned", "リネームを計画"},
    {"Rename target exists", "リネーム先が既に存在"},
    {"Skipped", "スキップ"},
    {"File error", "ファイルエラー"},
};

inline const char* get(Id id) {
    return messages[static_cast<int>(id)][::refmt::debug::g_lang];
}

inline void log(::refmt::debug::Stage stage, Id id,
                ::refmt::debug::Level level = ::refmt::debug::Level::Debug) {
    if (!::refmt::debug::enabled(level))
        return;
    ::refmt::debug::log(stage, level, get(id));
}

inline void log(::refmt::debug::Stage stage, Id id, const std::string& detail,
                ::refmt::debug::Level level = ::refmt::debug::Level::Debug) {
    if (!::refmt::debug::enabled(level))
        return;
    ::refmt::debug::log(stage, level, std::string(get(id)) + ": " + detail);
}

}  // namespace refmt::debug::xform
