#pragma once

#include <fmt/format.h>

#include <fstream>
#include <iostream>
#include <memory>
#include <string>

namespace refmt::debug {

/// コンソールログ出力フラグ
inline bool g_debug_mode = true;

/// 言語設定 (0=English, 1=Japanese, ...)
inline int g_lang = 0;

/// デバッグレベル
enum class Level { Trace, Debug, Info, Warn, Error };

/// 現在のコンソール出力レベル（デフォルトはWarn以上のみ）
inline Level g_debug_level = Level::Warn;

/// ログファイル（--log-file 指定時のみ、Debug以上を記録）
inline std::unique_ptr<std::ofstream> g_log_file;

/// 処理段階
enum class Stage { Cli, Config, Walk, Convert, Clean, Emoji, Rename, Combined };

/// 段階を文字列に変換
inline const char* stage_str(Stage s) {
    switch (s) {
        case Stage::Cli:
            return "CLI";
        case Stage::Config:
            return "CONFIG";
        case Stage::Walk:
            return "WALK";
        case Stage::Convert:
            return "CONVERT";
        case Stage::Clean:
            return "CLEAN";
        case Stage::Emoji:
            return "EMOJI";
        case Stage::Rename:
            return "RENAME";
        case Stage::Combined:
            return "COMBINED";
    }
    return "UNKNOWN";
}

/// レベルを文字列に変換
inline const char* level_str(Level l) {
    switch (l) {
        case Level::Trace:
            return "TRACE";
        case Level::Debug:
            return "DEBUG";
        case Level::Info:
            return "INFO";
        case Level::Warn:
            return "WARN";
        case Level::Error:
            return "ERROR";
    }
    return "UNKNOWN";
}

/// 出力先のいずれかで有効なレベルか
inline bool enabled(Level level) {
    if (g_debug_mode && level >= g_debug_level)
        return true;
    return g_log_file && level >= Level::Debug;
}

/// デバッグ出力
inline void log(Stage stage, Level level, const char* msg) {
    if (g_debug_mode && level >= g_debug_level) {
        // レベルに応じてプレフィックスを付加（ただし[]は1つだけ）
        const char* prefix = "";
        switch (level) {
            case Level::Error: prefix = "ERROR: "; break;
            case Level::Warn: prefix = "WARN: "; break;
            default: break;
        }
        std::cerr << "[" << stage_str(stage) << "] " << prefix << msg << std::endl;
    }
    if (g_log_file && level >= Level::Debug) {
        *g_log_file << fmt::format("{:<5} [{}] {}", level_str(level), stage_str(stage), msg)
                    << std::endl;
    }
}

inline void log(Stage stage, Level level, const std::string& msg) {
    log(stage, level, msg.c_str());
}

/// 設定関数
inline void set_debug_mode(bool enabled) {
    g_debug_mode = enabled;
}
inline void set_lang(int lang) {
    g_lang = lang;
}
inline void set_level(Level level) {
    g_debug_level = level;
}

/// ログファイルを開く（失敗時は false）
inline bool open_log_file(const std::string& path) {
    auto file = std::make_unique<std::ofstream>(path, std::ios::out | std::ios::trunc);
    if (!file->is_open()) {
        return false;
    }
    g_log_file = std::move(file);
    return true;
}

/// -v の回数からレベルを決定
inline Level level_from_verbosity(int verbose, bool quiet) {
    if (quiet)
        return Level::Error;
    switch (verbose) {
        case 0:
            return Level::Warn;
        case 1:
            return Level::Info;
        case 2:
            return Level::Debug;
        default:
            return Level::Trace;
    }
}

}  // namespace refmt::debug
