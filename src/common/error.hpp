#pragma once

// ============================================================
// エラー型
// ============================================================
// ConfigError: 実行前に検出される設定エラー（致命的）
// FileError:   ファイル単位のI/Oエラー（報告して次のファイルへ）

#include <filesystem>
#include <stdexcept>
#include <string>

namespace refmt {

/// 設定エラー（不正なパターン、矛盾するオプションなど）
class ConfigError : public std::runtime_error {
   public:
    explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

/// ファイル単位のエラー
class FileError : public std::runtime_error {
   public:
    FileError(std::filesystem::path path, const std::string& message)
        : std::runtime_error(message), path_(std::move(path)) {}

    const std::filesystem::path& path() const { return path_; }

   private:
    std::filesystem::path path_;
};

}  // namespace refmt
