#pragma once

// ============================================================
// ファイル入出力
// ============================================================

#include <filesystem>
#include <string>
#include <string_view>

namespace refmt {
namespace fs {

/// ファイル全体を読み込む
/// 開けない・読めない・UTF-8として不正な場合は FileError
std::string read_file(const std::filesystem::path& path);

/// ファイル全体を書き込む（失敗時は FileError）
void write_file(const std::filesystem::path& path, const std::string& content);

/// UTF-8として妥当か（不正な場合は最初の不正バイト位置を返す）
bool is_valid_utf8(std::string_view text, size_t* error_offset = nullptr);

}  // namespace fs
}  // namespace refmt
