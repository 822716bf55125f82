// ============================================================
// ファイル入出力 - 実装
// ============================================================

#include "file_io.hpp"

#include "common/error.hpp"

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <fmt/format.h>
#include <fstream>
#include <sstream>

namespace refmt {
namespace fs {

std::string read_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw FileError(path, fmt::format("cannot open for reading: {}", std::strerror(errno)));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        throw FileError(path, "read failed");
    }

    std::string content = buffer.str();
    size_t bad_offset = 0;
    if (!is_valid_utf8(content, &bad_offset)) {
        throw FileError(path, fmt::format("stream did not contain valid UTF-8 (byte {})",
                                          bad_offset));
    }
    return content;
}

void write_file(const std::filesystem::path& path, const std::string& content) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw FileError(path, fmt::format("cannot open for writing: {}", std::strerror(errno)));
    }
    file << content;
    file.flush();
    if (!file) {
        throw FileError(path, "write failed");
    }
}

bool is_valid_utf8(std::string_view text, size_t* error_offset) {
    size_t i = 0;
    while (i < text.size()) {
        auto c = static_cast<unsigned char>(text[i]);
        size_t len = 0;
        uint32_t cp = 0;

        if (c < 0x80) {
            ++i;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            len = 2;
            cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            len = 3;
            cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            len = 4;
            cp = c & 0x07;
        } else {
            break;
        }

        if (i + len > text.size())
            break;

        bool ok = true;
        for (size_t k = 1; k < len; ++k) {
            auto cc = static_cast<unsigned char>(text[i + k]);
            if ((cc & 0xC0) != 0x80) {
                ok = false;
                break;
            }
            cp = (cp << 6) | (cc & 0x3F);
        }
        if (!ok)
            break;

        // 冗長表現・サロゲート・範囲外を拒否
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000) ||
            (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
            break;
        }
        i += len;
    }

    if (i < text.size()) {
        if (error_offset)
            *error_offset = i;
        return false;
    }
    return true;
}

}  // namespace fs
}  // namespace refmt
