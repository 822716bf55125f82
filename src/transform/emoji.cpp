// ============================================================
// EmojiTransformer - 実装
// ============================================================

#include "emoji.hpp"

#include "common/debug_messages.hpp"
#include "common/error.hpp"
#include "common/utf8.hpp"
#include "fs/file_io.hpp"

#include <fmt/format.h>

namespace refmt {
namespace transform {

namespace {

struct TaskEmoji {
    char32_t cp;
    const char* text;
};

constexpr TaskEmoji kTaskEmojis[] = {
    {0x2705, "[x]"},       // ✅
    {0x2611, "[x]"},       // ☑
    {0x2714, "[x]"},       // ✔
    {0x2713, "[x]"},       // ✓
    {0x2610, "[ ]"},       // ☐
    {0x2612, "[X]"},       // ☒
    {0x274C, "[X]"},       // ❌
    {0x274E, "[X]"},       // ❎
    {0x26A0, "[!]"},       // ⚠
    {0x26D4, "[!]"},       // ⛔
    {0x2B50, "[+]"},       // ⭐
    {0x1F7E0, "[orange]"},
    {0x1F7E1, "[yellow]"},
    {0x1F7E8, "[yellow]"},
    {0x1F7E2, "[green]"},
    {0x1F534, "[red]"},
    {0x1F4DD, "[note]"},
    {0x1F4CB, "[list]"},
    {0x1F4C4, "[doc]"},
    {0x1F4C5, "[cal]"},
    {0x1F4C6, "[cal]"},
    {0x1F5D3, "[cal]"},
    {0x1F4D1, "[tab]"},
    {0x1F4CC, "[pin]"},
    {0x1F4CD, "[pin]"},
    {0x1F4CE, "[clip]"},
};

constexpr utf8::CodeRange kRemovableRanges[] = {
    {0x1F600, 0x1F64F},  // 顔文字
    {0x1F300, 0x1F5FF},  // 記号・絵文字
    {0x1F680, 0x1F6FF},  // 乗り物・地図
    {0x1F1E0, 0x1F1FF},  // 国旗（地域指示子）
    {0x2600, 0x26FF},    // その他の記号
    {0x2700, 0x27BF},    // 装飾記号
    {0x1F900, 0x1F9FF},
    {0x1FA00, 0x1FA6F},
    {0x1FA70, 0x1FAFF},
    {0xFE00, 0xFE0F},    // 異体字セレクタ
    {0x1F004, 0x1F004},
    {0x1F0CF, 0x1F0CF},
    {0x1F18E, 0x1F18E},
    {0x1F191, 0x1F19A},
};

}  // namespace

const std::vector<std::string>& default_emoji_extensions() {
    static const std::vector<std::string> extensions = {
        ".md", ".txt", ".rst",  ".org", ".py", ".rs", ".go",  ".java",
        ".js", ".ts",  ".jsx", ".tsx", ".c",  ".h",  ".cpp", ".hpp",
    };
    return extensions;
}

const char* task_emoji_replacement(char32_t cp) {
    for (const auto& e : kTaskEmojis) {
        if (e.cp == cp)
            return e.text;
    }
    return nullptr;
}

bool is_removable_emoji(char32_t cp) {
    return utf8::in_ranges(cp, kRemovableRanges);
}

EmojiResult transform_emojis(const std::string& content, bool replace_task, bool remove_other) {
    EmojiResult result;
    result.text.reserve(content.size());

    size_t pos = 0;
    while (pos < content.size()) {
        size_t len;
        char32_t cp = utf8::decode(content, pos, len);
        if (len == 0) {
            result.text += content[pos++];
            continue;
        }

        // タスク絵文字の置換を先に適用
        const char* text = replace_task ? task_emoji_replacement(cp) : nullptr;
        if (text) {
            result.text += text;
            ++result.replaced;
        } else if (remove_other && is_removable_emoji(cp)) {
            ++result.removed;
        } else {
            result.text.append(content, pos, len);
        }
        pos += len;
    }
    return result;
}

EmojiTransformer::EmojiTransformer(EmojiOptions options, std::ostream& out, std::ostream& err)
    : options_(std::move(options)),
      walker_(fs::WalkOptions{options_.recursive, options_.file_extensions, std::nullopt, true,
                              fs::default_skip_dirs()}),
      reporter_(options_.dry_run, out),
      err_(err) {}

size_t EmojiTransformer::transform_file(const std::filesystem::path& path,
                                        const std::filesystem::path& root) const {
    std::filesystem::path base = root.empty() ? path.parent_path() : root;
    if (!std::filesystem::is_regular_file(path) || !walker_.accepts(path, base)) {
        debug::xform::log(debug::Stage::Emoji, debug::xform::Id::Skipped, path.string(),
                          debug::Level::Trace);
        return 0;
    }

    debug::xform::log(debug::Stage::Emoji, debug::xform::Id::FileStart, path.string());
    std::string content = fs::read_file(path);
    auto result = transform_emojis(content, options_.replace_task_emojis,
                                   options_.remove_other_emojis);
    if (result.text == content) {
        return 0;
    }

    reporter_.report(path, content, result.text, fs::kEmojiVerbs);
    if (result.replaced > 0) {
        debug::xform::log(debug::Stage::Emoji, debug::xform::Id::EmojiReplaced,
                          fmt::format("{} ({})", path.string(), result.replaced));
    }
    if (result.removed > 0) {
        debug::xform::log(debug::Stage::Emoji, debug::xform::Id::EmojiRemoved,
                          fmt::format("{} ({})", path.string(), result.removed));
    }
    size_t changes = result.replaced + result.removed;
    return changes > 0 ? changes : 1;
}

std::pair<size_t, size_t> EmojiTransformer::process(const std::filesystem::path& path) const {
    size_t total_files = 0;
    size_t total_changes = 0;
    debug::xform::log(debug::Stage::Emoji, debug::xform::Id::Start, path.string(),
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
            size_t changes = transform_file(file, root);
            if (changes > 0) {
                ++total_files;
                total_changes += changes;
            }
        } catch (const FileError& e) {
            debug::xform::log(debug::Stage::Emoji, debug::xform::Id::FileError, e.what());
            err_ << fmt::format("Error processing file '{}': {}\n", file.string(), e.what());
        }
    }

    debug::xform::log(debug::Stage::Emoji, debug::xform::Id::End,
                      fmt::format("{} file(s), {} change(s)", total_files, total_changes),
                      debug::Level::Info);
    return {total_files, total_changes};
}

}  // namespace transform
}  // namespace refmt
