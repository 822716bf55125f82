// ============================================================
// 設定ファイル (.refmt.yml)
// ============================================================
// コマンドラインで指定されなかった値のデフォルトを与える

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace refmt {
namespace config {

inline constexpr const char* kConfigFileName = ".refmt.yml";

// 読み込んだ設定値（未指定は nullopt）
struct Settings {
    // defaults:
    std::optional<bool> recursive;
    std::optional<bool> dry_run;

    // convert: / clean: / emojis:
    std::optional<std::vector<std::string>> convert_extensions;
    std::optional<std::vector<std::string>> clean_extensions;
    std::optional<std::vector<std::string>> emoji_extensions;

    // emojis:
    std::optional<bool> replace_task;
    std::optional<bool> remove_other;
};

// 設定ローダー
class ConfigLoader {
   public:
    // ファイルを読み込み（開けなければ false、不正な値は ConfigError）
    bool load(const std::filesystem::path& filepath);

    // 文字列から読み込み
    void load_string(const std::string& content);

    // .refmt.yml を探す（開始ディレクトリから親に向かって最大10レベル）
    bool find_and_load(const std::filesystem::path& start_path = ".");

    const Settings& settings() const { return settings_; }

    bool is_loaded() const { return loaded_; }

    const std::string& config_path() const { return config_path_; }

    // "py, .js" → {".py", ".js"}
    static std::vector<std::string> parse_extensions(const std::string& value);

   private:
    enum class Section { None, Defaults, Convert, Clean, Emojis };

    // 簡易YAMLパーサー（2階層の key: value 形式のみ）
    void parse_yaml(const std::string& content);

    void apply(Section section, const std::string& key, const std::string& value, int line);

    static bool parse_bool(const std::string& value, const std::string& key, int line);

    static std::string trim(const std::string& str);

    Settings settings_;
    std::string config_path_;
    bool loaded_ = false;
};

}  // namespace config
}  // namespace refmt
