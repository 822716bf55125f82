// ============================================================
// 設定ファイル - 実装
// ============================================================

#include "config.hpp"

#include "common/debug.hpp"
#include "common/error.hpp"

#include <fmt/format.h>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace refmt {
namespace config {

bool ConfigLoader::load(const fs::path& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    config_path_ = filepath.string();
    load_string(buffer.str());
    debug::log(debug::Stage::Config, debug::Level::Info,
               fmt::format("Loaded configuration: {}", config_path_));
    return true;
}

void ConfigLoader::load_string(const std::string& content) {
    parse_yaml(content);
    loaded_ = true;
}

bool ConfigLoader::find_and_load(const fs::path& start_path) {
    std::error_code ec;
    fs::path current = fs::absolute(start_path, ec);
    if (ec) {
        return false;
    }

    // 最大10レベルまで親ディレクトリを探索
    for (int i = 0; i < 10; ++i) {
        fs::path config_file = current / kConfigFileName;
        if (fs::exists(config_file, ec)) {
            return load(config_file);
        }

        fs::path parent = current.parent_path();
        if (parent == current) {
            break;  // ルートに到達
        }
        current = parent;
    }

    debug::log(debug::Stage::Config, debug::Level::Debug, "No configuration file found");
    return false;
}

void ConfigLoader::parse_yaml(const std::string& content) {
    // サポート形式:
    // defaults:
    //   recursive: true
    // convert:
    //   extensions: .py, .js

    std::istringstream stream(content);
    std::string line;
    Section section = Section::None;
    int line_num = 0;

    while (std::getline(stream, line)) {
        ++line_num;

        // 行内コメントを除去
        size_t hash = line.find('#');
        if (hash != std::string::npos) {
            line.erase(hash);
        }
        std::string trimmed = trim(line);
        if (trimmed.empty()) {
            continue;
        }

        size_t colon = trimmed.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        std::string key = trim(trimmed.substr(0, colon));
        std::string value = trim(trimmed.substr(colon + 1));

        bool indented = line[0] == ' ' || line[0] == '\t';
        if (!indented) {
            if (key == "defaults")
                section = Section::Defaults;
            else if (key == "convert")
                section = Section::Convert;
            else if (key == "clean")
                section = Section::Clean;
            else if (key == "emojis")
                section = Section::Emojis;
            else
                section = Section::None;  // 未知のセクションは無視
            continue;
        }

        if (section != Section::None && !value.empty()) {
            apply(section, key, value, line_num);
        }
    }
}

void ConfigLoader::apply(Section section, const std::string& key, const std::string& value,
                         int line) {
    switch (section) {
        case Section::Defaults:
            if (key == "recursive")
                settings_.recursive = parse_bool(value, key, line);
            else if (key == "dry_run")
                settings_.dry_run = parse_bool(value, key, line);
            break;
        case Section::Convert:
            if (key == "extensions")
                settings_.convert_extensions = parse_extensions(value);
            break;
        case Section::Clean:
            if (key == "extensions")
                settings_.clean_extensions = parse_extensions(value);
            break;
        case Section::Emojis:
            if (key == "extensions")
                settings_.emoji_extensions = parse_extensions(value);
            else if (key == "replace_task")
                settings_.replace_task = parse_bool(value, key, line);
            else if (key == "remove_other")
                settings_.remove_other = parse_bool(value, key, line);
            break;
        case Section::None:
            break;
    }
}

std::vector<std::string> ConfigLoader::parse_extensions(const std::string& value) {
    std::vector<std::string> result;
    std::istringstream stream(value);
    std::string item;
    while (std::getline(stream, item, ',')) {
        std::string ext = trim(item);
        if (ext.empty()) {
            continue;
        }
        if (ext[0] != '.') {
            ext.insert(ext.begin(), '.');
        }
        result.push_back(ext);
    }
    return result;
}

bool ConfigLoader::parse_bool(const std::string& value, const std::string& key, int line) {
    if (value == "true" || value == "yes" || value == "on")
        return true;
    if (value == "false" || value == "no" || value == "off")
        return false;
    throw ConfigError(
        fmt::format("{}:{}: '{}' expects a boolean, got '{}'", kConfigFileName, line, key, value));
}

std::string ConfigLoader::trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos)
        return "";
    size_t end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

}  // namespace config
}  // namespace refmt
