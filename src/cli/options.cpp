// ============================================================
// コマンドラインオプション - 実装
// ============================================================

#include "options.hpp"

#include "common/error.hpp"
#include "config/config.hpp"

#include <fmt/format.h>
#include <initializer_list>
#include <sstream>

namespace refmt {
namespace cli {

namespace {

bool is_one_of(Command command, std::initializer_list<Command> allowed) {
    for (Command c : allowed) {
        if (c == command)
            return true;
    }
    return false;
}

std::optional<Command> parse_command(const std::string& name) {
    if (name == "convert")
        return Command::Convert;
    if (name == "clean")
        return Command::Clean;
    if (name == "emojis")
        return Command::Emojis;
    if (name == "rename_files")
        return Command::RenameFiles;
    if (name == "help")
        return Command::Help;
    return std::nullopt;
}

// 引数列を順に読むカーソル
class ArgCursor {
   public:
    explicit ArgCursor(const std::vector<std::string>& args) : args_(args) {}

    bool next() {
        if (index_ >= args_.size())
            return false;
        const std::string& arg = args_[index_++];
        inline_value_.reset();
        name_ = arg;
        // --key=value
        if (arg.size() > 2 && arg[0] == '-' && arg[1] == '-') {
            size_t eq = arg.find('=');
            if (eq != std::string::npos) {
                name_ = arg.substr(0, eq);
                inline_value_ = arg.substr(eq + 1);
            }
        }
        return true;
    }

    const std::string& name() const { return name_; }

    std::string value() {
        if (inline_value_) {
            return *inline_value_;
        }
        if (index_ >= args_.size()) {
            throw ConfigError(fmt::format("option '{}' requires a value", name_));
        }
        return args_[index_++];
    }

   private:
    const std::vector<std::string>& args_;
    size_t index_ = 0;
    std::string name_;
    std::optional<std::string> inline_value_;
};

void append_extensions(std::optional<std::vector<std::string>>& target, const std::string& value) {
    if (!target) {
        target.emplace();
    }
    for (auto& ext : config::ConfigLoader::parse_extensions(value)) {
        target->push_back(std::move(ext));
    }
}

// -v, -vv, -vvv
bool parse_verbose_flag(const std::string& arg, int& verbose) {
    if (arg == "--verbose") {
        ++verbose;
        return true;
    }
    if (arg.size() < 2 || arg[0] != '-' || arg[1] != 'v') {
        return false;
    }
    for (size_t i = 1; i < arg.size(); ++i) {
        if (arg[i] != 'v')
            return false;
    }
    verbose += static_cast<int>(arg.size() - 1);
    return true;
}

}  // namespace

const char* command_name(Command command) {
    switch (command) {
        case Command::None:
            return "";
        case Command::Combined:
            return "refmt";
        case Command::Convert:
            return "convert";
        case Command::Clean:
            return "clean";
        case Command::Emojis:
            return "emojis";
        case Command::RenameFiles:
            return "rename_files";
        case Command::Help:
            return "help";
        case Command::Version:
            return "--version";
    }
    return "";
}

Options parse_options(const std::vector<std::string>& args) {
    Options opts;
    ArgCursor cursor(args);

    // 指定されたコマンド以外では使えないオプション
    auto require = [&](std::initializer_list<Command> allowed) {
        if (!is_one_of(opts.command, allowed)) {
            throw ConfigError(fmt::format("unexpected option '{}' for '{}'", cursor.name(),
                                          command_name(opts.command)));
        }
    };

    while (cursor.next()) {
        const std::string& arg = cursor.name();

        if (arg.empty()) {
            continue;
        }

        if (arg[0] != '-') {
            // 最初の位置引数はコマンド名またはパス
            if (opts.command == Command::None) {
                if (auto cmd = parse_command(arg)) {
                    opts.command = *cmd;
                    if (opts.command == Command::Help)
                        return opts;
                    continue;
                }
                opts.command = Command::Combined;
            }
            if (!opts.path.empty()) {
                throw ConfigError(fmt::format("unexpected argument '{}'", arg));
            }
            opts.path = arg;
            continue;
        }

        // グローバルオプション
        if (arg == "--help" || arg == "-h") {
            opts.command = Command::Help;
            return opts;
        } else if (arg == "--version" || arg == "-V") {
            opts.command = Command::Version;
            return opts;
        } else if (parse_verbose_flag(arg, opts.verbose)) {
            // -v の回数を加算済み
        } else if (arg == "-q" || arg == "--quiet") {
            opts.quiet = true;
        } else if (arg == "--log-file") {
            opts.log_file = cursor.value();
        } else if (arg == "--lang") {
            std::string lang = cursor.value();
            if (lang != "ja" && lang != "en") {
                throw ConfigError(fmt::format("unsupported language '{}'", lang));
            }
            opts.lang_ja = (lang == "ja");
        }
        // 共通オプション
        else if (arg == "-r" || arg == "--recursive") {
            opts.recursive = true;
        } else if (arg == "-d" || arg == "--dry-run") {
            opts.dry_run = true;
        } else if (arg == "-e" || arg == "--extensions") {
            require({Command::Convert, Command::Clean, Command::Emojis});
            append_extensions(opts.extensions, cursor.value());
        }
        // convert
        else if (arg.starts_with("--from-") || arg.starts_with("--to-")) {
            bool from = arg.starts_with("--from-");
            std::string name = arg.substr(from ? 7 : 5);
            // rename_files の --to-lowercase などはここで処理
            if (!from && opts.command == Command::RenameFiles) {
                if (name == "lowercase")
                    opts.case_transform = transform::CaseTransform::Lowercase;
                else if (name == "uppercase")
                    opts.case_transform = transform::CaseTransform::Uppercase;
                else if (name == "capitalize")
                    opts.case_transform = transform::CaseTransform::Capitalize;
                else
                    throw ConfigError(fmt::format("unknown option '{}'", arg));
                continue;
            }
            require({Command::Convert});
            auto style = naming::parse_case_style(name);
            if (!style) {
                throw ConfigError(fmt::format("unknown case style '{}'", name));
            }
            (from ? opts.from_styles : opts.to_styles).push_back(*style);
        } else if (arg == "--prefix") {
            require({Command::Convert});
            opts.prefix = cursor.value();
        } else if (arg == "--suffix") {
            require({Command::Convert});
            opts.suffix = cursor.value();
        } else if (arg == "--strip-prefix") {
            require({Command::Convert});
            opts.strip_prefix = cursor.value();
        } else if (arg == "--strip-suffix") {
            require({Command::Convert});
            opts.strip_suffix = cursor.value();
        } else if (arg == "--replace-prefix-from") {
            require({Command::Convert});
            opts.replace_prefix_from = cursor.value();
        } else if (arg == "--replace-prefix-to") {
            require({Command::Convert});
            opts.replace_prefix_to = cursor.value();
        } else if (arg == "--replace-suffix-from") {
            require({Command::Convert});
            opts.replace_suffix_from = cursor.value();
        } else if (arg == "--replace-suffix-to") {
            require({Command::Convert});
            opts.replace_suffix_to = cursor.value();
        } else if (arg == "--glob") {
            require({Command::Convert});
            opts.glob = cursor.value();
        } else if (arg == "--word-filter") {
            require({Command::Convert});
            opts.word_filter = cursor.value();
        }
        // emojis
        else if (arg == "--replace-task") {
            require({Command::Emojis});
            opts.replace_task = true;
        } else if (arg == "--no-replace-task") {
            require({Command::Emojis});
            opts.replace_task = false;
        } else if (arg == "--remove-other") {
            require({Command::Emojis});
            opts.remove_other = true;
        } else if (arg == "--no-remove-other") {
            require({Command::Emojis});
            opts.remove_other = false;
        }
        // rename_files
        else if (arg == "--underscored") {
            require({Command::RenameFiles});
            opts.space_replace = transform::SpaceReplace::Underscore;
        } else if (arg == "--hyphenated") {
            require({Command::RenameFiles});
            opts.space_replace = transform::SpaceReplace::Hyphen;
        } else if (arg == "--add-prefix") {
            require({Command::RenameFiles});
            opts.add_prefix = cursor.value();
        } else if (arg == "--rm-prefix") {
            require({Command::RenameFiles});
            opts.rm_prefix = cursor.value();
        } else if (arg == "--add-suffix") {
            require({Command::RenameFiles});
            opts.add_suffix = cursor.value();
        } else if (arg == "--rm-suffix") {
            require({Command::RenameFiles});
            opts.rm_suffix = cursor.value();
        } else if (arg == "--timestamp-long") {
            require({Command::RenameFiles});
            opts.timestamp = transform::TimestampFormat::Long;
        } else if (arg == "--timestamp-short") {
            require({Command::RenameFiles});
            opts.timestamp = transform::TimestampFormat::Short;
        } else {
            throw ConfigError(fmt::format("unknown option '{}'", arg));
        }
    }

    if (opts.command != Command::None && opts.path.empty()) {
        throw ConfigError(fmt::format("'{}' requires a path", command_name(opts.command)));
    }
    return opts;
}

naming::RewriteJob make_rewrite_job(const Options& opts) {
    if (opts.from_styles.size() != 1) {
        throw ConfigError("exactly one source style must be chosen (--from-<style>)");
    }
    if (opts.to_styles.size() != 1) {
        throw ConfigError("exactly one target style must be chosen (--to-<style>)");
    }

    naming::RewriteJob job;
    job.source = opts.from_styles.front();
    job.target = opts.to_styles.front();
    job.prefix = opts.prefix;
    job.suffix = opts.suffix;
    job.strip_prefix = opts.strip_prefix;
    job.strip_suffix = opts.strip_suffix;
    job.replace_prefix_from = opts.replace_prefix_from;
    job.replace_prefix_to = opts.replace_prefix_to;
    job.replace_suffix_from = opts.replace_suffix_from;
    job.replace_suffix_to = opts.replace_suffix_to;
    job.word_filter = opts.word_filter;
    return job;
}

std::string help_text(const char* program_name) {
    std::ostringstream out;
    out << "refmt - batch text transformation tool\n\n";
    out << "Usage:\n";
    out << "  " << program_name << " [-r] [-d] <path>            rename (lowercase), emojis, clean\n";
    out << "  " << program_name << " <command> <path> [options]\n\n";
    out << "Commands:\n";
    out << "  convert        convert identifiers between case styles\n";
    out << "  clean          remove trailing whitespace\n";
    out << "  emojis         replace task emojis with text, remove other emojis\n";
    out << "  rename_files   rename files\n";
    out << "  help           show this help\n\n";
    out << "Common options:\n";
    out << "  -r, --recursive         process directories recursively\n";
    out << "  -d, --dry-run           report changes without writing\n";
    out << "  -e, --extensions <ext>  file extensions (repeatable, comma separated)\n\n";
    out << "convert options:\n";
    out << "  --from-<style>, --to-<style>\n";
    out << "      style: camel pascal snake screaming-snake kebab screaming-kebab\n";
    out << "  --prefix <s>, --suffix <s>               added to converted identifiers\n";
    out << "  --strip-prefix <s>, --strip-suffix <s>   removed before conversion\n";
    out << "  --replace-prefix-from <s> --replace-prefix-to <s>\n";
    out << "  --replace-suffix-from <s> --replace-suffix-to <s>\n";
    out << "  --glob <pattern>        only files matching the pattern\n";
    out << "  --word-filter <regex>   only identifiers matching the regex\n\n";
    out << "emojis options:\n";
    out << "  --no-replace-task       keep task emojis\n";
    out << "  --no-remove-other       keep other emojis\n\n";
    out << "rename_files options:\n";
    out << "  --to-lowercase | --to-uppercase | --to-capitalize\n";
    out << "  --underscored | --hyphenated\n";
    out << "  --add-prefix <s>, --rm-prefix <s>, --add-suffix <s>, --rm-suffix <s>\n";
    out << "  --timestamp-long (YYYYMMDD_) | --timestamp-short (YYMMDD_)\n\n";
    out << "Global options:\n";
    out << "  -v, -vv, -vvv           increase log verbosity\n";
    out << "  -q, --quiet             errors only\n";
    out << "  --log-file <file>       write debug log to file\n";
    out << "  --lang=ja               Japanese log messages\n";
    out << "  -h, --help, --version\n";
    return out.str();
}

}  // namespace cli
}  // namespace refmt
