#include "cli/options.hpp"
#include "common/debug.hpp"
#include "common/error.hpp"
#include "config/config.hpp"
#include "transform/combined.hpp"
#include "transform/converter.hpp"
#include "transform/emoji.hpp"
#include "transform/rename.hpp"
#include "transform/whitespace.hpp"

#include <chrono>
#include <fmt/format.h>
#include <iostream>
#include <string>
#include <vector>

#ifndef REFMT_VERSION
#define REFMT_VERSION "0.2.0"
#endif

namespace refmt {

namespace {

// サブコマンドの所要時間を Info で記録
class ScopedTimer {
   public:
    explicit ScopedTimer(const char* name)
        : name_(name), start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start_);
        debug::log(debug::Stage::Cli, debug::Level::Info,
                   fmt::format("{} finished in {:.3f}s", name_, elapsed.count()));
    }

   private:
    const char* name_;
    std::chrono::steady_clock::time_point start_;
};

const char* dry_run_prefix(bool dry_run) {
    return dry_run ? "[DRY-RUN] " : "";
}

int run_convert(const cli::Options& opts, const config::Settings& settings) {
    ScopedTimer timer("convert");

    transform::ConvertOptions options;
    options.job = cli::make_rewrite_job(opts);
    options.extensions = opts.extensions ? opts.extensions : settings.convert_extensions;
    options.glob = opts.glob;
    options.recursive = opts.recursive || settings.recursive.value_or(false);
    options.dry_run = opts.dry_run || settings.dry_run.value_or(false);

    debug::log(debug::Stage::Cli, debug::Level::Info,
               fmt::format("Converting from {} to {}", naming::to_string(options.job.source),
                           naming::to_string(options.job.target)));

    transform::CaseConverter converter(options);
    auto stats = converter.process(opts.path);

    if (stats.files_changed > 0) {
        std::cout << fmt::format("{}Converted {} file(s) ({} identifier(s))\n",
                                 dry_run_prefix(options.dry_run), stats.files_changed,
                                 stats.replacements);
    } else {
        std::cout << "No files needed conversion\n";
    }
    if (stats.files_failed > 0) {
        std::cerr << fmt::format("{} file(s) could not be processed\n", stats.files_failed);
    }
    return 0;
}

int run_clean(const cli::Options& opts, const config::Settings& settings) {
    ScopedTimer timer("clean");

    transform::WhitespaceOptions options;
    options.recursive = opts.recursive || settings.recursive.value_or(true);
    options.dry_run = opts.dry_run || settings.dry_run.value_or(false);
    if (opts.extensions) {
        options.file_extensions = *opts.extensions;
    } else if (settings.clean_extensions) {
        options.file_extensions = *settings.clean_extensions;
    }

    transform::WhitespaceCleaner cleaner(options);
    auto [files, lines] = cleaner.process(opts.path);

    if (files > 0) {
        std::cout << fmt::format("{}Cleaned {} lines in {} file(s)\n",
                                 dry_run_prefix(options.dry_run), lines, files);
    } else {
        std::cout << "No files needed cleaning\n";
    }
    return 0;
}

int run_emojis(const cli::Options& opts, const config::Settings& settings) {
    ScopedTimer timer("emojis");

    transform::EmojiOptions options;
    options.recursive = opts.recursive || settings.recursive.value_or(true);
    options.dry_run = opts.dry_run || settings.dry_run.value_or(false);
    options.replace_task_emojis = opts.replace_task.value_or(settings.replace_task.value_or(true));
    options.remove_other_emojis = opts.remove_other.value_or(settings.remove_other.value_or(true));
    if (opts.extensions) {
        options.file_extensions = *opts.extensions;
    } else if (settings.emoji_extensions) {
        options.file_extensions = *settings.emoji_extensions;
    }

    debug::log(debug::Stage::Cli, debug::Level::Info,
               fmt::format("Replace task emojis: {}, Remove other emojis: {}",
                           options.replace_task_emojis, options.remove_other_emojis));

    transform::EmojiTransformer transformer(options);
    auto [files, changes] = transformer.process(opts.path);

    if (files > 0) {
        std::cout << fmt::format("{}Transformed emojis in {} file(s) ({} changes)\n",
                                 dry_run_prefix(options.dry_run), files, changes);
    } else {
        std::cout << "No files contained emojis to transform\n";
    }
    return 0;
}

int run_rename(const cli::Options& opts, const config::Settings& settings) {
    ScopedTimer timer("rename_files");

    transform::RenameOptions options;
    options.recursive = opts.recursive || settings.recursive.value_or(true);
    options.dry_run = opts.dry_run || settings.dry_run.value_or(false);
    options.case_transform = opts.case_transform;
    options.space_replace = opts.space_replace;
    options.timestamp = opts.timestamp;
    options.add_prefix = opts.add_prefix;
    options.remove_prefix = opts.rm_prefix;
    options.add_suffix = opts.add_suffix;
    options.remove_suffix = opts.rm_suffix;

    transform::FileRenamer renamer(options);
    size_t count = renamer.process(opts.path);

    if (count > 0) {
        std::cout << fmt::format("{}Renamed {} file(s)\n", dry_run_prefix(options.dry_run),
                                 count);
    } else {
        std::cout << "No files needed renaming\n";
    }
    return 0;
}

int run_combined(const cli::Options& opts, const config::Settings& settings) {
    ScopedTimer timer("combined");

    transform::CombinedOptions options;
    options.recursive = opts.recursive || settings.recursive.value_or(false);
    options.dry_run = opts.dry_run || settings.dry_run.value_or(false);

    transform::CombinedProcessor processor(options);
    auto stats = processor.process(opts.path);

    if (stats.files_renamed == 0 && stats.files_emoji_transformed == 0 &&
        stats.files_whitespace_cleaned == 0) {
        std::cout << "No files needed processing\n";
        return 0;
    }

    std::cout << fmt::format("{}Processed files:\n", dry_run_prefix(options.dry_run));
    if (stats.files_renamed > 0) {
        std::cout << fmt::format("  - Renamed: {} file(s)\n", stats.files_renamed);
    }
    if (stats.files_emoji_transformed > 0) {
        std::cout << fmt::format("  - Emoji transformations: {} file(s) ({} changes)\n",
                                 stats.files_emoji_transformed, stats.emoji_changes);
    }
    if (stats.files_whitespace_cleaned > 0) {
        std::cout << fmt::format("  - Whitespace cleaned: {} file(s) ({} lines)\n",
                                 stats.files_whitespace_cleaned, stats.whitespace_lines_cleaned);
    }
    return 0;
}

int run_command(const cli::Options& opts, const config::Settings& settings) {
    debug::log(debug::Stage::Cli, debug::Level::Debug,
               fmt::format("Running '{}' on {}", cli::command_name(opts.command), opts.path));
    switch (opts.command) {
        case cli::Command::Convert:
            return run_convert(opts, settings);
        case cli::Command::Clean:
            return run_clean(opts, settings);
        case cli::Command::Emojis:
            return run_emojis(opts, settings);
        case cli::Command::RenameFiles:
            return run_rename(opts, settings);
        case cli::Command::Combined:
            return run_combined(opts, settings);
        default:
            break;
    }
    return 0;
}

}  // namespace

}  // namespace refmt

int main(int argc, char* argv[]) {
    using namespace refmt;

    std::vector<std::string> args(argv + 1, argv + argc);
    cli::Options opts;
    try {
        opts = cli::parse_options(args);
    } catch (const ConfigError& e) {
        std::cerr << "error: " << e.what() << "\n";
        std::cerr << "Use --help for usage information.\n";
        return 1;
    }

    switch (opts.command) {
        case cli::Command::Help:
            std::cout << cli::help_text(argv[0]);
            return 0;
        case cli::Command::Version:
            std::cout << "refmt " << REFMT_VERSION << "\n";
            return 0;
        case cli::Command::None:
            std::cerr << "error: No command or path specified. Use --help for usage "
                         "information.\n";
            return 1;
        default:
            break;
    }

    // ログ設定
    debug::set_level(debug::level_from_verbosity(opts.verbose, opts.quiet));
    if (opts.lang_ja) {
        debug::set_lang(1);
    }
    if (opts.log_file) {
        if (debug::open_log_file(*opts.log_file)) {
            std::cerr << "Logging to file: " << *opts.log_file << "\n";
        } else {
            std::cerr << "Warning: cannot open log file '" << *opts.log_file << "'\n";
        }
    }

    try {
        config::ConfigLoader loader;
        loader.find_and_load();
        return run_command(opts, loader.settings());
    } catch (const ConfigError& e) {
        debug::log(debug::Stage::Cli, debug::Level::Debug, e.what());
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
}
