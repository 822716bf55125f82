// ============================================================
// IdentifierRewriter - 実装
// ============================================================

#include "rewriter.hpp"

#include "common/debug_messages.hpp"
#include "common/error.hpp"

#include <fmt/format.h>

namespace refmt {
namespace naming {

bool AffixTransform::apply(std::string& name) const {
    if (anchor == Anchor::Prefix) {
        if (!name.starts_with(from))
            return false;
        name = to + name.substr(from.size());
    } else {
        if (!name.ends_with(from))
            return false;
        name = name.substr(0, name.size() - from.size()) + to;
    }
    return true;
}

IdentifierRewriter::IdentifierRewriter(RewriteJob job) : job_(std::move(job)) {
    validate(job_);

    if (job_.word_filter) {
        auto filter = std::make_shared<RE2>(*job_.word_filter, RE2::Quiet);
        if (!filter->ok()) {
            throw ConfigError(fmt::format("invalid word filter '{}': {}", *job_.word_filter,
                                          filter->error()));
        }
        word_filter_ = std::move(filter);
    }

    // 前処理ステージを適用順に並べる（未設定のものは含めない）
    using Anchor = AffixTransform::Anchor;
    if (job_.strip_prefix) {
        stages_.push_back({Anchor::Prefix, *job_.strip_prefix, ""});
    }
    if (job_.strip_suffix) {
        stages_.push_back({Anchor::Suffix, *job_.strip_suffix, ""});
    }
    if (job_.replace_prefix_from && job_.replace_prefix_to) {
        stages_.push_back({Anchor::Prefix, *job_.replace_prefix_from, *job_.replace_prefix_to});
    }
    if (job_.replace_suffix_from && job_.replace_suffix_to) {
        stages_.push_back({Anchor::Suffix, *job_.replace_suffix_from, *job_.replace_suffix_to});
    }

    debug::conv::log(debug::conv::Id::JobCompiled,
                     fmt::format("{} -> {} ({} stage(s){})", to_string(job_.source),
                                 to_string(job_.target), stages_.size(),
                                 word_filter_ ? ", word filter" : ""));
}

void IdentifierRewriter::validate(const RewriteJob& job) {
    if (job.replace_prefix_to && !job.replace_prefix_from) {
        throw ConfigError("--replace-prefix-to requires --replace-prefix-from");
    }
    if (job.replace_suffix_to && !job.replace_suffix_from) {
        throw ConfigError("--replace-suffix-to requires --replace-suffix-from");
    }
}

std::string IdentifierRewriter::preprocess(const std::string& token) const {
    std::string name = token;
    for (const auto& stage : stages_) {
        if (stage.apply(name)) {
            debug::conv::log(debug::conv::Id::StageApplied, name, debug::Level::Trace);
        }
    }
    return name;
}

std::string IdentifierRewriter::convert(const std::string& token) const {
    std::string name = preprocess(token);

    // フィルタは前処理後の名前で判定するが、除外時は元のトークンを返す
    if (word_filter_ && !RE2::PartialMatch(name, *word_filter_)) {
        debug::conv::log(debug::conv::Id::FilterRejected, token, debug::Level::Trace);
        return token;
    }

    auto words = split_words(job_.source, name);
    return join_words(job_.target, words, job_.prefix, job_.suffix);
}

MatchOutcome IdentifierRewriter::rewrite(const std::string& text) const {
    MatchOutcome outcome;
    outcome.text.reserve(text.size());

    size_t last = 0;
    for (const auto& span : find_tokens(job_.source, text)) {
        outcome.text.append(text, last, span.offset - last);

        std::string token = text.substr(span.offset, span.length);
        debug::conv::log(debug::conv::Id::TokenMatched, token, debug::Level::Trace);
        std::string replacement = convert(token);
        if (replacement != token) {
            ++outcome.replacements;
            if (debug::enabled(debug::Level::Trace)) {
                debug::conv::log(debug::conv::Id::TokenRewritten,
                                 fmt::format("\"{}\" -> \"{}\"", token, replacement),
                                 debug::Level::Trace);
            }
        }
        outcome.text += replacement;
        last = span.offset + span.length;
    }
    outcome.text.append(text, last, std::string::npos);

    outcome.changed = (outcome.text != text);
    return outcome;
}

}  // namespace naming
}  // namespace refmt
