#include "../../src/common/debug_messages.hpp"
#include "../../src/common/error.hpp"
#include "../../src/naming/rewriter.hpp"

#include <gtest/gtest.h>

using namespace refmt;
using namespace refmt::naming;

class RewriterTest : public ::testing::Test {
   protected:
    static RewriteJob job(CaseStyle source, CaseStyle target) {
        RewriteJob j;
        j.source = source;
        j.target = target;
        return j;
    }

    static std::string rewrite(const RewriteJob& j, const std::string& text) {
        return IdentifierRewriter(j).rewrite(text).text;
    }
};

// ============================================================
// 基本シナリオ
// ============================================================

TEST_F(RewriterTest, CamelToSnake) {
    auto outcome = IdentifierRewriter(job(CaseStyle::Camel, CaseStyle::Snake))
                       .rewrite("myVariable = 'test'");
    EXPECT_TRUE(outcome.changed);
    EXPECT_EQ(outcome.text, "my_variable = 'test'");
    EXPECT_EQ(outcome.replacements, 1u);
}

TEST_F(RewriterTest, PascalToSnakeWithStripPrefix) {
    auto j = job(CaseStyle::Pascal, CaseStyle::Snake);
    j.strip_prefix = "My";
    EXPECT_EQ(rewrite(j, "MyUserName"), "user_name");
}

TEST_F(RewriterTest, SnakeToCamelWithStripSuffix) {
    auto j = job(CaseStyle::Snake, CaseStyle::Camel);
    j.strip_suffix = "_tmp";
    EXPECT_EQ(rewrite(j, "user_name_tmp"), "userName");
}

TEST_F(RewriterTest, WordFilterSelectsTokens) {
    auto j = job(CaseStyle::Camel, CaseStyle::Snake);
    j.word_filter = "^get.*";
    EXPECT_EQ(rewrite(j, "getUserName(myVariable);"), "get_user_name(myVariable);");
}

TEST_F(RewriterTest, KebabToScreamingSnake) {
    EXPECT_EQ(rewrite(job(CaseStyle::Kebab, CaseStyle::ScreamingSnake), "first-name"),
              "FIRST_NAME");
}

// ============================================================
// 前処理ステージ
// ============================================================

TEST_F(RewriterTest, StagesAreOrdered) {
    auto j = job(CaseStyle::Pascal, CaseStyle::Snake);
    j.strip_prefix = "I";
    j.replace_suffix_from = "Impl";
    j.replace_suffix_to = "Service";
    IdentifierRewriter rewriter(j);
    ASSERT_EQ(rewriter.stages().size(), 2u);
    EXPECT_EQ(rewriter.stages()[0].anchor, AffixTransform::Anchor::Prefix);
    EXPECT_EQ(rewriter.stages()[1].anchor, AffixTransform::Anchor::Suffix);
    EXPECT_EQ(rewriter.preprocess("IUserImpl"), "UserService");
    EXPECT_EQ(rewriter.convert("IUserImpl"), "user_service");
}

TEST_F(RewriterTest, ReplacePrefix) {
    auto j = job(CaseStyle::Pascal, CaseStyle::Pascal);
    j.replace_prefix_from = "Base";
    j.replace_prefix_to = "Abstract";
    EXPECT_EQ(rewrite(j, "class BaseUserService {}"), "class AbstractUserService {}");
}

TEST_F(RewriterTest, StripOnlyWhenPresent) {
    auto j = job(CaseStyle::Camel, CaseStyle::Snake);
    j.strip_prefix = "m";
    // "mValue" → "Value" → ["value"]、"userName" はそのまま分割
    EXPECT_EQ(rewrite(j, "mValue userName"), "value user_name");
}

TEST_F(RewriterTest, NoStagesWhenUnconfigured) {
    IdentifierRewriter rewriter(job(CaseStyle::Camel, CaseStyle::Snake));
    EXPECT_TRUE(rewriter.stages().empty());
}

TEST_F(RewriterTest, PrefixAndSuffixWrapOutput) {
    auto j = job(CaseStyle::Camel, CaseStyle::Snake);
    j.prefix = "g_";
    j.suffix = "_v";
    EXPECT_EQ(rewrite(j, "userCount"), "g_user_count_v");
}

// ============================================================
// ワードフィルタ
// ============================================================

// 除外されたトークンは前処理前の元のまま残る
TEST_F(RewriterTest, FilterRejectionRestoresRawToken) {
    auto j = job(CaseStyle::Pascal, CaseStyle::Snake);
    j.strip_prefix = "My";
    j.word_filter = "^Get";
    EXPECT_EQ(rewrite(j, "MyUserName"), "MyUserName");
}

// フィルタは前処理後の名前に対して評価される
TEST_F(RewriterTest, FilterSeesPreprocessedName) {
    auto j = job(CaseStyle::Pascal, CaseStyle::Snake);
    j.strip_prefix = "My";
    j.word_filter = "^User";
    EXPECT_EQ(rewrite(j, "MyUserName"), "user_name");
}

TEST_F(RewriterTest, InvalidWordFilterIsConfigError) {
    auto j = job(CaseStyle::Camel, CaseStyle::Snake);
    j.word_filter = "([a-z";
    EXPECT_THROW(IdentifierRewriter{j}, ConfigError);
}

// ============================================================
// 設定の検証
// ============================================================

TEST_F(RewriterTest, ReplacePrefixToWithoutFromIsRejected) {
    auto j = job(CaseStyle::Camel, CaseStyle::Snake);
    j.replace_prefix_to = "x";
    EXPECT_THROW(IdentifierRewriter{j}, ConfigError);
}

TEST_F(RewriterTest, ReplaceSuffixToWithoutFromIsRejected) {
    auto j = job(CaseStyle::Camel, CaseStyle::Snake);
    j.replace_suffix_to = "x";
    EXPECT_THROW(IdentifierRewriter{j}, ConfigError);
}

// from のみ指定された場合は置換ステージを作らない
TEST_F(RewriterTest, ReplaceFromWithoutToIsIgnored) {
    auto j = job(CaseStyle::Camel, CaseStyle::Snake);
    j.replace_prefix_from = "get";
    IdentifierRewriter rewriter(j);
    EXPECT_TRUE(rewriter.stages().empty());
    EXPECT_EQ(rewriter.convert("getName"), "get_name");
}

// ============================================================
// 変更判定
// ============================================================

TEST_F(RewriterTest, AlreadyConvertedTextIsUnchanged) {
    auto outcome = IdentifierRewriter(job(CaseStyle::Camel, CaseStyle::Snake))
                       .rewrite("user_name = max_size;\n");
    EXPECT_FALSE(outcome.changed);
    EXPECT_EQ(outcome.replacements, 0u);
    EXPECT_EQ(outcome.text, "user_name = max_size;\n");
}

// 同じ文字列への置換は変更として数えない
TEST_F(RewriterTest, IdentityReplacementIsNotCounted) {
    auto outcome =
        IdentifierRewriter(job(CaseStyle::Snake, CaseStyle::Snake)).rewrite("first_name");
    EXPECT_FALSE(outcome.changed);
    EXPECT_EQ(outcome.replacements, 0u);
}

TEST_F(RewriterTest, ReplacementsAreNotRescanned) {
    // 変換結果が再びマッチしても1パスのみ
    auto j = job(CaseStyle::Snake, CaseStyle::Snake);
    j.prefix = "a_";
    EXPECT_EQ(rewrite(j, "b_c d_e"), "a_b_c a_d_e");
}

TEST_F(RewriterTest, PreservesSurroundingText) {
    std::string text = "int myCount = 0; // keepThis\n";
    EXPECT_EQ(rewrite(job(CaseStyle::Camel, CaseStyle::Snake), text),
              "int my_count = 0; // keep_this\n");
}

// 非ASCIIの文字に隣接するトークンは識別子の一部なので書き換えない
TEST_F(RewriterTest, NonAsciiNeighboursBlockMatch) {
    auto j = job(CaseStyle::Camel, CaseStyle::Snake);
    EXPECT_EQ(rewrite(j, "éfooBar"), "éfooBar");
    EXPECT_EQ(rewrite(j, "fooBarñ = 1"), "fooBarñ = 1");
    EXPECT_EQ(rewrite(j, "「fooBar」を参照 → myValue"), "「foo_bar」を参照 → my_value");
}

// Trace レベルでは検出したトークンと書き換え結果を出力する
TEST_F(RewriterTest, TraceLogsTokens) {
    debug::set_lang(0);
    debug::set_level(debug::Level::Trace);
    ::testing::internal::CaptureStderr();
    auto outcome = IdentifierRewriter(job(CaseStyle::Camel, CaseStyle::Snake))
                       .rewrite("userId = keepMe");
    std::string log = ::testing::internal::GetCapturedStderr();
    debug::set_level(debug::Level::Warn);

    EXPECT_EQ(outcome.text, "user_id = keep_me");
    EXPECT_NE(log.find("Token matched: userId"), std::string::npos);
    EXPECT_NE(log.find("Token rewritten: \"userId\" -> \"user_id\""), std::string::npos);
}

// ============================================================
// 巨大な入力
// ============================================================

TEST_F(RewriterTest, VeryLongSnakeToken) {
    std::string token = std::string(50000, 'a') + "_b";
    EXPECT_EQ(rewrite(job(CaseStyle::Snake, CaseStyle::Camel), token),
              std::string(50000, 'a') + "B");
}

// base64 の data URI は 300k 文字の1トークンになる
TEST_F(RewriterTest, DataUriInMarkdown) {
    std::string payload = "a";
    std::string expected = "a";
    for (int i = 0; i < 100000; ++i) {
        payload += "aB3";
        expected += "a_b3";
    }
    std::string head = "![img](data:image/png;base64,";

    auto j = job(CaseStyle::Camel, CaseStyle::Snake);
    auto outcome = IdentifierRewriter(j).rewrite(head + payload + ")\n");
    EXPECT_EQ(outcome.replacements, 1u);
    EXPECT_EQ(outcome.text, head + expected + ")\n");

    // ワードフィルタも巨大なトークンに対して評価される
    j.word_filter = ".*B3.*";
    EXPECT_EQ(rewrite(j, head + payload + ")\n"), head + expected + ")\n");
    j.word_filter = "^zz";
    EXPECT_EQ(rewrite(j, head + payload), head + payload);
}
