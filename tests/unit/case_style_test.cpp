#include "../../src/naming/case_style.hpp"

#include <gtest/gtest.h>

#include <regex>

using namespace refmt::naming;

class CaseStyleTest : public ::testing::Test {
   protected:
    static bool matches_whole(CaseStyle style, const std::string& text) {
        return is_token(style, text);
    }

    static std::vector<std::string> find_all(CaseStyle style, const std::string& text) {
        std::vector<std::string> found;
        for (const auto& span : find_tokens(style, text)) {
            found.push_back(text.substr(span.offset, span.length));
        }
        return found;
    }

    static std::vector<std::string> regex_find_all(CaseStyle style, const std::string& text) {
        std::vector<std::string> found;
        std::regex re(pattern(style));
        for (std::sregex_iterator it(text.begin(), text.end(), re), end; it != end; ++it) {
            found.push_back(it->str());
        }
        return found;
    }

    using Words = std::vector<std::string>;
};

// ============================================================
// 認識パターン
// ============================================================

TEST_F(CaseStyleTest, CamelPattern) {
    EXPECT_TRUE(matches_whole(CaseStyle::Camel, "myVariable"));
    EXPECT_TRUE(matches_whole(CaseStyle::Camel, "getUserName"));
    EXPECT_FALSE(matches_whole(CaseStyle::Camel, "variable"));
    EXPECT_FALSE(matches_whole(CaseStyle::Camel, "MyVariable"));
    EXPECT_FALSE(matches_whole(CaseStyle::Camel, "a1B"));
}

TEST_F(CaseStyleTest, PascalPatternNeedsTwoHumps) {
    EXPECT_TRUE(matches_whole(CaseStyle::Pascal, "UserName"));
    EXPECT_FALSE(matches_whole(CaseStyle::Pascal, "User"));
    EXPECT_FALSE(matches_whole(CaseStyle::Pascal, "userName"));
    EXPECT_FALSE(matches_whole(CaseStyle::Pascal, "IUser"));
}

TEST_F(CaseStyleTest, SnakeAndKebabNeedSeparator) {
    EXPECT_TRUE(matches_whole(CaseStyle::Snake, "first_name"));
    EXPECT_FALSE(matches_whole(CaseStyle::Snake, "first"));
    EXPECT_FALSE(matches_whole(CaseStyle::Snake, "first__name"));
    EXPECT_TRUE(matches_whole(CaseStyle::ScreamingSnake, "MAX_SIZE"));
    EXPECT_FALSE(matches_whole(CaseStyle::ScreamingSnake, "max_size"));
    EXPECT_TRUE(matches_whole(CaseStyle::Kebab, "first-name"));
    EXPECT_TRUE(matches_whole(CaseStyle::ScreamingKebab, "FIRST-NAME"));
    EXPECT_FALSE(matches_whole(CaseStyle::Kebab, "first_name"));
}

TEST_F(CaseStyleTest, PatternRespectsWordBoundaries) {
    // 識別子の途中からはマッチしない
    EXPECT_EQ(find_all(CaseStyle::Camel, "x = myVar + _myVar;"), Words({"myVar"}));
    EXPECT_EQ(find_all(CaseStyle::Snake, "call(first_name, last_name)"),
              Words({"first_name", "last_name"}));
}

// kebab は '-' をまたいで語を貪欲に連結し、不正な語の手前で止まる
TEST_F(CaseStyleTest, KebabChainsStopAtInvalidWord) {
    EXPECT_EQ(find_all(CaseStyle::Kebab, "Foo-bar-baz"), Words({"bar-baz"}));
    EXPECT_EQ(find_all(CaseStyle::Kebab, "foo-bar-Baz"), Words({"foo-bar"}));
    EXPECT_EQ(find_all(CaseStyle::Kebab, "foo-bar_x a-b- -c"), Words({"a-b"}));
}

// 走査結果は ASCII テキストでは正規表現 pattern() と一致する
TEST_F(CaseStyleTest, ScannerAgreesWithPattern) {
    const std::string samples[] = {
        "x = myVar + _myVar; getHTTPResponse aB a1B",
        "class UserName : IUser, BaseHTTPHandler {}",
        "first_name __init__ a_b_ MAX_SIZE_2 X_Y",
        "Foo-bar-baz foo-bar_x MAX-SIZE-2 a--b --x-y z-",
        "data:image/png;base64,aB3cD+eF/gh== vec_3d",
    };
    for (const auto& text : samples) {
        for (CaseStyle style : kAllCaseStyles) {
            EXPECT_EQ(find_all(style, text), regex_find_all(style, text))
                << to_string(style) << ": " << text;
        }
    }
}

// 非ASCIIの文字は識別子の一部、記号・句読点は区切り
TEST_F(CaseStyleTest, NonAsciiLettersAreIdentifierCharacters) {
    EXPECT_TRUE(find_all(CaseStyle::Camel, "éfooBar fooBaré 变量fooBar").empty());
    EXPECT_EQ(find_all(CaseStyle::Camel, "「fooBar」と“userId”"), Words({"fooBar", "userId"}));
    EXPECT_EQ(find_all(CaseStyle::Snake, "x→my_var　max_len"), Words({"my_var", "max_len"}));
    EXPECT_TRUE(find_all(CaseStyle::Kebab, "éfoo-bar foo-barñ").empty());
}

// ============================================================
// 分割
// ============================================================

TEST_F(CaseStyleTest, SplitCamelAndPascal) {
    EXPECT_EQ(split_words(CaseStyle::Camel, "getUserName"), Words({"get", "user", "name"}));
    EXPECT_EQ(split_words(CaseStyle::Pascal, "UserName"), Words({"user", "name"}));
}

TEST_F(CaseStyleTest, SplitDropsEmptySegments) {
    EXPECT_EQ(split_words(CaseStyle::Snake, "_first__name_"), Words({"first", "name"}));
    EXPECT_EQ(split_words(CaseStyle::ScreamingKebab, "FIRST--NAME"), Words({"first", "name"}));
}

TEST_F(CaseStyleTest, SplitLowercasesWords) {
    EXPECT_EQ(split_words(CaseStyle::ScreamingSnake, "MAX_BUFFER_SIZE"),
              Words({"max", "buffer", "size"}));
}

// ============================================================
// 結合
// ============================================================

TEST_F(CaseStyleTest, JoinAllStyles) {
    Words words = {"user", "name"};
    EXPECT_EQ(join_words(CaseStyle::Camel, words), "userName");
    EXPECT_EQ(join_words(CaseStyle::Pascal, words), "UserName");
    EXPECT_EQ(join_words(CaseStyle::Snake, words), "user_name");
    EXPECT_EQ(join_words(CaseStyle::ScreamingSnake, words), "USER_NAME");
    EXPECT_EQ(join_words(CaseStyle::Kebab, words), "user-name");
    EXPECT_EQ(join_words(CaseStyle::ScreamingKebab, words), "USER-NAME");
}

TEST_F(CaseStyleTest, JoinWrapsPrefixAndSuffix) {
    EXPECT_EQ(join_words(CaseStyle::Snake, {"user", "name"}, "m_", "_t"), "m_user_name_t");
}

TEST_F(CaseStyleTest, JoinEmptyWordsIsEmpty) {
    EXPECT_EQ(join_words(CaseStyle::Pascal, {}, "pre", "post"), "");
}

// 分割は結合の左逆写像
TEST_F(CaseStyleTest, SplitInvertsJoinForAllStyles) {
    Words words = {"parse", "config", "file"};
    for (CaseStyle style : kAllCaseStyles) {
        EXPECT_EQ(split_words(style, join_words(style, words)), words) << to_string(style);
    }
}

TEST_F(CaseStyleTest, JoinInvertsSplitForMatchingTokens) {
    EXPECT_EQ(join_words(CaseStyle::Camel, split_words(CaseStyle::Camel, "getUserName")),
              "getUserName");
    EXPECT_EQ(join_words(CaseStyle::ScreamingSnake,
                         split_words(CaseStyle::ScreamingSnake, "MAX_SIZE")),
              "MAX_SIZE");
}

// 数字は大文字境界を持たないため、往復で失われる場合がある
TEST_F(CaseStyleTest, DigitsAreLossyAcrossStyles) {
    auto words = split_words(CaseStyle::Snake, "vec_3d");
    EXPECT_EQ(words, Words({"vec", "3d"}));
    std::string camel = join_words(CaseStyle::Camel, words);
    EXPECT_EQ(camel, "vec3d");
    EXPECT_EQ(split_words(CaseStyle::Camel, camel), Words({"vec3d"}));
}

// ============================================================
// 名前
// ============================================================

TEST_F(CaseStyleTest, ParseFlagNames) {
    for (CaseStyle style : kAllCaseStyles) {
        EXPECT_EQ(parse_case_style(flag_name(style)), style);
    }
    EXPECT_FALSE(parse_case_style("train").has_value());
    EXPECT_STREQ(to_string(CaseStyle::ScreamingKebab), "SCREAMING-KEBAB-CASE");
}
