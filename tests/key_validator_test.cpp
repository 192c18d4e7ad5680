#include "tinykey/key_validator.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

namespace tinykey::tests {

namespace {

bool HasEntry(const std::vector<std::string>& entries, const std::string& needle) {
    return std::any_of(entries.begin(), entries.end(), [&needle](const std::string& entry) {
        return entry.find(needle) != std::string::npos;
    });
}

}  // namespace

TEST(KeyValidatorTest, NoRulesAcceptsAnything) {
    const ValidationReport report = KeyValidator::Verify("anything!@#");
    EXPECT_TRUE(report.valid);
    EXPECT_EQ(report.reasons, std::vector<std::string>{"No errors"});
    EXPECT_FALSE(report.expected_charset.has_value());
    EXPECT_EQ(report.core, "anything!@#");
    EXPECT_EQ(report.length, 11U);
    EXPECT_TRUE(HasEntry(report.hints, "No alphabet or preset was provided"));
}

TEST(KeyValidatorTest, StripsPrefixAndSuffix) {
    VerifyRules rules;
    rules.prefix = "PRE_";
    rules.suffix = "_SUF";
    const ValidationReport report = KeyValidator::Verify("PRE_middle_SUF", rules);
    EXPECT_TRUE(report.valid);
    EXPECT_EQ(report.core, "middle");
    EXPECT_EQ(report.length, 6U);
}

TEST(KeyValidatorTest, TooShort) {
    VerifyRules rules;
    rules.min_length = 5;
    const ValidationReport report = KeyValidator::Verify("hi", rules);
    EXPECT_FALSE(report.valid);
    ASSERT_EQ(report.reasons.size(), 1U);
    EXPECT_EQ(report.reasons[0], "Length smaller than minimum: 2 < 5");
    EXPECT_EQ(report.min_length, std::optional<std::size_t>{5});
}

TEST(KeyValidatorTest, WithinBounds) {
    VerifyRules rules;
    rules.min_length = 3;
    rules.max_length = 10;
    EXPECT_TRUE(KeyValidator::Verify("hello", rules).valid);
}

TEST(KeyValidatorTest, TooLong) {
    VerifyRules rules;
    rules.max_length = 3;
    const ValidationReport report = KeyValidator::Verify("abcdef", rules);
    EXPECT_FALSE(report.valid);
    EXPECT_EQ(report.reasons, std::vector<std::string>{"Length larger than maximum: 6 > 3"});
}

TEST(KeyValidatorTest, MaxLengthZero) {
    VerifyRules rules;
    rules.max_length = 0;
    EXPECT_FALSE(KeyValidator::Verify("x", rules).valid);
    EXPECT_TRUE(KeyValidator::Verify("", rules).valid);
}

TEST(KeyValidatorTest, ContradictoryBoundsReportBoth) {
    VerifyRules rules;
    rules.min_length = 10;
    rules.max_length = 3;
    const ValidationReport report = KeyValidator::Verify("abcdef", rules);
    EXPECT_FALSE(report.valid);
    EXPECT_TRUE(HasEntry(report.reasons, "6 < 10"));
    EXPECT_TRUE(HasEntry(report.reasons, "6 > 3"));
}

TEST(KeyValidatorTest, PrefixMismatch) {
    VerifyRules rules;
    rules.prefix = "PREFIX_";
    const ValidationReport report = KeyValidator::Verify("WRONG_rest", rules);
    EXPECT_FALSE(report.valid);
    EXPECT_EQ(report.reasons[0], "Prefix mismatch: expected 'PREFIX_', found 'WRONG_r'");
    EXPECT_EQ(report.core, "est");
    EXPECT_EQ(report.length, 3U);
}

TEST(KeyValidatorTest, SuffixMismatch) {
    VerifyRules rules;
    rules.suffix = "_end";
    const ValidationReport report = KeyValidator::Verify("value_fin", rules);
    EXPECT_FALSE(report.valid);
    EXPECT_EQ(report.reasons[0], "Suffix mismatch: expected '_end', found '_fin'");
    EXPECT_EQ(report.core, "value");
}

TEST(KeyValidatorTest, DecorationLongerThanKey) {
    VerifyRules rules;
    rules.prefix = "abcd";
    rules.suffix = "xy";
    const ValidationReport report = KeyValidator::Verify("abc", rules);
    EXPECT_FALSE(report.valid);
    EXPECT_EQ(report.core, "");
    EXPECT_EQ(report.length, 0U);
    EXPECT_EQ(report.reasons[0], "Key shorter than its prefix and suffix: 3 < 6");
    EXPECT_TRUE(HasEntry(report.reasons, "Prefix mismatch"));
    EXPECT_TRUE(HasEntry(report.reasons, "Suffix mismatch"));
}

TEST(KeyValidatorTest, EmptyAffixIsAbsent) {
    VerifyRules rules;
    rules.prefix = "";
    rules.suffix = "";
    const ValidationReport report = KeyValidator::Verify("abc", rules);
    EXPECT_TRUE(report.valid);
    EXPECT_EQ(report.core, "abc");
}

TEST(KeyValidatorTest, InvalidCharactersSortedOnce) {
    VerifyRules rules;
    rules.alphabet = Preset::Numbers;
    const ValidationReport report = KeyValidator::Verify("C1B2A3CA", rules);
    EXPECT_FALSE(report.valid);
    EXPECT_EQ(report.reasons, std::vector<std::string>{"Invalid characters: A, B, C"});
    EXPECT_EQ(report.expected_charset, std::optional<std::string>{"0123456789"});
}

TEST(KeyValidatorTest, UnderscoreHint) {
    VerifyRules rules;
    rules.alphabet = Preset::Lowercase;
    const ValidationReport report = KeyValidator::Verify("abc_def", rules);
    EXPECT_FALSE(report.valid);
    EXPECT_EQ(report.reasons, std::vector<std::string>{"Invalid characters: _"});
    EXPECT_TRUE(HasEntry(report.hints, "Found '_' among invalid characters"));
}

TEST(KeyValidatorTest, NonPrintableShownAsHex) {
    VerifyRules rules;
    rules.alphabet = Preset::Lowercase;
    const ValidationReport report = KeyValidator::Verify(std::string("ab\x01", 3), rules);
    EXPECT_EQ(report.reasons, std::vector<std::string>{"Invalid characters: \\x01"});
}

TEST(KeyValidatorTest, AffixesExemptFromCharset) {
    VerifyRules rules;
    rules.alphabet = Preset::Hex;
    rules.prefix = "sk_";
    const ValidationReport report = KeyValidator::Verify("sk_0f3a", rules);
    EXPECT_TRUE(report.valid);
    EXPECT_EQ(report.core, "0f3a");
}

TEST(KeyValidatorTest, LiteralAlphabet) {
    VerifyRules rules;
    rules.alphabet = std::string("aab");
    EXPECT_TRUE(KeyValidator::Verify("baba", rules).valid);
    EXPECT_FALSE(KeyValidator::Verify("abc", rules).valid);
}

TEST(KeyValidatorTest, EmptyKeyWithAlphabet) {
    VerifyRules rules;
    rules.alphabet = Preset::Alphanumeric;
    const ValidationReport report = KeyValidator::Verify("", rules);
    EXPECT_TRUE(report.valid);
    EXPECT_TRUE(report.hints.empty());
}

TEST(KeyValidatorTest, AffixLengthHints) {
    VerifyRules rules;
    rules.prefix = "PRE_";
    rules.min_length = 5;
    const ValidationReport short_core = KeyValidator::Verify("PRE_ab", rules);
    EXPECT_FALSE(short_core.valid);
    EXPECT_TRUE(HasEntry(short_core.hints, "'min_length' failure"));

    VerifyRules max_rules;
    max_rules.prefix = "P";
    max_rules.max_length = 4;
    // Core "abcd_" is 5 > 4, whole key 6 is not below 4, so no hint.
    const ValidationReport no_hint = KeyValidator::Verify("Pabcd_", max_rules);
    EXPECT_FALSE(no_hint.valid);
    EXPECT_FALSE(HasEntry(no_hint.hints, "'max_length' failure"));
}

TEST(KeyValidatorTest, ReasonsNeverEmpty) {
    VerifyRules rules;
    rules.alphabet = Preset::Hex;
    rules.min_length = 2;
    for (const std::string key : {"", "a", "zz", "abcdef", "xyz_"}) {
        EXPECT_FALSE(KeyValidator::Verify(key, rules).reasons.empty()) << key;
    }
}

TEST(KeyValidatorTest, VerifyManyNumbersKeys) {
    VerifyRules rules;
    rules.alphabet = Preset::Numbers;
    const std::vector<ValidationReport> reports = KeyValidator::VerifyMany({"123", "abc", "456"}, rules);
    ASSERT_EQ(reports.size(), 3U);
    EXPECT_EQ(reports[0].key_number, "1 out of 3");
    EXPECT_EQ(reports[2].key_number, "3 out of 3");
    EXPECT_TRUE(reports[0].valid);
    EXPECT_FALSE(reports[1].valid);
    EXPECT_TRUE(reports[2].valid);

    EXPECT_TRUE(KeyValidator::VerifyMany({}, rules).empty());
}

TEST(KeyValidatorTest, DropHelpers) {
    EXPECT_EQ(KeyValidator::DropFirst("abcdef", 2), "cdef");
    EXPECT_EQ(KeyValidator::DropLast("abcdef", 2), "abcd");
    EXPECT_EQ(KeyValidator::DropFirst("abc", 0), "abc");
    EXPECT_EQ(KeyValidator::DropFirst("abc", 5), "");
    EXPECT_EQ(KeyValidator::DropLast("abc", 3), "");
}

}  // namespace tinykey::tests
