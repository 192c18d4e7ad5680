#include "tinykey/selector.hpp"

#include <gtest/gtest.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace tinykey::tests {

namespace {

// Pearson statistic of observed counts against a flat distribution.
double ChiSquare(const std::vector<std::size_t>& counts, const std::size_t total) {
    const double expected = static_cast<double>(total) / static_cast<double>(counts.size());
    double statistic = 0.0;
    for (const std::size_t count : counts) {
        const double delta = static_cast<double>(count) - expected;
        statistic += delta * delta / expected;
    }
    return statistic;
}

}  // namespace

TEST(SelectorTest, EmptyAlphabetFails) {
    char symbol = '?';
    EXPECT_EQ(Selector::Choose("", symbol), KeyStatus::EmptyAlphabet);
    EXPECT_EQ(symbol, '?');

    std::size_t index = 99;
    StubEntropySource stub({0});
    EXPECT_EQ(Selector::ChooseIndex(stub, 0, index), KeyStatus::EmptyAlphabet);
    EXPECT_EQ(stub.Consumed(), 0U);
}

TEST(SelectorTest, SingleSymbolAlwaysChosen) {
    StubEntropySource stub({255, 0, 128});
    for (int i = 0; i < 3; ++i) {
        char symbol = '?';
        ASSERT_EQ(Selector::Choose(stub, "x", symbol), KeyStatus::Ok);
        EXPECT_EQ(symbol, 'x');
    }
    EXPECT_EQ(stub.Consumed(), 3U);
}

TEST(SelectorTest, DrawWidth) {
    EXPECT_EQ(Selector::DrawWidth(1), 1U);
    EXPECT_EQ(Selector::DrawWidth(62), 1U);
    EXPECT_EQ(Selector::DrawWidth(256), 1U);
    EXPECT_EQ(Selector::DrawWidth(257), 2U);
    EXPECT_EQ(Selector::DrawWidth(65536), 2U);
    EXPECT_EQ(Selector::DrawWidth(65537), 3U);
}

TEST(SelectorTest, RejectsTopOfByteRange) {
    // For three symbols the limit is 255, so 255 is redrawn and 254 maps to 2.
    StubEntropySource stub({255, 254});
    char symbol = '?';
    ASSERT_EQ(Selector::Choose(stub, "abc", symbol), KeyStatus::Ok);
    EXPECT_EQ(symbol, 'c');
    EXPECT_EQ(stub.Consumed(), 2U);
}

TEST(SelectorTest, RejectionThenExhaustionFails) {
    StubEntropySource stub({255});
    char symbol = '?';
    EXPECT_EQ(Selector::Choose(stub, "abc", symbol), KeyStatus::EntropySourceFailure);
    EXPECT_EQ(symbol, '?');
}

TEST(SelectorTest, FullByteAlphabetNeverRejects) {
    StubEntropySource stub({255});
    std::size_t index = 0;
    ASSERT_EQ(Selector::ChooseIndex(stub, 256, index), KeyStatus::Ok);
    EXPECT_EQ(index, 255U);
}

TEST(SelectorTest, AcceptedBytesSplitEvenly) {
    std::vector<std::uint8_t> every_byte;
    for (int value = 0; value < 256; ++value) {
        every_byte.push_back(static_cast<std::uint8_t>(value));
    }

    for (const std::size_t n : {std::size_t{3}, std::size_t{5}, std::size_t{7}, std::size_t{10}, std::size_t{62}}) {
        StubEntropySource stub(every_byte);
        std::vector<std::size_t> counts(n, 0);
        std::size_t index = 0;
        while (Selector::ChooseIndex(stub, n, index) == KeyStatus::Ok) {
            ++counts[index];
        }

        const std::size_t limit = 256 - 256 % n;
        for (const std::size_t count : counts) {
            EXPECT_EQ(count, limit / n) << "n=" << n;
        }
    }
}

TEST(SelectorTest, WideDrawCombinesBigEndian) {
    // 300 symbols: two bytes per draw, ceiling 65399.
    StubEntropySource stub({0xFF, 0xFF, 0x01, 0x2D});
    std::size_t index = 0;
    ASSERT_EQ(Selector::ChooseIndex(stub, 300, index), KeyStatus::Ok);
    EXPECT_EQ(index, 1U);
    EXPECT_EQ(stub.Consumed(), 4U);
}

TEST(SelectorTest, WideDrawAcceptsCeiling) {
    // 65399 is the largest accepted value; 65399 % 300 == 299.
    StubEntropySource stub({0xFF, 0x77});
    std::size_t index = 0;
    ASSERT_EQ(Selector::ChooseIndex(stub, 300, index), KeyStatus::Ok);
    EXPECT_EQ(index, 299U);

    StubEntropySource above({0xFF, 0x78});
    EXPECT_EQ(Selector::ChooseIndex(above, 300, index), KeyStatus::EntropySourceFailure);
}

TEST(SelectorTest, UniformOverSmallAlphabets) {
    constexpr std::size_t kDraws = 100000;
    // Critical chi-square values near p = 1e-6 stay under 40 for these sizes.
    constexpr double kThreshold = 40.0;

    for (const std::string alphabet : {"abc", "abcde", "abcdefg"}) {
        std::vector<std::size_t> counts(alphabet.size(), 0);
        for (std::size_t i = 0; i < kDraws; ++i) {
            char symbol = 0;
            ASSERT_EQ(Selector::Choose(alphabet, symbol), KeyStatus::Ok);
            const auto position = alphabet.find(symbol);
            ASSERT_NE(position, std::string::npos);
            ++counts[position];
        }

        const double expected = static_cast<double>(kDraws) / static_cast<double>(alphabet.size());
        for (const std::size_t count : counts) {
            EXPECT_NEAR(static_cast<double>(count), expected, expected * 0.05) << alphabet;
        }
        EXPECT_LT(ChiSquare(counts, kDraws), kThreshold) << alphabet;
    }
}

TEST(SelectorTest, LargeAlphabetReachesEveryIndex) {
    constexpr std::size_t kSize = 1000;
    constexpr std::size_t kDraws = 100000;
    std::vector<std::size_t> counts(kSize, 0);
    for (std::size_t i = 0; i < kDraws; ++i) {
        std::size_t index = kSize;
        ASSERT_EQ(Selector::ChooseIndex(SystemEntropy(), kSize, index), KeyStatus::Ok);
        ASSERT_LT(index, kSize);
        ++counts[index];
    }
    for (std::size_t i = 0; i < kSize; ++i) {
        EXPECT_GT(counts[i], 0U) << "index " << i;
    }
}

TEST(SelectorTest, DuplicateSymbolsWeighted) {
    // "aab": 'a' holds two of three slots. Limit 255, bytes map by value % 3.
    StubEntropySource stub({0, 1, 2, 3});
    std::string drawn;
    for (int i = 0; i < 4; ++i) {
        char symbol = 0;
        ASSERT_EQ(Selector::Choose(stub, "aab", symbol), KeyStatus::Ok);
        drawn.push_back(symbol);
    }
    EXPECT_EQ(drawn, "aaba");
}

}  // namespace tinykey::tests
