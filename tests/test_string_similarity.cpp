#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "similarity/StringSimilarity.hpp"
#include "similarity/TextUtils.hpp"

#include <string>
#include <utility>
#include <vector>

using namespace similarity;
using Catch::Matchers::WithinAbs;

TEST_CASE("StringSimilarity - Levenshtein", "[similarity]")
{
    SECTION("Classic distance")
    {
        REQUIRE(levenshteinDistance(std::string("kitten"), std::string("sitting")) == 3);
        REQUIRE(levenshteinDistance(std::string("flaw"), std::string("lawn")) == 2);
    }

    SECTION("Distance against empty string is the other length")
    {
        REQUIRE(levenshteinDistance(std::string(""), std::string("abc")) == 3);
        REQUIRE(levenshteinDistance(std::string("abc"), std::string("")) == 3);
    }

    SECTION("Distance counts codepoints, not bytes")
    {
        REQUIRE(levenshteinDistance(std::string("café"), std::string("cafe")) == 1);
        REQUIRE(levenshteinDistance(std::string("東京"), std::string("東都")) == 1);
    }

    SECTION("Similarity is normalized by the longer length")
    {
        REQUIRE_THAT(levenshteinSimilarity(std::string("kitten"), std::string("sitting")), WithinAbs(4.0 / 7.0, 1e-9));
        REQUIRE_THAT(levenshteinSimilarity(std::string("abc"), std::string("")), WithinAbs(0.0, 1e-9));
    }

    SECTION("Symmetric for every pair")
    {
        const std::vector<std::pair<std::string, std::string>> pairs = {
            { "kitten", "sitting" }, { "flaw", "lawn" }, { "Engineering", "Marketing" },
            { "caf\xC3\xA9", "coffee" }, { "", "abc" }, { "\xE6\x9D\xB1\xE4\xBA\xAC", "\xE4\xBA\xAC\xE9\x83\xBD" },
        };
        for (const auto& [left, right] : pairs)
        {
            CAPTURE(left, right);
            REQUIRE(levenshteinDistance(left, right) == levenshteinDistance(right, left));
            REQUIRE(levenshteinSimilarity(left, right) == levenshteinSimilarity(right, left));
        }
    }

    SECTION("Distance to itself is zero")
    {
        for (const std::string text : { "kitten", "Human Resources", "caf\xC3\xA9", "\xE6\x9D\xB1\xE4\xBA\xAC" })
        {
            CAPTURE(text);
            REQUIRE(levenshteinDistance(text, text) == 0);
            REQUIRE(levenshteinSimilarity(text, text) == 1.0);
        }
    }

    SECTION("Two empty strings are identical")
    {
        REQUIRE_THAT(levenshteinSimilarity(std::string(""), std::string("")), WithinAbs(1.0, 1e-9));
    }
}

TEST_CASE("StringSimilarity - Jaro", "[similarity]")
{
    SECTION("Reference values")
    {
        REQUIRE_THAT(jaroSimilarity(std::string("MARTHA"), std::string("MARHTA")), WithinAbs(0.9444, 0.001));
        REQUIRE_THAT(jaroSimilarity(std::string("DIXON"), std::string("DICKSONX")), WithinAbs(0.7667, 0.001));
    }

    SECTION("Equal strings score 1")
    {
        REQUIRE(jaroSimilarity(std::string(""), std::string("")) == 1.0);
        REQUIRE(jaroSimilarity(std::string("a"), std::string("a")) == 1.0);
    }

    SECTION("Empty side scores 0")
    {
        REQUIRE(jaroSimilarity(std::string("abc"), std::string("")) == 0.0);
    }

    SECTION("Single different characters have no match window")
    {
        REQUIRE(jaroSimilarity(std::string("a"), std::string("b")) == 0.0);
    }

    SECTION("No common characters")
    {
        REQUIRE(jaroSimilarity(std::string("abc"), std::string("xyz")) == 0.0);
    }
}

TEST_CASE("StringSimilarity - Jaro-Winkler", "[similarity]")
{
    SECTION("Prefix bonus is applied")
    {
        REQUIRE_THAT(jaroWinklerSimilarity(std::string("MARTHA"), std::string("MARHTA")), WithinAbs(0.9611, 0.001));
        REQUIRE_THAT(jaroWinklerSimilarity(std::string("DIXON"), std::string("DICKSONX")), WithinAbs(0.8133, 0.001));
    }

    SECTION("Scores below 0.7 are returned unchanged")
    {
        std::string a = "abcdef";
        std::string b = "azzzzz";
        double jaro = jaroSimilarity(a, b);
        REQUIRE(jaro < 0.7);
        REQUIRE(jaroWinklerSimilarity(a, b) == jaro);
    }

    SECTION("Prefix scale of zero disables the bonus")
    {
        REQUIRE_THAT(jaroWinklerSimilarity(std::string("MARTHA"), std::string("MARHTA"), 0.0),
                     WithinAbs(jaroSimilarity(std::string("MARTHA"), std::string("MARHTA")), 1e-12));
    }
}

TEST_CASE("StringSimilarity - Combined", "[similarity]")
{
    const std::string a = "MARTHA";
    const std::string b = "MARHTA";

    SECTION("Default weights blend the three metrics")
    {
        double expected = 0.4 * levenshteinSimilarity(a, b) + 0.3 * jaroSimilarity(a, b) +
                          0.3 * jaroWinklerSimilarity(a, b);
        REQUIRE_THAT(combinedSimilarity(a, b), WithinAbs(expected, 1e-9));
    }

    SECTION("Weights are re-normalized")
    {
        SimilarityWeights doubled{ 0.8, 0.6, 0.6 };
        REQUIRE_THAT(combinedSimilarity(a, b, doubled), WithinAbs(combinedSimilarity(a, b), 1e-9));
    }

    SECTION("Zero weights fall back to the defaults")
    {
        SimilarityWeights zero{ 0.0, 0.0, 0.0 };
        REQUIRE_THAT(combinedSimilarity(a, b, zero), WithinAbs(combinedSimilarity(a, b), 1e-9));
    }

    SECTION("Levenshtein only")
    {
        SimilarityWeights lev_only{ 1.0, 0.0, 0.0 };
        REQUIRE_THAT(combinedSimilarity(a, b, lev_only), WithinAbs(levenshteinSimilarity(a, b), 1e-9));
    }

    SECTION("Negative weights count as zero")
    {
        // Unclamped, -0.5/1.0/0.0 would score 2 * jaro - levenshtein, above 1 here
        SimilarityWeights negative{ -0.5, 1.0, 0.0 };
        double score = combinedSimilarity(a, b, negative);
        REQUIRE_THAT(score, WithinAbs(jaroSimilarity(a, b), 1e-9));
        REQUIRE(score <= 1.0);

        SimilarityWeights all_negative{ -1.0, -1.0, -1.0 };
        REQUIRE_THAT(combinedSimilarity(a, b, all_negative), WithinAbs(combinedSimilarity(a, b), 1e-9));
    }

    SECTION("Symmetric and bounded")
    {
        double ab = combinedSimilarity(std::string("Engineering"), std::string("Enginering"));
        double ba = combinedSimilarity(std::string("Enginering"), std::string("Engineering"));
        REQUIRE_THAT(ab, WithinAbs(ba, 1e-9));
        REQUIRE(ab > 0.9);
        REQUIRE(ab < 1.0);
    }
}

TEST_CASE("TextUtils - UTF-8 conversion", "[similarity][utf8]")
{
    SECTION("Round trip of multi-byte text")
    {
        std::string text = "Zürich 東京";
        std::u32string cps = utf8ToUtf32(text);
        REQUIRE(cps.size() == 9);
        REQUIRE(utf32ToUtf8(cps) == text);
    }

    SECTION("Malformed bytes become the replacement character")
    {
        std::u32string cps = utf8ToUtf32(std::string("a\xFF" "b"));
        REQUIRE(cps == std::u32string{ U'a', REPLACEMENT_CHAR, U'b' });
    }

    SECTION("Whitespace and alphanumeric classes")
    {
        REQUIRE(isWhitespace(U' '));
        REQUIRE(isWhitespace(U'\t'));
        REQUIRE(isWhitespace(U'\u00A0'));
        REQUIRE(isWhitespace(U'\u3000'));
        REQUIRE_FALSE(isWhitespace(U'x'));

        REQUIRE(isAlphanumeric(U'a'));
        REQUIRE(isAlphanumeric(U'7'));
        REQUIRE(isAlphanumeric(U'\u00E9'));
        REQUIRE(isAlphanumeric(U'\u6771'));
        REQUIRE_FALSE(isAlphanumeric(U'-'));
        REQUIRE_FALSE(isAlphanumeric(U' '));
    }

    SECTION("Lowercase mapping")
    {
        REQUIRE(toLower(U'A') == U'a');
        REQUIRE(toLower(U'\u00C9') == U'\u00E9');
        REQUIRE(toLower(U'1') == U'1');
    }
}
