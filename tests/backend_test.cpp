#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "aho_matcher.hpp"
#include "automaton.hpp"
#include "compiler.hpp"
#include "double_array.hpp"
#include "double_array_matcher.hpp"
#include "from_patterns.hpp"
#include "nfa_matcher.hpp"

using namespace dfl;

namespace {

PatternTable table_of(const std::vector<std::string>& words) {
    PatternTable table;
    for (const auto& word : words) {
        table.add(PatternInfo{word, word, "test", default_priority, 0});
    }
    return table;
}

class BackendTest : public ::testing::TestWithParam<BackendKind> {
protected:
    MatcherPtr build(const std::vector<std::string>& words) {
        return compile_words(words, GetParam());
    }

    MatcherPtr build(const std::vector<DenyWordList>& lists) {
        return compile(lists, GetParam());
    }
};

}  // namespace

TEST_P(BackendTest, FindsSingleWord) {
    const auto matcher = build(std::vector<std::string>{"spam"});
    EXPECT_TRUE(matcher->is_match("this has spam in it"));
    const auto match = matcher->scan_text("this has spam in it");
    ASSERT_TRUE(match);
    EXPECT_EQ(match->hit.start, 9u);
    EXPECT_EQ(match->hit.end, 13u);
    EXPECT_EQ(match->pattern->word, "spam");
}

TEST_P(BackendTest, NoFalsePositive) {
    const auto matcher = build(std::vector<std::string>{"spam", "eggs"});
    EXPECT_FALSE(matcher->is_match("a perfectly clean sentence"));
    EXPECT_FALSE(matcher->scan_text("a perfectly clean sentence"));
    EXPECT_FALSE(matcher->scan_text(""));
    EXPECT_FALSE(matcher->scan_text("spa"));
}

TEST_P(BackendTest, MatchesSubstringsInsideWords) {
    const auto matcher = build(std::vector<std::string>{"bad"});
    EXPECT_TRUE(matcher->is_match("badminton"));
    EXPECT_TRUE(matcher->is_match("notbad"));
}

TEST_P(BackendTest, LeftmostThenLongest) {
    const auto matcher = build(std::vector<DenyWordList>{
        {"short", 1, {"spam"}},
        {"long", 5, {"spamalot"}},
    });
    const auto match = matcher->scan_text("spamalot");
    ASSERT_TRUE(match);
    EXPECT_EQ(match->pattern->word, "spamalot");
    EXPECT_EQ(match->pattern->list_name, "long");
    EXPECT_EQ(match->hit.start, 0u);
    EXPECT_EQ(match->hit.end, 8u);
}

TEST_P(BackendTest, EarlierStartBeatsLongerLaterMatch) {
    const auto matcher = build(std::vector<std::string>{"cde", "abcdefgh", "bc"});
    const auto match = matcher->scan_text("xbcdefgh");
    ASSERT_TRUE(match);
    EXPECT_EQ(match->pattern->word, "bc");
    EXPECT_EQ(match->hit.start, 1u);
}

TEST_P(BackendTest, OverlappingSuffixPatterns) {
    const auto matcher = build(std::vector<std::string>{"he", "she", "his", "hers"});
    const auto match = matcher->scan_text("ushers");
    ASSERT_TRUE(match);
    EXPECT_EQ(match->pattern->word, "she");
    EXPECT_EQ(match->hit.start, 1u);

    const auto later = matcher->scan_text("ahishers");
    ASSERT_TRUE(later);
    EXPECT_EQ(later->pattern->word, "his");
}

TEST_P(BackendTest, SingleCharacterWords) {
    const auto matcher = build(std::vector<std::string>{"x", "y"});
    EXPECT_TRUE(matcher->is_match("box"));
    EXPECT_FALSE(matcher->is_match("abc"));
    const auto match = matcher->scan_text("yes and x");
    ASSERT_TRUE(match);
    EXPECT_EQ(match->pattern->word, "y");
}

TEST_P(BackendTest, SpecialCharactersAreLiteral) {
    const auto matcher = build(std::vector<std::string>{"@#$", "a.b", "(x|y)*"});
    EXPECT_TRUE(matcher->is_match("look: @#$ here"));
    EXPECT_TRUE(matcher->is_match("a.b"));
    EXPECT_FALSE(matcher->is_match("axb"));
    EXPECT_TRUE(matcher->is_match("match (x|y)* literally"));
    EXPECT_FALSE(matcher->is_match("xyxy"));
}

TEST_P(BackendTest, MultiByteWords) {
    const auto matcher = build(std::vector<std::string>{"café", "σπαμ"});
    EXPECT_TRUE(matcher->is_match("un café noir"));
    EXPECT_TRUE(matcher->is_match("σπαμ!"));
    EXPECT_FALSE(matcher->is_match("cafe"));
}

TEST_P(BackendTest, LongText) {
    const auto matcher = build(std::vector<std::string>{"needle"});
    std::string text(10000, 'a');
    EXPECT_FALSE(matcher->is_match(text));
    text.replace(9000, 6, "needle");
    const auto match = matcher->scan_text(text);
    ASSERT_TRUE(match);
    EXPECT_EQ(match->hit.start, 9000u);
}

TEST_P(BackendTest, MultilineText) {
    const auto matcher = build(std::vector<std::string>{"spam"});
    EXPECT_TRUE(matcher->is_match("first line\nsecond spam line\nthird"));
    EXPECT_FALSE(matcher->is_match("sp\nam"));
}

TEST_P(BackendTest, StatsReportTheBackend) {
    const auto matcher = build(std::vector<std::string>{"spam", "ham"});
    const auto stats = matcher->stats();
    EXPECT_EQ(matcher->backend(), GetParam());
    EXPECT_EQ(stats.patterns, 2u);
    EXPECT_GT(stats.states, 0u);
    EXPECT_GT(stats.memory_bytes, 0u);
}

INSTANTIATE_TEST_SUITE_P(AllBackends,
                         BackendTest,
                         ::testing::Values(BackendKind::automaton,
                                           BackendKind::alternation,
                                           BackendKind::compact_trie),
                         [](const auto& info) {
                             return std::string{to_string(info.param)};
                         });

TEST(Automaton, BuildsTrieWithFailureLinks) {
    const auto table = table_of({"he", "she", "his", "hers"});
    const auto automaton = aho::from_patterns(table);

    // root, h, he, hi, his, her, hers, s, sh, she
    EXPECT_EQ(automaton.states.size(), 10u);
    EXPECT_EQ(automaton.max_depth(), 4u);

    auto walk = [&](std::string_view path) {
        auto state = automaton.root();
        for (char c : path) {
            state = *automaton.transition(state, static_cast<unsigned char>(c));
        }
        return state;
    };

    const auto she = walk("she");
    const auto he = walk("he");
    EXPECT_EQ(automaton.fail[she], he);
    EXPECT_EQ(automaton.accept(she), PatternID{1});
    EXPECT_EQ(automaton.output(she), he);
    EXPECT_EQ(automaton.depth(she), 3u);
    EXPECT_FALSE(automaton.transition(automaton.root(), 'z'));
    EXPECT_EQ(automaton.next(automaton.root(), 'z'), automaton.root());
}

TEST(Automaton, KeepsFirstPatternForRepeatedWord) {
    const auto table = table_of({"spam", "spam"});
    const auto automaton = aho::from_patterns(table);
    auto state = automaton.root();
    for (char c : std::string_view{"spam"}) {
        state = automaton.next(state, static_cast<unsigned char>(c));
    }
    EXPECT_EQ(automaton.accept(state), PatternID{0});
}

TEST(DoubleArray, MirrorsTheAutomaton) {
    const auto table = table_of({"he", "she", "his", "hers"});
    const auto automaton = aho::from_patterns(table);
    const auto da = datrie::from_automaton(automaton);

    EXPECT_EQ(da.used_slots(), automaton.states.size());
    EXPECT_GE(da.slot_count(), da.used_slots());
    EXPECT_EQ(da.max_depth(), automaton.max_depth());

    auto state = da.root();
    for (char c : std::string_view{"she"}) {
        const auto next = da.transition(state, static_cast<unsigned char>(c));
        ASSERT_TRUE(next);
        state = *next;
    }
    EXPECT_EQ(da.accept(state), PatternID{1});
    EXPECT_EQ(da.depth(state), 3u);
    ASSERT_TRUE(da.output(state));
    EXPECT_EQ(da.accept(*da.output(state)), PatternID{0});
    EXPECT_FALSE(da.transition(da.root(), 'z'));
}

TEST(DoubleArray, HandlesWideFanOut) {
    std::vector<std::string> words;
    for (int c = 1; c < 256; ++c) {
        words.push_back(std::string(1, static_cast<char>(c)) + "x");
    }
    const auto table = table_of(words);
    const datrie::DoubleArrayMatcher matcher(table);
    const aho::AhoCorasickMatcher reference(table);

    for (int c = 1; c < 256; ++c) {
        const std::string text = std::string("..") + static_cast<char>(c) + "x";
        EXPECT_EQ(matcher.find(text, table), reference.find(text, table));
    }
}

TEST(NFA, OneBranchPerPattern) {
    const auto table = table_of({"ab", "cd"});
    const auto nfa = nfa::from_patterns(table);
    const nfa::NFAMatcher matcher(table);

    // Two states per byte, one pattern-end state per branch, plus the
    // shared entry and exit.
    EXPECT_EQ(nfa.states.size(), 12u);
    EXPECT_EQ(nfa.states[nfa.start_state].size(), 2u);
    EXPECT_TRUE(matcher.is_match("xxcd"));
    EXPECT_FALSE(matcher.is_match("acbd"));
    EXPECT_EQ(matcher.find("zabcd", table), (Hit{0, 1, 3}));
}

TEST(NFA, ChainsEveryByteOfAWord) {
    const auto table = table_of({"x", "spam"});
    const nfa::NFAMatcher matcher(table);

    EXPECT_EQ(matcher.find("..x", table), (Hit{0, 2, 3}));
    EXPECT_EQ(matcher.find("sp spam", table), (Hit{1, 3, 7}));
    EXPECT_FALSE(matcher.is_match("spa"));
    EXPECT_THROW(nfa::from_patterns(table_of({""})), CompileError);
}
