#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "compiler.hpp"

using namespace dfl;

TEST(Compiler, FoldsAndTrimsWords) {
    const auto matcher = compile_words({"  SpAm  ", "CAFÉ"},
                                       BackendKind::automaton);
    const auto& patterns = matcher->patterns();
    ASSERT_EQ(patterns.size(), 2u);
    EXPECT_EQ(patterns[0].word, "SpAm");
    EXPECT_EQ(patterns[0].normalized, "spam");
    EXPECT_EQ(patterns[1].normalized, "café");
    EXPECT_EQ(patterns[0].list_name, "default");
    EXPECT_EQ(patterns[0].priority, default_priority);
}

TEST(Compiler, SkipsBlankWordsWithWarnings) {
    const auto matcher = compile_words({"", "   ", "spam", "\t\n"},
                                       BackendKind::automaton);
    EXPECT_EQ(matcher->patterns().size(), 1u);
    EXPECT_EQ(matcher->stats().warnings, 3u);
}

TEST(Compiler, SkipsOversizedWords) {
    CompileOptions options;
    options.max_pattern_bytes = 8;
    const auto matcher = compile_words({"short", "far too long for it"},
                                       BackendKind::automaton, options);
    EXPECT_EQ(matcher->patterns().size(), 1u);
    EXPECT_EQ(matcher->stats().warnings, 1u);
}

TEST(Compiler, DuplicatesKeepFirstListedAttribution) {
    const auto matcher = compile(
        {
            {"first", 10, {"spam", "SPAM"}},
            {"second", 1, {"Spam", "eggs"}},
        },
        BackendKind::automaton);

    const auto& patterns = matcher->patterns();
    ASSERT_EQ(patterns.size(), 2u);
    EXPECT_EQ(patterns[0].normalized, "spam");
    EXPECT_EQ(patterns[0].list_name, "first");
    EXPECT_EQ(patterns[0].priority, 10);
    EXPECT_EQ(patterns[1].list_name, "second");
    EXPECT_EQ(patterns[1].list_index, 1u);

    const auto match = matcher->scan_text("spam");
    ASSERT_TRUE(match);
    EXPECT_EQ(match->pattern->list_name, "first");
}

TEST(Compiler, RejectsDuplicateListNames) {
    EXPECT_THROW(compile({{"same", 1, {"a"}}, {"same", 2, {"b"}}},
                         BackendKind::automaton),
                 CompileError);
}

TEST(Compiler, EnforcesPatternLimit) {
    CompileOptions options;
    options.max_patterns = 2;
    EXPECT_THROW(compile_words({"a", "b", "c"}, BackendKind::automaton,
                               options),
                 CompileError);
    // Repeats do not count against the limit.
    EXPECT_NO_THROW(compile_words({"a", "b", "A", "B"},
                                  BackendKind::automaton, options));
}

TEST(Compiler, EmptyListsRejectedByDefault) {
    EXPECT_THROW(compile_words({}, BackendKind::automaton), CompileError);
    EXPECT_THROW(compile_words({" ", ""}, BackendKind::automaton),
                 CompileError);
    EXPECT_THROW(compile({}, BackendKind::automaton), CompileError);
}

TEST(Compiler, EmptyListsNeverMatchWhenAllowed) {
    CompileOptions options;
    options.empty_policy = EmptyPolicy::never_match;
    for (auto backend : {BackendKind::automaton, BackendKind::alternation,
                         BackendKind::compact_trie}) {
        const auto matcher = compile_words({}, backend, options);
        EXPECT_TRUE(matcher->never_matches());
        EXPECT_FALSE(matcher->is_match("anything at all"));
        EXPECT_FALSE(matcher->scan_text("anything at all"));
        EXPECT_FALSE(matcher->scan_text(""));
    }
}

TEST(Compiler, ListWithoutWordsContributesNothing) {
    const auto matcher = compile({{"empty", 1, {}}, {"real", 2, {"spam"}}},
                                 BackendKind::automaton);
    ASSERT_EQ(matcher->patterns().size(), 1u);
    EXPECT_EQ(matcher->patterns()[0].list_name, "real");
    EXPECT_EQ(matcher->patterns()[0].list_index, 1u);
}

TEST(Backend, ParsesNamesAndAliases) {
    EXPECT_EQ(parse_backend("automaton"), BackendKind::automaton);
    EXPECT_EQ(parse_backend("aho_corasick"), BackendKind::automaton);
    EXPECT_EQ(parse_backend("alternation"), BackendKind::alternation);
    EXPECT_EQ(parse_backend("regex_set"), BackendKind::alternation);
    EXPECT_EQ(parse_backend("compact_trie"), BackendKind::compact_trie);
    EXPECT_EQ(parse_backend("double_array"), BackendKind::compact_trie);
    EXPECT_FALSE(parse_backend("bloom"));
    EXPECT_EQ(to_string(BackendKind::compact_trie), "compact_trie");
}
