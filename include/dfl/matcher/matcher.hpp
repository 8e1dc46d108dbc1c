#pragma once

#include <cstddef>
#include <optional>
#include <string_view>
#include <variant>
#include "aho_matcher.hpp"
#include "double_array_matcher.hpp"
#include "nfa_matcher.hpp"
#include "pattern.hpp"

namespace dfl {

enum class BackendKind {
    automaton,
    alternation,
    compact_trie,
};

std::string_view to_string(BackendKind kind);
std::optional<BackendKind> parse_backend(std::string_view name);

struct TextMatch {
    Hit hit;
    const PatternInfo* pattern;
};

struct MatcherStats {
    std::size_t patterns = 0;
    std::size_t warnings = 0;
    std::size_t states = 0;
    std::size_t memory_bytes = 0;
};

// Immutable once built; every member function is safe to call from any
// number of threads at once. Text passed in must already be case folded.
class CompiledMatcher {
public:
    using Backend = std::variant<aho::AhoCorasickMatcher,
                                 nfa::NFAMatcher,
                                 datrie::DoubleArrayMatcher>;

    CompiledMatcher(PatternTable&& patterns,
                    BackendKind kind,
                    std::size_t warnings);

    BackendKind backend() const;

    bool is_match(std::string_view folded) const;
    std::optional<TextMatch> scan_text(std::string_view folded) const;

    const PatternTable& patterns() const;
    bool never_matches() const;
    MatcherStats stats() const;

private:
    static Backend make_backend(const PatternTable& patterns,
                                BackendKind kind);

    PatternTable patterns_;
    BackendKind kind_;
    std::size_t warnings_;
    Backend backend_;
};

}  // namespace dfl
