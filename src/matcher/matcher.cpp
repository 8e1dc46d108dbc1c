#include "matcher.hpp"
#include <utility>

namespace dfl {

std::string_view to_string(BackendKind kind) {
    switch (kind) {
        case BackendKind::automaton:
            return "automaton";
        case BackendKind::alternation:
            return "alternation";
        case BackendKind::compact_trie:
            return "compact_trie";
    }
    return "unknown";
}

std::optional<BackendKind> parse_backend(std::string_view name) {
    if (name == "automaton" || name == "aho_corasick") {
        return BackendKind::automaton;
    }
    if (name == "alternation" || name == "regex_set") {
        return BackendKind::alternation;
    }
    if (name == "compact_trie" || name == "double_array") {
        return BackendKind::compact_trie;
    }
    return std::nullopt;
}

CompiledMatcher::Backend CompiledMatcher::make_backend(
    const PatternTable& patterns,
    BackendKind kind) {
    switch (kind) {
        case BackendKind::automaton:
            return aho::AhoCorasickMatcher(patterns);
        case BackendKind::alternation:
            return nfa::NFAMatcher(patterns);
        case BackendKind::compact_trie:
            return datrie::DoubleArrayMatcher(patterns);
    }
    throw CompileError("Unknown matcher backend");
}

CompiledMatcher::CompiledMatcher(PatternTable&& patterns,
                                 BackendKind kind,
                                 std::size_t warnings)
    : patterns_(std::move(patterns)),
      kind_(kind),
      warnings_(warnings),
      backend_(make_backend(patterns_, kind)) {}

BackendKind CompiledMatcher::backend() const {
    return kind_;
}

bool CompiledMatcher::is_match(std::string_view folded) const {
    return std::visit(
        [folded](const auto& matcher) { return matcher.is_match(folded); },
        backend_);
}

std::optional<TextMatch> CompiledMatcher::scan_text(
    std::string_view folded) const {
    auto hit = std::visit(
        [this, folded](const auto& matcher) {
            return matcher.find(folded, patterns_);
        },
        backend_);
    if (!hit) {
        return std::nullopt;
    }
    return TextMatch{*hit, &patterns_[hit->pattern]};
}

const PatternTable& CompiledMatcher::patterns() const {
    return patterns_;
}

bool CompiledMatcher::never_matches() const {
    return patterns_.empty();
}

MatcherStats CompiledMatcher::stats() const {
    MatcherStats stats;
    stats.patterns = patterns_.size();
    stats.warnings = warnings_;
    std::visit(
        [&stats](const auto& matcher) {
            stats.states = matcher.state_count();
            stats.memory_bytes = matcher.memory_usage();
        },
        backend_);
    return stats;
}

}  // namespace dfl
