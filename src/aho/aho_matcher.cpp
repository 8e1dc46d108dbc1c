#include "aho_matcher.hpp"
#include <utility>
#include "search.hpp"

namespace dfl::aho {

AhoCorasickMatcher::AhoCorasickMatcher(const PatternTable& patterns)
    : automaton_(from_patterns(patterns)) {}

bool AhoCorasickMatcher::is_match(std::string_view text) const {
    return contains_any(automaton_, text);
}

std::optional<Hit> AhoCorasickMatcher::find(
    std::string_view text,
    const PatternTable& patterns) const {
    return find_first(automaton_, text, patterns);
}

std::size_t AhoCorasickMatcher::state_count() const {
    return automaton_.states.size();
}

// Rough estimate: per-state bookkeeping plus one map node per transition.
std::size_t AhoCorasickMatcher::memory_usage() const {
    using StateID = Automaton::StateID;
    std::size_t bytes = 0;
    for (const auto& transitions : automaton_.states) {
        bytes += sizeof(transitions) +
                 transitions.size() *
                     (sizeof(std::pair<unsigned char, StateID>) +
                      2 * sizeof(void*));
    }
    bytes += automaton_.fail.size() * sizeof(StateID);
    bytes += automaton_.accepts.size() * sizeof(std::optional<PatternID>);
    bytes += automaton_.outputs.size() * sizeof(std::optional<StateID>);
    bytes += automaton_.depths.size() * sizeof(std::size_t);
    return bytes;
}

}  // namespace dfl::aho
