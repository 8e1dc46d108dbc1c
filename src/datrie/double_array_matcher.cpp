#include "double_array_matcher.hpp"
#include "automaton.hpp"
#include "search.hpp"

namespace dfl::datrie {

DoubleArrayMatcher::DoubleArrayMatcher(const PatternTable& patterns)
    : da_(from_automaton(aho::from_patterns(patterns))) {}

bool DoubleArrayMatcher::is_match(std::string_view text) const {
    return aho::contains_any(da_, text);
}

std::optional<Hit> DoubleArrayMatcher::find(
    std::string_view text,
    const PatternTable& patterns) const {
    return aho::find_first(da_, text, patterns);
}

std::size_t DoubleArrayMatcher::state_count() const {
    return da_.used_slots();
}

std::size_t DoubleArrayMatcher::memory_usage() const {
    return da_.base.size() * sizeof(DoubleArray::Index) +
           da_.check.size() * sizeof(DoubleArray::Index) +
           da_.fail.size() * sizeof(DoubleArray::Index) +
           da_.accepts.size() * sizeof(std::int64_t) +
           da_.outputs.size() * sizeof(DoubleArray::Index) +
           da_.depths.size() * sizeof(std::uint32_t);
}

}  // namespace dfl::datrie
