#pragma once

#include <concepts>
#include <cstddef>
#include <optional>
#include <string_view>
#include "pattern.hpp"

namespace dfl::aho {

template <class A>
concept SearchAutomaton = requires(const A& a,
                                   typename A::StateID s,
                                   unsigned char c) {
    { a.root() } -> std::same_as<typename A::StateID>;
    { a.next(s, c) } -> std::same_as<typename A::StateID>;
    { a.accept(s) } -> std::same_as<std::optional<PatternID>>;
    { a.output(s) } -> std::same_as<std::optional<typename A::StateID>>;
    { a.depth(s) } -> std::convertible_to<std::size_t>;
    { a.max_depth() } -> std::convertible_to<std::size_t>;
};

template <SearchAutomaton A>
bool contains_any(const A& automaton, std::string_view text) {
    auto state = automaton.root();
    for (char ch : text) {
        state = automaton.next(state, static_cast<unsigned char>(ch));
        if (automaton.accept(state) || automaton.output(state)) {
            return true;
        }
    }
    return false;
}

// Walks every occurrence ending at each position and keeps the one that
// precedes all others under PatternTable::precedes. Stops once no later
// occurrence can start at or before the current best.
template <SearchAutomaton A>
std::optional<Hit> find_first(const A& automaton,
                              std::string_view text,
                              const PatternTable& patterns) {
    std::optional<Hit> best;
    const std::size_t longest = automaton.max_depth();
    auto state = automaton.root();

    for (std::size_t pos = 0; pos < text.size(); ++pos) {
        state = automaton.next(state, static_cast<unsigned char>(text[pos]));

        std::optional<typename A::StateID> emit = state;
        if (!automaton.accept(state)) {
            emit = automaton.output(state);
        }
        while (emit) {
            if (auto id = automaton.accept(*emit)) {
                const std::size_t end = pos + 1;
                best = patterns.better(
                    best, Hit{*id, end - automaton.depth(*emit), end});
            }
            emit = automaton.output(*emit);
        }

        // The earliest start any later occurrence can have is pos + 2 - longest.
        if (best && pos + 2 > best->start + longest) {
            break;
        }
    }

    return best;
}

}  // namespace dfl::aho
