#pragma once

#include <cstddef>
#include <queue>
#include <ranges>
#include <variant>
#include <vector>
#include "pattern.hpp"

namespace dfl::nfa {

using StateID = std::size_t;

struct EpsilonTransition {};
struct PatternEnd {
    PatternID pattern;
};
using TransitionCondition = std::variant<EpsilonTransition, char, PatternEnd>;

struct Transition {
    TransitionCondition condition;
    StateID target;
};

class NFA {
public:
    NFA() = default;

    StateID create_state();
    void add_transition(StateID from, TransitionCondition cond, StateID to);
    std::size_t transition_count() const;

    std::vector<std::vector<Transition>> states;
    StateID start_state = 0;
};

// Follows epsilon and pattern-end transitions; `on_accept` receives the
// pattern id of every pattern-end transition taken.
template <template <class...> class Set, std::ranges::input_range R, class F>
Set<StateID> epsilon_closure(const NFA& nfa, R&& states, F&& on_accept) {
    Set<StateID> closure(std::ranges::begin(states), std::ranges::end(states));
    std::queue<StateID> processing_queue;
    for (auto state : closure) {
        processing_queue.push(state);
    }

    while (!processing_queue.empty()) {
        auto current = processing_queue.front();
        processing_queue.pop();

        for (const auto& trans : nfa.states[current]) {
            if (const auto* end = std::get_if<PatternEnd>(&trans.condition)) {
                on_accept(end->pattern);
            } else if (!std::holds_alternative<EpsilonTransition>(
                           trans.condition)) {
                continue;
            }
            if (!closure.contains(trans.target)) {
                closure.insert(trans.target);
                processing_queue.push(trans.target);
            }
        }
    }

    return closure;
}

}  // namespace dfl::nfa
