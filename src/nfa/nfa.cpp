#include "nfa.hpp"
#include <utility>

namespace dfl::nfa {

StateID NFA::create_state() {
    states.emplace_back();
    return states.size() - 1;
}

void NFA::add_transition(StateID from, TransitionCondition cond, StateID to) {
    states.at(from).emplace_back(Transition{std::move(cond), to});
}

std::size_t NFA::transition_count() const {
    std::size_t count = 0;
    for (const auto& transitions : states) {
        count += transitions.size();
    }
    return count;
}

}  // namespace dfl::nfa
