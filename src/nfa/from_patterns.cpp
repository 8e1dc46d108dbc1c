#include "from_patterns.hpp"
#include <stack>
#include <string_view>
#include <vector>
#include "nfa.hpp"

namespace dfl::nfa {

namespace {

struct Fragment {
    StateID start;
    StateID end;
};

void handle_literal(NFA& nfa, std::stack<Fragment>& frag_stack, char c) {
    const auto start = nfa.create_state();
    const auto end = nfa.create_state();
    nfa.add_transition(start, c, end);
    frag_stack.push(Fragment{start, end});
}

void handle_concatenation(NFA& nfa, std::stack<Fragment>& frag_stack) {
    Fragment rhs = frag_stack.top();
    frag_stack.pop();
    Fragment lhs = frag_stack.top();
    frag_stack.pop();

    nfa.add_transition(lhs.end, EpsilonTransition{}, rhs.start);
    frag_stack.push(Fragment{lhs.start, rhs.end});
}

Fragment handle_word(NFA& nfa, std::string_view word) {
    if (word.empty()) {
        throw CompileError("Empty pattern in alternation");
    }
    std::stack<Fragment> frag_stack;
    handle_literal(nfa, frag_stack, word.front());
    for (char c : word.substr(1)) {
        handle_literal(nfa, frag_stack, c);
        handle_concatenation(nfa, frag_stack);
    }
    return frag_stack.top();
}

// n-ary alternation: one shared entry and exit for all branches.
Fragment handle_alternation(NFA& nfa, const std::vector<Fragment>& branches) {
    const auto new_start = nfa.create_state();
    const auto new_end = nfa.create_state();
    for (const auto& branch : branches) {
        nfa.add_transition(new_start, EpsilonTransition{}, branch.start);
        nfa.add_transition(branch.end, EpsilonTransition{}, new_end);
    }
    return Fragment{new_start, new_end};
}

void handle_pattern_end(NFA& nfa, Fragment& branch, PatternID id) {
    const auto end = nfa.create_state();
    nfa.add_transition(branch.end, PatternEnd{id}, end);
    branch.end = end;
}

}  // namespace

NFA from_patterns(const PatternTable& patterns) {
    NFA nfa;
    std::vector<Fragment> branches;
    branches.reserve(patterns.size());

    PatternID id = 0;
    for (const auto& info : patterns) {
        auto branch = handle_word(nfa, info.normalized);
        handle_pattern_end(nfa, branch, id++);
        branches.push_back(branch);
    }

    nfa.start_state = handle_alternation(nfa, branches).start;

    return nfa;
}

}  // namespace dfl::nfa
