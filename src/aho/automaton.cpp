#include "automaton.hpp"
#include <algorithm>
#include <queue>
#include <string_view>

namespace dfl::aho {

Automaton::Automaton() {
    create_state();
}

Automaton::StateID Automaton::create_state() {
    states.emplace_back();
    fail.push_back(0);
    accepts.emplace_back();
    outputs.emplace_back();
    depths.push_back(0);
    return states.size() - 1;
}

void Automaton::add_transition(StateID from, unsigned char c, StateID to) {
    states.at(from)[c] = to;
}

std::optional<Automaton::StateID> Automaton::transition(StateID from,
                                                        unsigned char c) const {
    const auto& transitions = states[from];
    if (auto it = transitions.find(c); it != transitions.end()) {
        return it->second;
    }
    return std::nullopt;
}

Automaton::StateID Automaton::next(StateID state, unsigned char c) const {
    while (true) {
        if (auto to = transition(state, c)) {
            return *to;
        }
        if (state == root()) {
            return root();
        }
        state = fail[state];
    }
}

std::optional<PatternID> Automaton::accept(StateID state) const {
    return accepts[state];
}

std::optional<Automaton::StateID> Automaton::output(StateID state) const {
    return outputs[state];
}

std::size_t Automaton::depth(StateID state) const {
    return depths[state];
}

namespace {

void insert_pattern(Automaton& automaton,
                    std::string_view pattern,
                    PatternID id) {
    auto current = automaton.root();
    for (char ch : pattern) {
        const auto c = static_cast<unsigned char>(ch);
        if (auto to = automaton.transition(current, c)) {
            current = *to;
        } else {
            const auto created = automaton.create_state();
            automaton.depths[created] = automaton.depths[current] + 1;
            automaton.add_transition(current, c, created);
            current = created;
        }
    }
    if (!automaton.accepts[current]) {
        automaton.accepts[current] = id;
    }
}

void link_failures(Automaton& automaton) {
    std::queue<Automaton::StateID> processing_queue;

    for (auto [c, child] : automaton.states[automaton.root()]) {
        automaton.fail[child] = automaton.root();
        processing_queue.push(child);
    }

    while (!processing_queue.empty()) {
        const auto current = processing_queue.front();
        processing_queue.pop();

        for (auto [c, child] : automaton.states[current]) {
            auto fallback = automaton.fail[current];
            while (fallback != automaton.root() &&
                   !automaton.transition(fallback, c)) {
                fallback = automaton.fail[fallback];
            }
            const auto target = automaton.transition(fallback, c);
            automaton.fail[child] =
                (target && *target != child) ? *target : automaton.root();

            const auto suffix = automaton.fail[child];
            automaton.outputs[child] =
                automaton.accepts[suffix] ? std::optional{suffix}
                                          : automaton.outputs[suffix];

            processing_queue.push(child);
        }
    }
}

}  // namespace

Automaton from_patterns(const PatternTable& patterns) {
    Automaton automaton;
    PatternID id = 0;
    for (const auto& info : patterns) {
        insert_pattern(automaton, info.normalized, id++);
        automaton.max_depth_ =
            std::max(automaton.max_depth_, info.normalized.size());
    }
    link_failures(automaton);
    return automaton;
}

}  // namespace dfl::aho
