#pragma once

#include <cstddef>
#include <optional>
#include <unordered_map>
#include <vector>
#include "pattern.hpp"

namespace dfl::aho {

class Automaton {
public:
    using StateID = std::size_t;

    Automaton();

    StateID create_state();
    void add_transition(StateID from, unsigned char c, StateID to);
    std::optional<StateID> transition(StateID from, unsigned char c) const;

    // Goto with failure fallback, never fails.
    StateID next(StateID state, unsigned char c) const;

    StateID root() const { return 0; }
    std::optional<PatternID> accept(StateID state) const;
    std::optional<StateID> output(StateID state) const;
    std::size_t depth(StateID state) const;
    std::size_t max_depth() const { return max_depth_; }

    std::vector<std::unordered_map<unsigned char, StateID>> states;
    std::vector<StateID> fail;
    std::vector<std::optional<PatternID>> accepts;
    std::vector<std::optional<StateID>> outputs;
    std::vector<std::size_t> depths;

private:
    friend Automaton from_patterns(const PatternTable& patterns);

    std::size_t max_depth_ = 0;
};

// Builds the trie over the normalized patterns and links failure and
// output transitions breadth first.
Automaton from_patterns(const PatternTable& patterns);

}  // namespace dfl::aho
