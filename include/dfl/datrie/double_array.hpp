#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>
#include "automaton.hpp"

namespace dfl::datrie {

// Aho-Corasick automaton flattened into a double array. A child of slot s on
// byte c sits at base[s] + c + 1 and is valid when check[t] == s.
class DoubleArray {
public:
    using StateID = std::size_t;
    using Index = std::int32_t;

    static constexpr Index free_slot = -1;

    DoubleArray() = default;

    StateID root() const { return 0; }
    std::optional<StateID> transition(StateID from, unsigned char c) const;
    StateID next(StateID state, unsigned char c) const;
    std::optional<PatternID> accept(StateID state) const;
    std::optional<StateID> output(StateID state) const;
    std::size_t depth(StateID state) const;
    std::size_t max_depth() const { return max_depth_; }

    std::size_t slot_count() const { return check.size(); }
    std::size_t used_slots() const { return used_; }

    std::vector<Index> base;
    std::vector<Index> check;
    std::vector<Index> fail;
    std::vector<std::int64_t> accepts;
    std::vector<Index> outputs;
    std::vector<std::uint32_t> depths;

private:
    friend DoubleArray from_automaton(const aho::Automaton& automaton);

    std::size_t max_depth_ = 0;
    std::size_t used_ = 0;
};

DoubleArray from_automaton(const aho::Automaton& automaton);

}  // namespace dfl::datrie
