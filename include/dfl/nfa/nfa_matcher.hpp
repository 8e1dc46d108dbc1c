#pragma once

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>
#include "nfa.hpp"

namespace dfl::nfa {

class NFAMatcher {
public:
    explicit NFAMatcher(const PatternTable& patterns);

    bool is_match(std::string_view str) const;
    std::optional<Hit> find(std::string_view str,
                            const PatternTable& patterns) const;

    std::size_t state_count() const;
    std::size_t memory_usage() const;

private:
    NFA nfa_;
    std::vector<StateID> entry_states_;
};

}  // namespace dfl::nfa
