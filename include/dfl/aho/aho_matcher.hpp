#pragma once

#include <cstddef>
#include <optional>
#include <string_view>
#include "automaton.hpp"

namespace dfl::aho {

class AhoCorasickMatcher {
public:
    explicit AhoCorasickMatcher(const PatternTable& patterns);

    bool is_match(std::string_view text) const;
    std::optional<Hit> find(std::string_view text,
                            const PatternTable& patterns) const;

    std::size_t state_count() const;
    std::size_t memory_usage() const;

private:
    Automaton automaton_;
};

}  // namespace dfl::aho
