#pragma once

#include <cstddef>
#include <optional>
#include <string_view>
#include "double_array.hpp"

namespace dfl::datrie {

class DoubleArrayMatcher {
public:
    explicit DoubleArrayMatcher(const PatternTable& patterns);

    bool is_match(std::string_view text) const;
    std::optional<Hit> find(std::string_view text,
                            const PatternTable& patterns) const;

    std::size_t state_count() const;
    std::size_t memory_usage() const;

private:
    DoubleArray da_;
};

}  // namespace dfl::datrie
