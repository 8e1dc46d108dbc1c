#pragma once

#include "nfa.hpp"
#include "pattern.hpp"

namespace dfl::nfa {

// Thompson construction of (p0|p1|...|pn) where every branch ends with a
// PatternEnd transition naming its pattern.
NFA from_patterns(const PatternTable& patterns);

}  // namespace dfl::nfa
