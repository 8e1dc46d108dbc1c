#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>
#include "matcher.hpp"
#include "pattern.hpp"

namespace dfl {

enum class EmptyPolicy {
    reject,
    never_match,
};

struct CompileOptions {
    EmptyPolicy empty_policy = EmptyPolicy::reject;
    std::size_t max_patterns = 100000;
    std::size_t max_pattern_bytes = 4096;
};

using MatcherPtr = std::shared_ptr<const CompiledMatcher>;

// Trims and case folds every word, drops blanks (counted as warnings) and
// keeps the first list's attribution for words repeated across lists.
// Throws CompileError on duplicate list names, on too many patterns, and
// on an empty result under EmptyPolicy::reject.
MatcherPtr compile(const std::vector<DenyWordList>& lists,
                   BackendKind backend,
                   const CompileOptions& options = {});

MatcherPtr compile_words(const std::vector<std::string>& words,
                         BackendKind backend,
                         const CompileOptions& options = {});

}  // namespace dfl
