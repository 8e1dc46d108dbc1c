#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include "compiler.hpp"
#include "pattern.hpp"
#include "scanner.hpp"
#include "value.hpp"

namespace dfl {

enum class MatchReason {
    none,
    deny_word,
    depth_exceeded,
    size_exceeded,
    malformed_payload,
    no_matcher,
};

std::string_view to_string(MatchReason reason);

struct MatchOutcome {
    bool matched = false;
    MatchReason reason = MatchReason::none;
    // Deny word as configured; empty unless reason is deny_word.
    std::string word;
    std::string list_name;
    Priority priority = default_priority;
    std::string location_hint;
    // Byte range of the hit inside the case folded leaf.
    std::size_t match_start = 0;
    std::size_t match_end = 0;
    // Error text for fail-closed outcomes.
    std::string detail;

    bool fail_closed() const {
        return matched && reason != MatchReason::deny_word;
    }

    bool operator==(const MatchOutcome&) const = default;
};

enum class Disclosure {
    redacted,
    include_word,
};

// Never throws for payload problems: depth, size and type violations come
// back as a rejecting outcome.
MatchOutcome check(const Value& payload,
                   const CompiledMatcher& matcher,
                   const ScanOptions& options = {});

MatchOutcome check(const Value& payload,
                   const MatcherPtr& matcher,
                   const ScanOptions& options = {});

// "prompt rejected: matched deny word from list 'x'" and friends. The
// literal word is only shown with Disclosure::include_word.
std::string describe(const MatchOutcome& outcome,
                     Disclosure disclosure = Disclosure::redacted);

}  // namespace dfl
