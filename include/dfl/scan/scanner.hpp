#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include "matcher.hpp"
#include "scan_error.hpp"
#include "value.hpp"

namespace dfl {

struct ScanOptions {
    std::size_t max_depth = 32;
    // 0 disables the bound.
    std::size_t max_total_bytes = 0;
    bool scan_keys = false;
};

struct ScanHit {
    TextMatch match;
    // Key/index path of the matching leaf, e.g. "a.b[1]"; "$" is the root.
    std::string location;
};

// Depth first, pre-order walk over every string leaf. Each leaf is case
// folded once and handed to the matcher; the walk stops at the first leaf
// that matches. Throws DepthExceededError, SizeExceededError or TypeError.
std::optional<ScanHit> scan_any(const Value& value,
                                const CompiledMatcher& matcher,
                                const ScanOptions& options = {});

// Looks only at the string values directly inside a top level mapping.
std::optional<ScanHit> scan_top_level(const Value& args,
                                      const CompiledMatcher& matcher);

// Case folds `str` and scans it as a single leaf.
std::optional<TextMatch> scan_str(std::string_view str,
                                  const CompiledMatcher& matcher);

}  // namespace dfl
