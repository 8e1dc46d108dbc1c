#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <vector>
#include "compiler.hpp"

namespace dfl {

// Publishes compiled matchers to concurrent readers. A reader keeps the
// snapshot it took for the whole of its check; a matcher is destroyed when
// the last snapshot referring to it is released.
class MatcherStore {
public:
    MatcherStore() = default;
    explicit MatcherStore(MatcherPtr initial);

    MatcherStore(const MatcherStore&) = delete;
    MatcherStore& operator=(const MatcherStore&) = delete;

    MatcherPtr snapshot() const;
    std::uint64_t version() const;

    // Compiles and publishes. On CompileError the current matcher stays in
    // place and the error propagates.
    std::uint64_t reload(const std::vector<DenyWordList>& lists,
                         BackendKind backend,
                         const CompileOptions& options = {});

    std::uint64_t publish(MatcherPtr matcher);

private:
    std::atomic<std::shared_ptr<const CompiledMatcher>> current_;
    std::atomic<std::uint64_t> version_{0};
};

}  // namespace dfl
