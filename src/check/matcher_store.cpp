#include "matcher_store.hpp"
#include <spdlog/spdlog.h>
#include <utility>

namespace dfl {

MatcherStore::MatcherStore(MatcherPtr initial) {
    publish(std::move(initial));
}

MatcherPtr MatcherStore::snapshot() const {
    return current_.load(std::memory_order_acquire);
}

std::uint64_t MatcherStore::version() const {
    return version_.load(std::memory_order_acquire);
}

std::uint64_t MatcherStore::reload(const std::vector<DenyWordList>& lists,
                                   BackendKind backend,
                                   const CompileOptions& options) {
    MatcherPtr next;
    try {
        next = compile(lists, backend, options);
    } catch (const CompileError& e) {
        spdlog::error("Deny list reload rejected, keeping version {}: {}",
                      version(), e.what());
        throw;
    }
    return publish(std::move(next));
}

std::uint64_t MatcherStore::publish(MatcherPtr matcher) {
    current_.store(std::move(matcher), std::memory_order_release);
    const auto version = version_.fetch_add(1, std::memory_order_acq_rel) + 1;
    spdlog::info("Deny list matcher version {} is live", version);
    return version;
}

}  // namespace dfl
