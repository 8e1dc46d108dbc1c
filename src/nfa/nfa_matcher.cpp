#include "nfa_matcher.hpp"
#include <queue>
#include <ranges>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include "from_patterns.hpp"

namespace dfl::nfa {

NFAMatcher::NFAMatcher(const PatternTable& patterns)
    : nfa_(from_patterns(patterns)) {
    auto closure = epsilon_closure<std::unordered_set>(
        nfa_, std::views::single(nfa_.start_state), [](PatternID) {});
    entry_states_.assign(closure.begin(), closure.end());
}

namespace {

// Active state -> offset at which its thread entered the alternation.
using Threads = std::unordered_map<StateID, std::size_t>;

void step(const NFA& nfa,
          const std::unordered_set<StateID>& current,
          char c,
          std::unordered_set<StateID>& next_states) {
    for (auto state : current) {
        for (const auto& trans : nfa.states[state]) {
            if (const auto* ch = std::get_if<char>(&trans.condition)) {
                if (*ch == c) {
                    next_states.insert(trans.target);
                }
            }
        }
    }
}

void close_threads(const NFA& nfa,
                   Threads& threads,
                   std::size_t pos,
                   const PatternTable& patterns,
                   std::optional<Hit>& best) {
    std::queue<StateID> processing_queue;
    for (const auto& [state, _] : threads) {
        processing_queue.push(state);
    }

    while (!processing_queue.empty()) {
        const auto current = processing_queue.front();
        processing_queue.pop();
        const auto start = threads.at(current);

        for (const auto& trans : nfa.states[current]) {
            if (const auto* end = std::get_if<PatternEnd>(&trans.condition)) {
                best = patterns.better(best, Hit{end->pattern, start, pos});
            } else if (!std::holds_alternative<EpsilonTransition>(
                           trans.condition)) {
                continue;
            }
            if (threads.try_emplace(trans.target, start).second) {
                processing_queue.push(trans.target);
            }
        }
    }
}

}  // namespace

bool NFAMatcher::is_match(std::string_view str) const {
    bool matched = false;
    auto on_accept = [&matched](PatternID) { matched = true; };

    std::unordered_set<StateID> current(entry_states_.begin(),
                                        entry_states_.end());

    for (char c : str) {
        std::unordered_set<StateID> next_states(entry_states_.begin(),
                                                entry_states_.end());
        step(nfa_, current, c, next_states);

        current = epsilon_closure<std::unordered_set>(nfa_, next_states,
                                                      on_accept);
        if (matched) {
            return true;
        }
    }

    return false;
}

// Unanchored simulation: a new thread enters at every offset until the
// first hit. After that only threads that started no later than the best
// hit are advanced, so a longer or earlier alternative can still win.
std::optional<Hit> NFAMatcher::find(std::string_view str,
                                    const PatternTable& patterns) const {
    std::optional<Hit> best;
    Threads current;

    for (std::size_t pos = 0;; ++pos) {
        if (!best) {
            for (auto state : entry_states_) {
                current.try_emplace(state, pos);
            }
        }
        if (pos == str.size()) {
            break;
        }

        Threads next;
        for (const auto& [state, start] : current) {
            if (best && start > best->start) {
                continue;
            }
            for (const auto& trans : nfa_.states[state]) {
                if (const auto* ch = std::get_if<char>(&trans.condition)) {
                    if (*ch == str[pos]) {
                        auto [it, inserted] = next.try_emplace(trans.target,
                                                               start);
                        if (!inserted && start < it->second) {
                            it->second = start;
                        }
                    }
                }
            }
        }

        close_threads(nfa_, next, pos + 1, patterns, best);
        current = std::move(next);

        if (best && current.empty()) {
            break;
        }
    }

    return best;
}

std::size_t NFAMatcher::state_count() const {
    return nfa_.states.size();
}

std::size_t NFAMatcher::memory_usage() const {
    return nfa_.states.size() * sizeof(std::vector<Transition>) +
           nfa_.transition_count() * sizeof(Transition);
}

}  // namespace dfl::nfa
