#include "double_array.hpp"
#include <algorithm>
#include <limits>
#include <queue>
#include <utility>
#include "pattern.hpp"

namespace dfl::datrie {

std::optional<DoubleArray::StateID> DoubleArray::transition(
    StateID from,
    unsigned char c) const {
    const auto t = static_cast<std::size_t>(base[from]) + c + 1;
    if (t < check.size() && check[t] == static_cast<Index>(from)) {
        return t;
    }
    return std::nullopt;
}

DoubleArray::StateID DoubleArray::next(StateID state, unsigned char c) const {
    while (true) {
        if (auto to = transition(state, c)) {
            return *to;
        }
        if (state == root()) {
            return root();
        }
        state = static_cast<StateID>(fail[state]);
    }
}

std::optional<PatternID> DoubleArray::accept(StateID state) const {
    if (accepts[state] < 0) {
        return std::nullopt;
    }
    return static_cast<PatternID>(accepts[state]);
}

std::optional<DoubleArray::StateID> DoubleArray::output(StateID state) const {
    if (outputs[state] < 0) {
        return std::nullopt;
    }
    return static_cast<StateID>(outputs[state]);
}

std::size_t DoubleArray::depth(StateID state) const {
    return depths[state];
}

namespace {

using Index = DoubleArray::Index;

void ensure_size(DoubleArray& da, std::size_t size) {
    if (size <= da.check.size()) {
        return;
    }
    const auto grown = std::max(size, da.check.size() * 2);
    if (grown > static_cast<std::size_t>(std::numeric_limits<Index>::max())) {
        throw CompileError("Double array exceeds addressable size");
    }
    da.base.resize(grown, 0);
    da.check.resize(grown, DoubleArray::free_slot);
}

bool fits(const DoubleArray& da,
          std::size_t base,
          const std::vector<std::size_t>& codes) {
    return std::ranges::all_of(codes, [&](std::size_t code) {
        const auto t = base + code;
        return t >= da.check.size() || da.check[t] == DoubleArray::free_slot;
    });
}

// Codes are byte value + 1 so that a slot never maps onto its own parent
// through a zero offset.
std::vector<std::size_t> child_codes(const aho::Automaton& automaton,
                                     aho::Automaton::StateID state) {
    std::vector<std::size_t> codes;
    codes.reserve(automaton.states[state].size());
    for (auto [c, _] : automaton.states[state]) {
        codes.push_back(std::size_t{c} + 1);
    }
    std::ranges::sort(codes);
    return codes;
}

}  // namespace

DoubleArray from_automaton(const aho::Automaton& automaton) {
    DoubleArray da;
    ensure_size(da, 257);
    da.check[0] = 0;
    da.used_ = 1;

    std::vector<Index> slot_of(automaton.states.size(), DoubleArray::free_slot);
    slot_of[automaton.root()] = 0;

    std::size_t next_free = 1;
    std::queue<aho::Automaton::StateID> processing_queue;
    processing_queue.push(automaton.root());

    while (!processing_queue.empty()) {
        const auto state = processing_queue.front();
        processing_queue.pop();

        const auto codes = child_codes(automaton, state);
        if (codes.empty()) {
            continue;
        }

        while (next_free < da.check.size() &&
               da.check[next_free] != DoubleArray::free_slot) {
            ++next_free;
        }

        std::size_t base =
            next_free > codes.front() ? next_free - codes.front() : 0;
        while (!fits(da, base, codes)) {
            ++base;
        }
        ensure_size(da, base + codes.back() + 1);

        const auto parent = slot_of[state];
        da.base[parent] = static_cast<Index>(base);
        for (auto [c, child] : automaton.states[state]) {
            const auto t = base + std::size_t{c} + 1;
            da.check[t] = parent;
            slot_of[child] = static_cast<Index>(t);
            ++da.used_;
            processing_queue.push(child);
        }
    }

    auto size = da.check.size();
    while (size > 1 && da.check[size - 1] == DoubleArray::free_slot) {
        --size;
    }
    da.base.resize(size);
    da.check.resize(size);
    da.base.shrink_to_fit();
    da.check.shrink_to_fit();

    da.fail.assign(size, 0);
    da.accepts.assign(size, -1);
    da.outputs.assign(size, -1);
    da.depths.assign(size, 0);

    for (std::size_t state = 0; state < automaton.states.size(); ++state) {
        const auto slot = static_cast<std::size_t>(slot_of[state]);
        da.fail[slot] = slot_of[automaton.fail[state]];
        if (auto id = automaton.accept(state)) {
            da.accepts[slot] = *id;
        }
        if (auto out = automaton.output(state)) {
            da.outputs[slot] = slot_of[*out];
        }
        da.depths[slot] = static_cast<std::uint32_t>(automaton.depth(state));
    }
    da.max_depth_ = automaton.max_depth();

    return da;
}

}  // namespace dfl::datrie
