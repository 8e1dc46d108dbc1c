#include "pattern.hpp"
#include <utility>

namespace dfl {

PatternID PatternTable::add(PatternInfo&& info) {
    patterns_.push_back(std::move(info));
    return static_cast<PatternID>(patterns_.size() - 1);
}

const PatternInfo& PatternTable::operator[](PatternID id) const {
    return patterns_.at(id);
}

std::vector<PatternInfo>::const_iterator PatternTable::begin() const {
    return patterns_.cbegin();
}

std::vector<PatternInfo>::const_iterator PatternTable::end() const {
    return patterns_.cend();
}

bool PatternTable::precedes(const Hit& a, const Hit& b) const {
    if (a.start != b.start) {
        return a.start < b.start;
    }
    if (a.length() != b.length()) {
        return a.length() > b.length();
    }
    const auto pa = patterns_[a.pattern].priority;
    const auto pb = patterns_[b.pattern].priority;
    if (pa != pb) {
        return pa < pb;
    }
    return a.pattern < b.pattern;
}

std::optional<Hit> PatternTable::better(const std::optional<Hit>& current,
                                        const Hit& candidate) const {
    if (!current || precedes(candidate, *current)) {
        return candidate;
    }
    return current;
}

}  // namespace dfl
