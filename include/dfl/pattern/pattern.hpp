#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace dfl {

using PatternID = std::uint32_t;

// Lower value means higher priority.
using Priority = std::int64_t;

inline constexpr Priority default_priority = 100;

struct DenyWordList {
    std::string name;
    Priority priority = default_priority;
    std::vector<std::string> words;
};

struct PatternInfo {
    std::string word;
    std::string normalized;
    std::string list_name;
    Priority priority = default_priority;
    std::size_t list_index = 0;
};

// A pattern occurrence in folded text, [start, end) in bytes.
struct Hit {
    PatternID pattern;
    std::size_t start;
    std::size_t end;

    std::size_t length() const { return end - start; }

    bool operator==(const Hit&) const = default;
};

class PatternTable {
public:
    PatternTable() = default;

    PatternID add(PatternInfo&& info);

    const PatternInfo& operator[](PatternID id) const;
    std::size_t size() const { return patterns_.size(); }
    bool empty() const { return patterns_.empty(); }

    std::vector<PatternInfo>::const_iterator begin() const;
    std::vector<PatternInfo>::const_iterator end() const;

    // Total order used to pick a single hit out of several: leftmost start,
    // then longest, then highest priority, then lowest pattern id.
    bool precedes(const Hit& a, const Hit& b) const;

    std::optional<Hit> better(const std::optional<Hit>& current,
                              const Hit& candidate) const;

private:
    std::vector<PatternInfo> patterns_;
};

class CompileError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

}  // namespace dfl
