#include "compiler.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <string_view>
#include <unordered_set>
#include <utility>
#include "case_fold.hpp"

namespace dfl {

namespace {

void check_list_names(const std::vector<DenyWordList>& lists) {
    std::unordered_set<std::string_view> names;
    for (const auto& list : lists) {
        if (!names.insert(list.name).second) {
            throw CompileError(
                fmt::format("Duplicate deny list name '{}'", list.name));
        }
    }
}

}  // namespace

MatcherPtr compile(const std::vector<DenyWordList>& lists,
                   BackendKind backend,
                   const CompileOptions& options) {
    check_list_names(lists);

    PatternTable patterns;
    std::unordered_set<std::string> seen;
    std::size_t warnings = 0;

    for (std::size_t list_index = 0; list_index < lists.size(); ++list_index) {
        const auto& list = lists[list_index];
        std::size_t usable = 0;

        for (const auto& raw : list.words) {
            const auto word = text::trim(raw);
            if (word.empty()) {
                ++warnings;
                spdlog::warn("Skipping blank word in deny list '{}'",
                             list.name);
                continue;
            }
            if (word.size() > options.max_pattern_bytes) {
                ++warnings;
                spdlog::warn(
                    "Skipping {} byte word in deny list '{}' (limit {})",
                    word.size(), list.name, options.max_pattern_bytes);
                continue;
            }

            auto normalized = text::fold_case(word);
            if (!seen.insert(normalized).second) {
                spdlog::debug("Deny list '{}' repeats '{}', keeping the first",
                              list.name, normalized);
                continue;
            }
            if (patterns.size() >= options.max_patterns) {
                throw CompileError(fmt::format(
                    "Deny lists exceed the limit of {} patterns",
                    options.max_patterns));
            }

            patterns.add(PatternInfo{std::string{word}, std::move(normalized),
                                     list.name, list.priority, list_index});
            ++usable;
        }

        if (usable == 0) {
            spdlog::warn("Deny list '{}' contributes no patterns", list.name);
        }
    }

    if (patterns.empty()) {
        if (options.empty_policy == EmptyPolicy::reject) {
            throw CompileError("Deny lists contain no usable words");
        }
        spdlog::warn("Deny lists contain no usable words, nothing will match");
    }

    auto matcher = std::make_shared<const CompiledMatcher>(
        std::move(patterns), backend, warnings);

    const auto stats = matcher->stats();
    spdlog::info(
        "Compiled {} deny patterns from {} lists with the {} backend "
        "({} states, ~{} bytes, {} warnings)",
        stats.patterns, lists.size(), to_string(backend), stats.states,
        stats.memory_bytes, stats.warnings);

    return matcher;
}

MatcherPtr compile_words(const std::vector<std::string>& words,
                         BackendKind backend,
                         const CompileOptions& options) {
    return compile({DenyWordList{"default", default_priority, words}}, backend,
                   options);
}

}  // namespace dfl
