#include "deny_check.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <utility>

namespace dfl {

std::string_view to_string(MatchReason reason) {
    switch (reason) {
        case MatchReason::none:
            return "none";
        case MatchReason::deny_word:
            return "deny_word";
        case MatchReason::depth_exceeded:
            return "depth_exceeded";
        case MatchReason::size_exceeded:
            return "size_exceeded";
        case MatchReason::malformed_payload:
            return "malformed_payload";
        case MatchReason::no_matcher:
            return "no_matcher";
    }
    return "unknown";
}

namespace {

MatchOutcome fail_closed(MatchReason reason, const ScanError& e) {
    MatchOutcome outcome;
    outcome.matched = true;
    outcome.reason = reason;
    outcome.location_hint = e.location();
    outcome.detail = e.what();
    spdlog::debug("Deny check failed closed ({}): {}", to_string(reason),
                  e.what());
    return outcome;
}

}  // namespace

MatchOutcome check(const Value& payload,
                   const CompiledMatcher& matcher,
                   const ScanOptions& options) {
    try {
        auto hit = scan_any(payload, matcher, options);
        if (!hit) {
            return MatchOutcome{};
        }

        const auto& info = *hit->match.pattern;
        MatchOutcome outcome;
        outcome.matched = true;
        outcome.reason = MatchReason::deny_word;
        outcome.word = info.word;
        outcome.list_name = info.list_name;
        outcome.priority = info.priority;
        outcome.location_hint = std::move(hit->location);
        outcome.match_start = hit->match.hit.start;
        outcome.match_end = hit->match.hit.end;
        spdlog::debug("Deny word from list '{}' found at {}", info.list_name,
                      outcome.location_hint);
        return outcome;
    } catch (const DepthExceededError& e) {
        return fail_closed(MatchReason::depth_exceeded, e);
    } catch (const SizeExceededError& e) {
        return fail_closed(MatchReason::size_exceeded, e);
    } catch (const TypeError& e) {
        return fail_closed(MatchReason::malformed_payload, e);
    }
}

MatchOutcome check(const Value& payload,
                   const MatcherPtr& matcher,
                   const ScanOptions& options) {
    if (!matcher) {
        MatchOutcome outcome;
        outcome.matched = true;
        outcome.reason = MatchReason::no_matcher;
        outcome.detail = "no deny list matcher is loaded";
        return outcome;
    }
    return check(payload, *matcher, options);
}

std::string describe(const MatchOutcome& outcome, Disclosure disclosure) {
    if (!outcome.matched) {
        return "allowed";
    }
    switch (outcome.reason) {
        case MatchReason::deny_word:
            if (disclosure == Disclosure::include_word) {
                return fmt::format(
                    "prompt rejected: matched deny word '{}' from list '{}'",
                    outcome.word, outcome.list_name);
            }
            return fmt::format(
                "prompt rejected: matched deny word from list '{}'",
                outcome.list_name);
        case MatchReason::depth_exceeded:
            return "prompt rejected: payload nesting too deep";
        case MatchReason::size_exceeded:
            return "prompt rejected: payload text too large";
        case MatchReason::malformed_payload:
            return "prompt rejected: malformed payload";
        case MatchReason::no_matcher:
            return "prompt rejected: deny list unavailable";
        case MatchReason::none:
            break;
    }
    return "prompt rejected";
}

}  // namespace dfl
