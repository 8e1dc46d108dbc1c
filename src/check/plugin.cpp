#include "plugin.hpp"
#include <spdlog/spdlog.h>
#include <utility>
#include "scanner.hpp"

namespace dfl {

DenyListPlugin::DenyListPlugin(const MatcherStore& store,
                               std::string plugin_name,
                               PluginOptions options)
    : store_(store),
      plugin_name_(std::move(plugin_name)),
      options_(options) {}

PluginResult DenyListPlugin::prompt_pre_fetch(const Value& args) const {
    const auto matcher = store_.snapshot();
    const auto outcome = check(args, matcher, options_.scan);
    if (!outcome.matched) {
        return PluginResult{};
    }
    return reject(outcome);
}

bool DenyListPlugin::scan_str(std::string_view text) const {
    const auto matcher = store_.snapshot();
    if (!matcher) {
        return true;
    }
    return dfl::scan_str(text, *matcher).has_value();
}

bool DenyListPlugin::scan(const Value& args) const {
    const auto matcher = store_.snapshot();
    if (!matcher) {
        return true;
    }
    return scan_top_level(args, *matcher).has_value();
}

PluginResult DenyListPlugin::reject(const MatchOutcome& outcome) const {
    PluginViolation violation;
    violation.plugin_name = plugin_name_;
    violation.details["cause"] = to_string(outcome.reason);
    violation.details["message"] = describe(outcome, options_.disclosure);
    violation.details["location"] = outcome.location_hint;

    if (outcome.fail_closed()) {
        violation.reason = "Deny list scan failed";
        violation.description = outcome.detail;
        violation.code = scan_failed_code;
        spdlog::warn("{}: request rejected, {}", plugin_name_, outcome.detail);
    } else {
        violation.reason = "Denied word found in prompt";
        violation.description = "The prompt contains words from the deny list";
        violation.code = violation_code;
        violation.details["list_name"] = outcome.list_name;
        if (options_.disclosure == Disclosure::include_word) {
            violation.details["word"] = outcome.word;
        }
        spdlog::info("{}: request rejected by deny list '{}' at {}",
                     plugin_name_, outcome.list_name, outcome.location_hint);
    }

    return PluginResult{false, std::move(violation)};
}

}  // namespace dfl
