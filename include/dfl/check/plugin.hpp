#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include "deny_check.hpp"
#include "matcher_store.hpp"

namespace dfl {

inline constexpr std::string_view violation_code = "DENY_LIST_VIOLATION";
inline constexpr std::string_view scan_failed_code = "DENY_LIST_SCAN_FAILED";

struct PluginViolation {
    std::string reason;
    std::string description;
    std::string code;
    std::string plugin_name;
    std::map<std::string, std::string> details;
};

struct PluginResult {
    bool continue_processing = true;
    std::optional<PluginViolation> violation;
};

struct PluginOptions {
    ScanOptions scan;
    Disclosure disclosure = Disclosure::redacted;
};

// Pre-fetch hook run once per inbound request. Reads the store's current
// matcher on every call, so a reload takes effect on the next request.
class DenyListPlugin {
public:
    explicit DenyListPlugin(const MatcherStore& store,
                            std::string plugin_name = "DenyListPlugin",
                            PluginOptions options = {});

    PluginResult prompt_pre_fetch(const Value& args) const;

    // Lighter checks: one string, or only the top level string values.
    bool scan_str(std::string_view text) const;
    bool scan(const Value& args) const;

    const std::string& name() const { return plugin_name_; }

private:
    PluginResult reject(const MatchOutcome& outcome) const;

    const MatcherStore& store_;
    std::string plugin_name_;
    PluginOptions options_;
};

}  // namespace dfl
