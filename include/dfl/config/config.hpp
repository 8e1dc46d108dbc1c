#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "compiler.hpp"
#include "pattern.hpp"
#include "scanner.hpp"
#include "value.hpp"

namespace dfl::config {

using json = nlohmann::ordered_json;

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct SampleText {
    std::string name;
    std::string text;
};

struct FilterConfig {
    BackendKind backend = BackendKind::automaton;
    std::string plugin_name = "DenyListPlugin";
    CompileOptions compile;
    ScanOptions scan;
    std::vector<DenyWordList> lists;
    std::vector<SampleText> samples;
};

FilterConfig parse_config(const json& j);
FilterConfig load_config(const std::filesystem::path& path);

// Converts a JSON payload, keeping object key order. Binary and discarded
// values throw TypeError.
Value to_value(const json& j);

json read_json_file(const std::filesystem::path& path);

}  // namespace dfl::config
