#include "config.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <fstream>
#include <limits>
#include <utility>
#include "scan_error.hpp"

namespace dfl::config {

namespace {

template <typename T>
T get_or(const json& j, const char* key, T fallback) {
    if (!j.contains(key)) {
        return fallback;
    }
    try {
        return j.at(key).get<T>();
    } catch (const json::exception& e) {
        throw ConfigError(fmt::format("'{}': {}", key, e.what()));
    }
}

const json& require(const json& j, const char* key, const char* context) {
    if (!j.is_object() || !j.contains(key)) {
        throw ConfigError(fmt::format("{} is missing '{}'", context, key));
    }
    return j.at(key);
}

DenyWordList parse_list(const json& j, std::size_t index) {
    if (!j.is_object()) {
        throw ConfigError(
            fmt::format("deny_word_lists[{}] is not an object", index));
    }

    DenyWordList list;
    const auto& name = require(j, "name", "deny word list");
    if (!name.is_string()) {
        throw ConfigError(
            fmt::format("deny_word_lists[{}].name is not a string", index));
    }
    list.name = name.get<std::string>();
    list.priority = get_or<Priority>(j, "priority", default_priority);

    const auto& words = require(j, "words", "deny word list");
    if (!words.is_array()) {
        throw ConfigError(
            fmt::format("deny list '{}': words is not an array", list.name));
    }
    for (const auto& word : words) {
        if (!word.is_string()) {
            throw ConfigError(fmt::format(
                "deny list '{}': every word must be a string", list.name));
        }
        list.words.push_back(word.get<std::string>());
    }
    return list;
}

void parse_scan(const json& j, ScanOptions& scan) {
    if (!j.is_object()) {
        throw ConfigError("'scan' is not an object");
    }
    scan.max_depth = get_or<std::size_t>(j, "max_depth", scan.max_depth);
    scan.max_total_bytes =
        get_or<std::size_t>(j, "max_total_bytes", scan.max_total_bytes);
    scan.scan_keys = get_or<bool>(j, "scan_keys", scan.scan_keys);
}

EmptyPolicy parse_empty_policy(const std::string& name) {
    if (name == "reject") {
        return EmptyPolicy::reject;
    }
    if (name == "never_match") {
        return EmptyPolicy::never_match;
    }
    throw ConfigError(fmt::format("Unknown empty_policy '{}'", name));
}

}  // namespace

FilterConfig parse_config(const json& j) {
    if (!j.is_object()) {
        throw ConfigError("Configuration root must be an object");
    }

    FilterConfig config;

    const auto backend_name = get_or<std::string>(
        j, "backend", std::string{to_string(config.backend)});
    if (auto backend = parse_backend(backend_name)) {
        config.backend = *backend;
    } else {
        throw ConfigError(fmt::format("Unknown backend '{}'", backend_name));
    }

    config.plugin_name = get_or<std::string>(j, "plugin_name",
                                             config.plugin_name);
    config.compile.empty_policy = parse_empty_policy(
        get_or<std::string>(j, "empty_policy", "reject"));
    config.compile.max_patterns = get_or<std::size_t>(
        j, "max_patterns", config.compile.max_patterns);
    config.compile.max_pattern_bytes = get_or<std::size_t>(
        j, "max_pattern_bytes", config.compile.max_pattern_bytes);

    if (j.contains("scan")) {
        parse_scan(j.at("scan"), config.scan);
    }

    const auto& lists = require(j, "deny_word_lists", "configuration");
    if (!lists.is_array()) {
        throw ConfigError("'deny_word_lists' is not an array");
    }
    for (std::size_t i = 0; i < lists.size(); ++i) {
        config.lists.push_back(parse_list(lists[i], i));
    }

    if (j.contains("sample_texts")) {
        for (const auto& sample : j.at("sample_texts")) {
            const auto& text = require(sample, "text", "sample text");
            if (!text.is_string()) {
                throw ConfigError("sample text 'text' is not a string");
            }
            config.samples.push_back(SampleText{
                get_or<std::string>(sample, "name", "sample"),
                text.get<std::string>()});
        }
    }

    spdlog::debug("Parsed configuration: {} deny lists, {} samples, backend {}",
                  config.lists.size(), config.samples.size(),
                  to_string(config.backend));
    return config;
}

json read_json_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError(fmt::format("Cannot open {}", path.string()));
    }
    try {
        return json::parse(file);
    } catch (const json::parse_error& e) {
        throw ConfigError(
            fmt::format("Invalid JSON in {}: {}", path.string(), e.what()));
    }
}

FilterConfig load_config(const std::filesystem::path& path) {
    auto config = parse_config(read_json_file(path));
    spdlog::info("Loaded {} deny lists from {}", config.lists.size(),
                 path.string());
    return config;
}

// Iterative; nesting limits are enforced later by the scanner.
Value to_value(const json& j) {
    Value root;
    std::vector<std::pair<const json*, Value*>> work{{&j, &root}};

    while (!work.empty()) {
        auto [src, dst] = work.back();
        work.pop_back();

        switch (src->type()) {
            case json::value_t::null:
                *dst = Value{};
                break;
            case json::value_t::boolean:
                *dst = Value{src->get<bool>()};
                break;
            case json::value_t::number_integer:
                *dst = Value{src->get<std::int64_t>()};
                break;
            case json::value_t::number_unsigned: {
                const auto u = src->get<std::uint64_t>();
                if (u > static_cast<std::uint64_t>(
                            std::numeric_limits<std::int64_t>::max())) {
                    *dst = Value{static_cast<double>(u)};
                } else {
                    *dst = Value{static_cast<std::int64_t>(u)};
                }
                break;
            }
            case json::value_t::number_float:
                *dst = Value{src->get<double>()};
                break;
            case json::value_t::string:
                *dst = Value{src->get<std::string>()};
                break;
            case json::value_t::array: {
                *dst = Value{Sequence(src->size())};
                auto* seq = dst->as_sequence();
                for (std::size_t i = 0; i < src->size(); ++i) {
                    work.emplace_back(&(*src)[i], &(*seq)[i]);
                }
                break;
            }
            case json::value_t::object: {
                *dst = Value{Mapping{}};
                auto* map = dst->as_mapping();
                map->reserve(src->size());
                for (const auto& entry : src->items()) {
                    map->emplace_back(entry.key(), Value{});
                }
                std::size_t i = 0;
                for (const auto& item : *src) {
                    work.emplace_back(&item, &(*map)[i++].second);
                }
                break;
            }
            case json::value_t::binary:
            case json::value_t::discarded:
                throw TypeError(
                    fmt::format("unsupported JSON value of type {}",
                                src->type_name()),
                    "$");
        }
    }

    return root;
}

}  // namespace dfl::config
