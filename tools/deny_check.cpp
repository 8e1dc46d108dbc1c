#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include "case_fold.hpp"
#include "compiler.hpp"
#include "config.hpp"
#include "deny_check.hpp"

namespace {

constexpr int exit_allow = 0;
constexpr int exit_reject = 1;
constexpr int exit_usage = 2;

struct Arguments {
    std::string config_path;
    std::optional<std::string> backend;
    std::optional<std::string> payload_path;
    bool reveal = false;
    bool bench = false;
    std::size_t count = 1;
};

void print_usage() {
    fmt::print(stderr,
               "usage: deny_check --config <file> [--backend <name>] "
               "[--reveal] [payload.json]\n"
               "       deny_check --config <file> --bench [--count N]\n");
}

std::optional<Arguments> parse_arguments(int argc, char* argv[]) {
    Arguments args;
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];
        const bool has_value = i + 1 < argc;
        if (arg == "--config" && has_value) {
            args.config_path = argv[++i];
        } else if (arg == "--backend" && has_value) {
            args.backend = argv[++i];
        } else if (arg == "--count" && has_value) {
            char* end = nullptr;
            const auto count = std::strtoull(argv[++i], &end, 10);
            if (*end != '\0' || count == 0) {
                return std::nullopt;
            }
            args.count = count;
        } else if (arg == "--reveal") {
            args.reveal = true;
        } else if (arg == "--bench") {
            args.bench = true;
        } else if (!arg.starts_with("--") && !args.payload_path) {
            args.payload_path = std::string{arg};
        } else {
            return std::nullopt;
        }
    }
    if (args.config_path.empty()) {
        return std::nullopt;
    }
    return args;
}

// What a plain substring search over the folded words would conclude.
bool naive_expectation(const dfl::DenyWordList& list, std::string_view text) {
    const auto folded_text = dfl::text::fold_case(text);
    return std::any_of(list.words.begin(), list.words.end(),
                       [&](const std::string& word) {
                           const auto folded =
                               dfl::text::fold_case(dfl::text::trim(word));
                           return !folded.empty() &&
                                  folded_text.find(folded) != std::string::npos;
                       });
}

int run_bench(const dfl::config::FilterConfig& config, std::size_t count) {
    using clock = std::chrono::steady_clock;

    std::size_t total = 0;
    std::size_t blocked = 0;
    std::size_t agreed = 0;
    double min_us = std::numeric_limits<double>::max();
    double max_us = 0;
    double sum_us = 0;

    for (const auto& list : config.lists) {
        const auto matcher = dfl::compile({list}, config.backend,
                                          config.compile);
        for (const auto& sample : config.samples) {
            const dfl::Value payload = dfl::Value::mapping(
                {{"prompt", dfl::Value{sample.text}}});
            const bool expected = naive_expectation(list, sample.text);

            for (std::size_t i = 0; i < count; ++i) {
                const auto start = clock::now();
                const auto outcome = dfl::check(payload, *matcher,
                                                config.scan);
                const std::chrono::duration<double, std::micro> elapsed =
                    clock::now() - start;

                const double us = elapsed.count();
                min_us = std::min(min_us, us);
                max_us = std::max(max_us, us);
                sum_us += us;
                ++total;
                blocked += outcome.matched ? 1 : 0;
                agreed += outcome.matched == expected ? 1 : 0;
            }
            spdlog::debug("list '{}' x sample '{}': expected {}", list.name,
                          sample.name, expected ? "block" : "pass");
        }
    }

    if (total == 0) {
        spdlog::warn("Nothing to benchmark: configuration has no samples");
        return exit_allow;
    }

    fmt::print("backend:   {}\n", dfl::to_string(config.backend));
    fmt::print("total:     {}\n", total);
    fmt::print("blocked:   {}\n", blocked);
    fmt::print("passed:    {}\n", total - blocked);
    fmt::print("latency:   min {:.2f} us, avg {:.2f} us, max {:.2f} us\n",
               min_us, sum_us / static_cast<double>(total), max_us);
    fmt::print("accuracy:  {:.1f}%\n",
               100.0 * static_cast<double>(agreed) /
                   static_cast<double>(total));
    return exit_allow;
}

int run_check(const dfl::config::FilterConfig& config,
              const Arguments& args) {
    const auto document =
        args.payload_path
            ? dfl::config::read_json_file(*args.payload_path)
            : dfl::config::json::parse(std::cin);

    const auto matcher = dfl::compile(config.lists, config.backend,
                                      config.compile);
    const auto outcome = dfl::check(dfl::config::to_value(document),
                                    matcher, config.scan);

    const auto disclosure = args.reveal ? dfl::Disclosure::include_word
                                        : dfl::Disclosure::redacted;
    fmt::print("{}\n", dfl::describe(outcome, disclosure));
    if (outcome.matched) {
        fmt::print("location: {}\n", outcome.location_hint);
        return exit_reject;
    }
    return exit_allow;
}

}  // namespace

int main(int argc, char* argv[]) {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
    spdlog::set_level(spdlog::level::warn);

    const auto args = parse_arguments(argc, argv);
    if (!args) {
        print_usage();
        return exit_usage;
    }

    try {
        auto config = dfl::config::load_config(args->config_path);
        if (args->backend) {
            const auto backend = dfl::parse_backend(*args->backend);
            if (!backend) {
                spdlog::error("Unknown backend '{}'", *args->backend);
                return exit_usage;
            }
            config.backend = *backend;
        }

        if (args->bench) {
            return run_bench(config, args->count);
        }
        return run_check(config, *args);
    } catch (const dfl::config::ConfigError& e) {
        spdlog::error("Configuration error: {}", e.what());
    } catch (const dfl::CompileError& e) {
        spdlog::error("Cannot compile deny lists: {}", e.what());
    } catch (const dfl::config::json::exception& e) {
        spdlog::error("Invalid payload: {}", e.what());
    } catch (const dfl::TypeError& e) {
        spdlog::error("Unsupported payload: {}", e.what());
    }
    return exit_usage;
}
