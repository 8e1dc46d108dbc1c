#include "scanner.hpp"
#include <fmt/format.h>
#include <string_view>
#include <type_traits>
#include <vector>
#include "case_fold.hpp"

namespace dfl {

DepthExceededError::DepthExceededError(std::size_t max_depth,
                                       std::string location)
    : ScanError(fmt::format("payload nesting exceeds max depth {} at {}",
                            max_depth, location),
                location),
      max_depth_(max_depth) {}

SizeExceededError::SizeExceededError(std::size_t max_bytes,
                                     std::string location)
    : ScanError(fmt::format("payload text exceeds {} bytes at {}", max_bytes,
                            location),
                location),
      max_bytes_(max_bytes) {}

namespace {

constexpr std::size_t no_parent = static_cast<std::size_t>(-1);

struct PathNode {
    std::size_t parent;
    std::string_view key;
    std::size_t index;
    bool is_index;
};

class PathArena {
public:
    PathArena() { nodes_.push_back(PathNode{no_parent, {}, 0, false}); }

    std::size_t root() const { return 0; }

    std::size_t key(std::size_t parent, std::string_view key) {
        nodes_.push_back(PathNode{parent, key, 0, false});
        return nodes_.size() - 1;
    }

    std::size_t index(std::size_t parent, std::size_t index) {
        nodes_.push_back(PathNode{parent, {}, index, true});
        return nodes_.size() - 1;
    }

    std::string render(std::size_t node) const {
        std::vector<const PathNode*> chain;
        for (; node != root(); node = nodes_[node].parent) {
            chain.push_back(&nodes_[node]);
        }
        if (chain.empty()) {
            return "$";
        }

        std::string out;
        for (auto it = chain.rbegin(); it != chain.rend(); ++it) {
            const auto& seg = **it;
            if (seg.is_index) {
                out += fmt::format("[{}]", seg.index);
            } else {
                if (!out.empty()) {
                    out += '.';
                }
                out.append(seg.key);
            }
        }
        return out;
    }

private:
    std::vector<PathNode> nodes_;
};

struct Frame {
    const Value* value;
    // Set for a mapping key visited as a leaf; `value` is null then.
    const std::string* key;
    std::size_t depth;
    std::size_t path;
};

class Walker {
public:
    Walker(const CompiledMatcher& matcher, const ScanOptions& options)
        : matcher_(matcher), options_(options) {}

    std::optional<ScanHit> run(const Value& root) {
        stack_.push_back(Frame{&root, nullptr, 0, paths_.root()});

        while (!stack_.empty()) {
            const Frame frame = stack_.back();
            stack_.pop_back();

            if (frame.depth > options_.max_depth) {
                throw DepthExceededError(options_.max_depth,
                                         paths_.render(frame.path));
            }

            if (frame.key) {
                if (auto hit = scan_leaf(*frame.key, frame.path)) {
                    return hit;
                }
                continue;
            }

            if (auto hit = visit(frame)) {
                return hit;
            }
        }
        return std::nullopt;
    }

private:
    std::optional<ScanHit> visit(const Frame& frame) {
        const auto& storage = frame.value->storage();
        if (storage.valueless_by_exception()) {
            throw TypeError("payload node holds no value",
                            paths_.render(frame.path));
        }

        return std::visit(
            [&](const auto& node) -> std::optional<ScanHit> {
                using T = std::decay_t<decltype(node)>;
                if constexpr (std::is_same_v<T, std::string>) {
                    return scan_leaf(node, frame.path);
                } else if constexpr (std::is_same_v<T, Sequence>) {
                    push_sequence(node, frame);
                } else if constexpr (std::is_same_v<T, Mapping>) {
                    push_mapping(node, frame);
                }
                return std::nullopt;
            },
            storage);
    }

    // Children are pushed in reverse so they pop in their stored order.
    void push_sequence(const Sequence& seq, const Frame& frame) {
        for (std::size_t i = seq.size(); i-- > 0;) {
            stack_.push_back(Frame{&seq[i], nullptr, frame.depth + 1,
                                   paths_.index(frame.path, i)});
        }
    }

    void push_mapping(const Mapping& map, const Frame& frame) {
        for (auto it = map.rbegin(); it != map.rend(); ++it) {
            const auto path = paths_.key(frame.path, it->first);
            stack_.push_back(
                Frame{&it->second, nullptr, frame.depth + 1, path});
            if (options_.scan_keys) {
                stack_.push_back(
                    Frame{nullptr, &it->first, frame.depth + 1, path});
            }
        }
    }

    std::optional<ScanHit> scan_leaf(const std::string& text,
                                     std::size_t path) {
        scanned_bytes_ += text.size();
        if (options_.max_total_bytes != 0 &&
            scanned_bytes_ > options_.max_total_bytes) {
            throw SizeExceededError(options_.max_total_bytes,
                                    paths_.render(path));
        }

        text::fold_case_into(text, folded_);
        if (!matcher_.is_match(folded_)) {
            return std::nullopt;
        }
        if (auto match = matcher_.scan_text(folded_)) {
            return ScanHit{*match, paths_.render(path)};
        }
        return std::nullopt;
    }

    const CompiledMatcher& matcher_;
    const ScanOptions& options_;
    std::vector<Frame> stack_;
    PathArena paths_;
    std::string folded_;
    std::size_t scanned_bytes_ = 0;
};

}  // namespace

std::optional<ScanHit> scan_any(const Value& value,
                                const CompiledMatcher& matcher,
                                const ScanOptions& options) {
    return Walker(matcher, options).run(value);
}

std::optional<ScanHit> scan_top_level(const Value& args,
                                      const CompiledMatcher& matcher) {
    const auto* map = args.as_mapping();
    if (!map) {
        return std::nullopt;
    }

    std::string folded;
    for (const auto& [key, value] : *map) {
        const auto* str = value.as_string();
        if (!str) {
            continue;
        }
        text::fold_case_into(*str, folded);
        if (auto match = matcher.scan_text(folded)) {
            return ScanHit{*match, key};
        }
    }
    return std::nullopt;
}

std::optional<TextMatch> scan_str(std::string_view str,
                                  const CompiledMatcher& matcher) {
    return matcher.scan_text(text::fold_case(str));
}

}  // namespace dfl
