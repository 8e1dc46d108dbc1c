#include "value.hpp"
#include <stdexcept>
#include <utility>
#include <vector>

namespace dfl {

namespace {

bool has_children(const Value::Storage& data) {
    if (const auto* seq = std::get_if<Sequence>(&data)) {
        return !seq->empty();
    }
    if (const auto* map = std::get_if<Mapping>(&data)) {
        return !map->empty();
    }
    return false;
}

void take_children(Value::Storage& data, std::vector<Value>& pending) {
    if (auto* seq = std::get_if<Sequence>(&data)) {
        for (auto& item : *seq) {
            pending.push_back(std::move(item));
        }
        seq->clear();
    } else if (auto* map = std::get_if<Mapping>(&data)) {
        for (auto& entry : *map) {
            pending.push_back(std::move(entry.second));
        }
        map->clear();
    }
}

}  // namespace

// Children are released through a work list so nesting depth never reaches
// the call stack.
Value::~Value() {
    if (!has_children(data_)) {
        return;
    }
    std::vector<Value> pending;
    take_children(data_, pending);
    while (!pending.empty()) {
        Value current = std::move(pending.back());
        pending.pop_back();
        take_children(current.data_, pending);
    }
}

Value Value::sequence(std::initializer_list<Value> items) {
    return Value{Sequence(items)};
}

Value Value::mapping(
    std::initializer_list<std::pair<std::string, Value>> entries) {
    return Value{Mapping(entries)};
}

const std::string* Value::as_string() const {
    return std::get_if<std::string>(&data_);
}

const Sequence* Value::as_sequence() const {
    return std::get_if<Sequence>(&data_);
}

const Mapping* Value::as_mapping() const {
    return std::get_if<Mapping>(&data_);
}

Sequence* Value::as_sequence() {
    return std::get_if<Sequence>(&data_);
}

Mapping* Value::as_mapping() {
    return std::get_if<Mapping>(&data_);
}

Value& Value::set(std::string key, Value value) {
    auto* map = as_mapping();
    if (!map) {
        throw std::logic_error("Value::set on a value that is not a mapping");
    }
    map->emplace_back(std::move(key), std::move(value));
    return map->back().second;
}

Value& Value::push_back(Value value) {
    auto* seq = as_sequence();
    if (!seq) {
        throw std::logic_error(
            "Value::push_back on a value that is not a sequence");
    }
    seq->push_back(std::move(value));
    return seq->back();
}

bool Value::operator==(const Value& other) const {
    return data_ == other.data_;
}

}  // namespace dfl
