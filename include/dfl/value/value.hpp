#pragma once

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace dfl {

class Value;

using Null = std::monostate;
using Sequence = std::vector<Value>;
// Entries keep insertion order; duplicate keys are allowed.
using Mapping = std::vector<std::pair<std::string, Value>>;

class Value {
public:
    using Storage = std::variant<Null,
                                 bool,
                                 std::int64_t,
                                 double,
                                 std::string,
                                 Sequence,
                                 Mapping>;

    Value() = default;
    Value(const Value&) = default;
    Value(Value&&) = default;
    Value& operator=(const Value&) = default;
    Value& operator=(Value&&) = default;
    ~Value();

    Value(Null) {}
    Value(bool b) : data_(b) {}
    Value(int i) : data_(std::int64_t{i}) {}
    Value(std::int64_t i) : data_(i) {}
    Value(double d) : data_(d) {}
    Value(const char* s) : data_(std::string{s}) {}
    Value(std::string_view s) : data_(std::string{s}) {}
    Value(std::string s) : data_(std::move(s)) {}
    Value(Sequence seq) : data_(std::move(seq)) {}
    Value(Mapping map) : data_(std::move(map)) {}

    static Value sequence(std::initializer_list<Value> items);
    static Value mapping(
        std::initializer_list<std::pair<std::string, Value>> entries);

    bool is_null() const { return std::holds_alternative<Null>(data_); }
    bool is_string() const { return std::holds_alternative<std::string>(data_); }
    bool is_sequence() const { return std::holds_alternative<Sequence>(data_); }
    bool is_mapping() const { return std::holds_alternative<Mapping>(data_); }

    const std::string* as_string() const;
    const Sequence* as_sequence() const;
    const Mapping* as_mapping() const;

    Sequence* as_sequence();
    Mapping* as_mapping();

    // Appends to a mapping, which must already hold one.
    Value& set(std::string key, Value value);
    // Appends to a sequence, which must already hold one.
    Value& push_back(Value value);

    const Storage& storage() const { return data_; }
    Storage& storage() { return data_; }

    bool operator==(const Value& other) const;

private:
    Storage data_;
};

}  // namespace dfl
