#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace relalg {

// NOTE: order of the enumerators must follow the order of alternatives in
// Value
enum class Type {
    kInt,
    kString,
};

std::string ToString(Type type);

using IntValue = std::int64_t;
using StringValue = std::string;

// Ordered by alternative index first, then by the contained scalar.
using Value = std::variant<IntValue, StringValue>;
using Tuple = std::vector<Value>;
using Tuples = std::vector<Tuple>;

Type GetType(const Value& value);

std::string ToString(const Value& value);

std::string ToString(const Tuple& tuple);

}  // namespace relalg
