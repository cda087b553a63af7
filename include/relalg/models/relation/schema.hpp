#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <relalg/logic/result/result.hpp>
#include <relalg/models/relation/value.hpp>

namespace relalg {

struct AttributeInfo {
    std::string name;
    Type type;

    auto operator<=>(const AttributeInfo& other) const = default;
};

std::string ToString(const AttributeInfo& attr);

using AttributesInfo = std::vector<AttributeInfo>;

/// Ordered, uniquely named list of typed attributes. Immutable once built.
class Schema {
public:
    static Result<Schema> Create(AttributesInfo attributes);

    std::size_t Arity() const;
    const AttributesInfo& GetAttributes() const;
    std::optional<std::size_t> GetIndex(std::string_view name) const;

    /// Checks arity and per-position types of a tuple.
    Result<> ValidateTuple(const Tuple& tuple) const;

    bool operator==(const Schema& other) const = default;

private:
    explicit Schema(AttributesInfo attributes);

private:
    AttributesInfo attributes_;
};

}  // namespace relalg
