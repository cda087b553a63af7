#include <relalg/models/relation/schema.hpp>

#include <algorithm>
#include <unordered_set>

namespace relalg {

std::string ToString(const AttributeInfo& attr) {
    return attr.name + ":" + ToString(attr.type);
}

Schema::Schema(AttributesInfo attributes) : attributes_(std::move(attributes)) {}

Result<Schema> Schema::Create(AttributesInfo attributes) {
    std::unordered_set<std::string_view> names;
    for (const auto& attr : attributes) {
        if (!names.insert(attr.name).second) {
            return MakeError<ErrorType::kDuplicateAttributeName>("duplicate attribute name " + attr.name);
        }
    }
    return Schema{std::move(attributes)};
}

std::size_t Schema::Arity() const { return attributes_.size(); }

const AttributesInfo& Schema::GetAttributes() const { return attributes_; }

std::optional<std::size_t> Schema::GetIndex(std::string_view name) const {
    auto it = std::find_if(attributes_.begin(), attributes_.end(),
                           [&name](const AttributeInfo& attr) { return attr.name == name; });
    if (it == attributes_.end()) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(it - attributes_.begin());
}

Result<> Schema::ValidateTuple(const Tuple& tuple) const {
    if (tuple.size() != attributes_.size()) {
        return MakeError<ErrorType::kSchemaViolation>(
            "tuple " + ToString(tuple) + " has " + std::to_string(tuple.size())
            + " values, expected " + std::to_string(attributes_.size()));
    }
    for (std::size_t i = 0; i < tuple.size(); ++i) {
        const auto& attr = attributes_[i];
        if (GetType(tuple[i]) != attr.type) {
            Result<> mismatch = MakeError<ErrorType::kTypeMismatch>(
                "value " + ToString(tuple[i]) + " is not of type " + ToString(attr.type));
            return WrapError<ErrorType::kSchemaViolation>(std::move(mismatch),
                                                          "bad value for attribute " + attr.name);
        }
    }
    return Ok();
}

}  // namespace relalg
