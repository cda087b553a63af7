#pragma once

#include <cstddef>

namespace relalg {

constexpr static char kDerivedRelationName[] = "derived";

// Minimal width of a column in ToString(const Relation&)
constexpr static std::size_t kColumnWidth = 8;

}  // namespace relalg
