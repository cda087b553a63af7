#pragma once

#include <string>

#include <relalg/models/algebra/relational_algebra_ast.hpp>

namespace relalg {

// Graphviz representation of an operator tree, leaves at the bottom
std::string GetDotRepresentation(const Operator& op);

}  // namespace relalg
