#pragma once

#include <memory>

#include <relalg/logic/result/result.hpp>
#include <relalg/models/algebra/relational_algebra_ast.hpp>
#include <relalg/models/relation/relation.hpp>

namespace relalg {

/// Evaluates an operator tree bottom-up exactly as it is written.
///
/// Every node produces a new relation named kDerivedRelationName which
/// shares no storage with its input. Relations referenced by Table leaves
/// are only read.
class Evaluator {
public:
  Result<Relation> Evaluate(const Operator& op) const;

private:
  Result<Relation> EvaluateTable(const Table& table) const;
  Result<Relation> EvaluateProjection(const Projection& proj) const;
  Result<Relation> EvaluateSelection(const Selection& selection) const;
  Result<Relation> EvaluateBinaryOperation(const BinaryOperation& binop) const;

  template <typename Apply>
  Result<Relation> WithSource(const std::shared_ptr<Operator>& source, Apply&& apply) const;
};

}  // namespace relalg
