#include <relalg/logic/evaluator/evaluator.hpp>

#include <iostream>
#include <deque>
#include <functional>
#include <iterator>
#include <numeric>
#include <set>
#include <utility>

#include <relalg/models/relation/constants.hpp>

namespace relalg {

namespace {

Result<std::vector<std::size_t>> GetProjectedIndices(const Schema& schema, const Projection& proj) {
  std::vector<std::size_t> indices;
  if (proj.attributes.empty()) {
    indices.resize(schema.Arity());
    std::iota(indices.begin(), indices.end(), 0);
    return indices;
  }
  indices.reserve(proj.attributes.size());
  for (const auto& name : proj.attributes) {
    auto index = schema.GetIndex(name);
    if (!index) {
      return MakeError<ErrorType::kUnknownAttribute>("no such attribute " + name);
    }
    indices.push_back(*index);
  }
  return indices;
}

Result<Schema> GetSchemaAfterProjection(const Schema& schema, const std::vector<std::size_t>& indices) {
  AttributesInfo result_attributes;
  result_attributes.reserve(indices.size());
  for (auto index : indices) {
    result_attributes.push_back(schema.GetAttributes()[index]);
  }
  return Schema::Create(std::move(result_attributes));
}

Tuple ApplyProjection(const Tuple& source, const std::vector<std::size_t>& indices) {
  Tuple result;
  result.reserve(indices.size());
  for (auto index : indices) {
    result.push_back(source[index]);
  }
  return result;
}

Result<> ValidatePredicate(const Predicate& predicate, const Schema& schema) {
  struct ValidateVisitor {
    Result<> operator()(const Comparison& cmp) {
      auto index = schema.GetIndex(cmp.attribute);
      if (!index) {
        return MakeError<ErrorType::kUnknownAttribute>("no such attribute " + cmp.attribute);
      }
      const auto& attr = schema.GetAttributes()[*index];
      if (GetType(cmp.constant) != attr.type) {
        return MakeError<ErrorType::kTypeMismatch>("can't compare " + attr.name + " of type "
                                                   + ToString(attr.type) + " with "
                                                   + ToString(cmp.constant));
      }
      return Ok();
    }
    Result<> operator()(const Connection& conn) {
      if (conn.lhs == nullptr || conn.rhs == nullptr) {
        return MakeError<ErrorType::kNotFound>("missing operand of " + ToString(conn.connective));
      }
      auto lhs = std::visit(*this, *conn.lhs);
      if (!lhs) {
        return lhs;
      }
      return std::visit(*this, *conn.rhs);
    }

    const Schema& schema;
  };
  return std::visit(ValidateVisitor{schema}, predicate);
}

bool ApplyPredicate(const Tuple& source, const Schema& schema, const Predicate& predicate) {
  struct PredicateVisitor {
    bool operator()(const Comparison& cmp) {
      // NOTE: already checked in ValidatePredicate
      const auto& value = source[*schema.GetIndex(cmp.attribute)];
      switch (cmp.op) {
        case CompareOp::kGt:
          return value > cmp.constant;
        case CompareOp::kLt:
          return value < cmp.constant;
        case CompareOp::kGe:
          return value >= cmp.constant;
        case CompareOp::kLe:
          return value <= cmp.constant;
        case CompareOp::kEq:
          return value == cmp.constant;
        case CompareOp::kNotEq:
          return value != cmp.constant;
      }
      std::unreachable();
    }
    bool operator()(const Connection& conn) {
      switch (conn.connective) {
        case Connective::kAnd:
          return std::visit(*this, *conn.lhs) && std::visit(*this, *conn.rhs);
        case Connective::kOr:
          return std::visit(*this, *conn.lhs) || std::visit(*this, *conn.rhs);
      }
      std::unreachable();
    }

    const Tuple& source;
    const Schema& schema;
  };
  return std::visit(PredicateVisitor{source, schema}, predicate);
}

// Empty relation with the schema and key policy of the input
Result<Relation> CreateDerivedLike(const Relation& input) {
  if (auto pk = input.GetPrimaryKeyIndex()) {
    return Relation::Create(kDerivedRelationName, input.GetSchema(), *pk);
  }
  return Relation::CreateRowIdKeyed(kDerivedRelationName, input.GetSchema());
}

} // namespace

template <typename Apply>
Result<Relation> Evaluator::WithSource(const std::shared_ptr<Operator>& source, Apply&& apply) const {
  if (source == nullptr) {
    return MakeError<ErrorType::kNotFound>("missing source operator");
  }
  // NOTE: base relations are read in place, only derived inputs are
  // materialized
  if (const Table* table = std::get_if<Table>(source.get())) {
    if (table->relation == nullptr) {
      return MakeError<ErrorType::kNotFound>("table is not bound to a relation");
    }
    return apply(*table->relation);
  }
  auto input = Evaluate(*source);
  if (!input) {
    return WrapError(std::move(input), "can't evaluate source");
  }
  return apply(*input);
}

Result<Relation> Evaluator::Evaluate(const Operator& op) const {
  struct EvaluateVisitor {
    Result<Relation> operator()(const Table& table) {
      return evaluator.EvaluateTable(table);
    }
    Result<Relation> operator()(const Projection& projection) {
      return evaluator.EvaluateProjection(projection);
    }
    Result<Relation> operator()(const Selection& selection) {
      return evaluator.EvaluateSelection(selection);
    }
    Result<Relation> operator()(const BinaryOperation& binop) {
      return evaluator.EvaluateBinaryOperation(binop);
    }

    const Evaluator& evaluator;
  };
  return std::visit(EvaluateVisitor{*this}, op);
}

Result<Relation> Evaluator::EvaluateTable(const Table& table) const {
  if (table.relation == nullptr) {
    return MakeError<ErrorType::kNotFound>("table is not bound to a relation");
  }
  std::clog << "Copying relation " << table.relation->GetName() << '\n';
  return table.relation->WithName(kDerivedRelationName);
}

Result<Relation> Evaluator::EvaluateProjection(const Projection& proj) const {
  return WithSource(proj.source, [&proj](const Relation& input) -> Result<Relation> {
    std::clog << "Evaluating projection over " << input.GetName() << '\n';
    auto indices = GetProjectedIndices(input.GetSchema(), proj);
    if (!indices) {
      return std::unexpected(std::move(indices).error());
    }
    auto schema = GetSchemaAfterProjection(input.GetSchema(), *indices);
    if (!schema) {
      return std::unexpected(std::move(schema).error());
    }

    auto derived = Relation::CreateRowIdKeyed(kDerivedRelationName, std::move(*schema));
    // deque keeps references to projected tuples valid while it grows
    std::deque<Tuple> projected;
    std::set<std::reference_wrapper<const Tuple>, std::less<Tuple>> seen;
    for (const auto& [_, tuple] : input.GetStorage()) {
      projected.push_back(ApplyProjection(tuple, *indices));
      if (!seen.insert(std::cref(projected.back())).second) {
        projected.pop_back();
      }
    }
    seen.clear();
    std::clog << "Projected " << input.Size() << " tuples to " << projected.size()
              << " distinct tuples\n";

    Tuples rows(std::make_move_iterator(projected.begin()),
                std::make_move_iterator(projected.end()));
    projected.clear();
    auto inserted = derived.InsertRows(std::move(rows));
    if (!inserted) {
      return std::unexpected(std::move(inserted).error());
    }
    return derived;
  });
}

Result<Relation> Evaluator::EvaluateSelection(const Selection& selection) const {
  return WithSource(selection.source, [&selection](const Relation& input) -> Result<Relation> {
    std::clog << "Evaluating selection " << ToString(selection.predicate) << " over "
              << input.GetName() << '\n';
    auto valid = ValidatePredicate(selection.predicate, input.GetSchema());
    if (!valid) {
      return std::unexpected(std::move(valid).error());
    }

    auto derived = CreateDerivedLike(input);
    if (!derived) {
      return derived;
    }
    Tuples rows;
    for (const auto& [_, tuple] : input.GetStorage()) {
      if (ApplyPredicate(tuple, input.GetSchema(), selection.predicate)) {
        rows.push_back(tuple);
      }
    }
    std::clog << "Selected " << rows.size() << " of " << input.Size() << " tuples\n";

    auto inserted = derived->InsertRows(std::move(rows));
    if (!inserted) {
      return std::unexpected(std::move(inserted).error());
    }
    return derived;
  });
}

Result<Relation> Evaluator::EvaluateBinaryOperation(const BinaryOperation& binop) const {
  std::clog << "Evaluating " << ToString(binop.op) << '\n';
  if (binop.lhs == nullptr || binop.rhs == nullptr) {
    return MakeError<ErrorType::kNotFound>("missing operand of " + ToString(binop.op));
  }
  auto lhs = Evaluate(*binop.lhs);
  if (!lhs) {
    return WrapError(std::move(lhs), "can't evaluate " + ToString(binop.op) + " lhs");
  }
  auto rhs = Evaluate(*binop.rhs);
  if (!rhs) {
    return WrapError(std::move(rhs), "can't evaluate " + ToString(binop.op) + " rhs");
  }
  return MakeError<ErrorType::kNotSupported>(ToString(binop.op) + " is currently unsupported");
}

}  // namespace relalg
