#include <relalg/models/algebra/relational_algebra_ast.hpp>

#include <utility>

namespace relalg {

namespace {

// Missing children are equal only to missing children
template <typename T>
bool PointeesEqual(const std::shared_ptr<T>& lhs, const std::shared_ptr<T>& rhs) {
  if (lhs == nullptr || rhs == nullptr) {
    return lhs == rhs;
  }
  return *lhs == *rhs;
}

} // namespace

bool Projection::operator==(const Projection& other) const {
  return attributes == other.attributes && PointeesEqual(source, other.source);
}

bool Selection::operator==(const Selection& other) const {
  return predicate == other.predicate && PointeesEqual(source, other.source);
}

bool Connection::operator==(const Connection& other) const {
  return PointeesEqual(lhs, other.lhs) && connective == other.connective
         && PointeesEqual(rhs, other.rhs);
}

bool BinaryOperation::operator==(const BinaryOperation& other) const {
  return op == other.op && PointeesEqual(lhs, other.lhs) && PointeesEqual(rhs, other.rhs);
}

std::string ToString(CompareOp op) {
    switch (op) {
      case CompareOp::kGt:
        return ">";
      case CompareOp::kLt:
        return "<";
      case CompareOp::kGe:
        return ">=";
      case CompareOp::kLe:
        return "<=";
      case CompareOp::kEq:
        return "=";
      case CompareOp::kNotEq:
        return "<>";
    }
    std::unreachable();
}

std::string ToString(Connective connective) {
    switch (connective) {
      case Connective::kAnd:
        return "and";
      case Connective::kOr:
        return "or";
    }
    std::unreachable();
}

std::string ToString(BinaryOp op) {
  switch (op) {
    case BinaryOp::kJoin:
      return "join";
    case BinaryOp::kUnion:
      return "union";
  }
  std::unreachable();
}

std::string ToString(const Predicate& predicate) {
    struct Formatter {
        std::string operator()(const Comparison& pred) {
          return pred.attribute + " " + ToString(pred.op) + " " + ToString(pred.constant);
        }
        std::string operator()(const Connection& pred) {
          return "(" + Operand(pred.lhs) + " " + ToString(pred.connective) + " "
                 + Operand(pred.rhs) + ")";
        }
        std::string Operand(const std::shared_ptr<Predicate>& operand) {
          return operand ? std::visit(*this, *operand) : "?";
        }
    };
    return std::visit(Formatter{}, predicate);
}

} // namespace relalg
