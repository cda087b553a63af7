#include <gmock/gmock.h>

#include <relalg/models/algebra/relational_algebra_ast.hpp>

using ::testing::Eq;
using ::testing::IsFalse;
using ::testing::IsTrue;

namespace relalg {

TEST(RelationalAlgebraAstTest, EqualTreesWithMissingChildren) {
  Operator lhs = BinaryOperation{BinaryOp::kJoin, nullptr,
                                 std::make_shared<Operator>(Projection{{"name"}, nullptr})};
  Operator rhs = BinaryOperation{BinaryOp::kJoin, nullptr,
                                 std::make_shared<Operator>(Projection{{"name"}, nullptr})};

  ASSERT_THAT(lhs == rhs, IsTrue());
}

TEST(RelationalAlgebraAstTest, MissingChildDiffersFromPresentOne) {
  Operator lhs = Projection{{"name"}, nullptr};
  Operator rhs = Projection{{"name"}, std::make_shared<Operator>(Table{nullptr})};

  ASSERT_THAT(lhs == rhs, IsFalse());
  ASSERT_THAT(rhs == lhs, IsFalse());
}

TEST(RelationalAlgebraAstTest, PredicateWithMissingOperand) {
  Predicate predicate = Connection{
      std::make_shared<Predicate>(Comparison{"name", CompareOp::kEq, StringValue{"bob"}}),
      Connective::kOr, nullptr};
  Predicate same = Connection{
      std::make_shared<Predicate>(Comparison{"name", CompareOp::kEq, StringValue{"bob"}}),
      Connective::kOr, nullptr};

  ASSERT_THAT(ToString(predicate), Eq("(name = \"bob\" or ?)"));
  ASSERT_THAT(predicate == same, IsTrue());
}

}  // namespace relalg
