#include <gmock/gmock.h>

#include <relalg/models/relation/relation.hpp>

using ::testing::Eq;
using ::testing::IsFalse;
using ::testing::IsTrue;
using ::testing::Optional;

namespace relalg {

namespace {

Relation CreateTestRelation() {
  auto schema = Schema::Create({{"key", Type::kInt}, {"value", Type::kString}}).value();
  return Relation::Create("test", std::move(schema), 0).value();
}

} // namespace

TEST(RelationTest, CreateEmpty) {
  auto relation = CreateTestRelation();

  ASSERT_THAT(relation.GetName(), Eq("test"));
  ASSERT_THAT(relation.GetPrimaryKeyIndex(), Optional(0));
  ASSERT_THAT(relation.IsRowIdKeyed(), IsFalse());
  ASSERT_THAT(relation.Empty(), IsTrue());
  ASSERT_THAT(relation.GetTuples(), Eq(Tuples{}));
}

TEST(RelationTest, PrimaryKeyOutOfRange) {
  auto schema = Schema::Create({{"key", Type::kInt}}).value();

  auto got = Relation::Create("test", std::move(schema), 1);

  ASSERT_THAT(got.has_value(), IsFalse());
  ASSERT_THAT(got.error().Wraps(ErrorType::kInvalidPrimaryKey), IsTrue());
}

TEST(RelationTest, InsertRow) {
  auto relation = CreateTestRelation();

  ASSERT_THAT(relation.InsertRow({IntValue{1}, StringValue{"foo"}}).has_value(), IsTrue());

  auto got = relation.InsertRow({IntValue{1}, StringValue{"bar"}});

  ASSERT_THAT(got.has_value(), IsFalse());
  ASSERT_THAT(got.error().What(), Eq("primary key 1 already exists in test"));
  ASSERT_THAT(got.error().Wraps(ErrorType::kDuplicatePrimaryKey), IsTrue());
  ASSERT_THAT(relation.GetTuples(), Eq(Tuples{{IntValue{1}, StringValue{"foo"}}}));
}

TEST(RelationTest, TuplesAreReturnedInPrimaryKeyOrder) {
  auto relation = CreateTestRelation();

  auto got = relation.InsertRows({
      {IntValue{3}, StringValue{"baz"}},
      {IntValue{1}, StringValue{"foo"}},
      {IntValue{2}, StringValue{"bar"}},
  });

  ASSERT_THAT(got.has_value(), IsTrue());
  ASSERT_THAT(relation.Size(), Eq(3));
  ASSERT_THAT(relation.GetTuples(), Eq(Tuples{
                                        {IntValue{1}, StringValue{"foo"}},
                                        {IntValue{2}, StringValue{"bar"}},
                                        {IntValue{3}, StringValue{"baz"}},
                                    }));
}

TEST(RelationTest, StringPrimaryKey) {
  auto schema = Schema::Create({{"id", Type::kInt}, {"name", Type::kString}}).value();
  auto relation = Relation::Create("people", std::move(schema), 1).value();

  relation.InsertRows({
      {IntValue{1}, StringValue{"carol"}},
      {IntValue{2}, StringValue{"alice"}},
      {IntValue{3}, StringValue{"bob"}},
  }).value();

  ASSERT_THAT(relation.GetTuples(), Eq(Tuples{
                                        {IntValue{2}, StringValue{"alice"}},
                                        {IntValue{3}, StringValue{"bob"}},
                                        {IntValue{1}, StringValue{"carol"}},
                                    }));
}

TEST(RelationTest, InsertRowsIsAllOrNothing) {
  auto relation = CreateTestRelation();
  relation.InsertRows({
      {IntValue{1}, StringValue{"foo"}},
      {IntValue{2}, StringValue{"bar"}},
  }).value();
  auto before = relation.GetTuples();

  auto got = relation.InsertRows({
      {IntValue{4}, StringValue{"apple"}},
      {IntValue{5}, StringValue{"orange"}},
      {IntValue{1}, StringValue{"baz"}},
  });

  ASSERT_THAT(got.has_value(), IsFalse());
  ASSERT_THAT(got.error().Wraps(ErrorType::kDuplicatePrimaryKey), IsTrue());
  ASSERT_THAT(relation.GetTuples(), Eq(before));
  ASSERT_THAT(relation.Lookup(IntValue{4}).has_value(), IsFalse());
}

TEST(RelationTest, RepeatedPrimaryKeyInBatch) {
  auto relation = CreateTestRelation();

  auto got = relation.InsertRows({
      {IntValue{7}, StringValue{"foo"}},
      {IntValue{8}, StringValue{"bar"}},
      {IntValue{7}, StringValue{"baz"}},
  });

  ASSERT_THAT(got.has_value(), IsFalse());
  ASSERT_THAT(got.error().What(), Eq("primary key 7 repeats in inserted rows"));
  ASSERT_THAT(relation.Empty(), IsTrue());
}

TEST(RelationTest, RowWithTypeMismatchRejectsBatch) {
  auto relation = CreateTestRelation();

  auto got = relation.InsertRows({
      {IntValue{1}, StringValue{"foo"}},
      {IntValue{2}, IntValue{2}},
  });

  ASSERT_THAT(got.has_value(), IsFalse());
  ASSERT_THAT(got.error().What(),
              Eq("can't insert row 1: bad value for attribute value: value 2 is not of type string"));
  ASSERT_THAT(got.error().Wraps(ErrorType::kSchemaViolation), IsTrue());
  ASSERT_THAT(got.error().Wraps(ErrorType::kTypeMismatch), IsTrue());
  ASSERT_THAT(relation.Empty(), IsTrue());
}

TEST(RelationTest, RowWithWrongArityRejectsBatch) {
  auto relation = CreateTestRelation();

  auto got = relation.InsertRows({
      {IntValue{1}, StringValue{"foo"}},
      {IntValue{2}, StringValue{"bar"}, StringValue{"baz"}},
  });

  ASSERT_THAT(got.has_value(), IsFalse());
  ASSERT_THAT(got.error().Wraps(ErrorType::kSchemaViolation), IsTrue());
  ASSERT_THAT(relation.Empty(), IsTrue());
}

TEST(RelationTest, Lookup) {
  auto relation = CreateTestRelation();
  relation.InsertRows({
      {IntValue{1}, StringValue{"foo"}},
      {IntValue{2}, StringValue{"bar"}},
  }).value();

  ASSERT_THAT(relation.Lookup(IntValue{2}), Optional(Tuple{IntValue{2}, StringValue{"bar"}}));
  ASSERT_THAT(relation.Lookup(IntValue{3}).has_value(), IsFalse());
  ASSERT_THAT(relation.Lookup(StringValue{"foo"}).has_value(), IsFalse());
}

TEST(RelationTest, RowIdKeyedRelationNumbersRowsDensely) {
  auto schema = Schema::Create({{"value", Type::kString}}).value();
  auto relation = Relation::CreateRowIdKeyed("derived", std::move(schema));

  relation.InsertRows({{StringValue{"foo"}}, {StringValue{"bar"}}}).value();
  relation.InsertRow({StringValue{"baz"}}).value();

  ASSERT_THAT(relation.IsRowIdKeyed(), IsTrue());
  ASSERT_THAT(relation.GetPrimaryKeyIndex().has_value(), IsFalse());
  ASSERT_THAT(relation.GetTuples(),
              Eq(Tuples{{StringValue{"foo"}}, {StringValue{"bar"}}, {StringValue{"baz"}}}));
  ASSERT_THAT(relation.Lookup(IntValue{0}), Optional(Tuple{StringValue{"foo"}}));
  ASSERT_THAT(relation.Lookup(IntValue{2}), Optional(Tuple{StringValue{"baz"}}));
}

TEST(RelationTest, RowIdKeyedRelationRejectsDuplicateTuples) {
  auto schema = Schema::Create({{"value", Type::kString}}).value();
  auto relation = Relation::CreateRowIdKeyed("derived", std::move(schema));
  relation.InsertRow({StringValue{"foo"}}).value();

  auto got = relation.InsertRows({{StringValue{"bar"}}, {StringValue{"foo"}}});

  ASSERT_THAT(got.has_value(), IsFalse());
  ASSERT_THAT(got.error().Wraps(ErrorType::kDuplicateTuple), IsTrue());
  ASSERT_THAT(relation.Size(), Eq(1));
}

TEST(RelationTest, WithNameMakesIndependentCopy) {
  auto relation = CreateTestRelation();
  relation.InsertRow({IntValue{1}, StringValue{"foo"}}).value();

  auto copy = relation.WithName("copy");
  copy.InsertRow({IntValue{2}, StringValue{"bar"}}).value();

  ASSERT_THAT(copy.GetName(), Eq("copy"));
  ASSERT_THAT(copy.Size(), Eq(2));
  ASSERT_THAT(relation.Size(), Eq(1));
}

TEST(RelationTest, RelationToString) {
  auto relation = CreateTestRelation();
  relation.InsertRows({
      {IntValue{2}, StringValue{"bar"}},
      {IntValue{1}, StringValue{"foo"}},
  }).value();

  ASSERT_THAT(ToString(relation), Eq("1        foo     \n"
                                     "2        bar     \n"));
}

}  // namespace relalg
