#pragma once

#include <memory>
#include <string>
#include <variant>
#include <vector>

#include <relalg/models/relation/value.hpp>

namespace relalg {

class Relation;

struct Table;
struct Projection;
struct Selection;
struct BinaryOperation;

using Operator = std::variant<Table, Projection, Selection, BinaryOperation>;

// Leaf of an operator tree. Does not own the relation, which must outlive
// evaluation of the tree.
struct Table {
    const Relation* relation;

    bool operator==(const Table& other) const = default;
};

// Empty list means all attributes of the source
using ProjectionAttrs = std::vector<std::string>;

struct Projection {
    ProjectionAttrs attributes;
    std::shared_ptr<Operator> source;

    bool operator==(const Projection& other) const;
};

enum class CompareOp {
   kGt,
   kLt,
   kGe,
   kLe,
   kEq,
   kNotEq,
};

std::string ToString(CompareOp op);

enum class Connective {
   kAnd,
   kOr,
};

std::string ToString(Connective connective);

struct Comparison;
struct Connection;

using Predicate = std::variant<Comparison, Connection>;

std::string ToString(const Predicate& predicate);

struct Comparison {
    std::string attribute;
    CompareOp op;
    Value constant;

    bool operator==(const Comparison& other) const = default;
};

struct Connection {
    std::shared_ptr<Predicate> lhs;
    Connective connective;
    std::shared_ptr<Predicate> rhs;

    bool operator==(const Connection& other) const;
};

struct Selection {
    Predicate predicate;
    std::shared_ptr<Operator> source;

    bool operator==(const Selection& other) const;
};

enum class BinaryOp {
   kJoin,
   kUnion,
};

std::string ToString(BinaryOp op);

// Reserved for operators over two relations, evaluation is not supported yet
struct BinaryOperation {
    BinaryOp op;
    std::shared_ptr<Operator> lhs;
    std::shared_ptr<Operator> rhs;

    bool operator==(const BinaryOperation& other) const;
};

}  // namespace relalg
