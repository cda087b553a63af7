#pragma once

#include <map>
#include <optional>
#include <set>
#include <string>

#include <relalg/logic/result/result.hpp>
#include <relalg/models/relation/schema.hpp>
#include <relalg/models/relation/value.hpp>

namespace relalg {

/// Named, schema-bound set of tuples ordered by key.
///
/// The key is either the value of a primary key attribute or, for row-id
/// keyed relations, a dense synthetic IntValue (0, 1, 2, ...) assigned in
/// insertion order that is not part of the schema. Row-id keyed relations
/// are used for derived relations and reject tuples equal to a stored one.
///
/// Insertion is all-or-nothing: a failed InsertRows leaves the storage
/// untouched.
class Relation {
public:
    using Storage = std::map<Value, Tuple>;

    static Result<Relation> Create(std::string name, Schema schema, std::size_t primary_key_index);
    static Relation CreateRowIdKeyed(std::string name, Schema schema);

    const std::string& GetName() const;
    const Schema& GetSchema() const;
    std::optional<std::size_t> GetPrimaryKeyIndex() const;
    bool IsRowIdKeyed() const;

    std::size_t Size() const;
    bool Empty() const;

    Result<> InsertRow(Tuple row);
    Result<> InsertRows(Tuples rows);

    /// Tuples in key order.
    Tuples GetTuples() const;
    const Storage& GetStorage() const;
    std::optional<Tuple> Lookup(const Value& key) const;

    Relation WithName(std::string name) const;

private:
    Relation(std::string name, Schema schema, std::optional<std::size_t> primary_key_index);

    Result<> ValidateRows(const Tuples& rows) const;

private:
    std::string name_;
    Schema schema_;
    std::optional<std::size_t> primary_key_index_;
    Storage storage_;
    // only maintained for row-id keyed relations
    std::set<Tuple> distinct_;
};

std::string ToString(const Relation& relation);

}  // namespace relalg
