#include <relalg/models/relation/relation.hpp>

#include <functional>
#include <iomanip>
#include <iostream>
#include <sstream>

#include <relalg/models/relation/constants.hpp>

namespace relalg {

Relation::Relation(std::string name, Schema schema, std::optional<std::size_t> primary_key_index)
    : name_(std::move(name)),
      schema_(std::move(schema)),
      primary_key_index_(std::move(primary_key_index)) {}

Result<Relation> Relation::Create(std::string name, Schema schema, std::size_t primary_key_index) {
    if (primary_key_index >= schema.Arity()) {
        return MakeError<ErrorType::kInvalidPrimaryKey>(
            "primary key index " + std::to_string(primary_key_index) + " is out of range for "
            + std::to_string(schema.Arity()) + " attributes");
    }
    return Relation{std::move(name), std::move(schema), primary_key_index};
}

Relation Relation::CreateRowIdKeyed(std::string name, Schema schema) {
    return Relation{std::move(name), std::move(schema), std::nullopt};
}

const std::string& Relation::GetName() const { return name_; }

const Schema& Relation::GetSchema() const { return schema_; }

std::optional<std::size_t> Relation::GetPrimaryKeyIndex() const { return primary_key_index_; }

bool Relation::IsRowIdKeyed() const { return !primary_key_index_.has_value(); }

std::size_t Relation::Size() const { return storage_.size(); }

bool Relation::Empty() const { return storage_.empty(); }

Result<> Relation::ValidateRows(const Tuples& rows) const {
    using ValueRef = std::reference_wrapper<const Value>;
    using TupleRef = std::reference_wrapper<const Tuple>;
    std::set<ValueRef, std::less<Value>> batch_keys;
    std::set<TupleRef, std::less<Tuple>> batch_tuples;

    for (std::size_t i = 0; i < rows.size(); ++i) {
        const auto& row = rows[i];
        auto valid = schema_.ValidateTuple(row);
        if (!valid) {
            return WrapError(std::move(valid), "can't insert row " + std::to_string(i));
        }

        if (primary_key_index_) {
            const auto& key = row[*primary_key_index_];
            if (storage_.contains(key)) {
                return MakeError<ErrorType::kDuplicatePrimaryKey>(
                    "primary key " + ToString(key) + " already exists in " + name_);
            }
            if (!batch_keys.insert(std::cref(key)).second) {
                return MakeError<ErrorType::kDuplicatePrimaryKey>(
                    "primary key " + ToString(key) + " repeats in inserted rows");
            }
            continue;
        }

        if (distinct_.contains(row) || !batch_tuples.insert(std::cref(row)).second) {
            return MakeError<ErrorType::kDuplicateTuple>("tuple " + ToString(row)
                                                         + " already exists in " + name_);
        }
    }
    return Ok();
}

Result<> Relation::InsertRow(Tuple row) {
    Tuples rows;
    rows.push_back(std::move(row));
    return InsertRows(std::move(rows));
}

Result<> Relation::InsertRows(Tuples rows) {
    auto valid = ValidateRows(rows);
    if (!valid) {
        std::clog << "Rejected " << rows.size() << " rows for " << name_ << ": "
                  << valid.error().What() << '\n';
        return valid;
    }

    for (auto& row : rows) {
        if (primary_key_index_) {
            auto key = row[*primary_key_index_];
            storage_.emplace(std::move(key), std::move(row));
            continue;
        }
        auto row_id = static_cast<IntValue>(storage_.size());
        distinct_.insert(row);
        storage_.emplace(Value{row_id}, std::move(row));
    }
    std::clog << "Inserted " << rows.size() << " rows into " << name_ << '\n';
    return Ok();
}

Tuples Relation::GetTuples() const {
    Tuples tuples;
    tuples.reserve(storage_.size());
    for (const auto& [_, tuple] : storage_) {
        tuples.push_back(tuple);
    }
    return tuples;
}

const Relation::Storage& Relation::GetStorage() const { return storage_; }

std::optional<Tuple> Relation::Lookup(const Value& key) const {
    auto it = storage_.find(key);
    if (it == storage_.end()) {
        return std::nullopt;
    }
    return it->second;
}

Relation Relation::WithName(std::string name) const {
    Relation copy = *this;
    copy.name_ = std::move(name);
    return copy;
}

std::string ToString(const Relation& relation) {
    struct FormatVisitor {
        void operator()(const IntValue& v) {
            s << std::setw(kColumnWidth) << v;
        }
        void operator()(const StringValue& v) {
            s << std::setw(kColumnWidth) << v;
        }

        std::ostringstream& s;
    };

    std::ostringstream s;
    s << std::left;
    for (const auto& [_, tuple] : relation.GetStorage()) {
        for (std::size_t i = 0; i < tuple.size(); ++i) {
            if (i != 0) {
                s << ' ';
            }
            std::visit(FormatVisitor{s}, tuple[i]);
        }
        s << '\n';
    }

    return s.str();
}

}  // namespace relalg
