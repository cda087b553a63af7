#pragma once

#include <string>

#include <relalg/logic/result/result.hpp>
#include <relalg/models/relation/relation.hpp>

namespace relalg {

// Loads <dir>/<table_name>.csv. The first line holds name:type pairs (int or
// string), every next line is a tuple. All tuples are inserted as one batch.
struct CsvDirRelationLoader {
    std::string dir;

    Result<Relation> operator()(const std::string& table_name, std::size_t primary_key_index) const;
};

}  // namespace relalg
