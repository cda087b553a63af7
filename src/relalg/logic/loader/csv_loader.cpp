#include <relalg/logic/loader/csv_loader.hpp>

#include <charconv>
#include <fstream>
#include <iostream>
#include <ranges>

#include <boost/filesystem.hpp>

namespace relalg {

namespace fs = boost::filesystem;

namespace {

std::vector<std::string> SplitLine(std::string line) {
  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }
  std::vector<std::string> parts;
  for (const auto& part : line | std::views::split(',')) {
    parts.emplace_back(part.begin(), part.end());
  }
  return parts;
}

Result<Type> GetTypeFromString(const std::string& s) {
  if (s == "int") {
    return Type::kInt;
  }
  if (s == "string") {
    return Type::kString;
  }
  return MakeError<ErrorType::kParseError>("unknown type " + s);
}

Result<Value> BuildValueFromString(Type type, const std::string& value) {
  switch (type) {
    case Type::kInt: {
      IntValue res;
      auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), res);
      if (ec != std::errc{} || ptr != value.data() + value.size()) {
        return MakeError<ErrorType::kParseError>("can't parse " + value + " as int");
      }
      return Value{res};
    }
    case Type::kString:
      return Value{value};
  }
  std::unreachable();
}

Result<Tuple> ParseTuple(const std::string& line, const Schema& schema) {
  auto values = SplitLine(line);
  if (values.size() != schema.Arity()) {
    return MakeError<ErrorType::kSchemaViolation>(
        "line has " + std::to_string(values.size()) + " values, expected "
        + std::to_string(schema.Arity()));
  }
  Tuple tuple;
  tuple.reserve(values.size());
  for (std::size_t i = 0; i < values.size(); ++i) {
    auto value = BuildValueFromString(schema.GetAttributes()[i].type, values[i]);
    if (!value) {
      return std::unexpected(std::move(value).error());
    }
    tuple.push_back(std::move(*value));
  }
  return tuple;
}

Result<Schema> ParseHeader(const std::string& line) {
  AttributesInfo attributes;
  for (const auto& attr : SplitLine(line)) {
    auto mid = attr.find(':');
    if (mid == std::string::npos) {
      return MakeError<ErrorType::kParseError>("attribute " + attr + " has no type");
    }
    auto type = GetTypeFromString(attr.substr(mid + 1));
    if (!type) {
      return std::unexpected(std::move(type).error());
    }
    attributes.push_back(AttributeInfo{attr.substr(0, mid), *type});
  }
  return Schema::Create(std::move(attributes));
}

} // namespace

Result<Relation> CsvDirRelationLoader::operator()(const std::string& table_name,
                                                  std::size_t primary_key_index) const {
  auto path = fs::path{dir} / (table_name + ".csv");
  std::clog << "Loading table " << table_name << " from " << path.string() << '\n';
  if (!fs::exists(path)) {
    return MakeError<ErrorType::kNotFound>("no such file " + path.string());
  }

  std::ifstream input{path.string()};
  std::string line;
  if (!std::getline(input, line)) {
    return MakeError<ErrorType::kParseError>("missing header in " + path.string());
  }
  auto schema = ParseHeader(line);
  if (!schema) {
    return WrapError(std::move(schema), "bad header in " + path.string());
  }

  auto relation = Relation::Create(table_name, std::move(*schema), primary_key_index);
  if (!relation) {
    return relation;
  }

  Tuples rows;
  std::size_t line_number = 1;
  while (std::getline(input, line)) {
    ++line_number;
    if (line.empty() || line == "\r") {
      continue;
    }
    auto tuple = ParseTuple(line, relation->GetSchema());
    if (!tuple) {
      return WrapError(std::move(tuple), path.string() + ":" + std::to_string(line_number));
    }
    rows.push_back(std::move(*tuple));
  }
  std::clog << "Read " << rows.size() << " tuples from " << path.string() << '\n';

  auto inserted = relation->InsertRows(std::move(rows));
  if (!inserted) {
    return WrapError(std::move(inserted), "can't load table " + table_name);
  }
  return relation;
}

}  // namespace relalg
