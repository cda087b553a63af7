#include <relalg/models/relation/value.hpp>

#include <sstream>
#include <utility>

namespace relalg {

std::string ToString(Type type) {
    switch (type) {
      case Type::kInt:
          return "int";
      case Type::kString:
          return "string";
    }
    std::unreachable();
}

Type GetType(const Value& value) {
    return static_cast<Type>(value.index());
}

std::string ToString(const Value& value) {
    struct FormatVisitor {
        std::string operator()(const IntValue& v) {
            return std::to_string(v);
        }
        std::string operator()(const StringValue& v) {
            return '"' + v + '"';
        }
    };
    return std::visit(FormatVisitor{}, value);
}

std::string ToString(const Tuple& tuple) {
    std::ostringstream s;
    s << '(';
    for (std::size_t i = 0; i < tuple.size(); ++i) {
        if (i != 0) {
            s << ", ";
        }
        s << ToString(tuple[i]);
    }
    s << ')';
    return s.str();
}

}  // namespace relalg
