#include <relalg/logic/printer/dot.hpp>

#include <memory>
#include <utility>

#include <relalg/models/relation/relation.hpp>

namespace relalg {

namespace {

std::string Escape(const std::string& s) {
  std::string res;
  res.reserve(s.size());
  for (char c : s) {
    if (c == '"') {
      res.push_back('\\');
    }
    res.push_back(c);
  }
  return res;
}

std::string Quote(const std::string& node) { return "\"" + node + "\""; }

std::string Edge(const std::string& from, const std::string& to) {
  return Quote(from) + " -> " + Quote(to);
}

std::string GetSymbol(BinaryOp op) {
  switch (op) {
    case BinaryOp::kJoin:
      return "⋈";
    case BinaryOp::kUnion:
      return "∪";
  }
  std::unreachable();
}

} // namespace

std::string GetDotRepresentation(const Operator& op) {
    // Returns the node name of an operator and the statements of its subtree
    struct DotFormatter {
        std::pair<std::string, std::string> Child(const std::shared_ptr<Operator>& child) {
          if (child == nullptr) {
            return {"?", Quote("?")};
          }
          return std::visit(DotFormatter{}, *child);
        }
        std::pair<std::string, std::string> operator()(const Projection& op) {
          std::string attrs;
          for (const auto& attr : op.attributes) {
            if (!attrs.empty()) {
              attrs += ',';
            }
            attrs += attr;
          }
          if (attrs.empty()) {
            attrs = "*";
          }
          auto node = "π " + Escape(attrs);
          auto [source_node, rest] = Child(op.source);
          return {node, Quote(node) + "\n" + Edge(source_node, node) + "\n" + rest};
        }
        std::pair<std::string, std::string> operator()(const Selection& op) {
          auto node = "σ " + Escape(ToString(op.predicate));
          auto [source_node, rest] = Child(op.source);
          return {node, Quote(node) + "\n" + Edge(source_node, node) + "\n" + rest};
        }
        std::pair<std::string, std::string> operator()(const Table& op) {
          std::string node = op.relation ? Escape(op.relation->GetName()) : "?";
          return {node, Quote(node)};
        }
        std::pair<std::string, std::string> operator()(const BinaryOperation& op) {
          auto [lhs_node, lhs_rest] = Child(op.lhs);
          auto [rhs_node, rhs_rest] = Child(op.rhs);
          auto node = ToString(op.op) + "_" + lhs_node + "_" + rhs_node;
          auto rest = Quote(node) + "[label=\"" + GetSymbol(op.op) + "\"]\n"
                      + Edge(lhs_node, node) + "\n" + Edge(rhs_node, node) + "\n" + lhs_rest
                      + "\n" + rhs_rest;
          return {node, rest};
        }
    };
    auto [_, code] = std::visit(DotFormatter{}, op);
    return "digraph G { rankdir=BT; " + code + " }\n";
}

}  // namespace relalg
