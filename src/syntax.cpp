#include <modlint/syntax.h>

#include <tuple>

namespace modlint {

bool operator==(const Position &lhs, const Position &rhs) {
  return lhs.row == rhs.row && lhs.column == rhs.column;
}

bool operator!=(const Position &lhs, const Position &rhs) {
  return !(lhs == rhs);
}

bool operator<(const Position &lhs, const Position &rhs) {
  return std::tie(lhs.row, lhs.column) < std::tie(rhs.row, rhs.column);
}

bool operator==(const Range &lhs, const Range &rhs) {
  return lhs.start == rhs.start && lhs.end == rhs.end;
}

bool operator!=(const Range &lhs, const Range &rhs) { return !(lhs == rhs); }

bool RangeLess(const Range &lhs, const Range &rhs) {
  return std::tie(lhs.start.row, lhs.start.column, lhs.end.row,
                  lhs.end.column) < std::tie(rhs.start.row, rhs.start.column,
                                             rhs.end.row, rhs.end.column);
}

std::string JoinModuleName(const ModuleName &name) {
  std::string joined;
  for (std::size_t i = 0; i < name.size(); ++i) {
    if (i > 0) {
      joined.push_back('.');
    }
    joined.append(name[i]);
  }
  return joined;
}

ModuleName SplitModuleName(std::string_view dotted) {
  ModuleName segments;
  std::string current;
  for (const auto character : dotted) {
    if (character == '.') {
      if (!current.empty()) {
        segments.push_back(current);
        current.clear();
      }
      continue;
    }
    current.push_back(character);
  }
  if (!current.empty()) {
    segments.push_back(current);
  }
  return segments;
}

void WalkExpression(
    const Expression &root,
    const std::function<void(const Expression &, Direction)> &visit) {
  visit(root, Direction::kEnter);
  for (const auto &child : root.children) {
    WalkExpression(child, visit);
  }
  visit(root, Direction::kExit);
}

const char *ExpressionKindName(ExpressionKind kind) {
  switch (kind) {
  case ExpressionKind::kReference:
    return "reference";
  case ExpressionKind::kOperatorReference:
    return "operator-reference";
  case ExpressionKind::kLiteral:
    return "literal";
  case ExpressionKind::kApplication:
    return "application";
  case ExpressionKind::kOperatorApplication:
    return "operator-application";
  case ExpressionKind::kLambda:
    return "lambda";
  case ExpressionKind::kLet:
    return "let";
  case ExpressionKind::kIf:
    return "if";
  case ExpressionKind::kCase:
    return "case";
  case ExpressionKind::kRecord:
    return "record";
  case ExpressionKind::kRecordAccess:
    return "record-access";
  case ExpressionKind::kList:
    return "list";
  case ExpressionKind::kTuple:
    return "tuple";
  case ExpressionKind::kParenthesized:
    return "parenthesized";
  case ExpressionKind::kOther:
    return "other";
  }
  return "other";
}

const char *DeclarationKindName(DeclarationKind kind) {
  switch (kind) {
  case DeclarationKind::kFunction:
    return "function";
  case DeclarationKind::kTypeAlias:
    return "type-alias";
  case DeclarationKind::kCustomType:
    return "custom-type";
  case DeclarationKind::kPort:
    return "port";
  case DeclarationKind::kInfixOperator:
    return "infix";
  case DeclarationKind::kDestructuring:
    return "destructuring";
  }
  return "function";
}

} // namespace modlint
