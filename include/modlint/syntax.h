#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace modlint {

// Rows and columns are 1-based, as produced by the parser collaborator.
struct Position {
  int row = 0;
  int column = 0;
};

struct Range {
  Position start;
  Position end;
};

bool operator==(const Position &lhs, const Position &rhs);
bool operator!=(const Position &lhs, const Position &rhs);
bool operator<(const Position &lhs, const Position &rhs);
bool operator==(const Range &lhs, const Range &rhs);
bool operator!=(const Range &lhs, const Range &rhs);

// Orders by start row, start column, end row, end column.
bool RangeLess(const Range &lhs, const Range &rhs);

using ModuleName = std::vector<std::string>;

std::string JoinModuleName(const ModuleName &name);
ModuleName SplitModuleName(std::string_view dotted);

enum class ExpressionKind {
  kReference,
  kOperatorReference,
  kLiteral,
  kApplication,
  kOperatorApplication,
  kLambda,
  kLet,
  kIf,
  kCase,
  kRecord,
  kRecordAccess,
  kList,
  kTuple,
  kParenthesized,
  kOther
};

// A reference carries its (possibly empty) module qualifier in `qualifier`
// and the referenced name in `name`. Literals keep their source text in
// `name`. Sub-expressions are stored in source order.
struct Expression {
  ExpressionKind kind = ExpressionKind::kOther;
  ModuleName qualifier;
  std::string name;
  std::vector<Expression> children;
  Range range;
};

enum class DeclarationKind {
  kFunction,
  kTypeAlias,
  kCustomType,
  kPort,
  kInfixOperator,
  kDestructuring
};

// A type named in a declaration's signature or, for type aliases and custom
// types, in its definition.
struct TypeReference {
  ModuleName qualifier;
  std::string name;
  Range range;
};

struct Declaration {
  DeclarationKind kind = DeclarationKind::kFunction;
  std::string name;
  Range name_range;
  Range range;
  std::optional<Expression> body;
  std::vector<TypeReference> type_references;
};

struct Import {
  ModuleName module_name;
  std::optional<std::string> alias;
  bool exposing_all = false;
  std::vector<std::string> exposed;
  Range range;
};

enum class ModuleKind { kNormal, kPort, kEffect };

struct ModuleHeader {
  ModuleKind kind = ModuleKind::kNormal;
  ModuleName name;
  bool exposing_all = false;
  std::vector<std::string> exposed;
  Range range;
};

struct Comment {
  std::string text;
  Range range;
};

struct SyntaxFile {
  ModuleHeader header;
  std::vector<Import> imports;
  std::vector<Declaration> declarations;
  std::vector<Comment> comments;
};

enum class Direction { kEnter, kExit };

// Walks `root` depth first, calling `visit` with kEnter before the children
// of a node and with kExit after them.
void WalkExpression(
    const Expression &root,
    const std::function<void(const Expression &, Direction)> &visit);

const char *ExpressionKindName(ExpressionKind kind);
const char *DeclarationKindName(DeclarationKind kind);

} // namespace modlint
