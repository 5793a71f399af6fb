#pragma once

#include <codegate/lexer/token.h>
#include <codegate/source/span.h>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

/**
 * @file ast.h
 * @brief Syntax tree for the Python subset accepted by the parser.
 *
 * Names and number lexemes are views into the SourceUnit text; decoded string
 * literal contents are owned. Child expressions are held through unique_ptr or
 * by value inside vectors, so a tree is move-only.
 */

namespace codegate::parser
{

struct Expr;
struct Stmt;

using ExprPtr = std::unique_ptr<Expr>;

/** @brief Bare identifier. */
struct NameExpr
{
    std::string_view name;
};

/** @brief `None`, `True`, `False` or `...`. */
struct ConstantExpr
{
    enum class Kind
    {
        None,
        True,
        False,
        Ellipsis,
    };
    Kind kind = Kind::None;
};

/** @brief Numeric literal; the lexeme is kept verbatim (underscores, prefixes, suffixes). */
struct NumberExpr
{
    std::string_view lexeme;
};

/** @brief String or bytes literal with escapes decoded and adjacent literals joined. */
struct StringExpr
{
    std::string value;
    bool is_bytes = false;
};

/**
 * @brief One piece of an f-string: literal text, or a replacement field.
 *
 * A replacement field has `value` set, an optional conversion (`r`, `s`, `a`,
 * or 0) and an optional format spec, itself an FStringExpr.
 */
struct FStringPart
{
    std::string literal;
    ExprPtr value;
    char conversion = 0;
    ExprPtr format_spec;
};

/** @brief f-string; replacement fields are parsed expressions. */
struct FStringExpr
{
    std::vector<FStringPart> parts;
};

/** @brief Unary `-x`, `+x`, `~x` or `not x`. */
struct UnaryExpr
{
    codegate::lexer::TokenKind op;
    ExprPtr operand;
};

/** @brief Arithmetic or bitwise binary operation. */
struct BinaryExpr
{
    codegate::lexer::TokenKind op;
    ExprPtr lhs;
    ExprPtr rhs;
};

/** @brief Short-circuit `and` / `or` over two or more operands. */
struct BoolOpExpr
{
    codegate::lexer::TokenKind op; // KwAnd or KwOr
    std::vector<Expr> values;
};

enum class CmpOp
{
    Eq,
    NotEq,
    Lt,
    LtE,
    Gt,
    GtE,
    In,
    NotIn,
    Is,
    IsNot,
};

/** @brief Chained comparison `a < b <= c`. */
struct CompareExpr
{
    ExprPtr left;
    std::vector<CmpOp> ops;
    std::vector<Expr> comparators;
};

/** @brief Call argument: positional, `name=value`, `*iterable` or `**mapping`. */
struct Argument
{
    enum class Kind
    {
        Positional,
        Keyword,
        Star,
        DoubleStar,
    };
    Kind kind = Kind::Positional;
    std::string_view keyword;
    ExprPtr value;
    codegate::source::Span span;
};

struct CallExpr
{
    ExprPtr callee;
    std::vector<Argument> args;
};

/** @brief `value.attr`. */
struct AttributeExpr
{
    ExprPtr value;
    std::string_view attr;
    codegate::source::Span attr_span;
};

/** @brief `value[index]`; a slice index is a SliceExpr, several indices a TupleExpr. */
struct SubscriptExpr
{
    ExprPtr value;
    ExprPtr index;
};

/** @brief `lower:upper:step` inside a subscript; any part may be absent. */
struct SliceExpr
{
    ExprPtr lower;
    ExprPtr upper;
    ExprPtr step;
};

struct ListExpr
{
    std::vector<Expr> elts;
};

struct TupleExpr
{
    std::vector<Expr> elts;
};

struct SetExpr
{
    std::vector<Expr> elts;
};

/** @brief Dict display entry; a null key means `**mapping` unpacking. */
struct DictItem
{
    ExprPtr key;
    ExprPtr value;
};

struct DictExpr
{
    std::vector<DictItem> items;
};

/** @brief One `for target in iter if cond...` clause. */
struct Comprehension
{
    ExprPtr target;
    ExprPtr iter;
    std::vector<Expr> ifs;
    bool is_async = false;
};

/** @brief List, set, dict comprehension or generator expression. */
struct ComprehensionExpr
{
    enum class Kind
    {
        List,
        Set,
        Dict,
        Generator,
    };
    Kind kind = Kind::List;
    ExprPtr elt;   // key for dict comprehensions
    ExprPtr value; // dict comprehensions only
    std::vector<Comprehension> generators;
};

/** @brief Formal parameter with optional annotation and default. */
struct Param
{
    codegate::source::Span span;
    std::string_view name;
    ExprPtr annotation;
    ExprPtr default_value;
};

/** @brief Parameter list of a def or lambda. Positional-only parameters are folded into `positional`. */
struct Parameters
{
    std::vector<Param> positional;
    std::optional<Param> vararg;
    std::vector<Param> kwonly;
    std::optional<Param> kwarg;
};

struct LambdaExpr
{
    std::shared_ptr<Parameters> params;
    std::shared_ptr<Expr> body;
};

/** @brief `body if test else orelse`. */
struct IfExpr
{
    ExprPtr test;
    ExprPtr body;
    ExprPtr orelse;
};

struct StarredExpr
{
    ExprPtr value;
};

/** @brief Walrus `target := value`. */
struct NamedExpr
{
    std::string_view target;
    ExprPtr value;
};

struct AwaitExpr
{
    ExprPtr value;
};

struct YieldExpr
{
    ExprPtr value;
    bool is_from = false;
};

struct Expr
{
    codegate::source::Span span;
    std::variant<NameExpr, ConstantExpr, NumberExpr, StringExpr, FStringExpr, UnaryExpr,
                 BinaryExpr, BoolOpExpr, CompareExpr, CallExpr, AttributeExpr, SubscriptExpr,
                 SliceExpr, ListExpr, TupleExpr, SetExpr, DictExpr, ComprehensionExpr, LambdaExpr,
                 IfExpr, StarredExpr, NamedExpr, AwaitExpr, YieldExpr>
        node;
};

struct ExprStmt
{
    Expr value;
};

/** @brief `a = b = value`; every target receives the value. */
struct AssignStmt
{
    std::vector<Expr> targets;
    Expr value;
};

struct AugAssignStmt
{
    Expr target;
    codegate::lexer::TokenKind op; // the binary operator, e.g. Plus for `+=`
    Expr value;
};

struct AnnAssignStmt
{
    Expr target;
    Expr annotation;
    std::optional<Expr> value;
};

struct ReturnStmt
{
    std::optional<Expr> value;
};

struct PassStmt
{
};

struct BreakStmt
{
};

struct ContinueStmt
{
};

struct RaiseStmt
{
    std::optional<Expr> exc;
    std::optional<Expr> cause;
};

struct GlobalStmt
{
    std::vector<std::string_view> names;
};

struct NonlocalStmt
{
    std::vector<std::string_view> names;
};

struct DelStmt
{
    std::vector<Expr> targets;
};

struct AssertStmt
{
    Expr test;
    std::optional<Expr> msg;
};

/** @brief `name [as asname]` inside an import; `name` is the dotted path joined with '.'. */
struct ImportAlias
{
    codegate::source::Span span;
    std::string name;
    std::optional<std::string_view> asname;
};

struct ImportStmt
{
    std::vector<ImportAlias> names;
};

/** @brief `from [.]*module import names`; `level` counts leading dots, `*` imports use name "*". */
struct ImportFromStmt
{
    std::string module;
    std::size_t level = 0;
    std::vector<ImportAlias> names;
};

/** @brief `if`; an `elif` chain is an IfStmt nested as the sole statement of `orelse`. */
struct IfStmt
{
    Expr test;
    std::vector<Stmt> body;
    std::vector<Stmt> orelse;
};

struct WhileStmt
{
    Expr test;
    std::vector<Stmt> body;
    std::vector<Stmt> orelse;
};

struct ForStmt
{
    Expr target;
    Expr iter;
    std::vector<Stmt> body;
    std::vector<Stmt> orelse;
    bool is_async = false;
};

struct ExceptHandler
{
    codegate::source::Span span;
    std::optional<Expr> type;
    std::optional<std::string_view> name;
    std::vector<Stmt> body;
};

struct TryStmt
{
    std::vector<Stmt> body;
    std::vector<ExceptHandler> handlers;
    std::vector<Stmt> orelse;
    std::vector<Stmt> finalbody;
};

struct WithItem
{
    Expr context;
    std::optional<Expr> target;
};

struct WithStmt
{
    std::vector<WithItem> items;
    std::vector<Stmt> body;
    bool is_async = false;
};

/**
 * @brief `def`. Parameters and body are shared so that function objects created
 * at runtime can keep them alive independently of the module tree.
 */
struct FunctionDef
{
    std::string_view name;
    codegate::source::Span name_span;
    std::shared_ptr<Parameters> params;
    std::optional<Expr> returns;
    std::vector<Expr> decorators;
    std::shared_ptr<std::vector<Stmt>> body;
    bool is_async = false;
};

struct ClassDef
{
    std::string_view name;
    std::vector<Argument> bases;
    std::vector<Expr> decorators;
    std::vector<Stmt> body;
};

struct Stmt
{
    codegate::source::Span span;
    std::variant<ExprStmt, AssignStmt, AugAssignStmt, AnnAssignStmt, ReturnStmt, PassStmt,
                 BreakStmt, ContinueStmt, RaiseStmt, GlobalStmt, NonlocalStmt, DelStmt,
                 AssertStmt, ImportStmt, ImportFromStmt, IfStmt, WhileStmt, ForStmt, TryStmt,
                 WithStmt, FunctionDef, ClassDef>
        node;
};

/** @brief A parsed module: its top-level statements. */
struct Module
{
    std::vector<Stmt> body;
};

} // namespace codegate::parser
