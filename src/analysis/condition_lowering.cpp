#include <algorithm>
#include <cctype>
#include <charconv>
#include <codegate/analysis/condition_lowering.h>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <type_traits>
#include <utility>

namespace codegate::analysis
{
namespace
{

using namespace codegate::parser;
using codegate::lexer::TokenKind;

constexpr int kMaxExponent = 400;

struct TypedExpr
{
    z3::expr expr;
    Sort sort;
    bool is_literal = false;
};

using TypedResult = std::variant<TypedExpr, std::string>;

/** Position a name is used in, which decides the sort of an undeclared name. */
enum class Use
{
    Truth,
    Number,
};

bool is_number_literal(const Expr& e)
{
    if (std::holds_alternative<NumberExpr>(e.node))
    {
        return true;
    }
    const auto* unary = std::get_if<UnaryExpr>(&e.node);
    return unary != nullptr && (unary->op == TokenKind::Minus || unary->op == TokenKind::Plus) &&
           is_number_literal(*unary->operand);
}

/** Names used as operands of arithmetic or ordering comparisons in `e`. */
void collect_numeric_names(const Expr& e, std::set<std::string_view>& out)
{
    auto mark = [&out](const Expr& operand)
    {
        if (const auto* name = std::get_if<NameExpr>(&operand.node))
        {
            out.insert(name->name);
        }
    };
    std::visit(
        [&](const auto& node)
        {
            using Node = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<Node, UnaryExpr>)
            {
                if (node.op != TokenKind::KwNot)
                {
                    mark(*node.operand);
                }
                collect_numeric_names(*node.operand, out);
            }
            else if constexpr (std::is_same_v<Node, BinaryExpr>)
            {
                mark(*node.lhs);
                mark(*node.rhs);
                collect_numeric_names(*node.lhs, out);
                collect_numeric_names(*node.rhs, out);
            }
            else if constexpr (std::is_same_v<Node, BoolOpExpr>)
            {
                for (const auto& v : node.values)
                {
                    collect_numeric_names(v, out);
                }
            }
            else if constexpr (std::is_same_v<Node, CompareExpr>)
            {
                const Expr* left = node.left.get();
                for (std::size_t i = 0; i < node.ops.size(); ++i)
                {
                    const Expr& right = node.comparators[i];
                    const CmpOp op = node.ops[i];
                    const bool equality = op == CmpOp::Eq || op == CmpOp::NotEq;
                    const bool ordering = op == CmpOp::Lt || op == CmpOp::LtE ||
                                          op == CmpOp::Gt || op == CmpOp::GtE;
                    if (ordering || (equality && (is_number_literal(*left) ||
                                                  is_number_literal(right) ||
                                                  (std::holds_alternative<NameExpr>(left->node) &&
                                                   std::holds_alternative<NameExpr>(right.node)))))
                    {
                        mark(*left);
                        mark(right);
                    }
                    left = &right;
                }
                collect_numeric_names(*node.left, out);
                for (const auto& c : node.comparators)
                {
                    collect_numeric_names(c, out);
                }
            }
            else if constexpr (std::is_same_v<Node, IfExpr>)
            {
                collect_numeric_names(*node.test, out);
                collect_numeric_names(*node.body, out);
                collect_numeric_names(*node.orelse, out);
            }
        },
        e.node);
}

/** `digits[.digits][e[+-]digits]` as a Z3 rational numeral `num/den`. */
std::optional<std::string> decimal_rational(const std::string& text)
{
    std::string mantissa = text;
    long exponent = 0;
    const auto e = text.find_first_of("eE");
    if (e != std::string::npos)
    {
        mantissa = text.substr(0, e);
        const std::string exp_text = text.substr(e + 1);
        if (exp_text.empty() || exp_text.size() > 5)
        {
            return std::nullopt;
        }
        const char* first = exp_text.data() + (exp_text[0] == '+' ? 1 : 0);
        const auto [ptr, ec] = std::from_chars(first, exp_text.data() + exp_text.size(), exponent);
        if (ec != std::errc() || ptr != exp_text.data() + exp_text.size())
        {
            return std::nullopt;
        }
    }
    std::string digits;
    const auto dot = mantissa.find('.');
    if (dot != std::string::npos)
    {
        digits = mantissa.substr(0, dot) + mantissa.substr(dot + 1);
        exponent -= static_cast<long>(mantissa.size() - dot - 1);
    }
    else
    {
        digits = mantissa;
    }
    if (digits.empty() || !std::all_of(digits.begin(), digits.end(),
                                       [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }))
    {
        return std::nullopt;
    }
    if (exponent > kMaxExponent || exponent < -kMaxExponent)
    {
        return std::nullopt;
    }
    if (exponent >= 0)
    {
        return digits + std::string(static_cast<std::size_t>(exponent), '0');
    }
    return digits + "/1" + std::string(static_cast<std::size_t>(-exponent), '0');
}

TypedResult lower_number(std::string_view lexeme, z3::context& ctx)
{
    std::string text;
    for (const char c : lexeme)
    {
        if (c != '_')
        {
            text.push_back(c);
        }
    }
    if (text.empty() || text.back() == 'j' || text.back() == 'J')
    {
        return std::string("complex literals are not supported");
    }
    if (text.size() > 2 && text[0] == '0' && std::isalpha(static_cast<unsigned char>(text[1])) != 0)
    {
        const char prefix = static_cast<char>(std::tolower(static_cast<unsigned char>(text[1])));
        const int base = prefix == 'x' ? 16 : prefix == 'o' ? 8 : prefix == 'b' ? 2 : 0;
        if (base == 0 || text.size() > 2 + 16)
        {
            return std::string("unsupported numeric literal");
        }
        std::uint64_t value = 0;
        const char* last = text.data() + text.size();
        const auto [ptr, ec] = std::from_chars(text.data() + 2, last, value, base);
        if (ec != std::errc() || ptr != last)
        {
            return std::string("unsupported numeric literal");
        }
        return TypedExpr{ctx.int_val(value), Sort::Int, true};
    }
    if (text.find_first_of(".eE") != std::string::npos)
    {
        const auto rational = decimal_rational(text);
        if (!rational.has_value())
        {
            return std::string("unsupported float literal");
        }
        return TypedExpr{ctx.real_val(rational->c_str()), Sort::Real, true};
    }
    if (!std::all_of(text.begin(), text.end(),
                     [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }))
    {
        return std::string("unsupported numeric literal");
    }
    return TypedExpr{ctx.int_val(text.c_str()), Sort::Int, true};
}

class Lowering
{
  public:
    Lowering(LoweringContext& ctx, std::set<std::string_view> numeric)
        : ctx_(ctx), numeric_(std::move(numeric))
    {
    }

    TypedResult lower(const Expr& e, Use use)
    {
        return std::visit([&](const auto& node) -> TypedResult { return lower_node(node, use); },
                          e.node);
    }

    z3::expr truth(const TypedExpr& t)
    {
        switch (t.sort)
        {
        case Sort::Bool:
            return t.expr;
        case Sort::Int:
            return t.expr != ctx_.ctx.int_val(0);
        case Sort::Real:
            return t.expr != ctx_.ctx.real_val(0);
        }
        return t.expr;
    }

  private:
    LoweringContext& ctx_;
    std::set<std::string_view> numeric_;

    /** Numeric view: booleans count as 0 and 1. */
    TypedExpr number(const TypedExpr& t)
    {
        if (t.sort == Sort::Bool)
        {
            return TypedExpr{z3::ite(t.expr, ctx_.ctx.int_val(1), ctx_.ctx.int_val(0)), Sort::Int,
                             t.is_literal};
        }
        return t;
    }

    static z3::expr as_real(const TypedExpr& t)
    {
        return t.sort == Sort::Real ? t.expr : z3::to_real(t.expr);
    }

    /** Bring two numeric operands to a common sort. */
    std::pair<TypedExpr, TypedExpr> unify(const TypedExpr& a, const TypedExpr& b)
    {
        auto l = number(a);
        auto r = number(b);
        if (l.sort == r.sort)
        {
            return {l, r};
        }
        return {TypedExpr{as_real(l), Sort::Real, l.is_literal},
                TypedExpr{as_real(r), Sort::Real, r.is_literal}};
    }

    z3::expr variable(const std::string& name, Sort sort)
    {
        const auto key = name + (sort == Sort::Bool ? "!b" : sort == Sort::Int ? "!i" : "!r");
        if (const auto it = ctx_.vars.find(key); it != ctx_.vars.end())
        {
            return it->second;
        }
        z3::expr v = sort == Sort::Bool  ? ctx_.ctx.bool_const(name.c_str())
                     : sort == Sort::Int ? ctx_.ctx.int_const(name.c_str())
                                         : ctx_.ctx.real_const(name.c_str());
        ctx_.vars.emplace(key, v);
        return v;
    }

    TypedResult lower_node(const NameExpr& node, Use use)
    {
        if (const auto it = ctx_.declared.find(node.name); it != ctx_.declared.end())
        {
            return TypedExpr{variable(std::string(node.name), it->second), it->second};
        }
        // One sort per name across a scope: reuse whatever was created first.
        const std::string name(node.name);
        for (const Sort sort : {Sort::Real, Sort::Bool})
        {
            const auto key = name + (sort == Sort::Bool ? "!b" : "!r");
            if (const auto it = ctx_.vars.find(key); it != ctx_.vars.end())
            {
                return TypedExpr{it->second, sort};
            }
        }
        const Sort sort =
            use == Use::Number || numeric_.contains(node.name) ? Sort::Real : Sort::Bool;
        return TypedExpr{variable(name, sort), sort};
    }

    TypedResult lower_node(const ConstantExpr& node, Use)
    {
        switch (node.kind)
        {
        case ConstantExpr::Kind::True:
            return TypedExpr{ctx_.ctx.bool_val(true), Sort::Bool, true};
        case ConstantExpr::Kind::False:
            return TypedExpr{ctx_.ctx.bool_val(false), Sort::Bool, true};
        case ConstantExpr::Kind::None:
        case ConstantExpr::Kind::Ellipsis:
            break;
        }
        return std::string("None and ... are not supported");
    }

    TypedResult lower_node(const NumberExpr& node, Use)
    {
        return lower_number(node.lexeme, ctx_.ctx);
    }

    TypedResult lower_node(const UnaryExpr& node, Use)
    {
        if (node.op == TokenKind::KwNot)
        {
            auto operand = lower(*node.operand, Use::Truth);
            if (const auto* err = std::get_if<std::string>(&operand))
            {
                return *err;
            }
            return TypedExpr{!truth(std::get<TypedExpr>(operand)), Sort::Bool, false};
        }
        if (node.op != TokenKind::Minus && node.op != TokenKind::Plus)
        {
            return std::string("unsupported unary operator");
        }
        auto operand = lower(*node.operand, Use::Number);
        if (const auto* err = std::get_if<std::string>(&operand))
        {
            return *err;
        }
        auto typed = number(std::get<TypedExpr>(operand));
        if (node.op == TokenKind::Plus)
        {
            return typed;
        }
        return TypedExpr{-typed.expr, typed.sort, typed.is_literal};
    }

    TypedResult lower_node(const BinaryExpr& node, Use)
    {
        auto lhs = lower(*node.lhs, Use::Number);
        if (const auto* err = std::get_if<std::string>(&lhs))
        {
            return *err;
        }
        auto rhs = lower(*node.rhs, Use::Number);
        if (const auto* err = std::get_if<std::string>(&rhs))
        {
            return *err;
        }
        auto [left, right] = unify(std::get<TypedExpr>(lhs), std::get<TypedExpr>(rhs));
        const bool literal = left.is_literal && right.is_literal;

        switch (node.op)
        {
        case TokenKind::Plus:
            return TypedExpr{left.expr + right.expr, left.sort, literal};
        case TokenKind::Minus:
            return TypedExpr{left.expr - right.expr, left.sort, literal};
        case TokenKind::Star:
            if (!left.is_literal && !right.is_literal)
            {
                return std::string("non-linear multiplication is not supported");
            }
            return TypedExpr{left.expr * right.expr, left.sort, literal};
        case TokenKind::Slash:
        {
            if (!right.is_literal)
            {
                return std::string("division by a non-literal is not supported");
            }
            const auto l = as_real(left);
            const auto r = as_real(right);
            return TypedExpr{l / r, Sort::Real, literal};
        }
        case TokenKind::DoubleSlash:
        case TokenKind::Percent:
        {
            // Z3 integer div/mod are Euclidean; they agree with Python for positive divisors.
            if (left.sort != Sort::Int || right.sort != Sort::Int || !right.is_literal ||
                !right.expr.is_numeral())
            {
                return std::string("'//' and '%' need int operands and a literal divisor");
            }
            std::int64_t divisor = 0;
            if (!right.expr.is_numeral_i64(divisor) || divisor <= 0)
            {
                return std::string("'//' and '%' need a positive divisor");
            }
            return TypedExpr{node.op == TokenKind::DoubleSlash ? left.expr / right.expr
                                                               : z3::mod(left.expr, right.expr),
                             Sort::Int, literal};
        }
        default:
            break;
        }
        return std::string("unsupported binary operator");
    }

    TypedResult lower_node(const BoolOpExpr& node, Use use)
    {
        if (use == Use::Number)
        {
            return std::string("and/or used as a number is not supported");
        }
        std::optional<z3::expr> acc;
        for (const auto& v : node.values)
        {
            auto lowered = lower(v, Use::Truth);
            if (const auto* err = std::get_if<std::string>(&lowered))
            {
                return *err;
            }
            const auto t = truth(std::get<TypedExpr>(lowered));
            if (!acc.has_value())
            {
                acc = t;
            }
            else
            {
                acc = node.op == TokenKind::KwAnd ? (*acc && t) : (*acc || t);
            }
        }
        if (!acc.has_value())
        {
            return std::string("empty boolean operation");
        }
        return TypedExpr{*acc, Sort::Bool, false};
    }

    TypedResult lower_node(const CompareExpr& node, Use)
    {
        auto left = lower(*node.left, Use::Number);
        if (const auto* err = std::get_if<std::string>(&left))
        {
            return *err;
        }
        std::optional<z3::expr> acc;
        TypedExpr current = std::get<TypedExpr>(left);
        for (std::size_t i = 0; i < node.ops.size(); ++i)
        {
            auto right = lower(node.comparators[i], Use::Number);
            if (const auto* err = std::get_if<std::string>(&right))
            {
                return *err;
            }
            const auto next = std::get<TypedExpr>(right);
            std::optional<z3::expr> cmp;
            const CmpOp op = node.ops[i];
            if ((op == CmpOp::Eq || op == CmpOp::NotEq) && current.sort == Sort::Bool &&
                next.sort == Sort::Bool)
            {
                cmp = op == CmpOp::Eq ? current.expr == next.expr : current.expr != next.expr;
            }
            else
            {
                auto [l, r] = unify(current, next);
                switch (op)
                {
                case CmpOp::Eq:
                    cmp = l.expr == r.expr;
                    break;
                case CmpOp::NotEq:
                    cmp = l.expr != r.expr;
                    break;
                case CmpOp::Lt:
                    cmp = l.expr < r.expr;
                    break;
                case CmpOp::LtE:
                    cmp = l.expr <= r.expr;
                    break;
                case CmpOp::Gt:
                    cmp = l.expr > r.expr;
                    break;
                case CmpOp::GtE:
                    cmp = l.expr >= r.expr;
                    break;
                case CmpOp::In:
                case CmpOp::NotIn:
                case CmpOp::Is:
                case CmpOp::IsNot:
                    return std::string("membership and identity tests are not supported");
                }
            }
            acc = acc.has_value() ? (*acc && *cmp) : *cmp;
            current = next;
        }
        if (!acc.has_value())
        {
            return std::string("empty comparison");
        }
        return TypedExpr{*acc, Sort::Bool, false};
    }

    TypedResult lower_node(const IfExpr& node, Use use)
    {
        auto test = lower(*node.test, Use::Truth);
        auto body = lower(*node.body, use);
        auto orelse = lower(*node.orelse, use);
        for (const auto* part : {&test, &body, &orelse})
        {
            if (const auto* err = std::get_if<std::string>(part))
            {
                return *err;
            }
        }
        const auto cond = truth(std::get<TypedExpr>(test));
        const auto& b = std::get<TypedExpr>(body);
        const auto& o = std::get<TypedExpr>(orelse);
        if (b.sort == Sort::Bool && o.sort == Sort::Bool)
        {
            return TypedExpr{z3::ite(cond, b.expr, o.expr), Sort::Bool, false};
        }
        if (b.sort == Sort::Bool || o.sort == Sort::Bool)
        {
            if (use == Use::Truth)
            {
                return TypedExpr{z3::ite(cond, truth(b), truth(o)), Sort::Bool, false};
            }
        }
        auto [l, r] = unify(b, o);
        return TypedExpr{z3::ite(cond, l.expr, r.expr), l.sort, false};
    }

    template <typename Node>
    TypedResult lower_node(const Node&, Use)
    {
        return std::string("unsupported expression");
    }
};

} // namespace

LoweringResult lower_condition(const Expr& expr, LoweringContext& ctx)
{
    std::set<std::string_view> numeric;
    collect_numeric_names(expr, numeric);
    Lowering lowering(ctx, std::move(numeric));
    auto lowered = lowering.lower(expr, Use::Truth);
    if (const auto* err = std::get_if<std::string>(&lowered))
    {
        return *err;
    }
    return lowering.truth(std::get<TypedExpr>(lowered));
}

std::optional<Sort> sort_of_annotation(const Expr& annotation)
{
    const auto* name = std::get_if<NameExpr>(&annotation.node);
    if (name == nullptr)
    {
        return std::nullopt;
    }
    if (name->name == "int")
    {
        return Sort::Int;
    }
    if (name->name == "float")
    {
        return Sort::Real;
    }
    if (name->name == "bool")
    {
        return Sort::Bool;
    }
    return std::nullopt;
}

} // namespace codegate::analysis
