#include <codegate/parser/parser.h>
#include <codegate/proptest/signature.h>
#include <utility>

namespace codegate::proptest
{
namespace
{

using codegate::parser::Expr;
using Kind = TypeSpec::Kind;

/** Last component of a possibly dotted name (`typing.List` -> `List`). */
std::optional<std::string_view> simple_name(const Expr& e)
{
    if (const auto* n = std::get_if<codegate::parser::NameExpr>(&e.node))
    {
        return n->name;
    }
    if (const auto* a = std::get_if<codegate::parser::AttributeExpr>(&e.node))
    {
        return a->attr;
    }
    return std::nullopt;
}

bool is_none_literal(const Expr& e)
{
    const auto* c = std::get_if<codegate::parser::ConstantExpr>(&e.node);
    return c != nullptr && c->kind == codegate::parser::ConstantExpr::Kind::None;
}

std::optional<Kind> scalar_kind(std::string_view name)
{
    static const std::pair<std::string_view, Kind> table[] = {
        {"int", Kind::Int},         {"float", Kind::Float},       {"bool", Kind::Bool},
        {"str", Kind::Str},         {"bytes", Kind::Bytes},       {"list", Kind::List},
        {"List", Kind::List},       {"Sequence", Kind::List},     {"set", Kind::Set},
        {"Set", Kind::Set},         {"frozenset", Kind::Set},     {"FrozenSet", Kind::Set},
        {"tuple", Kind::Tuple},     {"Tuple", Kind::Tuple},       {"dict", Kind::Dict},
        {"Dict", Kind::Dict},       {"Mapping", Kind::Dict},      {"None", Kind::NoneType},
    };
    for (const auto& [spelling, kind] : table)
    {
        if (spelling == name)
        {
            return kind;
        }
    }
    return std::nullopt;
}

TypeSpec optional_of(TypeSpec inner)
{
    if (inner.kind == Kind::Optional || inner.kind == Kind::NoneType)
    {
        return inner;
    }
    TypeSpec t = TypeSpec::of(Kind::Optional);
    t.args.push_back(std::move(inner));
    return t;
}

std::vector<const Expr*> subscript_args(const Expr& index)
{
    std::vector<const Expr*> out;
    if (const auto* t = std::get_if<codegate::parser::TupleExpr>(&index.node))
    {
        for (const auto& e : t->elts)
        {
            out.push_back(&e);
        }
        return out;
    }
    out.push_back(&index);
    return out;
}

TypeSpec from_expr(const Expr& e, int depth);

/** Bare containers get int elements (str keys for dicts). */
TypeSpec bare_container(Kind kind)
{
    TypeSpec t = TypeSpec::of(kind);
    switch (kind)
    {
    case Kind::List:
    case Kind::Set:
        t.args.push_back(TypeSpec::of(Kind::Int));
        break;
    case Kind::Tuple:
        t.args.push_back(TypeSpec::of(Kind::Int));
        t.variadic = true;
        break;
    case Kind::Dict:
        t.args.push_back(TypeSpec::of(Kind::Str));
        t.args.push_back(TypeSpec::of(Kind::Int));
        break;
    default:
        break;
    }
    return t;
}

TypeSpec from_subscript(const codegate::parser::SubscriptExpr& s, int depth)
{
    const auto base = simple_name(*s.value);
    if (!base.has_value())
    {
        return TypeSpec::of(Kind::Any);
    }
    const auto args = subscript_args(*s.index);
    if (*base == "Optional" && args.size() == 1)
    {
        return optional_of(from_expr(*args[0], depth + 1));
    }
    if (*base == "Union")
    {
        std::vector<TypeSpec> members;
        bool has_none = false;
        for (const Expr* a : args)
        {
            if (is_none_literal(*a))
            {
                has_none = true;
                continue;
            }
            members.push_back(from_expr(*a, depth + 1));
        }
        // Only `Union[T, None]` has a useful generator; wider unions use the first member.
        TypeSpec first = members.empty() ? TypeSpec::of(Kind::NoneType) : members.front();
        return has_none ? optional_of(std::move(first)) : first;
    }
    const auto kind = scalar_kind(*base);
    if (!kind.has_value())
    {
        return TypeSpec::of(Kind::Any);
    }
    TypeSpec t = TypeSpec::of(*kind);
    switch (*kind)
    {
    case Kind::List:
    case Kind::Set:
        t.args.push_back(from_expr(*args[0], depth + 1));
        return t;
    case Kind::Tuple:
        if (args.size() == 2 && std::holds_alternative<codegate::parser::ConstantExpr>(args[1]->node) &&
            std::get<codegate::parser::ConstantExpr>(args[1]->node).kind ==
                codegate::parser::ConstantExpr::Kind::Ellipsis)
        {
            t.args.push_back(from_expr(*args[0], depth + 1));
            t.variadic = true;
            return t;
        }
        for (const Expr* a : args)
        {
            t.args.push_back(from_expr(*a, depth + 1));
        }
        return t;
    case Kind::Dict:
        if (args.size() != 2)
        {
            return bare_container(Kind::Dict);
        }
        t.args.push_back(from_expr(*args[0], depth + 1));
        t.args.push_back(from_expr(*args[1], depth + 1));
        return t;
    default:
        return t;
    }
}

TypeSpec from_expr(const Expr& e, int depth)
{
    if (depth > 8)
    {
        return TypeSpec::of(Kind::Any);
    }
    if (is_none_literal(e))
    {
        return TypeSpec::of(Kind::NoneType);
    }
    if (const auto* s = std::get_if<codegate::parser::SubscriptExpr>(&e.node))
    {
        return from_subscript(*s, depth);
    }
    if (const auto* b = std::get_if<codegate::parser::BinaryExpr>(&e.node);
        b != nullptr && b->op == codegate::lexer::TokenKind::Pipe)
    {
        if (is_none_literal(*b->rhs))
        {
            return optional_of(from_expr(*b->lhs, depth + 1));
        }
        if (is_none_literal(*b->lhs))
        {
            return optional_of(from_expr(*b->rhs, depth + 1));
        }
        return from_expr(*b->lhs, depth + 1);
    }
    if (const auto* str = std::get_if<codegate::parser::StringExpr>(&e.node);
        str != nullptr && !str->is_bytes)
    {
        // Forward reference written as a string.
        auto parsed = codegate::parser::parse_source(str->value);
        if (auto* m = std::get_if<codegate::parser::Module>(&parsed); m != nullptr && m->body.size() == 1)
        {
            if (const auto* es = std::get_if<codegate::parser::ExprStmt>(&m->body.front().node))
            {
                return from_expr(es->value, depth + 1);
            }
        }
        return TypeSpec::of(Kind::Any);
    }
    const auto name = simple_name(e);
    if (!name.has_value())
    {
        return TypeSpec::of(Kind::Any);
    }
    const auto kind = scalar_kind(*name);
    if (!kind.has_value())
    {
        return TypeSpec::of(Kind::Any);
    }
    return bare_container(*kind);
}

} // namespace

bool operator==(const TypeSpec& a, const TypeSpec& b)
{
    return a.kind == b.kind && a.variadic == b.variadic && a.args == b.args;
}

std::string to_string(const TypeSpec& type)
{
    const auto join = [&type]()
    {
        std::string out;
        for (std::size_t i = 0; i < type.args.size(); ++i)
        {
            if (i > 0)
            {
                out += ", ";
            }
            out += to_string(type.args[i]);
        }
        if (type.variadic)
        {
            out += ", ...";
        }
        return out;
    };
    switch (type.kind)
    {
    case Kind::Int:
        return "int";
    case Kind::Float:
        return "float";
    case Kind::Bool:
        return "bool";
    case Kind::Str:
        return "str";
    case Kind::Bytes:
        return "bytes";
    case Kind::List:
        return "list[" + join() + "]";
    case Kind::Set:
        return "set[" + join() + "]";
    case Kind::Tuple:
        return "tuple[" + join() + "]";
    case Kind::Dict:
        return "dict[" + join() + "]";
    case Kind::Optional:
        return join() + " | None";
    case Kind::NoneType:
        return "None";
    case Kind::Any:
        return "Any";
    }
    return "Any";
}

TypeSpec type_from_annotation(const Expr* annotation)
{
    if (annotation == nullptr)
    {
        return TypeSpec::of(Kind::Int);
    }
    return from_expr(*annotation, 0);
}

bool conforms(const codegate::runtime::Value& v, const TypeSpec& type)
{
    const auto all_conform = [](const std::vector<codegate::runtime::Value>& items, const TypeSpec& t)
    {
        for (const auto& item : items)
        {
            if (!conforms(item, t))
            {
                return false;
            }
        }
        return true;
    };
    switch (type.kind)
    {
    case Kind::Int:
        return v.is_int();
    case Kind::Float:
        return v.is_float() || v.is_int();
    case Kind::Bool:
        return v.is_bool();
    case Kind::Str:
        return v.is_str();
    case Kind::Bytes:
        return std::holds_alternative<codegate::runtime::Bytes>(v.data);
    case Kind::List:
        return v.is_list() && all_conform(v.as_list()->items, type.args.at(0));
    case Kind::Set:
        return v.is_set() && all_conform(v.as_set()->items, type.args.at(0));
    case Kind::Tuple:
    {
        if (!v.is_tuple())
        {
            return false;
        }
        const auto& items = v.as_tuple()->items;
        if (type.variadic)
        {
            return all_conform(items, type.args.at(0));
        }
        if (items.size() != type.args.size())
        {
            return false;
        }
        for (std::size_t i = 0; i < items.size(); ++i)
        {
            if (!conforms(items[i], type.args[i]))
            {
                return false;
            }
        }
        return true;
    }
    case Kind::Dict:
    {
        if (!v.is_dict())
        {
            return false;
        }
        for (const auto& [key, value] : v.as_dict()->items)
        {
            if (!conforms(key, type.args.at(0)) || !conforms(value, type.args.at(1)))
            {
                return false;
            }
        }
        return true;
    }
    case Kind::Optional:
        return v.is_none() || conforms(v, type.args.at(0));
    case Kind::NoneType:
        return v.is_none();
    case Kind::Any:
        return true;
    }
    return false;
}

std::variant<Signature, SignatureError> signature_of(const codegate::parser::Module& module,
                                                     std::string_view name)
{
    const codegate::parser::FunctionDef* found = nullptr;
    for (const auto& stmt : module.body)
    {
        if (const auto* fn = std::get_if<codegate::parser::FunctionDef>(&stmt.node);
            fn != nullptr && fn->name == name)
        {
            found = fn;
        }
    }
    if (found == nullptr)
    {
        return SignatureError{"no top-level function named '" + std::string(name) + "'"};
    }
    for (const auto& p : found->params->kwonly)
    {
        if (p.default_value == nullptr)
        {
            return SignatureError{"keyword-only parameter '" + std::string(p.name) +
                                  "' has no default"};
        }
    }

    Signature sig;
    sig.name = std::string(name);
    for (const auto& p : found->params->positional)
    {
        if (p.default_value != nullptr)
        {
            break;
        }
        sig.params.push_back(Parameter{.name = std::string(p.name),
                                       .type = type_from_annotation(p.annotation.get())});
    }
    if (found->returns.has_value())
    {
        sig.returns = type_from_annotation(&*found->returns);
    }
    return sig;
}

} // namespace codegate::proptest
