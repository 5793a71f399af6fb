#include <codegate/lexer/lexer.h>
#include <codegate/parser/parser.h>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <set>
#include <string_view>
#include <utility>
#include <vector>

namespace codegate::parser
{
namespace
{

using codegate::diag::Finding;
using codegate::lexer::Token;
using codegate::lexer::TokenKind;
using codegate::source::Span;

using ExprResult = std::variant<Expr, Finding>;
using StmtResult = std::variant<Stmt, Finding>;
using StmtsResult = std::variant<std::vector<Stmt>, Finding>;
using ArgsResult = std::variant<std::vector<Argument>, Finding>;
using ParamsResult = std::variant<Parameters, Finding>;
using PartsResult = std::variant<std::vector<FStringPart>, Finding>;
using ClausesResult = std::variant<std::vector<Comprehension>, Finding>;

// Bounds recursion on hostile input such as thousands of nested brackets.
constexpr std::size_t kMaxNesting = 200;

template <typename T> bool failed(const std::variant<T, Finding>& r)
{
    return std::holds_alternative<Finding>(r);
}

template <typename T> Finding take_error(std::variant<T, Finding>& r)
{
    return std::get<Finding>(std::move(r));
}

template <typename T> T take(std::variant<T, Finding>& r)
{
    return std::get<T>(std::move(r));
}

template <typename Node> Expr make_expr(Span span, Node node)
{
    Expr e;
    e.span = span;
    e.node = std::move(node);
    return e;
}

ExprPtr boxed(Expr e)
{
    return std::make_unique<Expr>(std::move(e));
}

Finding error_span(Span span, std::string message)
{
    Finding f;
    f.severity = codegate::diag::Severity::Error;
    f.message = std::move(message);
    f.span = span;
    f.origin = "parser";
    return f;
}

void append_utf8(std::uint32_t cp, std::string& out)
{
    if (cp < 0x80)
    {
        out.push_back(static_cast<char>(cp));
    }
    else if (cp < 0x800)
    {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    else if (cp < 0x10000)
    {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    else
    {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

int hex_value(char c)
{
    if (c >= '0' && c <= '9')
    {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f')
    {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F')
    {
        return c - 'A' + 10;
    }
    return -1;
}

// Decodes backslash escapes of a non-raw literal body. Unknown escapes are kept verbatim.
std::string decode_escapes(std::string_view body, bool is_bytes)
{
    std::string out;
    out.reserve(body.size());
    for (std::size_t i = 0; i < body.size(); ++i)
    {
        const char c = body[i];
        if (c != '\\' || i + 1 >= body.size())
        {
            out.push_back(c);
            continue;
        }

        const char e = body[++i];
        switch (e)
        {
        case '\n':
            break;
        case '\r':
            if (i + 1 < body.size() && body[i + 1] == '\n')
            {
                ++i;
            }
            break;
        case '\\':
        case '\'':
        case '"':
            out.push_back(e);
            break;
        case 'a':
            out.push_back('\a');
            break;
        case 'b':
            out.push_back('\b');
            break;
        case 'f':
            out.push_back('\f');
            break;
        case 'n':
            out.push_back('\n');
            break;
        case 'r':
            out.push_back('\r');
            break;
        case 't':
            out.push_back('\t');
            break;
        case 'v':
            out.push_back('\v');
            break;
        case 'x':
        case 'u':
        case 'U':
        {
            const std::size_t width = e == 'x' ? 2 : (e == 'u' ? 4 : 8);
            if ((e != 'x' && is_bytes) || i + width >= body.size())
            {
                out.push_back('\\');
                out.push_back(e);
                break;
            }
            std::uint32_t cp = 0;
            bool ok = true;
            for (std::size_t k = 1; k <= width; ++k)
            {
                const int h = hex_value(body[i + k]);
                if (h < 0)
                {
                    ok = false;
                    break;
                }
                cp = cp * 16 + static_cast<std::uint32_t>(h);
            }
            if (!ok)
            {
                out.push_back('\\');
                out.push_back(e);
                break;
            }
            i += width;
            if (is_bytes)
            {
                out.push_back(static_cast<char>(cp));
            }
            else
            {
                append_utf8(cp, out);
            }
            break;
        }
        default:
            if (e >= '0' && e <= '7')
            {
                std::uint32_t cp = static_cast<std::uint32_t>(e - '0');
                for (int k = 0; k < 2 && i + 1 < body.size() && body[i + 1] >= '0' &&
                                body[i + 1] <= '7';
                     ++k)
                {
                    cp = cp * 8 + static_cast<std::uint32_t>(body[++i] - '0');
                }
                if (is_bytes)
                {
                    out.push_back(static_cast<char>(cp & 0xFF));
                }
                else
                {
                    append_utf8(cp, out);
                }
                break;
            }
            out.push_back('\\');
            out.push_back(e);
            break;
        }
    }
    return out;
}

struct LiteralShape
{
    bool raw = false;
    bool bytes = false;
    bool fstring = false;
    std::size_t body_start = 0; // offset of the body within the lexeme
    std::size_t body_len = 0;
};

LiteralShape literal_shape(std::string_view lexeme)
{
    LiteralShape shape;
    std::size_t i = 0;
    while (i < lexeme.size() && lexeme[i] != '\'' && lexeme[i] != '"')
    {
        const char c = lexeme[i];
        shape.raw = shape.raw || c == 'r' || c == 'R';
        shape.bytes = shape.bytes || c == 'b' || c == 'B';
        shape.fstring = shape.fstring || c == 'f' || c == 'F';
        ++i;
    }
    const char quote = i < lexeme.size() ? lexeme[i] : '"';
    const bool triple = i + 2 < lexeme.size() && lexeme[i + 1] == quote && lexeme[i + 2] == quote &&
                        lexeme.size() - i >= 6;
    const std::size_t q = triple ? 3 : 1;
    shape.body_start = i + q;
    shape.body_len = lexeme.size() >= shape.body_start + q ? lexeme.size() - shape.body_start - q : 0;
    return shape;
}

struct DepthGuard
{
    explicit DepthGuard(std::size_t& depth) : depth_(depth) { ++depth_; }
    ~DepthGuard() { --depth_; }
    DepthGuard(const DepthGuard&) = delete;
    DepthGuard& operator=(const DepthGuard&) = delete;

  private:
    std::size_t& depth_;
};

class Parser
{
  public:
    Parser(std::span<const Token> tokens, std::size_t depth) : tokens_(tokens), depth_(depth) {}

    [[nodiscard]] ParseResult parse_module()
    {
        Module module;
        while (!is_at_end())
        {
            if (match(TokenKind::Newline))
            {
                continue;
            }
            auto stmts = parse_statement();
            if (failed(stmts))
            {
                return std::vector<Finding>{take_error(stmts)};
            }
            for (auto& s : take(stmts))
            {
                module.body.push_back(std::move(s));
            }
        }
        return module;
    }

    // Whole-input expression, used for f-string replacement fields.
    [[nodiscard]] ExprResult parse_standalone_expression()
    {
        auto expr = check(TokenKind::KwYield) ? parse_yield() : parse_star_expressions();
        if (failed(expr))
        {
            return expr;
        }
        if (!is_at_end())
        {
            return error_at(peek(), "f-string: expecting '}'");
        }
        return expr;
    }

  private:
    std::span<const Token> tokens_;
    std::size_t pos_ = 0;
    std::size_t depth_ = 0;

    [[nodiscard]] const Token& peek() const { return tokens_[pos_]; }

    [[nodiscard]] const Token& peek_at(std::size_t n) const
    {
        const std::size_t i = pos_ + n;
        return i < tokens_.size() ? tokens_[i] : tokens_.back();
    }

    [[nodiscard]] const Token& previous() const { return tokens_[pos_ == 0 ? 0 : pos_ - 1]; }
    [[nodiscard]] bool is_at_end() const { return peek().kind == TokenKind::Eof; }
    [[nodiscard]] bool check(TokenKind kind) const { return peek().kind == kind; }

    const Token& advance()
    {
        if (!is_at_end())
        {
            ++pos_;
        }
        return previous();
    }

    bool match(TokenKind kind)
    {
        if (check(kind))
        {
            advance();
            return true;
        }
        return false;
    }

    [[nodiscard]] Finding error_at(const Token& token, std::string_view message) const
    {
        std::string text(message);
        if (token.kind == TokenKind::Eof)
        {
            text += " (unexpected end of input)";
        }
        else if (token.kind == TokenKind::Indent)
        {
            text = "unexpected indent";
        }
        return error_span(token.span, std::move(text));
    }

    [[nodiscard]] std::optional<Finding> consume(TokenKind kind, std::string_view message)
    {
        if (check(kind))
        {
            advance();
            return std::nullopt;
        }
        return error_at(peek(), message);
    }

    [[nodiscard]] std::optional<Finding> enter()
    {
        if (depth_ >= kMaxNesting)
        {
            return error_at(peek(), "too many nested blocks or expressions");
        }
        return std::nullopt;
    }

    [[nodiscard]] Span span_from(std::size_t start_pos) const
    {
        const std::size_t start = tokens_[start_pos].span.start;
        const std::size_t end = pos_ > start_pos ? previous().span.end : start;
        return Span{.start = start, .end = end};
    }

    [[nodiscard]] bool at_statement_end() const
    {
        return check(TokenKind::Newline) || check(TokenKind::Semicolon) || is_at_end();
    }

    // Tokens after which a trailing comma ends an expression list.
    [[nodiscard]] bool at_list_end() const
    {
        switch (peek().kind)
        {
        case TokenKind::Newline:
        case TokenKind::Semicolon:
        case TokenKind::Eof:
        case TokenKind::RParen:
        case TokenKind::RBracket:
        case TokenKind::RBrace:
        case TokenKind::Equal:
        case TokenKind::Colon:
        case TokenKind::KwIn:
            return true;
        default:
            return codegate::lexer::is_augmented_assign(peek().kind);
        }
    }

    // ---- statements -------------------------------------------------------

    StmtsResult parse_statement()
    {
        switch (peek().kind)
        {
        case TokenKind::KwIf:
        case TokenKind::KwWhile:
        case TokenKind::KwFor:
        case TokenKind::KwTry:
        case TokenKind::KwWith:
        case TokenKind::KwDef:
        case TokenKind::KwClass:
        case TokenKind::At:
        case TokenKind::KwAsync:
        {
            auto stmt = parse_compound();
            if (failed(stmt))
            {
                return take_error(stmt);
            }
            std::vector<Stmt> out;
            out.push_back(take(stmt));
            return out;
        }
        case TokenKind::Indent:
            return error_at(peek(), "unexpected indent");
        case TokenKind::Dedent:
            return error_at(peek(), "unindent does not match any outer indentation level");
        default:
            return parse_simple_statements();
        }
    }

    StmtsResult parse_simple_statements()
    {
        std::vector<Stmt> out;
        while (true)
        {
            auto stmt = parse_simple_statement();
            if (failed(stmt))
            {
                return take_error(stmt);
            }
            out.push_back(take(stmt));
            if (match(TokenKind::Semicolon))
            {
                if (check(TokenKind::Newline) || is_at_end())
                {
                    break;
                }
                continue;
            }
            break;
        }

        if (is_at_end())
        {
            return out;
        }
        if (auto err = consume(TokenKind::Newline, "invalid syntax"))
        {
            return *err;
        }
        return out;
    }

    StmtsResult parse_block()
    {
        if (auto err = enter())
        {
            return *err;
        }
        DepthGuard guard(depth_);

        if (!match(TokenKind::Newline))
        {
            return parse_simple_statements();
        }
        if (!check(TokenKind::Indent))
        {
            return error_at(peek(), "expected an indented block");
        }
        advance();

        std::vector<Stmt> body;
        while (!is_at_end() && !check(TokenKind::Dedent))
        {
            if (match(TokenKind::Newline))
            {
                continue;
            }
            auto stmts = parse_statement();
            if (failed(stmts))
            {
                return take_error(stmts);
            }
            for (auto& s : take(stmts))
            {
                body.push_back(std::move(s));
            }
        }
        (void)match(TokenKind::Dedent);
        return body;
    }

    StmtsResult parse_suite(std::string_view after)
    {
        if (auto err = consume(TokenKind::Colon, "expected ':' after " + std::string(after)))
        {
            return *err;
        }
        return parse_block();
    }

    StmtResult parse_simple_statement()
    {
        const std::size_t start = pos_;
        Stmt stmt;
        switch (peek().kind)
        {
        case TokenKind::KwPass:
            advance();
            stmt.node = PassStmt{};
            break;
        case TokenKind::KwBreak:
            advance();
            stmt.node = BreakStmt{};
            break;
        case TokenKind::KwContinue:
            advance();
            stmt.node = ContinueStmt{};
            break;
        case TokenKind::KwReturn:
        {
            advance();
            ReturnStmt ret;
            if (!at_statement_end())
            {
                auto value = parse_star_expressions();
                if (failed(value))
                {
                    return take_error(value);
                }
                ret.value = take(value);
            }
            stmt.node = std::move(ret);
            break;
        }
        case TokenKind::KwRaise:
        {
            advance();
            RaiseStmt raise;
            if (!at_statement_end())
            {
                auto exc = parse_expression();
                if (failed(exc))
                {
                    return take_error(exc);
                }
                raise.exc = take(exc);
                if (match(TokenKind::KwFrom))
                {
                    auto cause = parse_expression();
                    if (failed(cause))
                    {
                        return take_error(cause);
                    }
                    raise.cause = take(cause);
                }
            }
            stmt.node = std::move(raise);
            break;
        }
        case TokenKind::KwGlobal:
        case TokenKind::KwNonlocal:
        {
            const bool global = advance().kind == TokenKind::KwGlobal;
            std::vector<std::string_view> names;
            do
            {
                if (!check(TokenKind::Name))
                {
                    return error_at(peek(), "expected name");
                }
                names.push_back(advance().lexeme);
            } while (match(TokenKind::Comma));
            if (global)
            {
                stmt.node = GlobalStmt{.names = std::move(names)};
            }
            else
            {
                stmt.node = NonlocalStmt{.names = std::move(names)};
            }
            break;
        }
        case TokenKind::KwDel:
        {
            advance();
            DelStmt del;
            do
            {
                if (at_statement_end())
                {
                    break;
                }
                auto target = parse_bitwise_or();
                if (failed(target))
                {
                    return take_error(target);
                }
                Expr t = take(target);
                if (auto err = check_target(t, "delete"))
                {
                    return *err;
                }
                del.targets.push_back(std::move(t));
            } while (match(TokenKind::Comma));
            if (del.targets.empty())
            {
                return error_at(peek(), "invalid syntax");
            }
            stmt.node = std::move(del);
            break;
        }
        case TokenKind::KwAssert:
        {
            advance();
            auto test = parse_expression();
            if (failed(test))
            {
                return take_error(test);
            }
            AssertStmt a{.test = take(test), .msg = std::nullopt};
            if (match(TokenKind::Comma))
            {
                auto msg = parse_expression();
                if (failed(msg))
                {
                    return take_error(msg);
                }
                a.msg = take(msg);
            }
            stmt.node = std::move(a);
            break;
        }
        case TokenKind::KwImport:
            return parse_import();
        case TokenKind::KwFrom:
            return parse_from_import();
        default:
            return parse_expression_statement();
        }
        stmt.span = span_from(start);
        return stmt;
    }

    std::variant<ImportAlias, Finding> parse_dotted_alias()
    {
        const std::size_t start = pos_;
        if (!check(TokenKind::Name))
        {
            return error_at(peek(), "expected module name");
        }
        ImportAlias alias;
        alias.name = std::string(advance().lexeme);
        while (match(TokenKind::Dot))
        {
            if (!check(TokenKind::Name))
            {
                return error_at(peek(), "expected name after '.'");
            }
            alias.name += ".";
            alias.name += advance().lexeme;
        }
        if (match(TokenKind::KwAs))
        {
            if (!check(TokenKind::Name))
            {
                return error_at(peek(), "expected name after 'as'");
            }
            alias.asname = advance().lexeme;
        }
        alias.span = span_from(start);
        return alias;
    }

    StmtResult parse_import()
    {
        const std::size_t start = pos_;
        advance();
        ImportStmt imp;
        do
        {
            auto alias = parse_dotted_alias();
            if (failed(alias))
            {
                return take_error(alias);
            }
            imp.names.push_back(take(alias));
        } while (match(TokenKind::Comma));

        Stmt stmt;
        stmt.node = std::move(imp);
        stmt.span = span_from(start);
        return stmt;
    }

    StmtResult parse_from_import()
    {
        const std::size_t start = pos_;
        advance();
        ImportFromStmt imp;
        while (check(TokenKind::Dot) || check(TokenKind::Ellipsis))
        {
            imp.level += advance().kind == TokenKind::Dot ? 1 : 3;
        }
        if (check(TokenKind::Name))
        {
            imp.module = std::string(advance().lexeme);
            while (match(TokenKind::Dot))
            {
                if (!check(TokenKind::Name))
                {
                    return error_at(peek(), "expected name after '.'");
                }
                imp.module += ".";
                imp.module += advance().lexeme;
            }
        }
        else if (imp.level == 0)
        {
            return error_at(peek(), "expected module name after 'from'");
        }

        if (auto err = consume(TokenKind::KwImport, "expected 'import'"))
        {
            return *err;
        }

        if (check(TokenKind::Star))
        {
            const Token& star = advance();
            imp.names.push_back(ImportAlias{.span = star.span, .name = "*", .asname = std::nullopt});
        }
        else
        {
            const bool parens = match(TokenKind::LParen);
            do
            {
                if (parens && check(TokenKind::RParen))
                {
                    break;
                }
                const std::size_t alias_start = pos_;
                if (!check(TokenKind::Name))
                {
                    return error_at(peek(), "expected name to import");
                }
                ImportAlias alias;
                alias.name = std::string(advance().lexeme);
                if (match(TokenKind::KwAs))
                {
                    if (!check(TokenKind::Name))
                    {
                        return error_at(peek(), "expected name after 'as'");
                    }
                    alias.asname = advance().lexeme;
                }
                alias.span = span_from(alias_start);
                imp.names.push_back(std::move(alias));
            } while (match(TokenKind::Comma));
            if (parens)
            {
                if (auto err = consume(TokenKind::RParen, "expected ')'"))
                {
                    return *err;
                }
            }
            if (imp.names.empty())
            {
                return error_at(peek(), "expected name to import");
            }
        }

        Stmt stmt;
        stmt.node = std::move(imp);
        stmt.span = span_from(start);
        return stmt;
    }

    [[nodiscard]] static std::string_view describe(const Expr& e)
    {
        return std::visit(
            [](const auto& node) -> std::string_view
            {
                using Node = std::decay_t<decltype(node)>;
                if constexpr (std::is_same_v<Node, CallExpr>)
                {
                    return "function call";
                }
                else if constexpr (std::is_same_v<Node, ConstantExpr> ||
                                   std::is_same_v<Node, NumberExpr> ||
                                   std::is_same_v<Node, StringExpr> ||
                                   std::is_same_v<Node, FStringExpr>)
                {
                    return "literal";
                }
                else if constexpr (std::is_same_v<Node, CompareExpr>)
                {
                    return "comparison";
                }
                else if constexpr (std::is_same_v<Node, LambdaExpr>)
                {
                    return "lambda";
                }
                else
                {
                    return "expression";
                }
            },
            e.node);
    }

    std::optional<Finding> check_target(const Expr& e, std::string_view verb) const
    {
        if (std::holds_alternative<NameExpr>(e.node) ||
            std::holds_alternative<AttributeExpr>(e.node) ||
            std::holds_alternative<SubscriptExpr>(e.node))
        {
            return std::nullopt;
        }
        if (const auto* star = std::get_if<StarredExpr>(&e.node))
        {
            return check_target(*star->value, verb);
        }
        const std::vector<Expr>* elts = nullptr;
        if (const auto* t = std::get_if<TupleExpr>(&e.node))
        {
            elts = &t->elts;
        }
        else if (const auto* l = std::get_if<ListExpr>(&e.node))
        {
            elts = &l->elts;
        }
        if (elts != nullptr)
        {
            for (const auto& child : *elts)
            {
                if (auto err = check_target(child, verb))
                {
                    return err;
                }
            }
            return std::nullopt;
        }
        return error_span(e.span, "cannot " + std::string(verb) + " " + std::string(describe(e)));
    }

    StmtResult parse_expression_statement()
    {
        const std::size_t start = pos_;
        auto first = check(TokenKind::KwYield) ? parse_yield() : parse_star_expressions();
        if (failed(first))
        {
            return take_error(first);
        }
        Expr lhs = take(first);

        Stmt stmt;
        if (check(TokenKind::Equal))
        {
            AssignStmt assign{.targets = {}, .value = Expr{}};
            Expr current = std::move(lhs);
            while (match(TokenKind::Equal))
            {
                if (auto err = check_target(current, "assign to"))
                {
                    return *err;
                }
                assign.targets.push_back(std::move(current));
                auto rhs = check(TokenKind::KwYield) ? parse_yield() : parse_star_expressions();
                if (failed(rhs))
                {
                    return take_error(rhs);
                }
                current = take(rhs);
            }
            assign.value = std::move(current);
            stmt.node = std::move(assign);
        }
        else if (codegate::lexer::is_augmented_assign(peek().kind))
        {
            const TokenKind op = codegate::lexer::augmented_base(advance().kind);
            if (!std::holds_alternative<NameExpr>(lhs.node) &&
                !std::holds_alternative<AttributeExpr>(lhs.node) &&
                !std::holds_alternative<SubscriptExpr>(lhs.node))
            {
                return error_span(lhs.span, "illegal expression for augmented assignment");
            }
            auto rhs = check(TokenKind::KwYield) ? parse_yield() : parse_star_expressions();
            if (failed(rhs))
            {
                return take_error(rhs);
            }
            stmt.node = AugAssignStmt{.target = std::move(lhs), .op = op, .value = take(rhs)};
        }
        else if (match(TokenKind::Colon))
        {
            if (!std::holds_alternative<NameExpr>(lhs.node) &&
                !std::holds_alternative<AttributeExpr>(lhs.node) &&
                !std::holds_alternative<SubscriptExpr>(lhs.node))
            {
                return error_span(lhs.span, "illegal target for annotation");
            }
            auto annotation = parse_expression();
            if (failed(annotation))
            {
                return take_error(annotation);
            }
            AnnAssignStmt ann{
                .target = std::move(lhs), .annotation = take(annotation), .value = std::nullopt};
            if (match(TokenKind::Equal))
            {
                auto value = check(TokenKind::KwYield) ? parse_yield() : parse_star_expressions();
                if (failed(value))
                {
                    return take_error(value);
                }
                ann.value = take(value);
            }
            stmt.node = std::move(ann);
        }
        else
        {
            stmt.node = ExprStmt{.value = std::move(lhs)};
        }

        stmt.span = span_from(start);
        return stmt;
    }

    StmtResult parse_compound()
    {
        switch (peek().kind)
        {
        case TokenKind::KwIf:
            return parse_if();
        case TokenKind::KwWhile:
            return parse_while();
        case TokenKind::KwFor:
            return parse_for(pos_, false);
        case TokenKind::KwTry:
            return parse_try();
        case TokenKind::KwWith:
            return parse_with(pos_, false);
        case TokenKind::KwDef:
            return parse_def(pos_, {}, false);
        case TokenKind::KwClass:
            return parse_class(pos_, {});
        case TokenKind::At:
            return parse_decorated();
        case TokenKind::KwAsync:
        {
            const std::size_t start = pos_;
            advance();
            if (check(TokenKind::KwDef))
            {
                return parse_def(start, {}, true);
            }
            if (check(TokenKind::KwFor))
            {
                return parse_for(start, true);
            }
            if (check(TokenKind::KwWith))
            {
                return parse_with(start, true);
            }
            return error_at(peek(), "expected 'def', 'for' or 'with' after 'async'");
        }
        default:
            return error_at(peek(), "invalid syntax");
        }
    }

    StmtResult parse_if()
    {
        const std::size_t start = pos_;
        advance(); // if / elif
        auto test = parse_named_expression();
        if (failed(test))
        {
            return take_error(test);
        }
        auto body = parse_suite("if condition");
        if (failed(body))
        {
            return take_error(body);
        }

        IfStmt node{.test = take(test), .body = take(body), .orelse = {}};
        if (check(TokenKind::KwElif))
        {
            auto nested = parse_if();
            if (failed(nested))
            {
                return take_error(nested);
            }
            node.orelse.push_back(take(nested));
        }
        else if (match(TokenKind::KwElse))
        {
            auto orelse = parse_suite("'else'");
            if (failed(orelse))
            {
                return take_error(orelse);
            }
            node.orelse = take(orelse);
        }

        Stmt stmt;
        stmt.node = std::move(node);
        stmt.span = span_from(start);
        return stmt;
    }

    StmtResult parse_while()
    {
        const std::size_t start = pos_;
        advance();
        auto test = parse_named_expression();
        if (failed(test))
        {
            return take_error(test);
        }
        auto body = parse_suite("while condition");
        if (failed(body))
        {
            return take_error(body);
        }
        WhileStmt node{.test = take(test), .body = take(body), .orelse = {}};
        if (match(TokenKind::KwElse))
        {
            auto orelse = parse_suite("'else'");
            if (failed(orelse))
            {
                return take_error(orelse);
            }
            node.orelse = take(orelse);
        }

        Stmt stmt;
        stmt.node = std::move(node);
        stmt.span = span_from(start);
        return stmt;
    }

    StmtResult parse_for(std::size_t start, bool is_async)
    {
        advance();
        auto target = parse_target_list();
        if (failed(target))
        {
            return take_error(target);
        }
        if (auto err = consume(TokenKind::KwIn, "expected 'in' in for statement"))
        {
            return *err;
        }
        auto iter = parse_star_expressions();
        if (failed(iter))
        {
            return take_error(iter);
        }
        auto body = parse_suite("for clause");
        if (failed(body))
        {
            return take_error(body);
        }
        ForStmt node{.target = take(target),
                     .iter = take(iter),
                     .body = take(body),
                     .orelse = {},
                     .is_async = is_async};
        if (match(TokenKind::KwElse))
        {
            auto orelse = parse_suite("'else'");
            if (failed(orelse))
            {
                return take_error(orelse);
            }
            node.orelse = take(orelse);
        }

        Stmt stmt;
        stmt.node = std::move(node);
        stmt.span = span_from(start);
        return stmt;
    }

    StmtResult parse_try()
    {
        const std::size_t start = pos_;
        advance();
        auto body = parse_suite("'try'");
        if (failed(body))
        {
            return take_error(body);
        }
        TryStmt node;
        node.body = take(body);

        while (check(TokenKind::KwExcept))
        {
            const std::size_t handler_start = pos_;
            advance();
            (void)match(TokenKind::Star);
            ExceptHandler handler;
            if (!check(TokenKind::Colon))
            {
                auto type = parse_expression();
                if (failed(type))
                {
                    return take_error(type);
                }
                handler.type = take(type);
                if (check(TokenKind::Comma))
                {
                    return error_at(peek(), "multiple exception types must be parenthesized");
                }
                if (match(TokenKind::KwAs))
                {
                    if (!check(TokenKind::Name))
                    {
                        return error_at(peek(), "expected name after 'as'");
                    }
                    handler.name = advance().lexeme;
                }
            }
            auto handler_body = parse_suite("'except'");
            if (failed(handler_body))
            {
                return take_error(handler_body);
            }
            handler.body = take(handler_body);
            handler.span = span_from(handler_start);
            node.handlers.push_back(std::move(handler));
        }

        if (!node.handlers.empty() && match(TokenKind::KwElse))
        {
            auto orelse = parse_suite("'else'");
            if (failed(orelse))
            {
                return take_error(orelse);
            }
            node.orelse = take(orelse);
        }

        if (match(TokenKind::KwFinally))
        {
            auto finalbody = parse_suite("'finally'");
            if (failed(finalbody))
            {
                return take_error(finalbody);
            }
            node.finalbody = take(finalbody);
        }
        else if (node.handlers.empty())
        {
            return error_at(peek(), "expected 'except' or 'finally' block");
        }

        Stmt stmt;
        stmt.node = std::move(node);
        stmt.span = span_from(start);
        return stmt;
    }

    StmtResult parse_with(std::size_t start, bool is_async)
    {
        advance();
        WithStmt node;
        node.is_async = is_async;
        do
        {
            auto context = parse_expression();
            if (failed(context))
            {
                return take_error(context);
            }
            WithItem item{.context = take(context), .target = std::nullopt};
            if (match(TokenKind::KwAs))
            {
                auto target = parse_target();
                if (failed(target))
                {
                    return take_error(target);
                }
                item.target = take(target);
            }
            node.items.push_back(std::move(item));
        } while (match(TokenKind::Comma));

        auto body = parse_suite("with statement");
        if (failed(body))
        {
            return take_error(body);
        }
        node.body = take(body);

        Stmt stmt;
        stmt.node = std::move(node);
        stmt.span = span_from(start);
        return stmt;
    }

    StmtResult parse_decorated()
    {
        const std::size_t start = pos_;
        std::vector<Expr> decorators;
        while (match(TokenKind::At))
        {
            auto dec = parse_named_expression();
            if (failed(dec))
            {
                return take_error(dec);
            }
            decorators.push_back(take(dec));
            if (auto err = consume(TokenKind::Newline, "expected newline after decorator"))
            {
                return *err;
            }
        }

        if (check(TokenKind::KwDef))
        {
            return parse_def(start, std::move(decorators), false);
        }
        if (check(TokenKind::KwAsync) && peek_at(1).kind == TokenKind::KwDef)
        {
            advance();
            return parse_def(start, std::move(decorators), true);
        }
        if (check(TokenKind::KwClass))
        {
            return parse_class(start, std::move(decorators));
        }
        return error_at(peek(), "expected 'def' or 'class' after decorator");
    }

    StmtResult parse_def(std::size_t start, std::vector<Expr> decorators, bool is_async)
    {
        advance(); // def
        if (!check(TokenKind::Name))
        {
            return error_at(peek(), "expected function name after 'def'");
        }
        const Token& name = advance();
        if (auto err = consume(TokenKind::LParen, "expected '(' after function name"))
        {
            return *err;
        }
        auto params = parse_parameters(TokenKind::RParen, true);
        if (failed(params))
        {
            return take_error(params);
        }
        if (auto err = consume(TokenKind::RParen, "expected ')' after parameters"))
        {
            return *err;
        }

        FunctionDef def;
        def.name = name.lexeme;
        def.name_span = name.span;
        def.params = std::make_shared<Parameters>(take(params));
        def.decorators = std::move(decorators);
        def.is_async = is_async;
        if (match(TokenKind::Arrow))
        {
            auto returns = parse_expression();
            if (failed(returns))
            {
                return take_error(returns);
            }
            def.returns = take(returns);
        }

        auto body = parse_suite("function signature");
        if (failed(body))
        {
            return take_error(body);
        }
        def.body = std::make_shared<std::vector<Stmt>>(take(body));

        Stmt stmt;
        stmt.node = std::move(def);
        stmt.span = span_from(start);
        return stmt;
    }

    StmtResult parse_class(std::size_t start, std::vector<Expr> decorators)
    {
        advance(); // class
        if (!check(TokenKind::Name))
        {
            return error_at(peek(), "expected class name after 'class'");
        }
        ClassDef cls;
        cls.name = advance().lexeme;
        cls.decorators = std::move(decorators);
        if (match(TokenKind::LParen))
        {
            auto args = parse_arguments();
            if (failed(args))
            {
                return take_error(args);
            }
            cls.bases = take(args);
        }
        auto body = parse_suite("class name");
        if (failed(body))
        {
            return take_error(body);
        }
        cls.body = take(body);

        Stmt stmt;
        stmt.node = std::move(cls);
        stmt.span = span_from(start);
        return stmt;
    }

    std::variant<Param, Finding> parse_param(bool allow_annotation, bool allow_default)
    {
        const std::size_t start = pos_;
        if (!check(TokenKind::Name))
        {
            return error_at(peek(), "expected parameter name");
        }
        Param p;
        p.name = advance().lexeme;
        if (allow_annotation && match(TokenKind::Colon))
        {
            auto annotation = parse_expression();
            if (failed(annotation))
            {
                return take_error(annotation);
            }
            p.annotation = boxed(take(annotation));
        }
        if (allow_default && match(TokenKind::Equal))
        {
            auto def = parse_expression();
            if (failed(def))
            {
                return take_error(def);
            }
            p.default_value = boxed(take(def));
        }
        p.span = span_from(start);
        return p;
    }

    ParamsResult parse_parameters(TokenKind end, bool allow_annotations)
    {
        Parameters params;
        bool seen_star = false;
        bool seen_default = false;
        std::set<std::string_view> names;

        auto remember = [&](const Param& p) -> std::optional<Finding>
        {
            if (!names.insert(p.name).second)
            {
                return error_span(p.span, "duplicate argument '" + std::string(p.name) +
                                              "' in function definition");
            }
            return std::nullopt;
        };

        while (!check(end))
        {
            if (match(TokenKind::Slash))
            {
                if (seen_star || params.positional.empty())
                {
                    return error_at(previous(), "invalid syntax");
                }
            }
            else if (match(TokenKind::DoubleStar))
            {
                auto p = parse_param(allow_annotations, false);
                if (failed(p))
                {
                    return take_error(p);
                }
                params.kwarg = take(p);
                if (auto err = remember(*params.kwarg))
                {
                    return *err;
                }
                (void)match(TokenKind::Comma);
                if (!check(end))
                {
                    return error_at(peek(), "arguments cannot follow var-keyword argument");
                }
                break;
            }
            else if (match(TokenKind::Star))
            {
                if (seen_star)
                {
                    return error_at(previous(), "* argument may appear only once");
                }
                seen_star = true;
                if (check(TokenKind::Name))
                {
                    auto p = parse_param(allow_annotations, false);
                    if (failed(p))
                    {
                        return take_error(p);
                    }
                    params.vararg = take(p);
                    if (auto err = remember(*params.vararg))
                    {
                        return *err;
                    }
                }
            }
            else
            {
                auto p = parse_param(allow_annotations, true);
                if (failed(p))
                {
                    return take_error(p);
                }
                Param param = take(p);
                if (auto err = remember(param))
                {
                    return *err;
                }
                if (seen_star)
                {
                    params.kwonly.push_back(std::move(param));
                }
                else
                {
                    if (param.default_value != nullptr)
                    {
                        seen_default = true;
                    }
                    else if (seen_default)
                    {
                        return error_span(param.span,
                                          "non-default argument follows default argument");
                    }
                    params.positional.push_back(std::move(param));
                }
            }

            if (!match(TokenKind::Comma))
            {
                break;
            }
        }
        return params;
    }

    // ---- expressions ------------------------------------------------------

    ExprResult parse_star_expressions()
    {
        const std::size_t start = pos_;
        auto first = parse_star_expression();
        if (failed(first) || !check(TokenKind::Comma))
        {
            return first;
        }

        TupleExpr tuple;
        tuple.elts.push_back(take(first));
        while (match(TokenKind::Comma))
        {
            if (at_list_end())
            {
                break;
            }
            auto next = parse_star_expression();
            if (failed(next))
            {
                return next;
            }
            tuple.elts.push_back(take(next));
        }
        return make_expr(span_from(start), std::move(tuple));
    }

    ExprResult parse_star_expression()
    {
        const std::size_t start = pos_;
        if (match(TokenKind::Star))
        {
            auto value = parse_bitwise_or();
            if (failed(value))
            {
                return value;
            }
            return make_expr(span_from(start), StarredExpr{.value = boxed(take(value))});
        }
        return parse_named_expression();
    }

    ExprResult parse_named_expression()
    {
        const std::size_t start = pos_;
        if (check(TokenKind::Name) && peek_at(1).kind == TokenKind::Walrus)
        {
            const std::string_view target = advance().lexeme;
            advance();
            auto value = parse_expression();
            if (failed(value))
            {
                return value;
            }
            return make_expr(span_from(start),
                             NamedExpr{.target = target, .value = boxed(take(value))});
        }
        return parse_expression();
    }

    ExprResult parse_expression()
    {
        if (auto err = enter())
        {
            return *err;
        }
        DepthGuard guard(depth_);

        const std::size_t start = pos_;
        if (check(TokenKind::KwLambda))
        {
            return parse_lambda();
        }

        auto body = parse_disjunction();
        if (failed(body) || !check(TokenKind::KwIf))
        {
            return body;
        }
        advance();
        auto test = parse_disjunction();
        if (failed(test))
        {
            return test;
        }
        if (auto err = consume(TokenKind::KwElse, "expected 'else' after 'if' expression"))
        {
            return *err;
        }
        auto orelse = parse_expression();
        if (failed(orelse))
        {
            return orelse;
        }
        return make_expr(span_from(start), IfExpr{.test = boxed(take(test)),
                                                  .body = boxed(take(body)),
                                                  .orelse = boxed(take(orelse))});
    }

    ExprResult parse_lambda()
    {
        const std::size_t start = pos_;
        advance();
        auto params = parse_parameters(TokenKind::Colon, false);
        if (failed(params))
        {
            return take_error(params);
        }
        if (auto err = consume(TokenKind::Colon, "expected ':' in lambda"))
        {
            return *err;
        }
        auto body = parse_expression();
        if (failed(body))
        {
            return body;
        }
        return make_expr(span_from(start),
                         LambdaExpr{.params = std::make_shared<Parameters>(take(params)),
                                    .body = std::make_shared<Expr>(take(body))});
    }

    ExprResult parse_bool_op(TokenKind op)
    {
        const std::size_t start = pos_;
        auto first = op == TokenKind::KwOr ? parse_bool_op(TokenKind::KwAnd) : parse_inversion();
        if (failed(first) || !check(op))
        {
            return first;
        }
        BoolOpExpr node{.op = op, .values = {}};
        node.values.push_back(take(first));
        while (match(op))
        {
            auto next = op == TokenKind::KwOr ? parse_bool_op(TokenKind::KwAnd) : parse_inversion();
            if (failed(next))
            {
                return next;
            }
            node.values.push_back(take(next));
        }
        return make_expr(span_from(start), std::move(node));
    }

    ExprResult parse_disjunction() { return parse_bool_op(TokenKind::KwOr); }

    ExprResult parse_inversion()
    {
        const std::size_t start = pos_;
        if (match(TokenKind::KwNot))
        {
            if (auto err = enter())
            {
                return *err;
            }
            DepthGuard guard(depth_);
            auto operand = parse_inversion();
            if (failed(operand))
            {
                return operand;
            }
            return make_expr(span_from(start),
                             UnaryExpr{.op = TokenKind::KwNot, .operand = boxed(take(operand))});
        }
        return parse_comparison();
    }

    std::optional<CmpOp> match_comparison()
    {
        switch (peek().kind)
        {
        case TokenKind::EqualEqual:
            advance();
            return CmpOp::Eq;
        case TokenKind::NotEqual:
            advance();
            return CmpOp::NotEq;
        case TokenKind::Less:
            advance();
            return CmpOp::Lt;
        case TokenKind::LessEqual:
            advance();
            return CmpOp::LtE;
        case TokenKind::Greater:
            advance();
            return CmpOp::Gt;
        case TokenKind::GreaterEqual:
            advance();
            return CmpOp::GtE;
        case TokenKind::KwIn:
            advance();
            return CmpOp::In;
        case TokenKind::KwNot:
            if (peek_at(1).kind == TokenKind::KwIn)
            {
                pos_ += 2;
                return CmpOp::NotIn;
            }
            return std::nullopt;
        case TokenKind::KwIs:
            advance();
            if (match(TokenKind::KwNot))
            {
                return CmpOp::IsNot;
            }
            return CmpOp::Is;
        default:
            return std::nullopt;
        }
    }

    ExprResult parse_comparison()
    {
        const std::size_t start = pos_;
        auto first = parse_bitwise_or();
        if (failed(first))
        {
            return first;
        }

        CompareExpr node;
        while (auto op = match_comparison())
        {
            auto rhs = parse_bitwise_or();
            if (failed(rhs))
            {
                return rhs;
            }
            node.ops.push_back(*op);
            node.comparators.push_back(take(rhs));
        }
        if (node.ops.empty())
        {
            return first;
        }
        node.left = boxed(take(first));
        return make_expr(span_from(start), std::move(node));
    }

    // Binary precedence levels from `|` (0) down to multiplicative (5).
    [[nodiscard]] static bool level_has(int level, TokenKind kind)
    {
        switch (level)
        {
        case 0:
            return kind == TokenKind::Pipe;
        case 1:
            return kind == TokenKind::Caret;
        case 2:
            return kind == TokenKind::Amper;
        case 3:
            return kind == TokenKind::LeftShift || kind == TokenKind::RightShift;
        case 4:
            return kind == TokenKind::Plus || kind == TokenKind::Minus;
        case 5:
            return kind == TokenKind::Star || kind == TokenKind::Slash ||
                   kind == TokenKind::DoubleSlash || kind == TokenKind::Percent ||
                   kind == TokenKind::At;
        default:
            return false;
        }
    }

    ExprResult parse_binary(int level)
    {
        if (level > 5)
        {
            return parse_factor();
        }
        const std::size_t start = pos_;
        auto lhs = parse_binary(level + 1);
        if (failed(lhs))
        {
            return lhs;
        }
        Expr expr = take(lhs);
        while (level_has(level, peek().kind))
        {
            const TokenKind op = advance().kind;
            auto rhs = parse_binary(level + 1);
            if (failed(rhs))
            {
                return rhs;
            }
            expr = make_expr(span_from(start), BinaryExpr{.op = op,
                                                          .lhs = boxed(std::move(expr)),
                                                          .rhs = boxed(take(rhs))});
        }
        return expr;
    }

    ExprResult parse_bitwise_or() { return parse_binary(0); }

    ExprResult parse_factor()
    {
        const std::size_t start = pos_;
        if (check(TokenKind::Plus) || check(TokenKind::Minus) || check(TokenKind::Tilde))
        {
            if (auto err = enter())
            {
                return *err;
            }
            DepthGuard guard(depth_);
            const TokenKind op = advance().kind;
            auto operand = parse_factor();
            if (failed(operand))
            {
                return operand;
            }
            return make_expr(span_from(start),
                             UnaryExpr{.op = op, .operand = boxed(take(operand))});
        }
        return parse_power();
    }

    ExprResult parse_power()
    {
        const std::size_t start = pos_;
        ExprResult base = [&]() -> ExprResult
        {
            if (match(TokenKind::KwAwait))
            {
                auto value = parse_primary();
                if (failed(value))
                {
                    return value;
                }
                return make_expr(span_from(start), AwaitExpr{.value = boxed(take(value))});
            }
            return parse_primary();
        }();
        if (failed(base) || !match(TokenKind::DoubleStar))
        {
            return base;
        }
        auto exponent = parse_factor();
        if (failed(exponent))
        {
            return exponent;
        }
        return make_expr(span_from(start), BinaryExpr{.op = TokenKind::DoubleStar,
                                                      .lhs = boxed(take(base)),
                                                      .rhs = boxed(take(exponent))});
    }

    ExprResult parse_primary()
    {
        const std::size_t start = pos_;
        auto atom = parse_atom();
        if (failed(atom))
        {
            return atom;
        }
        Expr expr = take(atom);

        while (true)
        {
            if (match(TokenKind::Dot))
            {
                if (!check(TokenKind::Name))
                {
                    return error_at(peek(), "expected attribute name after '.'");
                }
                const Token& attr = advance();
                expr = make_expr(span_from(start), AttributeExpr{.value = boxed(std::move(expr)),
                                                                 .attr = attr.lexeme,
                                                                 .attr_span = attr.span});
                continue;
            }
            if (match(TokenKind::LParen))
            {
                auto args = parse_arguments();
                if (failed(args))
                {
                    return take_error(args);
                }
                expr = make_expr(span_from(start),
                                 CallExpr{.callee = boxed(std::move(expr)), .args = take(args)});
                continue;
            }
            if (match(TokenKind::LBracket))
            {
                auto index = parse_slices();
                if (failed(index))
                {
                    return index;
                }
                if (auto err = consume(TokenKind::RBracket, "expected ']' after subscript"))
                {
                    return *err;
                }
                expr = make_expr(span_from(start), SubscriptExpr{.value = boxed(std::move(expr)),
                                                                 .index = boxed(take(index))});
                continue;
            }
            break;
        }
        return expr;
    }

    // Called after '('; consumes the closing ')'.
    ArgsResult parse_arguments()
    {
        if (auto err = enter())
        {
            return *err;
        }
        DepthGuard guard(depth_);

        std::vector<Argument> args;
        while (!check(TokenKind::RParen))
        {
            const std::size_t start = pos_;
            Argument arg;
            if (match(TokenKind::Star))
            {
                arg.kind = Argument::Kind::Star;
                auto value = parse_expression();
                if (failed(value))
                {
                    return take_error(value);
                }
                arg.value = boxed(take(value));
            }
            else if (match(TokenKind::DoubleStar))
            {
                arg.kind = Argument::Kind::DoubleStar;
                auto value = parse_expression();
                if (failed(value))
                {
                    return take_error(value);
                }
                arg.value = boxed(take(value));
            }
            else if (check(TokenKind::Name) && peek_at(1).kind == TokenKind::Equal)
            {
                arg.kind = Argument::Kind::Keyword;
                arg.keyword = advance().lexeme;
                advance();
                auto value = parse_expression();
                if (failed(value))
                {
                    return take_error(value);
                }
                arg.value = boxed(take(value));
            }
            else
            {
                auto value = parse_named_expression();
                if (failed(value))
                {
                    return take_error(value);
                }
                Expr v = take(value);
                if (check(TokenKind::KwFor) || check(TokenKind::KwAsync))
                {
                    auto gen = parse_comprehension_tail(start, ComprehensionExpr::Kind::Generator,
                                                        std::move(v), nullptr);
                    if (failed(gen))
                    {
                        return take_error(gen);
                    }
                    v = take(gen);
                }
                arg.value = boxed(std::move(v));
            }
            arg.span = span_from(start);
            args.push_back(std::move(arg));
            if (!match(TokenKind::Comma))
            {
                break;
            }
        }
        if (auto err = consume(TokenKind::RParen, "expected ')' after arguments"))
        {
            return *err;
        }
        return args;
    }

    ExprResult parse_slice()
    {
        const std::size_t start = pos_;
        SliceExpr slice;
        if (!check(TokenKind::Colon))
        {
            auto lower = parse_star_expression();
            if (failed(lower) || !check(TokenKind::Colon))
            {
                return lower;
            }
            slice.lower = boxed(take(lower));
        }
        advance(); // ':'
        if (!check(TokenKind::Colon) && !check(TokenKind::Comma) && !check(TokenKind::RBracket))
        {
            auto upper = parse_expression();
            if (failed(upper))
            {
                return upper;
            }
            slice.upper = boxed(take(upper));
        }
        if (match(TokenKind::Colon))
        {
            if (!check(TokenKind::Comma) && !check(TokenKind::RBracket))
            {
                auto step = parse_expression();
                if (failed(step))
                {
                    return step;
                }
                slice.step = boxed(take(step));
            }
        }
        return make_expr(span_from(start), std::move(slice));
    }

    ExprResult parse_slices()
    {
        const std::size_t start = pos_;
        auto first = parse_slice();
        if (failed(first) || !check(TokenKind::Comma))
        {
            return first;
        }
        TupleExpr tuple;
        tuple.elts.push_back(take(first));
        while (match(TokenKind::Comma))
        {
            if (check(TokenKind::RBracket))
            {
                break;
            }
            auto next = parse_slice();
            if (failed(next))
            {
                return next;
            }
            tuple.elts.push_back(take(next));
        }
        return make_expr(span_from(start), std::move(tuple));
    }

    ExprResult parse_target()
    {
        const std::size_t start = pos_;
        if (match(TokenKind::Star))
        {
            auto value = parse_bitwise_or();
            if (failed(value))
            {
                return value;
            }
            return make_expr(span_from(start), StarredExpr{.value = boxed(take(value))});
        }
        auto t = parse_bitwise_or();
        if (failed(t))
        {
            return t;
        }
        if (auto err = check_target(std::get<Expr>(t), "assign to"))
        {
            return *err;
        }
        return t;
    }

    // Targets of `for` loops and comprehensions; stops before `in`.
    ExprResult parse_target_list()
    {
        const std::size_t start = pos_;
        auto first = parse_target();
        if (failed(first) || !check(TokenKind::Comma))
        {
            return first;
        }
        TupleExpr tuple;
        tuple.elts.push_back(take(first));
        while (match(TokenKind::Comma))
        {
            if (check(TokenKind::KwIn))
            {
                break;
            }
            auto next = parse_target();
            if (failed(next))
            {
                return next;
            }
            tuple.elts.push_back(take(next));
        }
        return make_expr(span_from(start), std::move(tuple));
    }

    ClausesResult parse_comprehension_clauses()
    {
        std::vector<Comprehension> clauses;
        while (check(TokenKind::KwFor) ||
               (check(TokenKind::KwAsync) && peek_at(1).kind == TokenKind::KwFor))
        {
            Comprehension clause;
            clause.is_async = match(TokenKind::KwAsync);
            advance(); // for
            auto target = parse_target_list();
            if (failed(target))
            {
                return take_error(target);
            }
            clause.target = boxed(take(target));
            if (auto err = consume(TokenKind::KwIn, "expected 'in' in comprehension"))
            {
                return *err;
            }
            auto iter = parse_disjunction();
            if (failed(iter))
            {
                return take_error(iter);
            }
            clause.iter = boxed(take(iter));
            while (match(TokenKind::KwIf))
            {
                auto cond = parse_disjunction();
                if (failed(cond))
                {
                    return take_error(cond);
                }
                clause.ifs.push_back(take(cond));
            }
            clauses.push_back(std::move(clause));
        }
        return clauses;
    }

    ExprResult parse_comprehension_tail(std::size_t start, ComprehensionExpr::Kind kind, Expr elt,
                                        ExprPtr value)
    {
        auto clauses = parse_comprehension_clauses();
        if (failed(clauses))
        {
            return take_error(clauses);
        }
        ComprehensionExpr node;
        node.kind = kind;
        node.elt = boxed(std::move(elt));
        node.value = std::move(value);
        node.generators = take(clauses);
        return make_expr(span_from(start), std::move(node));
    }

    ExprResult parse_yield()
    {
        const std::size_t start = pos_;
        advance();
        YieldExpr node;
        if (match(TokenKind::KwFrom))
        {
            node.is_from = true;
            auto value = parse_expression();
            if (failed(value))
            {
                return value;
            }
            node.value = boxed(take(value));
        }
        else if (!at_list_end())
        {
            auto value = parse_star_expressions();
            if (failed(value))
            {
                return value;
            }
            node.value = boxed(take(value));
        }
        return make_expr(span_from(start), std::move(node));
    }

    ExprResult parse_atom()
    {
        if (auto err = enter())
        {
            return *err;
        }
        DepthGuard guard(depth_);

        const std::size_t start = pos_;
        const Token& tok = peek();
        switch (tok.kind)
        {
        case TokenKind::Name:
            advance();
            return make_expr(tok.span, NameExpr{.name = tok.lexeme});
        case TokenKind::KwTrue:
            advance();
            return make_expr(tok.span, ConstantExpr{.kind = ConstantExpr::Kind::True});
        case TokenKind::KwFalse:
            advance();
            return make_expr(tok.span, ConstantExpr{.kind = ConstantExpr::Kind::False});
        case TokenKind::KwNone:
            advance();
            return make_expr(tok.span, ConstantExpr{.kind = ConstantExpr::Kind::None});
        case TokenKind::Ellipsis:
            advance();
            return make_expr(tok.span, ConstantExpr{.kind = ConstantExpr::Kind::Ellipsis});
        case TokenKind::Number:
            advance();
            return make_expr(tok.span, NumberExpr{.lexeme = tok.lexeme});
        case TokenKind::String:
            return parse_strings();
        case TokenKind::LParen:
            return parse_paren(start);
        case TokenKind::LBracket:
            return parse_list(start);
        case TokenKind::LBrace:
            return parse_brace(start);
        case TokenKind::KwYield:
            return error_at(tok, "'yield' outside of a statement must be parenthesized");
        default:
            return error_at(tok, "invalid syntax");
        }
    }

    ExprResult parse_paren(std::size_t start)
    {
        advance(); // (
        if (match(TokenKind::RParen))
        {
            return make_expr(span_from(start), TupleExpr{});
        }
        if (check(TokenKind::KwYield))
        {
            auto y = parse_yield();
            if (failed(y))
            {
                return y;
            }
            if (auto err = consume(TokenKind::RParen, "expected ')'"))
            {
                return *err;
            }
            return y;
        }

        auto first = parse_star_expression();
        if (failed(first))
        {
            return first;
        }
        if (check(TokenKind::KwFor) || check(TokenKind::KwAsync))
        {
            auto gen = parse_comprehension_tail(start, ComprehensionExpr::Kind::Generator,
                                                take(first), nullptr);
            if (failed(gen))
            {
                return gen;
            }
            if (auto err = consume(TokenKind::RParen, "expected ')' after generator expression"))
            {
                return *err;
            }
            Expr g = take(gen);
            g.span = span_from(start);
            return g;
        }
        if (!check(TokenKind::Comma))
        {
            if (auto err = consume(TokenKind::RParen, "expected ')'"))
            {
                return *err;
            }
            return first;
        }

        TupleExpr tuple;
        tuple.elts.push_back(take(first));
        while (match(TokenKind::Comma))
        {
            if (check(TokenKind::RParen))
            {
                break;
            }
            auto next = parse_star_expression();
            if (failed(next))
            {
                return next;
            }
            tuple.elts.push_back(take(next));
        }
        if (auto err = consume(TokenKind::RParen, "expected ')' after tuple"))
        {
            return *err;
        }
        return make_expr(span_from(start), std::move(tuple));
    }

    ExprResult parse_list(std::size_t start)
    {
        advance(); // [
        ListExpr list;
        if (match(TokenKind::RBracket))
        {
            return make_expr(span_from(start), std::move(list));
        }
        auto first = parse_star_expression();
        if (failed(first))
        {
            return first;
        }
        if (check(TokenKind::KwFor) || check(TokenKind::KwAsync))
        {
            auto comp =
                parse_comprehension_tail(start, ComprehensionExpr::Kind::List, take(first), nullptr);
            if (failed(comp))
            {
                return comp;
            }
            if (auto err = consume(TokenKind::RBracket, "expected ']' after comprehension"))
            {
                return *err;
            }
            Expr c = take(comp);
            c.span = span_from(start);
            return c;
        }
        list.elts.push_back(take(first));
        while (match(TokenKind::Comma))
        {
            if (check(TokenKind::RBracket))
            {
                break;
            }
            auto next = parse_star_expression();
            if (failed(next))
            {
                return next;
            }
            list.elts.push_back(take(next));
        }
        if (auto err = consume(TokenKind::RBracket, "expected ']' after list"))
        {
            return *err;
        }
        return make_expr(span_from(start), std::move(list));
    }

    std::variant<DictItem, Finding> parse_dict_item()
    {
        DictItem item;
        if (match(TokenKind::DoubleStar))
        {
            auto value = parse_bitwise_or();
            if (failed(value))
            {
                return take_error(value);
            }
            item.value = boxed(take(value));
            return item;
        }
        auto key = parse_expression();
        if (failed(key))
        {
            return take_error(key);
        }
        if (auto err = consume(TokenKind::Colon, "expected ':' in dict display"))
        {
            return *err;
        }
        auto value = parse_expression();
        if (failed(value))
        {
            return take_error(value);
        }
        item.key = boxed(take(key));
        item.value = boxed(take(value));
        return item;
    }

    ExprResult parse_brace(std::size_t start)
    {
        advance(); // {
        if (match(TokenKind::RBrace))
        {
            return make_expr(span_from(start), DictExpr{});
        }

        const bool dict_first = check(TokenKind::DoubleStar);
        if (!dict_first)
        {
            auto first = parse_star_expression();
            if (failed(first))
            {
                return first;
            }
            if (match(TokenKind::Colon))
            {
                auto value = parse_expression();
                if (failed(value))
                {
                    return value;
                }
                if (check(TokenKind::KwFor) || check(TokenKind::KwAsync))
                {
                    auto comp = parse_comprehension_tail(start, ComprehensionExpr::Kind::Dict,
                                                         take(first), boxed(take(value)));
                    if (failed(comp))
                    {
                        return comp;
                    }
                    if (auto err = consume(TokenKind::RBrace, "expected '}' after comprehension"))
                    {
                        return *err;
                    }
                    Expr c = take(comp);
                    c.span = span_from(start);
                    return c;
                }
                DictExpr dict;
                dict.items.push_back(
                    DictItem{.key = boxed(take(first)), .value = boxed(take(value))});
                return finish_dict(start, std::move(dict));
            }

            if (check(TokenKind::KwFor) || check(TokenKind::KwAsync))
            {
                auto comp =
                    parse_comprehension_tail(start, ComprehensionExpr::Kind::Set, take(first), nullptr);
                if (failed(comp))
                {
                    return comp;
                }
                if (auto err = consume(TokenKind::RBrace, "expected '}' after comprehension"))
                {
                    return *err;
                }
                Expr c = take(comp);
                c.span = span_from(start);
                return c;
            }

            SetExpr set;
            set.elts.push_back(take(first));
            while (match(TokenKind::Comma))
            {
                if (check(TokenKind::RBrace))
                {
                    break;
                }
                auto next = parse_star_expression();
                if (failed(next))
                {
                    return next;
                }
                set.elts.push_back(take(next));
            }
            if (auto err = consume(TokenKind::RBrace, "expected '}' after set"))
            {
                return *err;
            }
            return make_expr(span_from(start), std::move(set));
        }

        DictExpr dict;
        auto item = parse_dict_item();
        if (failed(item))
        {
            return take_error(item);
        }
        dict.items.push_back(take(item));
        return finish_dict(start, std::move(dict));
    }

    ExprResult finish_dict(std::size_t start, DictExpr dict)
    {
        while (match(TokenKind::Comma))
        {
            if (check(TokenKind::RBrace))
            {
                break;
            }
            auto item = parse_dict_item();
            if (failed(item))
            {
                return take_error(item);
            }
            dict.items.push_back(take(item));
        }
        if (auto err = consume(TokenKind::RBrace, "expected '}' after dict"))
        {
            return *err;
        }
        return make_expr(span_from(start), std::move(dict));
    }

    // Adjacent literals concatenate; any f-string makes the whole an FStringExpr.
    ExprResult parse_strings()
    {
        const std::size_t start = pos_;
        std::vector<FStringPart> parts;
        bool any_fstring = false;
        bool any_bytes = false;
        bool any_text = false;

        while (check(TokenKind::String))
        {
            const Token& tok = advance();
            const LiteralShape shape = literal_shape(tok.lexeme);
            const std::string_view body = tok.lexeme.substr(shape.body_start, shape.body_len);
            any_bytes = any_bytes || shape.bytes;
            any_text = any_text || !shape.bytes;
            if (shape.fstring)
            {
                any_fstring = true;
                auto fparts = parse_fstring_body(body, tok.span.start + shape.body_start,
                                                 shape.raw);
                if (failed(fparts))
                {
                    return take_error(fparts);
                }
                for (auto& p : take(fparts))
                {
                    parts.push_back(std::move(p));
                }
                continue;
            }
            FStringPart lit;
            lit.literal = shape.raw ? std::string(body) : decode_escapes(body, shape.bytes);
            parts.push_back(std::move(lit));
        }

        if (any_bytes && any_text)
        {
            return error_span(span_from(start), "cannot mix bytes and nonbytes literals");
        }

        if (!any_fstring)
        {
            StringExpr s;
            s.is_bytes = any_bytes;
            for (const auto& p : parts)
            {
                s.value += p.literal;
            }
            return make_expr(span_from(start), std::move(s));
        }

        // Merge adjacent literal pieces.
        FStringExpr f;
        for (auto& p : parts)
        {
            if (p.value == nullptr && !f.parts.empty() && f.parts.back().value == nullptr)
            {
                f.parts.back().literal += p.literal;
                continue;
            }
            if (p.value == nullptr && p.literal.empty())
            {
                continue;
            }
            f.parts.push_back(std::move(p));
        }
        return make_expr(span_from(start), std::move(f));
    }

    // Finds where a replacement field's expression ends: '}', '!' (not '!='), ':' or a
    // self-documenting '=' at bracket depth zero, skipping nested string literals.
    [[nodiscard]] static std::size_t scan_field_end(std::string_view body, std::size_t i,
                                                    bool& debug)
    {
        int depth = 0;
        debug = false;
        while (i < body.size())
        {
            const char c = body[i];
            if (c == '\'' || c == '"')
            {
                const char q = c;
                ++i;
                while (i < body.size() && body[i] != q)
                {
                    i += body[i] == '\\' ? 2 : 1;
                }
                ++i;
                continue;
            }
            if (c == '(' || c == '[' || c == '{')
            {
                ++depth;
            }
            else if (c == ')' || c == ']' || (c == '}' && depth > 0))
            {
                --depth;
            }
            else if (depth == 0)
            {
                const char next = i + 1 < body.size() ? body[i + 1] : '\0';
                const char prev = i > 0 ? body[i - 1] : '\0';
                if (c == '}' || c == ':' || (c == '!' && next != '='))
                {
                    return i;
                }
                if (c == '=' && next != '=' && prev != '=' && prev != '!' && prev != '<' &&
                    prev != '>')
                {
                    std::size_t k = i + 1;
                    while (k < body.size() && body[k] == ' ')
                    {
                        ++k;
                    }
                    if (k < body.size() && (body[k] == '}' || body[k] == '!' || body[k] == ':'))
                    {
                        debug = true;
                        return i;
                    }
                }
            }
            ++i;
        }
        return body.size();
    }

    PartsResult parse_fstring_body(std::string_view body, std::size_t base, bool raw)
    {
        if (auto err = enter())
        {
            return *err;
        }
        DepthGuard guard(depth_);

        std::vector<FStringPart> parts;
        std::string pending;

        auto flush = [&]()
        {
            if (!pending.empty())
            {
                FStringPart lit;
                lit.literal = raw ? pending : decode_escapes(pending, false);
                parts.push_back(std::move(lit));
                pending.clear();
            }
        };

        std::size_t i = 0;
        while (i < body.size())
        {
            const char c = body[i];
            if (c == '{' && i + 1 < body.size() && body[i + 1] == '{')
            {
                pending.push_back('{');
                i += 2;
                continue;
            }
            if (c == '}')
            {
                if (i + 1 < body.size() && body[i + 1] == '}')
                {
                    pending.push_back('}');
                    i += 2;
                    continue;
                }
                return error_span(Span{base + i, base + i + 1},
                                  "f-string: single '}' is not allowed");
            }
            if (c == '\\' && !raw && i + 1 < body.size())
            {
                pending.push_back(c);
                pending.push_back(body[i + 1]);
                i += 2;
                continue;
            }
            if (c != '{')
            {
                pending.push_back(c);
                ++i;
                continue;
            }

            flush();
            const std::size_t expr_start = i + 1;
            bool debug = false;
            std::size_t j = scan_field_end(body, expr_start, debug);
            const std::string_view expr_text = body.substr(expr_start, j - expr_start);
            if (expr_text.find_first_not_of(" \t\r\n") == std::string_view::npos)
            {
                return error_span(Span{base + i, base + j}, "f-string: empty expression not allowed");
            }

            auto value = parse_field_expression(expr_text, base + expr_start);
            if (failed(value))
            {
                return take_error(value);
            }

            FStringPart field;
            if (debug)
            {
                FStringPart lit;
                lit.literal = std::string(expr_text) + "=";
                parts.push_back(std::move(lit));
                ++j; // '='
                while (j < body.size() && body[j] == ' ')
                {
                    ++j;
                }
                field.conversion = 'r';
            }
            field.value = boxed(take(value));

            if (j < body.size() && body[j] == '!')
            {
                if (j + 1 >= body.size() ||
                    (body[j + 1] != 'r' && body[j + 1] != 's' && body[j + 1] != 'a'))
                {
                    return error_span(Span{base + j, base + j + 1},
                                      "f-string: invalid conversion character");
                }
                field.conversion = body[j + 1];
                j += 2;
            }
            if (j < body.size() && body[j] == ':')
            {
                const std::size_t spec_start = j + 1;
                int nest = 0;
                std::size_t k = spec_start;
                while (k < body.size() && !(body[k] == '}' && nest == 0))
                {
                    nest += body[k] == '{' ? 1 : (body[k] == '}' ? -1 : 0);
                    ++k;
                }
                auto spec = parse_fstring_body(body.substr(spec_start, k - spec_start),
                                               base + spec_start, raw);
                if (failed(spec))
                {
                    return take_error(spec);
                }
                field.format_spec = boxed(make_expr(Span{base + spec_start, base + k},
                                                    FStringExpr{.parts = take(spec)}));
                if (debug && field.conversion == 'r')
                {
                    field.conversion = 0;
                }
                j = k;
            }
            if (j >= body.size() || body[j] != '}')
            {
                return error_span(Span{base + i, base + j}, "f-string: expecting '}'");
            }
            parts.push_back(std::move(field));
            i = j + 1;
        }
        flush();
        return parts;
    }

    ExprResult parse_field_expression(std::string_view text, std::size_t offset)
    {
        auto lexed = codegate::lexer::lex_expression(text, offset);
        if (auto* err = std::get_if<Finding>(&lexed))
        {
            return *err;
        }
        const auto& tokens = std::get<std::vector<Token>>(lexed);
        Parser sub(tokens, depth_);
        return sub.parse_standalone_expression();
    }
};

// ---- dump -----------------------------------------------------------------

void dump_expr(const Expr& expr, std::string& out);
void dump_stmts(const std::vector<Stmt>& stmts, std::string& out);

std::string_view cmp_name(CmpOp op)
{
    switch (op)
    {
    case CmpOp::Eq:
        return "==";
    case CmpOp::NotEq:
        return "!=";
    case CmpOp::Lt:
        return "<";
    case CmpOp::LtE:
        return "<=";
    case CmpOp::Gt:
        return ">";
    case CmpOp::GtE:
        return ">=";
    case CmpOp::In:
        return "in";
    case CmpOp::NotIn:
        return "not-in";
    case CmpOp::Is:
        return "is";
    case CmpOp::IsNot:
        return "is-not";
    }
    return "?";
}

void dump_list(std::string_view head, const std::vector<Expr>& elts, std::string& out)
{
    out += "(";
    out += head;
    for (const auto& e : elts)
    {
        out += " ";
        dump_expr(e, out);
    }
    out += ")";
}

void dump_opt(const ExprPtr& e, std::string& out)
{
    if (e == nullptr)
    {
        out += "_";
        return;
    }
    dump_expr(*e, out);
}

void dump_expr(const Expr& expr, std::string& out)
{
    std::visit(
        [&](const auto& node)
        {
            using Node = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<Node, NameExpr>)
            {
                out += node.name;
            }
            else if constexpr (std::is_same_v<Node, ConstantExpr>)
            {
                switch (node.kind)
                {
                case ConstantExpr::Kind::None:
                    out += "None";
                    break;
                case ConstantExpr::Kind::True:
                    out += "True";
                    break;
                case ConstantExpr::Kind::False:
                    out += "False";
                    break;
                case ConstantExpr::Kind::Ellipsis:
                    out += "...";
                    break;
                }
            }
            else if constexpr (std::is_same_v<Node, NumberExpr>)
            {
                out += node.lexeme;
            }
            else if constexpr (std::is_same_v<Node, StringExpr>)
            {
                out += node.is_bytes ? "b\"" : "\"";
                out += node.value;
                out += "\"";
            }
            else if constexpr (std::is_same_v<Node, FStringExpr>)
            {
                out += "(fstr";
                for (const auto& p : node.parts)
                {
                    out += " ";
                    if (p.value == nullptr)
                    {
                        out += "\"" + p.literal + "\"";
                        continue;
                    }
                    out += "{";
                    dump_expr(*p.value, out);
                    if (p.conversion != 0)
                    {
                        out += "!";
                        out.push_back(p.conversion);
                    }
                    if (p.format_spec != nullptr)
                    {
                        out += ":";
                        dump_expr(*p.format_spec, out);
                    }
                    out += "}";
                }
                out += ")";
            }
            else if constexpr (std::is_same_v<Node, UnaryExpr>)
            {
                out += "(";
                out += codegate::lexer::to_string(node.op);
                out += " ";
                dump_expr(*node.operand, out);
                out += ")";
            }
            else if constexpr (std::is_same_v<Node, BinaryExpr>)
            {
                out += "(";
                out += codegate::lexer::to_string(node.op);
                out += " ";
                dump_expr(*node.lhs, out);
                out += " ";
                dump_expr(*node.rhs, out);
                out += ")";
            }
            else if constexpr (std::is_same_v<Node, BoolOpExpr>)
            {
                dump_list(codegate::lexer::to_string(node.op), node.values, out);
            }
            else if constexpr (std::is_same_v<Node, CompareExpr>)
            {
                out += "(cmp ";
                dump_expr(*node.left, out);
                for (std::size_t i = 0; i < node.ops.size(); ++i)
                {
                    out += " ";
                    out += cmp_name(node.ops[i]);
                    out += " ";
                    dump_expr(node.comparators[i], out);
                }
                out += ")";
            }
            else if constexpr (std::is_same_v<Node, CallExpr>)
            {
                out += "(call ";
                dump_expr(*node.callee, out);
                for (const auto& a : node.args)
                {
                    out += " ";
                    switch (a.kind)
                    {
                    case Argument::Kind::Star:
                        out += "*";
                        break;
                    case Argument::Kind::DoubleStar:
                        out += "**";
                        break;
                    case Argument::Kind::Keyword:
                        out += a.keyword;
                        out += "=";
                        break;
                    case Argument::Kind::Positional:
                        break;
                    }
                    dump_expr(*a.value, out);
                }
                out += ")";
            }
            else if constexpr (std::is_same_v<Node, AttributeExpr>)
            {
                out += "(. ";
                dump_expr(*node.value, out);
                out += " ";
                out += node.attr;
                out += ")";
            }
            else if constexpr (std::is_same_v<Node, SubscriptExpr>)
            {
                out += "([] ";
                dump_expr(*node.value, out);
                out += " ";
                dump_expr(*node.index, out);
                out += ")";
            }
            else if constexpr (std::is_same_v<Node, SliceExpr>)
            {
                out += "(slice ";
                dump_opt(node.lower, out);
                out += " ";
                dump_opt(node.upper, out);
                out += " ";
                dump_opt(node.step, out);
                out += ")";
            }
            else if constexpr (std::is_same_v<Node, ListExpr>)
            {
                dump_list("list", node.elts, out);
            }
            else if constexpr (std::is_same_v<Node, TupleExpr>)
            {
                dump_list("tuple", node.elts, out);
            }
            else if constexpr (std::is_same_v<Node, SetExpr>)
            {
                dump_list("set", node.elts, out);
            }
            else if constexpr (std::is_same_v<Node, DictExpr>)
            {
                out += "(dict";
                for (const auto& item : node.items)
                {
                    out += " ";
                    if (item.key == nullptr)
                    {
                        out += "**";
                    }
                    else
                    {
                        dump_expr(*item.key, out);
                        out += ":";
                    }
                    dump_expr(*item.value, out);
                }
                out += ")";
            }
            else if constexpr (std::is_same_v<Node, ComprehensionExpr>)
            {
                switch (node.kind)
                {
                case ComprehensionExpr::Kind::List:
                    out += "(listcomp ";
                    break;
                case ComprehensionExpr::Kind::Set:
                    out += "(setcomp ";
                    break;
                case ComprehensionExpr::Kind::Dict:
                    out += "(dictcomp ";
                    break;
                case ComprehensionExpr::Kind::Generator:
                    out += "(genexp ";
                    break;
                }
                dump_expr(*node.elt, out);
                if (node.value != nullptr)
                {
                    out += ":";
                    dump_expr(*node.value, out);
                }
                for (const auto& g : node.generators)
                {
                    out += " (for ";
                    dump_expr(*g.target, out);
                    out += " ";
                    dump_expr(*g.iter, out);
                    for (const auto& cond : g.ifs)
                    {
                        out += " (if ";
                        dump_expr(cond, out);
                        out += ")";
                    }
                    out += ")";
                }
                out += ")";
            }
            else if constexpr (std::is_same_v<Node, LambdaExpr>)
            {
                out += "(lambda (";
                for (std::size_t i = 0; i < node.params->positional.size(); ++i)
                {
                    out += i > 0 ? " " : "";
                    out += node.params->positional[i].name;
                }
                out += ") ";
                dump_expr(*node.body, out);
                out += ")";
            }
            else if constexpr (std::is_same_v<Node, IfExpr>)
            {
                out += "(ifexp ";
                dump_expr(*node.test, out);
                out += " ";
                dump_expr(*node.body, out);
                out += " ";
                dump_expr(*node.orelse, out);
                out += ")";
            }
            else if constexpr (std::is_same_v<Node, StarredExpr>)
            {
                out += "(* ";
                dump_expr(*node.value, out);
                out += ")";
            }
            else if constexpr (std::is_same_v<Node, NamedExpr>)
            {
                out += "(:= ";
                out += node.target;
                out += " ";
                dump_expr(*node.value, out);
                out += ")";
            }
            else if constexpr (std::is_same_v<Node, AwaitExpr>)
            {
                out += "(await ";
                dump_expr(*node.value, out);
                out += ")";
            }
            else if constexpr (std::is_same_v<Node, YieldExpr>)
            {
                out += node.is_from ? "(yield-from " : "(yield ";
                dump_opt(node.value, out);
                out += ")";
            }
        },
        expr.node);
}

void dump_block(std::string_view head, const std::vector<Stmt>& body, std::string& out)
{
    out += " (";
    out += head;
    if (!body.empty())
    {
        out += " ";
        dump_stmts(body, out);
    }
    out += ")";
}

void dump_stmt(const Stmt& stmt, std::string& out)
{
    std::visit(
        [&](const auto& node)
        {
            using Node = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<Node, ExprStmt>)
            {
                dump_expr(node.value, out);
            }
            else if constexpr (std::is_same_v<Node, AssignStmt>)
            {
                out += "(=";
                for (const auto& t : node.targets)
                {
                    out += " ";
                    dump_expr(t, out);
                }
                out += " ";
                dump_expr(node.value, out);
                out += ")";
            }
            else if constexpr (std::is_same_v<Node, AugAssignStmt>)
            {
                out += "(";
                out += codegate::lexer::to_string(node.op);
                out += "= ";
                dump_expr(node.target, out);
                out += " ";
                dump_expr(node.value, out);
                out += ")";
            }
            else if constexpr (std::is_same_v<Node, AnnAssignStmt>)
            {
                out += "(ann ";
                dump_expr(node.target, out);
                out += " ";
                dump_expr(node.annotation, out);
                if (node.value.has_value())
                {
                    out += " ";
                    dump_expr(*node.value, out);
                }
                out += ")";
            }
            else if constexpr (std::is_same_v<Node, ReturnStmt>)
            {
                out += "(return";
                if (node.value.has_value())
                {
                    out += " ";
                    dump_expr(*node.value, out);
                }
                out += ")";
            }
            else if constexpr (std::is_same_v<Node, PassStmt>)
            {
                out += "(pass)";
            }
            else if constexpr (std::is_same_v<Node, BreakStmt>)
            {
                out += "(break)";
            }
            else if constexpr (std::is_same_v<Node, ContinueStmt>)
            {
                out += "(continue)";
            }
            else if constexpr (std::is_same_v<Node, RaiseStmt>)
            {
                out += "(raise";
                if (node.exc.has_value())
                {
                    out += " ";
                    dump_expr(*node.exc, out);
                }
                if (node.cause.has_value())
                {
                    out += " from ";
                    dump_expr(*node.cause, out);
                }
                out += ")";
            }
            else if constexpr (std::is_same_v<Node, GlobalStmt> ||
                               std::is_same_v<Node, NonlocalStmt>)
            {
                out += std::is_same_v<Node, GlobalStmt> ? "(global" : "(nonlocal";
                for (const auto& n : node.names)
                {
                    out += " ";
                    out += n;
                }
                out += ")";
            }
            else if constexpr (std::is_same_v<Node, DelStmt>)
            {
                dump_list("del", node.targets, out);
            }
            else if constexpr (std::is_same_v<Node, AssertStmt>)
            {
                out += "(assert ";
                dump_expr(node.test, out);
                out += ")";
            }
            else if constexpr (std::is_same_v<Node, ImportStmt>)
            {
                out += "(import";
                for (const auto& a : node.names)
                {
                    out += " " + a.name;
                    if (a.asname.has_value())
                    {
                        out += " as ";
                        out += *a.asname;
                    }
                }
                out += ")";
            }
            else if constexpr (std::is_same_v<Node, ImportFromStmt>)
            {
                out += "(from " + std::string(node.level, '.') + node.module + " import";
                for (const auto& a : node.names)
                {
                    out += " " + a.name;
                    if (a.asname.has_value())
                    {
                        out += " as ";
                        out += *a.asname;
                    }
                }
                out += ")";
            }
            else if constexpr (std::is_same_v<Node, IfStmt>)
            {
                out += "(if ";
                dump_expr(node.test, out);
                dump_block("then", node.body, out);
                if (!node.orelse.empty())
                {
                    dump_block("else", node.orelse, out);
                }
                out += ")";
            }
            else if constexpr (std::is_same_v<Node, WhileStmt>)
            {
                out += "(while ";
                dump_expr(node.test, out);
                dump_block("do", node.body, out);
                out += ")";
            }
            else if constexpr (std::is_same_v<Node, ForStmt>)
            {
                out += "(for ";
                dump_expr(node.target, out);
                out += " ";
                dump_expr(node.iter, out);
                dump_block("do", node.body, out);
                out += ")";
            }
            else if constexpr (std::is_same_v<Node, TryStmt>)
            {
                out += "(try";
                dump_block("body", node.body, out);
                for (const auto& h : node.handlers)
                {
                    out += " (except";
                    if (h.type.has_value())
                    {
                        out += " ";
                        dump_expr(*h.type, out);
                    }
                    if (h.name.has_value())
                    {
                        out += " as ";
                        out += *h.name;
                    }
                    out += ")";
                }
                if (!node.finalbody.empty())
                {
                    dump_block("finally", node.finalbody, out);
                }
                out += ")";
            }
            else if constexpr (std::is_same_v<Node, WithStmt>)
            {
                out += "(with";
                for (const auto& item : node.items)
                {
                    out += " ";
                    dump_expr(item.context, out);
                }
                dump_block("do", node.body, out);
                out += ")";
            }
            else if constexpr (std::is_same_v<Node, FunctionDef>)
            {
                out += "(def ";
                out += node.name;
                out += " (";
                for (std::size_t i = 0; i < node.params->positional.size(); ++i)
                {
                    out += i > 0 ? " " : "";
                    out += node.params->positional[i].name;
                }
                out += ")";
                dump_block("body", *node.body, out);
                out += ")";
            }
            else if constexpr (std::is_same_v<Node, ClassDef>)
            {
                out += "(class ";
                out += node.name;
                dump_block("body", node.body, out);
                out += ")";
            }
        },
        stmt.node);
}

void dump_stmts(const std::vector<Stmt>& stmts, std::string& out)
{
    for (std::size_t i = 0; i < stmts.size(); ++i)
    {
        if (i > 0)
        {
            out += " ";
        }
        dump_stmt(stmts[i], out);
    }
}

} // namespace

ParseResult parse(std::span<const Token> tokens)
{
    if (tokens.empty() || tokens.back().kind != TokenKind::Eof)
    {
        Finding f;
        f.message = "token stream is missing its end marker";
        f.origin = "parser";
        return std::vector<Finding>{f};
    }
    Parser parser(tokens, 0);
    return parser.parse_module();
}

ParseResult parse_source(std::string_view text)
{
    auto lexed = codegate::lexer::lex(text);
    if (auto* err = std::get_if<Finding>(&lexed))
    {
        return std::vector<Finding>{*err};
    }
    const auto& tokens = std::get<std::vector<Token>>(lexed);
    return parse(tokens);
}

std::string dump(const Module& module)
{
    std::string out;
    dump_stmts(module.body, out);
    return out;
}

std::string dump(const Expr& expr)
{
    std::string out;
    dump_expr(expr, out);
    return out;
}

} // namespace codegate::parser
