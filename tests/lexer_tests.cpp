#include <codegate/lexer/lexer.h>
#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

static void fail(const std::string& msg)
{
    std::cerr << "FAIL: " << msg << "\n";
    std::exit(1);
}

static void expect_token(const std::vector<codegate::lexer::Token>& tokens, std::size_t index,
                         codegate::lexer::TokenKind kind, std::string_view lexeme)
{
    if (index >= tokens.size())
    {
        fail("missing token at index " + std::to_string(index));
    }

    const auto& t = tokens[index];
    if (t.kind != kind)
    {
        fail("token kind mismatch at index " + std::to_string(index) + ": got " +
             std::string(codegate::lexer::to_string(t.kind)));
    }
    if (t.lexeme != lexeme)
    {
        fail("token lexeme mismatch at index " + std::to_string(index));
    }
}

static std::vector<codegate::lexer::Token> lex_ok(const std::string& src)
{
    auto res = codegate::lexer::lex(src);
    if (!std::holds_alternative<std::vector<codegate::lexer::Token>>(res))
    {
        fail("expected lex success for: " + src + " (" +
             std::get<codegate::diag::Finding>(res).message + ")");
    }
    return std::get<std::vector<codegate::lexer::Token>>(std::move(res));
}

static std::string lex_error(const std::string& src)
{
    const auto res = codegate::lexer::lex(src);
    if (!std::holds_alternative<codegate::diag::Finding>(res))
    {
        fail("expected lex error for: " + src);
    }
    return std::get<codegate::diag::Finding>(res).message;
}

int main()
{
    using namespace codegate::lexer;

    {
        const std::string src = "def f(x):\n    return x + 1\n";
        const auto toks = lex_ok(src);
        expect_token(toks, 0, TokenKind::KwDef, "def");
        expect_token(toks, 1, TokenKind::Name, "f");
        expect_token(toks, 2, TokenKind::LParen, "(");
        expect_token(toks, 3, TokenKind::Name, "x");
        expect_token(toks, 4, TokenKind::RParen, ")");
        expect_token(toks, 5, TokenKind::Colon, ":");
        expect_token(toks, 6, TokenKind::Newline, "\n");
        expect_token(toks, 7, TokenKind::Indent, "");
        expect_token(toks, 8, TokenKind::KwReturn, "return");
        expect_token(toks, 9, TokenKind::Name, "x");
        expect_token(toks, 10, TokenKind::Plus, "+");
        expect_token(toks, 11, TokenKind::Number, "1");
        expect_token(toks, 12, TokenKind::Newline, "\n");
        expect_token(toks, 13, TokenKind::Dedent, "");
        expect_token(toks, 14, TokenKind::Eof, "");
    }

    {
        // Blank and comment-only lines produce no layout tokens.
        const std::string src = "x = 1\n\n# note\n   \ny = 2";
        const auto toks = lex_ok(src);
        expect_token(toks, 0, TokenKind::Name, "x");
        expect_token(toks, 1, TokenKind::Equal, "=");
        expect_token(toks, 2, TokenKind::Number, "1");
        expect_token(toks, 3, TokenKind::Newline, "\n");
        expect_token(toks, 4, TokenKind::Name, "y");
        expect_token(toks, 5, TokenKind::Equal, "=");
        expect_token(toks, 6, TokenKind::Number, "2");
        expect_token(toks, 7, TokenKind::Newline, "");
        expect_token(toks, 8, TokenKind::Eof, "");
    }

    {
        // Lines inside brackets are joined.
        const std::string src = "xs = [1,\n      2]\n";
        const auto toks = lex_ok(src);
        expect_token(toks, 2, TokenKind::LBracket, "[");
        expect_token(toks, 3, TokenKind::Number, "1");
        expect_token(toks, 4, TokenKind::Comma, ",");
        expect_token(toks, 5, TokenKind::Number, "2");
        expect_token(toks, 6, TokenKind::RBracket, "]");
        expect_token(toks, 7, TokenKind::Newline, "\n");
    }

    {
        const std::string src = "a **= b // c -> d := e != f";
        const auto toks = lex_ok(src);
        expect_token(toks, 1, TokenKind::DoubleStarEqual, "**=");
        expect_token(toks, 3, TokenKind::DoubleSlash, "//");
        expect_token(toks, 5, TokenKind::Arrow, "->");
        expect_token(toks, 7, TokenKind::Walrus, ":=");
        expect_token(toks, 9, TokenKind::NotEqual, "!=");
        if (!is_augmented_assign(TokenKind::DoubleStarEqual) ||
            augmented_base(TokenKind::DoubleStarEqual) != TokenKind::DoubleStar)
        {
            fail("expected **= to map to **");
        }
    }

    {
        // String prefixes stay part of the lexeme.
        const std::string src = "s = f'{x}' + rb\"\\d\" + '''a\nb'''";
        const auto toks = lex_ok(src);
        expect_token(toks, 2, TokenKind::String, "f'{x}'");
        expect_token(toks, 4, TokenKind::String, "rb\"\\d\"");
        expect_token(toks, 6, TokenKind::String, "'''a\nb'''");
    }

    {
        const std::string src = "import os\nos.system('ls')";
        const auto toks = lex_ok(src);
        expect_token(toks, 0, TokenKind::KwImport, "import");
        expect_token(toks, 1, TokenKind::Name, "os");
        expect_token(toks, 5, TokenKind::Name, "system");
        if (toks[5].span.start != src.find("system") || toks[5].span.end != src.find("("))
        {
            fail("unexpected span for attribute name");
        }
    }

    {
        const std::string src = "x = 1.5e3 + 0x1F + 1_000 + .5";
        const auto toks = lex_ok(src);
        expect_token(toks, 2, TokenKind::Number, "1.5e3");
        expect_token(toks, 4, TokenKind::Number, "0x1F");
        expect_token(toks, 6, TokenKind::Number, "1_000");
        expect_token(toks, 8, TokenKind::Number, ".5");
    }

    {
        const std::string src = "x = 1 + \\\n    2\n";
        const auto toks = lex_ok(src);
        expect_token(toks, 3, TokenKind::Number, "2");
        expect_token(toks, 4, TokenKind::Newline, "\n");
    }

    if (lex_error("s = 'abc") != "unterminated string literal")
    {
        fail("expected unterminated string error");
    }
    if (lex_error("s = '''abc") != "unterminated triple-quoted string literal")
    {
        fail("expected unterminated triple-quoted error");
    }
    if (lex_error("xs = [1, 2") != "'[' was never closed")
    {
        fail("expected unclosed bracket error");
    }
    if (lex_error("x = 1)") != "unmatched ')'")
    {
        fail("expected unmatched paren error");
    }
    if (lex_error("x = (1]") != "closing parenthesis ']' does not match opening parenthesis '('")
    {
        fail("expected mismatched bracket error");
    }
    if (lex_error("if x:\n        y = 1\n    z = 2\n") !=
        "unindent does not match any outer indentation level")
    {
        fail("expected unindent error");
    }
    if (lex_error("x = 1 $ 2") != "invalid character '$' in source")
    {
        fail("expected invalid character error");
    }

    {
        const auto res = lex("x = `y`");
        const auto* f = std::get_if<codegate::diag::Finding>(&res);
        if (f == nullptr || !f->span.has_value() || f->span->start != 4 ||
            f->severity != codegate::diag::Severity::Error)
        {
            fail("expected an error finding with a span at the bad character");
        }
    }

    {
        const auto res = lex_expression("a + b", 10);
        const auto* toks = std::get_if<std::vector<Token>>(&res);
        if (toks == nullptr || toks->size() != 4)
        {
            fail("expected three tokens plus eof from an expression");
        }
        if ((*toks)[0].span.start != 10 || (*toks)[2].span.start != 14)
        {
            fail("expected expression spans shifted by the base offset");
        }
    }

    std::cout << "OK\n";
    return 0;
}
