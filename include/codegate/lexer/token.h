#pragma once

#include <codegate/source/span.h>
#include <string_view>

namespace codegate::lexer
{

enum class TokenKind
{
    Eof,

    // Layout
    Newline,
    Indent,
    Dedent,

    Name,
    Number,
    String,

    // Keywords
    KwFalse,
    KwNone,
    KwTrue,
    KwAnd,
    KwAs,
    KwAssert,
    KwAsync,
    KwAwait,
    KwBreak,
    KwClass,
    KwContinue,
    KwDef,
    KwDel,
    KwElif,
    KwElse,
    KwExcept,
    KwFinally,
    KwFor,
    KwFrom,
    KwGlobal,
    KwIf,
    KwImport,
    KwIn,
    KwIs,
    KwLambda,
    KwNonlocal,
    KwNot,
    KwOr,
    KwPass,
    KwRaise,
    KwReturn,
    KwTry,
    KwWhile,
    KwWith,
    KwYield,

    // Brackets
    LParen,
    RParen,
    LBracket,
    RBracket,
    LBrace,
    RBrace,

    // Punctuation
    Comma,
    Colon,
    Semicolon,
    Dot,
    Ellipsis,   // ...
    Arrow,      // ->
    Walrus,     // :=
    Equal,      // =
    At,         // @

    // Operators
    Plus,
    Minus,
    Star,
    DoubleStar,
    Slash,
    DoubleSlash,
    Percent,
    Amper,
    Pipe,
    Caret,
    Tilde,
    LeftShift,
    RightShift,

    // Comparisons
    EqualEqual,
    NotEqual,
    Less,
    LessEqual,
    Greater,
    GreaterEqual,

    // Augmented assignment
    PlusEqual,
    MinusEqual,
    StarEqual,
    DoubleStarEqual,
    SlashEqual,
    DoubleSlashEqual,
    PercentEqual,
    AmperEqual,
    PipeEqual,
    CaretEqual,
    LeftShiftEqual,
    RightShiftEqual,
    AtEqual,
};

struct Token
{
    TokenKind kind = TokenKind::Eof;
    std::string_view lexeme; // strings keep prefix and quotes
    codegate::source::Span span;
};

[[nodiscard]] constexpr bool is_augmented_assign(TokenKind kind)
{
    switch (kind)
    {
    case TokenKind::PlusEqual:
    case TokenKind::MinusEqual:
    case TokenKind::StarEqual:
    case TokenKind::DoubleStarEqual:
    case TokenKind::SlashEqual:
    case TokenKind::DoubleSlashEqual:
    case TokenKind::PercentEqual:
    case TokenKind::AmperEqual:
    case TokenKind::PipeEqual:
    case TokenKind::CaretEqual:
    case TokenKind::LeftShiftEqual:
    case TokenKind::RightShiftEqual:
    case TokenKind::AtEqual:
        return true;
    default:
        return false;
    }
}

/** @brief The binary operator an augmented assignment applies (`+=` to `+`). */
[[nodiscard]] constexpr TokenKind augmented_base(TokenKind kind)
{
    switch (kind)
    {
    case TokenKind::PlusEqual:
        return TokenKind::Plus;
    case TokenKind::MinusEqual:
        return TokenKind::Minus;
    case TokenKind::StarEqual:
        return TokenKind::Star;
    case TokenKind::DoubleStarEqual:
        return TokenKind::DoubleStar;
    case TokenKind::SlashEqual:
        return TokenKind::Slash;
    case TokenKind::DoubleSlashEqual:
        return TokenKind::DoubleSlash;
    case TokenKind::PercentEqual:
        return TokenKind::Percent;
    case TokenKind::AmperEqual:
        return TokenKind::Amper;
    case TokenKind::PipeEqual:
        return TokenKind::Pipe;
    case TokenKind::CaretEqual:
        return TokenKind::Caret;
    case TokenKind::LeftShiftEqual:
        return TokenKind::LeftShift;
    case TokenKind::RightShiftEqual:
        return TokenKind::RightShift;
    case TokenKind::AtEqual:
        return TokenKind::At;
    default:
        return kind;
    }
}

[[nodiscard]] constexpr std::string_view to_string(TokenKind kind)
{
    switch (kind)
    {
    case TokenKind::Eof:
        return "eof";
    case TokenKind::Newline:
        return "newline";
    case TokenKind::Indent:
        return "indent";
    case TokenKind::Dedent:
        return "dedent";
    case TokenKind::Name:
        return "name";
    case TokenKind::Number:
        return "number";
    case TokenKind::String:
        return "string";

    case TokenKind::KwFalse:
        return "False";
    case TokenKind::KwNone:
        return "None";
    case TokenKind::KwTrue:
        return "True";
    case TokenKind::KwAnd:
        return "and";
    case TokenKind::KwAs:
        return "as";
    case TokenKind::KwAssert:
        return "assert";
    case TokenKind::KwAsync:
        return "async";
    case TokenKind::KwAwait:
        return "await";
    case TokenKind::KwBreak:
        return "break";
    case TokenKind::KwClass:
        return "class";
    case TokenKind::KwContinue:
        return "continue";
    case TokenKind::KwDef:
        return "def";
    case TokenKind::KwDel:
        return "del";
    case TokenKind::KwElif:
        return "elif";
    case TokenKind::KwElse:
        return "else";
    case TokenKind::KwExcept:
        return "except";
    case TokenKind::KwFinally:
        return "finally";
    case TokenKind::KwFor:
        return "for";
    case TokenKind::KwFrom:
        return "from";
    case TokenKind::KwGlobal:
        return "global";
    case TokenKind::KwIf:
        return "if";
    case TokenKind::KwImport:
        return "import";
    case TokenKind::KwIn:
        return "in";
    case TokenKind::KwIs:
        return "is";
    case TokenKind::KwLambda:
        return "lambda";
    case TokenKind::KwNonlocal:
        return "nonlocal";
    case TokenKind::KwNot:
        return "not";
    case TokenKind::KwOr:
        return "or";
    case TokenKind::KwPass:
        return "pass";
    case TokenKind::KwRaise:
        return "raise";
    case TokenKind::KwReturn:
        return "return";
    case TokenKind::KwTry:
        return "try";
    case TokenKind::KwWhile:
        return "while";
    case TokenKind::KwWith:
        return "with";
    case TokenKind::KwYield:
        return "yield";

    case TokenKind::LParen:
        return "(";
    case TokenKind::RParen:
        return ")";
    case TokenKind::LBracket:
        return "[";
    case TokenKind::RBracket:
        return "]";
    case TokenKind::LBrace:
        return "{";
    case TokenKind::RBrace:
        return "}";

    case TokenKind::Comma:
        return ",";
    case TokenKind::Colon:
        return ":";
    case TokenKind::Semicolon:
        return ";";
    case TokenKind::Dot:
        return ".";
    case TokenKind::Ellipsis:
        return "...";
    case TokenKind::Arrow:
        return "->";
    case TokenKind::Walrus:
        return ":=";
    case TokenKind::Equal:
        return "=";
    case TokenKind::At:
        return "@";

    case TokenKind::Plus:
        return "+";
    case TokenKind::Minus:
        return "-";
    case TokenKind::Star:
        return "*";
    case TokenKind::DoubleStar:
        return "**";
    case TokenKind::Slash:
        return "/";
    case TokenKind::DoubleSlash:
        return "//";
    case TokenKind::Percent:
        return "%";
    case TokenKind::Amper:
        return "&";
    case TokenKind::Pipe:
        return "|";
    case TokenKind::Caret:
        return "^";
    case TokenKind::Tilde:
        return "~";
    case TokenKind::LeftShift:
        return "<<";
    case TokenKind::RightShift:
        return ">>";

    case TokenKind::EqualEqual:
        return "==";
    case TokenKind::NotEqual:
        return "!=";
    case TokenKind::Less:
        return "<";
    case TokenKind::LessEqual:
        return "<=";
    case TokenKind::Greater:
        return ">";
    case TokenKind::GreaterEqual:
        return ">=";

    case TokenKind::PlusEqual:
        return "+=";
    case TokenKind::MinusEqual:
        return "-=";
    case TokenKind::StarEqual:
        return "*=";
    case TokenKind::DoubleStarEqual:
        return "**=";
    case TokenKind::SlashEqual:
        return "/=";
    case TokenKind::DoubleSlashEqual:
        return "//=";
    case TokenKind::PercentEqual:
        return "%=";
    case TokenKind::AmperEqual:
        return "&=";
    case TokenKind::PipeEqual:
        return "|=";
    case TokenKind::CaretEqual:
        return "^=";
    case TokenKind::LeftShiftEqual:
        return "<<=";
    case TokenKind::RightShiftEqual:
        return ">>=";
    case TokenKind::AtEqual:
        return "@=";
    }
    return "unknown";
}

} // namespace codegate::lexer
