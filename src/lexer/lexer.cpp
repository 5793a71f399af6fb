#include <array>
#include <cctype>
#include <codegate/lexer/lexer.h>
#include <cstddef>
#include <optional>
#include <string>
#include <utility>

namespace codegate::lexer
{
namespace
{

struct Keyword
{
    std::string_view text;
    TokenKind kind;
};

constexpr std::array<Keyword, 35> kKeywords = {{
    {"False", TokenKind::KwFalse},       {"None", TokenKind::KwNone},
    {"True", TokenKind::KwTrue},         {"and", TokenKind::KwAnd},
    {"as", TokenKind::KwAs},             {"assert", TokenKind::KwAssert},
    {"async", TokenKind::KwAsync},       {"await", TokenKind::KwAwait},
    {"break", TokenKind::KwBreak},       {"class", TokenKind::KwClass},
    {"continue", TokenKind::KwContinue}, {"def", TokenKind::KwDef},
    {"del", TokenKind::KwDel},           {"elif", TokenKind::KwElif},
    {"else", TokenKind::KwElse},         {"except", TokenKind::KwExcept},
    {"finally", TokenKind::KwFinally},   {"for", TokenKind::KwFor},
    {"from", TokenKind::KwFrom},         {"global", TokenKind::KwGlobal},
    {"if", TokenKind::KwIf},             {"import", TokenKind::KwImport},
    {"in", TokenKind::KwIn},             {"is", TokenKind::KwIs},
    {"lambda", TokenKind::KwLambda},     {"nonlocal", TokenKind::KwNonlocal},
    {"not", TokenKind::KwNot},           {"or", TokenKind::KwOr},
    {"pass", TokenKind::KwPass},         {"raise", TokenKind::KwRaise},
    {"return", TokenKind::KwReturn},     {"try", TokenKind::KwTry},
    {"while", TokenKind::KwWhile},       {"with", TokenKind::KwWith},
    {"yield", TokenKind::KwYield},
}};

struct Operator
{
    std::string_view text;
    TokenKind kind;
};

// Longest operators first so a linear scan finds the maximal munch.
constexpr std::array<Operator, 47> kOperators = {{
    {"**=", TokenKind::DoubleStarEqual},
    {"//=", TokenKind::DoubleSlashEqual},
    {">>=", TokenKind::RightShiftEqual},
    {"<<=", TokenKind::LeftShiftEqual},
    {"...", TokenKind::Ellipsis},
    {"->", TokenKind::Arrow},
    {":=", TokenKind::Walrus},
    {"**", TokenKind::DoubleStar},
    {"//", TokenKind::DoubleSlash},
    {"<<", TokenKind::LeftShift},
    {">>", TokenKind::RightShift},
    {"<=", TokenKind::LessEqual},
    {">=", TokenKind::GreaterEqual},
    {"==", TokenKind::EqualEqual},
    {"!=", TokenKind::NotEqual},
    {"+=", TokenKind::PlusEqual},
    {"-=", TokenKind::MinusEqual},
    {"*=", TokenKind::StarEqual},
    {"/=", TokenKind::SlashEqual},
    {"%=", TokenKind::PercentEqual},
    {"&=", TokenKind::AmperEqual},
    {"|=", TokenKind::PipeEqual},
    {"^=", TokenKind::CaretEqual},
    {"@=", TokenKind::AtEqual},
    {"(", TokenKind::LParen},
    {")", TokenKind::RParen},
    {"[", TokenKind::LBracket},
    {"]", TokenKind::RBracket},
    {"{", TokenKind::LBrace},
    {"}", TokenKind::RBrace},
    {",", TokenKind::Comma},
    {":", TokenKind::Colon},
    {";", TokenKind::Semicolon},
    {".", TokenKind::Dot},
    {"=", TokenKind::Equal},
    {"@", TokenKind::At},
    {"+", TokenKind::Plus},
    {"-", TokenKind::Minus},
    {"*", TokenKind::Star},
    {"/", TokenKind::Slash},
    {"%", TokenKind::Percent},
    {"&", TokenKind::Amper},
    {"|", TokenKind::Pipe},
    {"^", TokenKind::Caret},
    {"~", TokenKind::Tilde},
    {"<", TokenKind::Less},
    {">", TokenKind::Greater},
}};

TokenKind keyword_or_name(std::string_view lexeme)
{
    for (const auto& kw : kKeywords)
    {
        if (kw.text == lexeme)
        {
            return kw.kind;
        }
    }
    return TokenKind::Name;
}

bool is_ident_start(char c)
{
    const auto uc = static_cast<unsigned char>(c);
    return (std::isalpha(uc) != 0) || c == '_' || uc >= 0x80;
}

bool is_ident_continue(char c)
{
    return is_ident_start(c) || (std::isdigit(static_cast<unsigned char>(c)) != 0);
}

bool is_digit(char c)
{
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

// r, u, b, f and the two-letter raw combinations.
bool is_string_prefix(std::string_view p)
{
    std::string lower;
    for (char c : p)
    {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return lower == "r" || lower == "u" || lower == "b" || lower == "f" || lower == "br" ||
           lower == "rb" || lower == "fr" || lower == "rf";
}

class Lexer
{
  public:
    Lexer(std::string_view input, std::size_t base_offset, bool expression_mode)
        : input_(input), base_(base_offset), expression_mode_(expression_mode)
    {
    }

    [[nodiscard]] LexResult lex_all()
    {
        while (true)
        {
            if (at_line_start_ && brackets_.empty() && !expression_mode_)
            {
                if (auto err = handle_indentation())
                {
                    return *err;
                }
                if (at_line_start_)
                {
                    // Blank line, comment-only line, or end of input.
                    if (is_at_end())
                    {
                        break;
                    }
                    continue;
                }
            }

            skip_inline_trivia();
            if (is_at_end())
            {
                break;
            }

            const std::size_t start = pos_;
            const char c = peek();

            if (c == '\\')
            {
                if (auto err = handle_continuation())
                {
                    return *err;
                }
                continue;
            }

            if (c == '\n' || c == '\r')
            {
                advance_newline();
                if (brackets_.empty() && !expression_mode_)
                {
                    if (line_has_tokens_)
                    {
                        push(TokenKind::Newline, start, pos_);
                    }
                    at_line_start_ = true;
                    line_has_tokens_ = false;
                }
                continue;
            }

            if (is_ident_start(c))
            {
                while (!is_at_end() && is_ident_continue(peek()))
                {
                    advance();
                }

                // A short identifier immediately followed by a quote is a string prefix.
                const std::string_view word = input_.substr(start, pos_ - start);
                if (!is_at_end() && (peek() == '"' || peek() == '\'') && word.size() <= 2 &&
                    is_string_prefix(word))
                {
                    if (auto err = scan_string(start))
                    {
                        return *err;
                    }
                    continue;
                }

                push(keyword_or_name(word), start, pos_);
                continue;
            }

            if (c == '"' || c == '\'')
            {
                if (auto err = scan_string(start))
                {
                    return *err;
                }
                continue;
            }

            if (is_digit(c) || (c == '.' && is_digit(peek_next())))
            {
                scan_number();
                push(TokenKind::Number, start, pos_);
                continue;
            }

            if (auto err = scan_operator())
            {
                return *err;
            }
        }

        if (!brackets_.empty())
        {
            const auto [ch, at] = brackets_.back();
            return make_error(at, at + 1, std::string("'") + ch + "' was never closed");
        }

        if (!expression_mode_)
        {
            if (line_has_tokens_)
            {
                push(TokenKind::Newline, pos_, pos_);
            }
            while (indents_.size() > 1)
            {
                indents_.pop_back();
                push(TokenKind::Dedent, pos_, pos_);
            }
        }

        push(TokenKind::Eof, pos_, pos_);
        return std::move(tokens_);
    }

  private:
    std::string_view input_;
    std::size_t base_ = 0;
    bool expression_mode_ = false;
    std::size_t pos_ = 0;
    bool at_line_start_ = true;
    bool line_has_tokens_ = false;
    std::vector<std::size_t> indents_{0};
    std::vector<std::pair<char, std::size_t>> brackets_;
    std::vector<Token> tokens_;

    [[nodiscard]] bool is_at_end() const { return pos_ >= input_.size(); }
    [[nodiscard]] char peek() const { return is_at_end() ? '\0' : input_[pos_]; }

    [[nodiscard]] char peek_next() const
    {
        const std::size_t n = pos_ + 1;
        return (n < input_.size()) ? input_[n] : '\0';
    }

    void advance() { ++pos_; }

    void advance_newline()
    {
        if (peek() == '\r' && peek_next() == '\n')
        {
            pos_ += 2;
            return;
        }
        ++pos_;
    }

    void push(TokenKind kind, std::size_t start, std::size_t end)
    {
        tokens_.push_back(Token{.kind = kind,
                                .lexeme = input_.substr(start, end - start),
                                .span = {base_ + start, base_ + end}});
        if (kind != TokenKind::Newline && kind != TokenKind::Indent &&
            kind != TokenKind::Dedent && kind != TokenKind::Eof)
        {
            line_has_tokens_ = true;
        }
    }

    [[nodiscard]] codegate::diag::Finding make_error(std::size_t start, std::size_t end,
                                                     std::string message) const
    {
        codegate::diag::Finding f;
        f.severity = codegate::diag::Severity::Error;
        f.message = std::move(message);
        f.span = codegate::source::Span{base_ + start, base_ + end};
        f.origin = "lexer";
        return f;
    }

    void skip_inline_trivia()
    {
        while (!is_at_end())
        {
            const char c = peek();
            if (c == ' ' || c == '\t' || c == '\f')
            {
                advance();
                continue;
            }
            if (c == '#')
            {
                while (!is_at_end() && peek() != '\n' && peek() != '\r')
                {
                    advance();
                }
                continue;
            }
            return;
        }
    }

    std::optional<codegate::diag::Finding> handle_indentation()
    {
        std::size_t col = 0;
        std::size_t p = pos_;
        while (p < input_.size())
        {
            const char c = input_[p];
            if (c == ' ')
            {
                ++col;
            }
            else if (c == '\t')
            {
                col = (col / 8 + 1) * 8;
            }
            else if (c == '\f')
            {
                col = 0;
            }
            else
            {
                break;
            }
            ++p;
        }

        pos_ = p;
        if (is_at_end())
        {
            return std::nullopt;
        }

        const char c = peek();
        if (c == '#')
        {
            skip_inline_trivia();
        }
        if (is_at_end())
        {
            return std::nullopt;
        }
        if (peek() == '\n' || peek() == '\r')
        {
            advance_newline();
            return std::nullopt;
        }

        at_line_start_ = false;
        if (col > indents_.back())
        {
            indents_.push_back(col);
            push(TokenKind::Indent, pos_, pos_);
            return std::nullopt;
        }

        while (col < indents_.back())
        {
            indents_.pop_back();
            push(TokenKind::Dedent, pos_, pos_);
        }
        if (col != indents_.back())
        {
            return make_error(pos_, pos_ + 1,
                              "unindent does not match any outer indentation level");
        }
        return std::nullopt;
    }

    std::optional<codegate::diag::Finding> handle_continuation()
    {
        const std::size_t start = pos_;
        advance();
        if (peek() == '\r' || peek() == '\n')
        {
            advance_newline();
            if (is_at_end())
            {
                return make_error(start, pos_, "unexpected end of file after line continuation");
            }
            return std::nullopt;
        }
        return make_error(start, pos_, "unexpected character after line continuation character");
    }

    // `pos_` sits on the opening quote; `start` includes any prefix.
    std::optional<codegate::diag::Finding> scan_string(std::size_t start)
    {
        const char quote = peek();
        const bool triple = pos_ + 2 < input_.size() && input_[pos_ + 1] == quote &&
                            input_[pos_ + 2] == quote;
        pos_ += triple ? 3 : 1;

        while (true)
        {
            if (is_at_end())
            {
                return make_error(start, pos_, triple ? "unterminated triple-quoted string literal"
                                                      : "unterminated string literal");
            }

            const char ch = peek();
            if (ch == '\\')
            {
                advance();
                if (!is_at_end())
                {
                    advance_newline_or_char();
                }
                continue;
            }

            if (!triple && (ch == '\n' || ch == '\r'))
            {
                return make_error(start, pos_, "unterminated string literal");
            }

            if (ch == quote)
            {
                if (!triple)
                {
                    advance();
                    break;
                }
                if (pos_ + 2 < input_.size() && input_[pos_ + 1] == quote &&
                    input_[pos_ + 2] == quote)
                {
                    pos_ += 3;
                    break;
                }
            }

            advance();
        }

        push(TokenKind::String, start, pos_);
        return std::nullopt;
    }

    void advance_newline_or_char()
    {
        if (peek() == '\r' || peek() == '\n')
        {
            advance_newline();
            return;
        }
        advance();
    }

    void scan_number()
    {
        const char c = peek();
        const char n = static_cast<char>(std::tolower(static_cast<unsigned char>(peek_next())));
        if (c == '0' && (n == 'x' || n == 'o' || n == 'b'))
        {
            pos_ += 2;
            while (!is_at_end() &&
                   ((std::isxdigit(static_cast<unsigned char>(peek())) != 0) || peek() == '_'))
            {
                advance();
            }
            return;
        }

        auto digits = [this]()
        {
            while (!is_at_end() && (is_digit(peek()) || peek() == '_'))
            {
                advance();
            }
        };

        digits();
        if (peek() == '.' && peek_next() != '.')
        {
            advance();
            digits();
        }
        if (peek() == 'e' || peek() == 'E')
        {
            const std::size_t save = pos_;
            advance();
            if (peek() == '+' || peek() == '-')
            {
                advance();
            }
            if (!is_digit(peek()))
            {
                pos_ = save;
            }
            else
            {
                digits();
            }
        }
        if (peek() == 'j' || peek() == 'J')
        {
            advance();
        }
    }

    std::optional<codegate::diag::Finding> scan_operator()
    {
        const std::size_t start = pos_;
        const std::string_view rest = input_.substr(pos_);
        for (const auto& op : kOperators)
        {
            if (rest.substr(0, op.text.size()) != op.text)
            {
                continue;
            }

            pos_ += op.text.size();
            switch (op.kind)
            {
            case TokenKind::LParen:
            case TokenKind::LBracket:
            case TokenKind::LBrace:
                brackets_.emplace_back(op.text[0], start);
                break;
            case TokenKind::RParen:
            case TokenKind::RBracket:
            case TokenKind::RBrace:
            {
                const char open = op.kind == TokenKind::RParen     ? '('
                                  : op.kind == TokenKind::RBracket ? '['
                                                                   : '{';
                if (brackets_.empty())
                {
                    return make_error(start, pos_,
                                      std::string("unmatched '") + op.text[0] + "'");
                }
                if (brackets_.back().first != open)
                {
                    return make_error(start, pos_,
                                      std::string("closing parenthesis '") + op.text[0] +
                                          "' does not match opening parenthesis '" +
                                          brackets_.back().first + "'");
                }
                brackets_.pop_back();
                break;
            }
            default:
                break;
            }
            push(op.kind, start, pos_);
            return std::nullopt;
        }

        advance();
        return make_error(start, pos_,
                          std::string("invalid character '") + input_[start] + "' in source");
    }
};

} // namespace

LexResult lex(std::string_view input)
{
    Lexer lexer(input, 0, false);
    return lexer.lex_all();
}

LexResult lex_expression(std::string_view input, std::size_t base_offset)
{
    Lexer lexer(input, base_offset, true);
    return lexer.lex_all();
}

} // namespace codegate::lexer
