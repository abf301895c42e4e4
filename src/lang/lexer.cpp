#include <codekata/lang/lexer.hpp>

#include <codekata/common/expected.hpp>
#include <codekata/lang/fault.hpp>
#include <codekata/lang/token.hpp>

#include <fmt/format.h>

#include <array>
#include <cctype>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace codekata::lang {

namespace {

constexpr std::array<std::pair<std::string_view, TokenKind>, 13> KEYWORDS{{
    {"true", TokenKind::KwTrue},
    {"false", TokenKind::KwFalse},
    {"nil", TokenKind::KwNil},
    {"def", TokenKind::KwDef},
    {"do", TokenKind::KwDo},
    {"end", TokenKind::KwEnd},
    {"fn", TokenKind::KwFn},
    {"if", TokenKind::KwIf},
    {"else", TokenKind::KwElse},
    {"while", TokenKind::KwWhile},
    {"and", TokenKind::KwAnd},
    {"or", TokenKind::KwOr},
    {"not", TokenKind::KwNot},
}};

// Longest match first
constexpr std::array<std::pair<std::string_view, TokenKind>, 27> OPERATORS{{
    {"%{", TokenKind::PercentBrace}, {"<>", TokenKind::Concat},     {"++", TokenKind::ListConcat},
    {"==", TokenKind::Equal},        {"!=", TokenKind::NotEqual},   {"<=", TokenKind::LessEqual},
    {">=", TokenKind::GreaterEqual}, {"->", TokenKind::Arrow},      {"=>", TokenKind::FatArrow},
    {"&&", TokenKind::AndAnd},       {"||", TokenKind::OrOr},       {"+", TokenKind::Plus},
    {"-", TokenKind::Minus},         {"*", TokenKind::Star},        {"/", TokenKind::Slash},
    {"<", TokenKind::Less},          {">", TokenKind::Greater},     {"=", TokenKind::Assign},
    {"!", TokenKind::Bang},          {".", TokenKind::Dot},         {",", TokenKind::Comma},
    {"(", TokenKind::LParen},        {")", TokenKind::RParen},      {"[", TokenKind::LBracket},
    {"]", TokenKind::RBracket},      {"{", TokenKind::LBrace},      {"}", TokenKind::RBrace},
}};

bool is_ident_start(char chr) {
    return chr == '_' || (chr >= 'a' && chr <= 'z');
}

bool is_ident_char(char chr) {
    return chr == '_' || std::isalnum(static_cast<unsigned char>(chr)) != 0;
}

bool is_digit(char chr) {
    return chr >= '0' && chr <= '9';
}

class Lexer
{
public:
    explicit Lexer(std::string_view source)
        : source_{source} {}

    Expected<std::vector<Token>, Fault> run() {
        std::vector<Token> tokens;

        while (!at_end()) {
            char chr = peek();

            if (chr == ' ' || chr == '\t' || chr == '\r') {
                advance();
                continue;
            }

            if (chr == '#') {
                while (!at_end() && peek() != '\n') {
                    advance();
                }
                continue;
            }

            SourcePos start = pos_;

            if (chr == '\n' || chr == ';') {
                advance();
                tokens.push_back({TokenKind::Separator, std::string(1, chr), start});
                continue;
            }

            std::optional<Token> tok;

            if (is_digit(chr)) {
                tok = lex_number();
            } else if (chr == '"') {
                auto str = lex_string();
                if (!str) {
                    return str.error();
                }
                tok = std::move(str.value());
            } else if (chr == ':' && is_ident_start_or_upper(peek(1))) {
                tok = lex_atom();
            } else if (is_ident_start(chr)) {
                tok = lex_identifier();
            } else if (chr >= 'A' && chr <= 'Z') {
                tok = lex_module_name();
            } else {
                tok = lex_operator();
            }

            if (!tok) {
                return Fault{FaultKind::Syntax, fmt::format("unexpected character '{}'", chr), start.line};
            }

            tok->pos = start;
            tokens.push_back(std::move(*tok));
        }

        tokens.push_back({TokenKind::EndOfInput, "", pos_});

        return tokens;
    }

private:
    static bool is_ident_start_or_upper(char chr) { return is_ident_start(chr) || (chr >= 'A' && chr <= 'Z'); }

    bool at_end() const { return offset_ >= source_.size(); }

    char peek(std::size_t ahead = 0) const {
        if (offset_ + ahead >= source_.size()) {
            return '\0';
        }
        return source_[offset_ + ahead];
    }

    char advance() {
        char chr = source_[offset_++];
        if (chr == '\n') {
            ++pos_.line;
            pos_.column = 1;
        } else {
            ++pos_.column;
        }
        return chr;
    }

    Token lex_number() {
        std::string text;
        bool is_float = false;

        auto take_digits = [this, &text] {
            while (is_digit(peek()) || (peek() == '_' && is_digit(peek(1)))) {
                char chr = advance();
                if (chr != '_') {
                    text += chr;
                }
            }
        };

        take_digits();

        if (peek() == '.' && is_digit(peek(1))) {
            is_float = true;
            text += advance();
            take_digits();

            if ((peek() == 'e' || peek() == 'E') &&
                (is_digit(peek(1)) || ((peek(1) == '-' || peek(1) == '+') && is_digit(peek(2))))) {
                text += advance();
                if (peek() == '-' || peek() == '+') {
                    text += advance();
                }
                take_digits();
            }
        }

        return {is_float ? TokenKind::Float : TokenKind::Integer, std::move(text), {}};
    }

    Expected<Token, Fault> lex_string() {
        int start_line = pos_.line;
        advance(); // opening quote

        std::string text;

        while (!at_end() && peek() != '"') {
            char chr = advance();

            if (chr != '\\') {
                text += chr;
                continue;
            }

            if (at_end()) {
                break;
            }

            char escaped = advance();
            switch (escaped) {
            case 'n':
                text += '\n';
                break;
            case 't':
                text += '\t';
                break;
            case 'r':
                text += '\r';
                break;
            case '0':
                text += '\0';
                break;
            case '\\':
            case '"':
                text += escaped;
                break;
            default:
                return Fault{FaultKind::Syntax, fmt::format("unknown escape sequence \\{}", escaped), pos_.line};
            }
        }

        if (at_end()) {
            return Fault{FaultKind::Syntax, "unterminated string literal", start_line};
        }

        advance(); // closing quote

        return Token{TokenKind::String, std::move(text), {}};
    }

    Token lex_atom() {
        advance(); // ':'

        std::string text;
        while (is_ident_char(peek())) {
            text += advance();
        }
        if (peek() == '?' || peek() == '!') {
            text += advance();
        }

        return {TokenKind::Atom, std::move(text), {}};
    }

    Token lex_identifier() {
        std::string text;
        while (is_ident_char(peek())) {
            text += advance();
        }
        if (peek() == '?' || peek() == '!') {
            // "x != y" must not swallow the '!'
            if (!(peek() == '!' && peek(1) == '=')) {
                text += advance();
            }
        }

        for (const auto& [keyword, kind] : KEYWORDS) {
            if (text == keyword) {
                return {kind, std::move(text), {}};
            }
        }

        return {TokenKind::Identifier, std::move(text), {}};
    }

    Token lex_module_name() {
        std::string text;
        while (is_ident_char(peek())) {
            text += advance();
        }
        return {TokenKind::ModuleName, std::move(text), {}};
    }

    std::optional<Token> lex_operator() {
        std::string_view rest = source_.substr(offset_);

        for (const auto& [lexeme, kind] : OPERATORS) {
            if (rest.starts_with(lexeme)) {
                for (std::size_t i = 0; i < lexeme.size(); ++i) {
                    advance();
                }
                return Token{kind, std::string{lexeme}, {}};
            }
        }

        return std::nullopt;
    }

    std::string_view source_;
    std::size_t offset_ = 0;
    SourcePos pos_;
};

} // namespace

Expected<std::vector<Token>, Fault> tokenize(std::string_view source) {
    return Lexer{source}.run();
}

} // namespace codekata::lang
