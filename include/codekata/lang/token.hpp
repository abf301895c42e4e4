#pragma once

#include <codekata/common/formatters/macros.hpp>

#include <string>

namespace codekata::lang {

enum class TokenKind {
    Integer,
    Float,
    String,
    Atom,
    Identifier,
    ModuleName,

    KwTrue,
    KwFalse,
    KwNil,
    KwDef,
    KwDo,
    KwEnd,
    KwFn,
    KwIf,
    KwElse,
    KwWhile,
    KwAnd,
    KwOr,
    KwNot,

    Plus,
    Minus,
    Star,
    Slash,
    Concat,     // <>
    ListConcat, // ++
    Equal,      // ==
    NotEqual,   // !=
    Less,
    LessEqual,
    Greater,
    GreaterEqual,
    Assign,
    AndAnd,
    OrOr,
    Bang,
    Arrow,    // ->
    FatArrow, // =>
    Dot,
    Comma,
    LParen,
    RParen,
    LBracket,
    RBracket,
    LBrace,
    RBrace,
    PercentBrace, // %{

    Separator, // newline or ';'
    EndOfInput,
};

struct SourcePos
{
    int line = 1;
    int column = 1;

    bool operator==(const SourcePos&) const = default;
};

struct Token
{
    TokenKind kind;
    /// Lexeme as written, except for strings (escapes decoded) and atoms (without ':')
    std::string text;
    SourcePos pos;
};

} // namespace codekata::lang

FMT_SERIALIZE_ENUM(::codekata::lang::TokenKind, Integer, Float, String, Atom, Identifier, ModuleName, KwTrue, KwFalse,
                   KwNil, KwDef, KwDo, KwEnd, KwFn, KwIf, KwElse, KwWhile, KwAnd, KwOr, KwNot, Plus, Minus, Star,
                   Slash, Concat, ListConcat, Equal, NotEqual, Less, LessEqual, Greater, GreaterEqual, Assign, AndAnd,
                   OrOr, Bang, Arrow, FatArrow, Dot, Comma, LParen, RParen, LBracket, RBracket, LBrace, RBrace,
                   PercentBrace, Separator, EndOfInput);
