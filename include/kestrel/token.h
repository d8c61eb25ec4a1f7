#pragma once

#include "source_location.h"
#include <cstdint>
#include <string>

namespace kestrel {

enum class TokenType {
    // Literals
    IntLiteral,
    FloatLiteral,
    StringLiteral,
    CharLiteral,
    BoolTrue,
    BoolFalse,

    // Identifiers
    Name,

    // Punctuation
    LeftBrace,
    RightBrace,
    LeftParen,
    RightParen,
    LeftBracket,
    RightBracket,
    MapStart,        // #{
    Dot,
    Comma,
    Semicolon,
    Colon,
    FatArrow,        // =>

    // Operators
    Plus,
    Minus,
    Star,
    Slash,
    Percent,
    StarStar,
    ShiftLeft,
    ShiftRight,
    Ampersand,
    Pipe,
    Caret,
    Bang,
    AndAnd,
    OrOr,
    Less,
    Greater,
    LessEqual,
    GreaterEqual,
    EqualEqual,
    BangEqual,
    DotDot,
    DotDotEqual,
    QuestionQuestion,

    // Assignment
    Equal,
    PlusEqual,
    MinusEqual,
    StarEqual,
    SlashEqual,
    PercentEqual,
    StarStarEqual,
    ShiftLeftEqual,
    ShiftRightEqual,
    AmpersandEqual,
    PipeEqual,
    CaretEqual,

    // Keywords
    Let,
    Const,
    If,
    Else,
    Switch,
    Do,
    While,
    Until,
    Loop,
    For,
    In,
    Fn,
    Return,
    Break,
    Continue,

    Eof,
};

struct Token {
    TokenType type = TokenType::Eof;
    std::string text;        // source text, or the decoded string for string/char literals
    SourceLocation location;
    int64_t intValue = 0;
    double floatValue = 0.0;
    uint32_t charValue = 0;  // code point of a char literal
};

const char* tokenTypeName(TokenType type);

bool isKeyword(TokenType type);

} // namespace kestrel
