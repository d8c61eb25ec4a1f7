#pragma once

#include "dialect.h"
#include "token.h"
#include <optional>
#include <string>
#include <string_view>

namespace kestrel {

/// Lazy tokenizer. Produces one token per next() call; reset() restarts the
/// sequence from the beginning of the source.
class Lexer {
public:
    explicit Lexer(std::string_view source, DialectConfig dialect = {});

    Token next();
    Token peek();
    void reset();
    bool atEnd();
    SourceLocation currentLocation() const;

private:
    std::string source_;  // own a copy for stable storage
    DialectConfig dialect_;
    size_t pos_ = 0;
    uint32_t line_ = 1;
    uint32_t column_ = 1;

    // Peek cache
    std::optional<Token> peeked_;

    Token scanToken();
    Token scanNumber();
    Token scanString();
    Token scanChar();
    Token scanName();
    Token scanOperator();

    char32_t scanEscape(SourceLocation backslashLoc);
    // Copies one UTF-8 encoded character to `out` and returns its code point.
    char32_t appendSourceChar(std::string& out);

    void skipWhitespaceAndComments();
    char current() const;
    char peekChar(size_t offset = 1) const;
    char advance();
    bool isAtEnd() const;
    SourceLocation loc() const;

    Token makeToken(TokenType type, std::string text, SourceLocation location) const;
};

} // namespace kestrel
