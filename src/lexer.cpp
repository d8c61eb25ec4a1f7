#include "kestrel/lexer.h"
#include "kestrel/error.h"
#include "kestrel/value.h"
#include <cctype>
#include <cstdlib>
#include <cstring>

namespace kestrel {

const char* tokenTypeName(TokenType type) {
    switch (type) {
        case TokenType::IntLiteral: return "IntLiteral";
        case TokenType::FloatLiteral: return "FloatLiteral";
        case TokenType::StringLiteral: return "StringLiteral";
        case TokenType::CharLiteral: return "CharLiteral";
        case TokenType::BoolTrue: return "'true'";
        case TokenType::BoolFalse: return "'false'";
        case TokenType::Name: return "identifier";
        case TokenType::LeftBrace: return "'{'";
        case TokenType::RightBrace: return "'}'";
        case TokenType::LeftParen: return "'('";
        case TokenType::RightParen: return "')'";
        case TokenType::LeftBracket: return "'['";
        case TokenType::RightBracket: return "']'";
        case TokenType::MapStart: return "'#{'";
        case TokenType::Dot: return "'.'";
        case TokenType::Comma: return "','";
        case TokenType::Semicolon: return "';'";
        case TokenType::Colon: return "':'";
        case TokenType::FatArrow: return "'=>'";
        case TokenType::Plus: return "'+'";
        case TokenType::Minus: return "'-'";
        case TokenType::Star: return "'*'";
        case TokenType::Slash: return "'/'";
        case TokenType::Percent: return "'%'";
        case TokenType::StarStar: return "'**'";
        case TokenType::ShiftLeft: return "'<<'";
        case TokenType::ShiftRight: return "'>>'";
        case TokenType::Ampersand: return "'&'";
        case TokenType::Pipe: return "'|'";
        case TokenType::Caret: return "'^'";
        case TokenType::Bang: return "'!'";
        case TokenType::AndAnd: return "'&&'";
        case TokenType::OrOr: return "'||'";
        case TokenType::Less: return "'<'";
        case TokenType::Greater: return "'>'";
        case TokenType::LessEqual: return "'<='";
        case TokenType::GreaterEqual: return "'>='";
        case TokenType::EqualEqual: return "'=='";
        case TokenType::BangEqual: return "'!='";
        case TokenType::DotDot: return "'..'";
        case TokenType::DotDotEqual: return "'..='";
        case TokenType::QuestionQuestion: return "'?\?'";
        case TokenType::Equal: return "'='";
        case TokenType::PlusEqual: return "'+='";
        case TokenType::MinusEqual: return "'-='";
        case TokenType::StarEqual: return "'*='";
        case TokenType::SlashEqual: return "'/='";
        case TokenType::PercentEqual: return "'%='";
        case TokenType::StarStarEqual: return "'**='";
        case TokenType::ShiftLeftEqual: return "'<<='";
        case TokenType::ShiftRightEqual: return "'>>='";
        case TokenType::AmpersandEqual: return "'&='";
        case TokenType::PipeEqual: return "'|='";
        case TokenType::CaretEqual: return "'^='";
        case TokenType::Let: return "'let'";
        case TokenType::Const: return "'const'";
        case TokenType::If: return "'if'";
        case TokenType::Else: return "'else'";
        case TokenType::Switch: return "'switch'";
        case TokenType::Do: return "'do'";
        case TokenType::While: return "'while'";
        case TokenType::Until: return "'until'";
        case TokenType::Loop: return "'loop'";
        case TokenType::For: return "'for'";
        case TokenType::In: return "'in'";
        case TokenType::Fn: return "'fn'";
        case TokenType::Return: return "'return'";
        case TokenType::Break: return "'break'";
        case TokenType::Continue: return "'continue'";
        case TokenType::Eof: return "end of input";
    }
    return "unknown";
}

namespace {

struct Spelling {
    const char* text;
    TokenType type;
};

const Spelling kKeywords[] = {
    {"true", TokenType::BoolTrue},
    {"false", TokenType::BoolFalse},
    {"let", TokenType::Let},
    {"const", TokenType::Const},
    {"if", TokenType::If},
    {"else", TokenType::Else},
    {"switch", TokenType::Switch},
    {"do", TokenType::Do},
    {"while", TokenType::While},
    {"until", TokenType::Until},
    {"loop", TokenType::Loop},
    {"for", TokenType::For},
    {"in", TokenType::In},
    {"fn", TokenType::Fn},
    {"return", TokenType::Return},
    {"break", TokenType::Break},
    {"continue", TokenType::Continue},
};

// Ordered longest first so the first hit is the longest match.
const Spelling kOperators[] = {
    {"**=", TokenType::StarStarEqual},
    {"<<=", TokenType::ShiftLeftEqual},
    {">>=", TokenType::ShiftRightEqual},
    {"..=", TokenType::DotDotEqual},
    {"**", TokenType::StarStar},
    {"<<", TokenType::ShiftLeft},
    {">>", TokenType::ShiftRight},
    {"<=", TokenType::LessEqual},
    {">=", TokenType::GreaterEqual},
    {"==", TokenType::EqualEqual},
    {"!=", TokenType::BangEqual},
    {"&&", TokenType::AndAnd},
    {"||", TokenType::OrOr},
    {"+=", TokenType::PlusEqual},
    {"-=", TokenType::MinusEqual},
    {"*=", TokenType::StarEqual},
    {"/=", TokenType::SlashEqual},
    {"%=", TokenType::PercentEqual},
    {"&=", TokenType::AmpersandEqual},
    {"|=", TokenType::PipeEqual},
    {"^=", TokenType::CaretEqual},
    {"..", TokenType::DotDot},
    {"??", TokenType::QuestionQuestion},
    {"=>", TokenType::FatArrow},
    {"#{", TokenType::MapStart},
    {"+", TokenType::Plus},
    {"-", TokenType::Minus},
    {"*", TokenType::Star},
    {"/", TokenType::Slash},
    {"%", TokenType::Percent},
    {"&", TokenType::Ampersand},
    {"|", TokenType::Pipe},
    {"^", TokenType::Caret},
    {"!", TokenType::Bang},
    {"<", TokenType::Less},
    {">", TokenType::Greater},
    {"=", TokenType::Equal},
    {".", TokenType::Dot},
    {",", TokenType::Comma},
    {";", TokenType::Semicolon},
    {":", TokenType::Colon},
    {"(", TokenType::LeftParen},
    {")", TokenType::RightParen},
    {"[", TokenType::LeftBracket},
    {"]", TokenType::RightBracket},
    {"{", TokenType::LeftBrace},
    {"}", TokenType::RightBrace},
};

TokenType classifyKeyword(std::string_view text) {
    for (const auto& kw : kKeywords) {
        if (text == kw.text) return kw.type;
    }
    return TokenType::Name;
}

bool isIdentStart(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool isIdentChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

int digitValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return 99;
}

} // anonymous namespace

bool isKeyword(TokenType type) {
    for (const auto& kw : kKeywords) {
        if (kw.type == type) return true;
    }
    return false;
}

Lexer::Lexer(std::string_view source, DialectConfig dialect)
    : source_(source), dialect_(dialect) {}

Token Lexer::next() {
    if (peeked_) {
        Token t = std::move(*peeked_);
        peeked_.reset();
        return t;
    }
    return scanToken();
}

Token Lexer::peek() {
    if (!peeked_) {
        peeked_ = scanToken();
    }
    return *peeked_;
}

void Lexer::reset() {
    pos_ = 0;
    line_ = 1;
    column_ = 1;
    peeked_.reset();
}

bool Lexer::atEnd() {
    return peek().type == TokenType::Eof;
}

SourceLocation Lexer::currentLocation() const {
    return loc();
}

char Lexer::current() const {
    return pos_ < source_.size() ? source_[pos_] : '\0';
}

char Lexer::peekChar(size_t offset) const {
    size_t idx = pos_ + offset;
    return idx < source_.size() ? source_[idx] : '\0';
}

char Lexer::advance() {
    char c = current();
    pos_++;
    if (c == '\n') {
        line_++;
        column_ = 1;
    } else {
        column_++;
    }
    return c;
}

bool Lexer::isAtEnd() const {
    return pos_ >= source_.size();
}

SourceLocation Lexer::loc() const {
    return {line_, column_, static_cast<uint32_t>(pos_)};
}

Token Lexer::makeToken(TokenType type, std::string text, SourceLocation location) const {
    Token t;
    t.type = type;
    t.text = std::move(text);
    t.location = location;
    return t;
}

void Lexer::skipWhitespaceAndComments() {
    while (!isAtEnd()) {
        char c = current();
        if (c == ' ' || c == '\t' || c == '\r' || c == '\n') {
            advance();
        } else if (c == '/' && peekChar() == '/') {
            while (!isAtEnd() && current() != '\n') advance();
        } else if (c == '/' && peekChar() == '*') {
            // Block comments nest
            auto start = loc();
            advance();
            advance();
            int depth = 1;
            while (depth > 0) {
                if (isAtEnd()) {
                    throw LexError(LexErrorKind::UnterminatedComment,
                                   "Unterminated block comment", start);
                }
                if (current() == '/' && peekChar() == '*') {
                    advance();
                    advance();
                    depth++;
                } else if (current() == '*' && peekChar() == '/') {
                    advance();
                    advance();
                    depth--;
                } else {
                    advance();
                }
            }
        } else {
            break;
        }
    }
}

Token Lexer::scanNumber() {
    auto startLoc = loc();
    size_t start = pos_;

    // Radix-prefixed integers
    if (current() == '0' && (peekChar() == 'x' || peekChar() == 'o' || peekChar() == 'b')) {
        char prefix = peekChar();
        int radix = prefix == 'x' ? 16 : prefix == 'o' ? 8 : 2;
        advance();
        advance();
        uint64_t value = 0;
        bool anyDigit = false;
        while (!isAtEnd() && (isIdentChar(current()))) {
            char c = advance();
            if (c == '_') continue;
            int d = digitValue(c);
            if (d >= radix) {
                throw LexError(LexErrorKind::MalformedNumber,
                               "Invalid digit '" + std::string(1, c) + "' in number literal",
                               startLoc);
            }
            if (value > (UINT64_MAX - static_cast<uint64_t>(d)) / static_cast<uint64_t>(radix)) {
                throw LexError(LexErrorKind::MalformedNumber, "Integer literal is too large",
                               startLoc);
            }
            value = value * static_cast<uint64_t>(radix) + static_cast<uint64_t>(d);
            anyDigit = true;
        }
        if (!anyDigit) {
            throw LexError(LexErrorKind::MalformedNumber, "Missing digits after '0" +
                           std::string(1, prefix) + "'", startLoc);
        }
        if (value > static_cast<uint64_t>(INT64_MAX)) {
            throw LexError(LexErrorKind::MalformedNumber, "Integer literal is too large",
                           startLoc);
        }
        Token t = makeToken(TokenType::IntLiteral, source_.substr(start, pos_ - start), startLoc);
        t.intValue = static_cast<int64_t>(value);
        return t;
    }

    std::string digits;
    bool isFloat = false;

    auto scanDigits = [&]() {
        while (!isAtEnd() && (std::isdigit(static_cast<unsigned char>(current())) ||
                              current() == '_')) {
            char c = advance();
            if (c != '_') digits += c;
        }
    };

    scanDigits();

    // Fraction only when a digit follows the '.', so `1..2` and `1.max()` stay integers
    if (current() == '.' && std::isdigit(static_cast<unsigned char>(peekChar()))) {
        isFloat = true;
        digits += advance();
        scanDigits();
    }

    // Exponent
    if (current() == 'e' || current() == 'E') {
        bool signedExp = (peekChar() == '+' || peekChar() == '-') &&
                         std::isdigit(static_cast<unsigned char>(peekChar(2)));
        if (signedExp || std::isdigit(static_cast<unsigned char>(peekChar()))) {
            isFloat = true;
            digits += advance();
            if (signedExp) digits += advance();
            scanDigits();
        }
    }

    if (!isAtEnd() && isIdentChar(current())) {
        throw LexError(LexErrorKind::MalformedNumber,
                       "Invalid character '" + std::string(1, current()) + "' in number literal",
                       startLoc);
    }

    std::string text = source_.substr(start, pos_ - start);

    if (isFloat) {
        if (!dialect_.allow_decimal_literals) {
            throw LexError(LexErrorKind::MalformedNumber,
                           "Decimal literals are not allowed: " + text, startLoc);
        }
        Token t = makeToken(TokenType::FloatLiteral, std::move(text), startLoc);
        t.floatValue = std::strtod(digits.c_str(), nullptr);
        return t;
    }

    uint64_t value = 0;
    for (char c : digits) {
        uint64_t d = static_cast<uint64_t>(c - '0');
        if (value > (static_cast<uint64_t>(INT64_MAX) - d) / 10) {
            throw LexError(LexErrorKind::MalformedNumber, "Integer literal is too large: " + text,
                           startLoc);
        }
        value = value * 10 + d;
    }
    Token t = makeToken(TokenType::IntLiteral, std::move(text), startLoc);
    t.intValue = static_cast<int64_t>(value);
    return t;
}

Token Lexer::scanName() {
    auto startLoc = loc();
    size_t start = pos_;

    while (!isAtEnd() && isIdentChar(current())) {
        advance();
    }

    std::string text = source_.substr(start, pos_ - start);
    TokenType type = classifyKeyword(text);

    return makeToken(type, std::move(text), startLoc);
}

char32_t Lexer::scanEscape(SourceLocation backslashLoc) {
    advance(); // consume '\'
    if (isAtEnd()) {
        throw LexError(LexErrorKind::InvalidEscape, "Incomplete escape sequence", backslashLoc);
    }
    char c = advance();
    int hexDigits = 0;
    switch (c) {
        case 'n': return U'\n';
        case 't': return U'\t';
        case 'r': return U'\r';
        case '0': return U'\0';
        case '\\': return U'\\';
        case '"': return U'"';
        case '\'': return U'\'';
        case 'x': hexDigits = 2; break;
        case 'u': hexDigits = 4; break;
        case 'U': hexDigits = 8; break;
        default:
            throw LexError(LexErrorKind::InvalidEscape,
                           "Invalid escape sequence '\\" + std::string(1, c) + "'", backslashLoc);
    }

    uint32_t cp = 0;
    for (int i = 0; i < hexDigits; i++) {
        int d = digitValue(current());
        if (isAtEnd() || d >= 16) {
            throw LexError(LexErrorKind::InvalidEscape,
                           "Expected " + std::to_string(hexDigits) + " hex digits after '\\" +
                           std::string(1, c) + "'", backslashLoc);
        }
        advance();
        cp = cp * 16 + static_cast<uint32_t>(d);
    }
    if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
        throw LexError(LexErrorKind::InvalidEscape, "Escape is not a valid code point",
                       backslashLoc);
    }
    return static_cast<char32_t>(cp);
}

// Copy one source character, keeping multi-byte UTF-8 sequences intact.
char32_t Lexer::appendSourceChar(std::string& out) {
    auto startLoc = loc();
    auto lead = static_cast<unsigned char>(advance());
    out += static_cast<char>(lead);
    if (lead < 0x80) return lead;

    int extra = lead >= 0xF8 ? -1 : lead >= 0xF0 ? 3 : lead >= 0xE0 ? 2 : lead >= 0xC0 ? 1 : -1;
    if (extra < 0) {
        throw LexError(LexErrorKind::InvalidUtf8, "Invalid UTF-8 lead byte", startLoc);
    }
    char32_t cp = lead & (0x3F >> extra);
    for (int i = 0; i < extra; i++) {
        if (isAtEnd() || (static_cast<unsigned char>(current()) & 0xC0) != 0x80) {
            throw LexError(LexErrorKind::InvalidUtf8, "Truncated UTF-8 sequence", startLoc);
        }
        auto b = static_cast<unsigned char>(advance());
        out += static_cast<char>(b);
        cp = (cp << 6) | (b & 0x3F);
    }
    return cp;
}

Token Lexer::scanString() {
    auto startLoc = loc();
    advance(); // consume opening '"'

    std::string text;

    while (true) {
        if (isAtEnd() || current() == '\n') {
            throw LexError(LexErrorKind::UnterminatedString, "Unterminated string literal",
                           startLoc);
        }
        char c = current();
        if (c == '"') break;
        if (c == '\\') {
            appendUtf8(text, scanEscape(loc()));
        } else {
            appendSourceChar(text);
        }
    }
    advance(); // consume closing '"'

    return makeToken(TokenType::StringLiteral, std::move(text), startLoc);
}

Token Lexer::scanChar() {
    auto startLoc = loc();
    advance(); // consume opening '\''

    if (isAtEnd() || current() == '\n') {
        throw LexError(LexErrorKind::UnterminatedChar, "Unterminated character literal", startLoc);
    }
    if (current() == '\'') {
        throw LexError(LexErrorKind::MalformedChar, "Empty character literal", startLoc);
    }

    char32_t cp;
    std::string text;
    if (current() == '\\') {
        cp = scanEscape(loc());
        appendUtf8(text, cp);
    } else {
        cp = appendSourceChar(text);
    }

    if (isAtEnd() || current() == '\n') {
        throw LexError(LexErrorKind::UnterminatedChar, "Unterminated character literal", startLoc);
    }
    if (current() != '\'') {
        throw LexError(LexErrorKind::MalformedChar,
                       "Character literal must hold exactly one character", startLoc);
    }
    advance(); // consume closing '\''

    Token t = makeToken(TokenType::CharLiteral, std::move(text), startLoc);
    t.charValue = static_cast<uint32_t>(cp);
    return t;
}

Token Lexer::scanOperator() {
    auto startLoc = loc();
    size_t remaining = source_.size() - pos_;
    for (const auto& op : kOperators) {
        size_t len = std::strlen(op.text);
        if (len <= remaining && source_.compare(pos_, len, op.text) == 0) {
            for (size_t i = 0; i < len; i++) advance();
            return makeToken(op.type, op.text, startLoc);
        }
    }
    throw LexError(LexErrorKind::UnexpectedCharacter,
                   std::string("Unexpected character: '") + current() + "'", startLoc);
}

Token Lexer::scanToken() {
    skipWhitespaceAndComments();

    if (isAtEnd()) {
        return makeToken(TokenType::Eof, "", loc());
    }

    char c = current();

    if (std::isdigit(static_cast<unsigned char>(c))) {
        return scanNumber();
    }
    if (isIdentStart(c)) {
        return scanName();
    }
    if (c == '"') {
        return scanString();
    }
    if (c == '\'') {
        return scanChar();
    }
    return scanOperator();
}

} // namespace kestrel
