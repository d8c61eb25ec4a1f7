#include <catch2/catch_test_macros.hpp>
#include "kestrel/lexer.h"
#include "kestrel/error.h"

using namespace kestrel;

// Helper to collect all tokens
static std::vector<Token> tokenize(std::string_view source, DialectConfig dialect = {}) {
    Lexer lexer(source, dialect);
    std::vector<Token> tokens;
    while (true) {
        Token t = lexer.next();
        tokens.push_back(t);
        if (t.type == TokenType::Eof) break;
    }
    return tokens;
}

static LexErrorKind lexErrorKind(std::string_view source, DialectConfig dialect = {}) {
    try {
        tokenize(source, dialect);
    } catch (const LexError& e) {
        return e.kind();
    }
    FAIL("expected a LexError for: " << source);
    return LexErrorKind::UnexpectedCharacter;
}

TEST_CASE("Lexer empty input", "[lexer]") {
    auto tokens = tokenize("");
    REQUIRE(tokens.size() == 1);
    CHECK(tokens[0].type == TokenType::Eof);
}

TEST_CASE("Lexer whitespace and comments only", "[lexer]") {
    auto tokens = tokenize("  \t\n // line comment\n /* block /* nested */ still */  ");
    REQUIRE(tokens.size() == 1);
    CHECK(tokens[0].type == TokenType::Eof);
}

TEST_CASE("Lexer let statement", "[lexer]") {
    auto tokens = tokenize("let x = 5;");
    REQUIRE(tokens.size() == 6);
    CHECK(tokens[0].type == TokenType::Let);
    CHECK(tokens[1].type == TokenType::Name);
    CHECK(tokens[1].text == "x");
    CHECK(tokens[2].type == TokenType::Equal);
    CHECK(tokens[3].type == TokenType::IntLiteral);
    CHECK(tokens[3].intValue == 5);
    CHECK(tokens[4].type == TokenType::Semicolon);
    CHECK(tokens[5].type == TokenType::Eof);
}

TEST_CASE("Lexer keywords", "[lexer]") {
    auto tokens = tokenize("let const if else switch do while until loop for in fn return "
                           "break continue true false");
    CHECK(tokens[0].type == TokenType::Let);
    CHECK(tokens[1].type == TokenType::Const);
    CHECK(tokens[2].type == TokenType::If);
    CHECK(tokens[3].type == TokenType::Else);
    CHECK(tokens[4].type == TokenType::Switch);
    CHECK(tokens[5].type == TokenType::Do);
    CHECK(tokens[6].type == TokenType::While);
    CHECK(tokens[7].type == TokenType::Until);
    CHECK(tokens[8].type == TokenType::Loop);
    CHECK(tokens[9].type == TokenType::For);
    CHECK(tokens[10].type == TokenType::In);
    CHECK(tokens[11].type == TokenType::Fn);
    CHECK(tokens[12].type == TokenType::Return);
    CHECK(tokens[13].type == TokenType::Break);
    CHECK(tokens[14].type == TokenType::Continue);
    CHECK(tokens[15].type == TokenType::BoolTrue);
    CHECK(tokens[16].type == TokenType::BoolFalse);
    CHECK(isKeyword(TokenType::Fn));
    CHECK_FALSE(isKeyword(TokenType::Name));
}

TEST_CASE("Lexer identifiers", "[lexer]") {
    auto tokens = tokenize("_tmp letter x1 iffy");
    CHECK(tokens[0].type == TokenType::Name);
    CHECK(tokens[0].text == "_tmp");
    CHECK(tokens[1].type == TokenType::Name);
    CHECK(tokens[1].text == "letter");
    CHECK(tokens[2].text == "x1");
    CHECK(tokens[3].type == TokenType::Name);
}

TEST_CASE("Lexer integer literals", "[lexer]") {
    auto tokens = tokenize("42 0 1_000_000 0xFF 0o17 0b1010");
    CHECK(tokens[0].intValue == 42);
    CHECK(tokens[1].intValue == 0);
    CHECK(tokens[2].intValue == 1000000);
    CHECK(tokens[3].intValue == 255);
    CHECK(tokens[4].intValue == 15);
    CHECK(tokens[5].intValue == 10);
    for (int i = 0; i < 6; i++) {
        CHECK(tokens[i].type == TokenType::IntLiteral);
    }
}

TEST_CASE("Lexer largest integer literal", "[lexer]") {
    auto tokens = tokenize("9223372036854775807");
    CHECK(tokens[0].intValue == INT64_MAX);
    CHECK(lexErrorKind("9223372036854775808") == LexErrorKind::MalformedNumber);
}

TEST_CASE("Lexer float literals", "[lexer]") {
    auto tokens = tokenize("3.14 0.5 1e3 2.5E-2");
    CHECK(tokens[0].type == TokenType::FloatLiteral);
    CHECK(tokens[0].floatValue == 3.14);
    CHECK(tokens[1].floatValue == 0.5);
    CHECK(tokens[2].type == TokenType::FloatLiteral);
    CHECK(tokens[2].floatValue == 1000.0);
    CHECK(tokens[3].floatValue == 0.025);
}

TEST_CASE("Lexer integer followed by range or method", "[lexer]") {
    auto tokens = tokenize("1..5");
    REQUIRE(tokens.size() == 4);
    CHECK(tokens[0].type == TokenType::IntLiteral);
    CHECK(tokens[1].type == TokenType::DotDot);
    CHECK(tokens[2].type == TokenType::IntLiteral);

    tokens = tokenize("5.abs()");
    CHECK(tokens[0].type == TokenType::IntLiteral);
    CHECK(tokens[1].type == TokenType::Dot);
    CHECK(tokens[2].type == TokenType::Name);
}

TEST_CASE("Lexer decimal literals can be disabled", "[lexer]") {
    DialectConfig dialect;
    dialect.allow_decimal_literals = false;
    CHECK(lexErrorKind("1.5", dialect) == LexErrorKind::MalformedNumber);
    CHECK(tokenize("15", dialect)[0].intValue == 15);
}

TEST_CASE("Lexer malformed numbers", "[lexer]") {
    CHECK(lexErrorKind("12abc") == LexErrorKind::MalformedNumber);
    CHECK(lexErrorKind("0x") == LexErrorKind::MalformedNumber);
    CHECK(lexErrorKind("0b102") == LexErrorKind::MalformedNumber);
}

TEST_CASE("Lexer string escapes", "[lexer]") {
    auto tokens = tokenize(R"("hello\nworld")");
    CHECK(tokens[0].type == TokenType::StringLiteral);
    CHECK(tokens[0].text == "hello\nworld");

    tokens = tokenize(R"("tab\there \"quoted\" back\\slash")");
    CHECK(tokens[0].text == "tab\there \"quoted\" back\\slash");

    tokens = tokenize(R"("\x41é\U0001F600")");
    CHECK(tokens[0].text == "A\xC3\xA9\xF0\x9F\x98\x80");
}

TEST_CASE("Lexer passes UTF-8 through strings", "[lexer]") {
    auto tokens = tokenize("\"caf\xC3\xA9\"");
    CHECK(tokens[0].text == "caf\xC3\xA9");
}

TEST_CASE("Lexer char literals", "[lexer]") {
    auto tokens = tokenize(R"('a' '\n' 'é')");
    CHECK(tokens[0].type == TokenType::CharLiteral);
    CHECK(tokens[0].charValue == 'a');
    CHECK(tokens[1].charValue == '\n');
    CHECK(tokens[2].charValue == 0xE9);

    tokens = tokenize("'\xC3\xA9'");
    CHECK(tokens[0].charValue == 0xE9);
}

TEST_CASE("Lexer decodes multi-byte characters", "[lexer]") {
    auto tokens = tokenize("'\xF0\x9F\x98\x80' '\xE2\x82\xAC'");
    CHECK(tokens[0].charValue == 0x1F600);
    CHECK(tokens[1].charValue == 0x20AC);
    CHECK(tokens[1].text == "\xE2\x82\xAC");
}

TEST_CASE("Lexer rejects malformed UTF-8", "[lexer]") {
    CHECK(lexErrorKind("'\xC3'") == LexErrorKind::InvalidUtf8);
    CHECK(lexErrorKind("'\xF0\x9F\x98'") == LexErrorKind::InvalidUtf8);
    CHECK(lexErrorKind("\"a\xE2\x82\"") == LexErrorKind::InvalidUtf8);
    CHECK(lexErrorKind("\"\x80\"") == LexErrorKind::InvalidUtf8);
    CHECK(lexErrorKind("\"\xFF\"") == LexErrorKind::InvalidUtf8);

    try {
        tokenize("let s = \"ab\xC3\";");
        FAIL("expected LexError");
    } catch (const LexError& e) {
        CHECK(e.location().column == 12);
    }
}

TEST_CASE("Lexer operators use longest match", "[lexer]") {
    auto tokens = tokenize("a **= b ** c <<= d ..= e .. f ?? g => h #{ } || |");
    CHECK(tokens[1].type == TokenType::StarStarEqual);
    CHECK(tokens[3].type == TokenType::StarStar);
    CHECK(tokens[5].type == TokenType::ShiftLeftEqual);
    CHECK(tokens[7].type == TokenType::DotDotEqual);
    CHECK(tokens[9].type == TokenType::DotDot);
    CHECK(tokens[11].type == TokenType::QuestionQuestion);
    CHECK(tokens[13].type == TokenType::FatArrow);
    CHECK(tokens[15].type == TokenType::MapStart);
    CHECK(tokens[16].type == TokenType::RightBrace);
    CHECK(tokens[17].type == TokenType::OrOr);
    CHECK(tokens[18].type == TokenType::Pipe);
}

TEST_CASE("Lexer comparison and compound operators", "[lexer]") {
    auto tokens = tokenize("<= >= == != && += -= %= ^=");
    CHECK(tokens[0].type == TokenType::LessEqual);
    CHECK(tokens[1].type == TokenType::GreaterEqual);
    CHECK(tokens[2].type == TokenType::EqualEqual);
    CHECK(tokens[3].type == TokenType::BangEqual);
    CHECK(tokens[4].type == TokenType::AndAnd);
    CHECK(tokens[5].type == TokenType::PlusEqual);
    CHECK(tokens[6].type == TokenType::MinusEqual);
    CHECK(tokens[7].type == TokenType::PercentEqual);
    CHECK(tokens[8].type == TokenType::CaretEqual);
}

TEST_CASE("Lexer tracks line and column", "[lexer]") {
    auto tokens = tokenize("let x\n  = 42");
    CHECK(tokens[0].location.line == 1);
    CHECK(tokens[0].location.column == 1);
    CHECK(tokens[1].location.column == 5);
    CHECK(tokens[2].location.line == 2);
    CHECK(tokens[2].location.column == 3);
    CHECK(tokens[3].location.line == 2);
    CHECK(tokens[3].location.column == 5);
}

TEST_CASE("Lexer unterminated string points at the opening quote", "[lexer]") {
    try {
        tokenize("let s = \"abc");
        FAIL("expected LexError");
    } catch (const LexError& e) {
        CHECK(e.kind() == LexErrorKind::UnterminatedString);
        CHECK(e.location().line == 1);
        CHECK(e.location().column == 9);
    }
}

TEST_CASE("Lexer string may not span lines", "[lexer]") {
    CHECK(lexErrorKind("\"abc\ndef\"") == LexErrorKind::UnterminatedString);
}

TEST_CASE("Lexer unterminated comment points at its start", "[lexer]") {
    try {
        tokenize("x /* a /* b */ c");
        FAIL("expected LexError");
    } catch (const LexError& e) {
        CHECK(e.kind() == LexErrorKind::UnterminatedComment);
        CHECK(e.location().column == 3);
    }
}

TEST_CASE("Lexer invalid escapes", "[lexer]") {
    try {
        tokenize(R"("ab\qc")");
        FAIL("expected LexError");
    } catch (const LexError& e) {
        CHECK(e.kind() == LexErrorKind::InvalidEscape);
        CHECK(e.location().column == 4);
    }
    CHECK(lexErrorKind(R"("\x4")") == LexErrorKind::InvalidEscape);
    CHECK(lexErrorKind(R"("\uD800")") == LexErrorKind::InvalidEscape);
}

TEST_CASE("Lexer malformed char literals", "[lexer]") {
    CHECK(lexErrorKind("''") == LexErrorKind::MalformedChar);
    CHECK(lexErrorKind("'ab'") == LexErrorKind::MalformedChar);
    CHECK(lexErrorKind("'a") == LexErrorKind::UnterminatedChar);
}

TEST_CASE("Lexer unexpected character", "[lexer]") {
    CHECK(lexErrorKind("let x = @;") == LexErrorKind::UnexpectedCharacter);
    CHECK(lexErrorKind("a ? b") == LexErrorKind::UnexpectedCharacter);
}

TEST_CASE("Lexer peek does not consume", "[lexer]") {
    Lexer lexer("a b");
    CHECK(lexer.peek().text == "a");
    CHECK(lexer.peek().text == "a");
    CHECK(lexer.next().text == "a");
    CHECK(lexer.next().text == "b");
    CHECK(lexer.atEnd());
}

TEST_CASE("Lexer reset restarts the sequence", "[lexer]") {
    Lexer lexer("x + 1");
    lexer.next();
    lexer.next();
    lexer.reset();
    auto t = lexer.next();
    CHECK(t.text == "x");
    CHECK(t.location.column == 1);
}
