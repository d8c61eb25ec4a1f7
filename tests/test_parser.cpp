#include <catch2/catch_test_macros.hpp>
#include "kestrel/parser.h"
#include "kestrel/error.h"

#include <string>

using namespace kestrel;

static std::shared_ptr<Ast> parse(std::string_view source, DialectConfig dialect = {}) {
    return Parser::parse(source, dialect);
}

static const AstNode& first(const std::shared_ptr<Ast>& ast) {
    REQUIRE(!ast->statements().empty());
    return *ast->statements()[0];
}

static ParseErrorKind parseErrorKind(std::string_view source, DialectConfig dialect = {}) {
    try {
        Parser::parse(source, dialect);
    } catch (const ParseError& e) {
        return e.kind();
    }
    FAIL("expected a ParseError for: " << source);
    return ParseErrorKind::UnexpectedToken;
}

TEST_CASE("Parser empty program", "[parser]") {
    auto ast = parse("");
    CHECK(ast->statements().empty());
    ast = parse(" ;; ; ");
    CHECK(ast->statements().empty());
}

TEST_CASE("Parser literals", "[parser]") {
    auto ast = parse("42; 2.5; \"hi\"; 'c'; true; ()");
    auto& s = ast->statements();
    REQUIRE(s.size() == 6);
    CHECK(s[0]->kind == AstNodeKind::IntLit);
    CHECK(s[0]->intValue == 42);
    CHECK(s[1]->kind == AstNodeKind::FloatLit);
    CHECK(s[2]->kind == AstNodeKind::StringLit);
    CHECK(s[2]->stringValue == "hi");
    CHECK(s[3]->kind == AstNodeKind::CharLit);
    CHECK(s[3]->charValue == 'c');
    CHECK(s[4]->kind == AstNodeKind::BoolLit);
    CHECK(s[5]->kind == AstNodeKind::UnitLit);
}

TEST_CASE("Parser multiplication binds tighter than addition", "[parser]") {
    auto ast = parse("2 + 3 * 4");
    auto& n = first(ast);
    REQUIRE(n.kind == AstNodeKind::Binary);
    CHECK(n.op == "+");
    CHECK(n.children[0]->intValue == 2);
    REQUIRE(n.children[1]->kind == AstNodeKind::Binary);
    CHECK(n.children[1]->op == "*");
}

TEST_CASE("Parser binary operators are left associative", "[parser]") {
    auto ast = parse("10 - 4 - 3");
    auto& n = first(ast);
    CHECK(n.op == "-");
    REQUIRE(n.children[0]->kind == AstNodeKind::Binary);
    CHECK(n.children[1]->intValue == 3);
}

TEST_CASE("Parser power is right associative", "[parser]") {
    auto ast = parse("2 ** 3 ** 2");
    auto& n = first(ast);
    CHECK(n.op == "**");
    CHECK(n.children[0]->kind == AstNodeKind::IntLit);
    REQUIRE(n.children[1]->kind == AstNodeKind::Binary);
    CHECK(n.children[1]->op == "**");
}

TEST_CASE("Parser comparison binds tighter than logical operators", "[parser]") {
    auto ast = parse("a < 1 && b || c");
    auto& n = first(ast);
    REQUIRE(n.kind == AstNodeKind::Or);
    REQUIRE(n.children[0]->kind == AstNodeKind::And);
    CHECK(n.children[0]->children[0]->kind == AstNodeKind::Binary);
    CHECK(n.children[0]->children[0]->op == "<");
}

TEST_CASE("Parser ranges and coalesce", "[parser]") {
    auto ast = parse("1..=n + 1; x ?? 0");
    auto& range = *ast->statements()[0];
    REQUIRE(range.kind == AstNodeKind::Range);
    CHECK(range.boolValue);
    CHECK(range.children[1]->kind == AstNodeKind::Binary);
    CHECK(ast->statements()[1]->kind == AstNodeKind::Coalesce);
}

TEST_CASE("Parser assignment is right associative", "[parser]") {
    auto ast = parse("let a; let b; a = b = 1");
    auto& n = *ast->statements()[2];
    REQUIRE(n.kind == AstNodeKind::Assign);
    CHECK(n.op == "=");
    CHECK(n.children[1]->kind == AstNodeKind::Assign);
}

TEST_CASE("Parser compound assignment to a path", "[parser]") {
    auto ast = parse("m.items[0] += 2");
    auto& n = first(ast);
    REQUIRE(n.kind == AstNodeKind::Assign);
    CHECK(n.op == "+=");
    REQUIRE(n.children[0]->kind == AstNodeKind::Index);
    CHECK(n.children[0]->children[0]->kind == AstNodeKind::Property);
}

TEST_CASE("Parser unary binds looser than postfix", "[parser]") {
    auto ast = parse("-a.b");
    auto& n = first(ast);
    REQUIRE(n.kind == AstNodeKind::Unary);
    CHECK(n.op == "-");
    CHECK(n.children[0]->kind == AstNodeKind::Property);
}

TEST_CASE("Parser calls and method chains", "[parser]") {
    auto ast = parse("f(1, 2); a.push(3).len");
    auto& call = *ast->statements()[0];
    REQUIRE(call.kind == AstNodeKind::Call);
    CHECK(call.stringValue == "f");
    CHECK(call.children.size() == 2);

    auto& prop = *ast->statements()[1];
    REQUIRE(prop.kind == AstNodeKind::Property);
    CHECK(prop.stringValue == "len");
    REQUIRE(prop.children[0]->kind == AstNodeKind::MethodCall);
    CHECK(prop.children[0]->stringValue == "push");
    CHECK(prop.children[0]->children.size() == 2);
}

TEST_CASE("Parser array and map literals", "[parser]") {
    auto ast = parse("[1, 2, 3,]; #{a: 1, \"b c\": [2]}");
    auto& arr = *ast->statements()[0];
    REQUIRE(arr.kind == AstNodeKind::ArrayLit);
    CHECK(arr.children.size() == 3);

    auto& map = *ast->statements()[1];
    REQUIRE(map.kind == AstNodeKind::MapLit);
    REQUIRE(map.nameParts.size() == 2);
    CHECK(map.nameParts[0] == "a");
    CHECK(map.nameParts[1] == "b c");
    CHECK(map.children[1]->kind == AstNodeKind::ArrayLit);
}

TEST_CASE("Parser let and const", "[parser]") {
    auto ast = parse("let x = 1; let y; const Z = 2");
    auto& s = ast->statements();
    CHECK(s[0]->kind == AstNodeKind::Let);
    CHECK(s[0]->nameParts[0] == "x");
    CHECK_FALSE(s[0]->boolValue);
    CHECK(s[1]->children.empty());
    CHECK(s[2]->boolValue);
}

TEST_CASE("Parser if / else if / else", "[parser]") {
    auto ast = parse("if a { 1 } else if b { 2 } else { 3 }");
    auto& n = first(ast);
    REQUIRE(n.kind == AstNodeKind::If);
    CHECK(n.hasElse);
    REQUIRE(n.children[2]->kind == AstNodeKind::If);
    CHECK(n.children[2]->hasElse);
}

TEST_CASE("Parser block statements need no semicolon", "[parser]") {
    auto ast = parse("if a { 1 } while b { } loop { break } for x in y { } { } 5");
    CHECK(ast->statements().size() == 6);
}

TEST_CASE("Parser loops", "[parser]") {
    auto ast = parse("do { x += 1 } until x > 3; for (v, i) in items { }");
    auto& dw = *ast->statements()[0];
    REQUIRE(dw.kind == AstNodeKind::DoWhile);
    CHECK(dw.boolValue);
    auto& forLoop = *ast->statements()[1];
    REQUIRE(forLoop.kind == AstNodeKind::For);
    REQUIRE(forLoop.nameParts.size() == 2);
    CHECK(forLoop.nameParts[0] == "v");
    CHECK(forLoop.nameParts[1] == "i");
}

TEST_CASE("Parser switch", "[parser]") {
    auto ast = parse("switch x { 1 | 2 => \"low\", -3 => { \"neg\" } _ => \"other\" }");
    auto& n = first(ast);
    REQUIRE(n.kind == AstNodeKind::Switch);
    CHECK(n.hasElse);
    REQUIRE(n.children.size() == 6);
    CHECK(n.children[1]->children.size() == 2);
    CHECK(n.children[3]->children[0]->intValue == -3);
    CHECK(n.children[5]->kind == AstNodeKind::StringLit);
}

TEST_CASE("Parser hoists function definitions", "[parser]") {
    auto ast = parse("sq(3); fn sq(x) { x * x } fn sq(x, y) { x * y }");
    CHECK(ast->library().contains("sq", 1));
    CHECK(ast->library().contains("sq", 2));
    CHECK(ast->library().size() == 2);
    CHECK(ast->statements()[1]->kind == AstNodeKind::FnDef);
}

TEST_CASE("Parser closures record free names", "[parser]") {
    auto ast = parse("|x| x + y * f(z)");
    auto& n = first(ast);
    REQUIRE(n.kind == AstNodeKind::Closure);
    REQUIRE(n.function);
    CHECK(n.function->name == "anonymous");
    CHECK(n.function->params == std::vector<std::string>{"x"});
    CHECK(n.function->captures == std::vector<std::string>{"y", "f", "z"});
}

TEST_CASE("Parser nested closures propagate captures", "[parser]") {
    auto ast = parse("|a| || a + c");
    auto& outer = first(ast);
    CHECK(outer.function->captures == std::vector<std::string>{"c"});
    auto& inner = *outer.function->body;
    REQUIRE(inner.kind == AstNodeKind::Closure);
    CHECK(inner.function->captures == std::vector<std::string>{"a", "c"});
}

TEST_CASE("Parser single expression", "[parser]") {
    auto expr = Parser::parseExpression("1 + 2");
    CHECK(expr->kind == AstNodeKind::Binary);
    CHECK_THROWS_AS(Parser::parseExpression("1 + 2 3"), ParseError);
}

TEST_CASE("Parser error kinds", "[parser]") {
    CHECK(parseErrorKind("let x = 5 let y = 6") == ParseErrorKind::MissingToken);
    CHECK(parseErrorKind("f(1, 2") == ParseErrorKind::MissingToken);
    CHECK(parseErrorKind(")") == ParseErrorKind::UnexpectedToken);
    CHECK(parseErrorKind("fn f(a, a) { }") == ParseErrorKind::DuplicateParameter);
    CHECK(parseErrorKind("for (v, v) in a { }") == ParseErrorKind::DuplicateParameter);
    CHECK(parseErrorKind("1 = 2") == ParseErrorKind::InvalidAssignmentTarget);
    CHECK(parseErrorKind("f() = 2") == ParseErrorKind::InvalidAssignmentTarget);
    CHECK(parseErrorKind("fn f(a) { } fn f(b) { }") == ParseErrorKind::DuplicateFunction);
    CHECK(parseErrorKind("{ fn g() { } }") == ParseErrorKind::WrongFnDefinition);
    CHECK(parseErrorKind("let g = fn") == ParseErrorKind::WrongFnDefinition);
    CHECK(parseErrorKind("switch x { 1 => 2, 1 => 3 }") == ParseErrorKind::DuplicateSwitchCase);
    CHECK(parseErrorKind("switch x { _ => 1, _ => 2 }") == ParseErrorKind::DuplicateSwitchCase);
    CHECK(parseErrorKind("switch x { _ => 1, 2 => 3 }") == ParseErrorKind::InvalidSwitchCase);
    CHECK(parseErrorKind("switch x { y => 1 }") == ParseErrorKind::InvalidSwitchCase);
    CHECK(parseErrorKind("const c = 1; c = 2") == ParseErrorKind::AssignmentToConstant);
    CHECK(parseErrorKind("const c = 1; c.x += 2") == ParseErrorKind::AssignmentToConstant);
    CHECK(parseErrorKind("const c") == ParseErrorKind::MissingToken);
    CHECK(parseErrorKind("#{a: 1, a: 2}") == ParseErrorKind::DuplicateProperty);
    CHECK(parseErrorKind("#{a: 1, \"a\": 2}") == ParseErrorKind::DuplicateProperty);
}

TEST_CASE("Parser allows assignment to a shadowed constant", "[parser]") {
    CHECK_NOTHROW(parse("const c = 1; { let c = 2; c = 3; }"));
}

TEST_CASE("Parser error locations", "[parser]") {
    try {
        parse("let x = ;");
        FAIL("expected ParseError");
    } catch (const ParseError& e) {
        CHECK(e.kind() == ParseErrorKind::UnexpectedToken);
        CHECK(e.location().line == 1);
        CHECK(e.location().column == 9);
    }
}

TEST_CASE("Parser loop control outside a loop", "[parser]") {
    // Accepted by default; reported when the program runs
    CHECK_NOTHROW(parse("break;"));

    DialectConfig strict;
    strict.strict_loop_control = true;
    CHECK(parseErrorKind("break;", strict) == ParseErrorKind::LoopControlOutsideLoop);
    CHECK(parseErrorKind("loop { let f = || { continue }; }", strict) ==
          ParseErrorKind::LoopControlOutsideLoop);
    CHECK_NOTHROW(parse("while true { if x { break } else { continue } }", strict));
}

TEST_CASE("Parser disabled features", "[parser]") {
    DialectConfig noClosures;
    noClosures.allow_closures = false;
    CHECK(parseErrorKind("let f = |x| x;", noClosures) == ParseErrorKind::FeatureDisabled);

    DialectConfig noSwitch;
    noSwitch.allow_switch = false;
    CHECK(parseErrorKind("switch 1 { _ => 2 }", noSwitch) == ParseErrorKind::FeatureDisabled);
}

TEST_CASE("Parser expression depth limit", "[parser]") {
    DialectConfig dialect;
    dialect.max_expr_depth = 8;
    CHECK(parseErrorKind("((((((((((1))))))))))", dialect) == ParseErrorKind::ExprTooDeep);
    CHECK_NOTHROW(parse("((1))", dialect));
}

TEST_CASE("Parser depth limit covers assignment chains", "[parser]") {
    std::string chain = "let a = 0; ";
    for (int i = 0; i < 200000; i++) chain += "a = ";
    chain += "1";
    CHECK(parseErrorKind(chain) == ParseErrorKind::ExprTooDeep);

    CHECK_NOTHROW(parse("let a = 0; let b = 0; a = b = 1"));
}

TEST_CASE("Parser depth limit covers else-if chains", "[parser]") {
    std::string chain = "if false {0}";
    for (int i = 0; i < 200000; i++) chain += " else if false {0}";
    CHECK(parseErrorKind(chain) == ParseErrorKind::ExprTooDeep);

    DialectConfig dialect;
    dialect.max_expr_depth = 8;
    CHECK_NOTHROW(parse("if a {0} else if b {1} else if c {2} else {3}", dialect));
}

TEST_CASE("Parser errors derive from CompileError", "[parser]") {
    CHECK_THROWS_AS(parse("let s = \"abc"), CompileError);
    CHECK_THROWS_AS(parse("let = 1"), CompileError);
}
