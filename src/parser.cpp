#include "kestrel/parser.h"
#include "kestrel/ast.h"
#include "kestrel/error.h"
#include "kestrel/lexer.h"
#include <algorithm>
#include <utility>

namespace kestrel {

// -- AST factory functions --

namespace {

std::unique_ptr<AstNode> makeNode(AstNodeKind kind, SourceLocation loc) {
    auto n = std::make_unique<AstNode>();
    n->kind = kind;
    n->loc = loc;
    return n;
}

} // anonymous namespace

std::unique_ptr<AstNode> makeIntLit(int64_t val, SourceLocation loc) {
    auto n = makeNode(AstNodeKind::IntLit, loc);
    n->intValue = val;
    return n;
}

std::unique_ptr<AstNode> makeFloatLit(double val, SourceLocation loc) {
    auto n = makeNode(AstNodeKind::FloatLit, loc);
    n->floatValue = val;
    return n;
}

std::unique_ptr<AstNode> makeStringLit(std::string val, SourceLocation loc) {
    auto n = makeNode(AstNodeKind::StringLit, loc);
    n->stringValue = std::move(val);
    return n;
}

std::unique_ptr<AstNode> makeCharLit(uint32_t val, SourceLocation loc) {
    auto n = makeNode(AstNodeKind::CharLit, loc);
    n->charValue = val;
    return n;
}

std::unique_ptr<AstNode> makeBoolLit(bool val, SourceLocation loc) {
    auto n = makeNode(AstNodeKind::BoolLit, loc);
    n->boolValue = val;
    return n;
}

std::unique_ptr<AstNode> makeUnitLit(SourceLocation loc) {
    return makeNode(AstNodeKind::UnitLit, loc);
}

std::unique_ptr<AstNode> makeArrayLit(std::vector<std::unique_ptr<AstNode>> elems, SourceLocation loc) {
    auto n = makeNode(AstNodeKind::ArrayLit, loc);
    n->children = std::move(elems);
    return n;
}

std::unique_ptr<AstNode> makeMapLit(std::vector<std::string> keys, std::vector<std::unique_ptr<AstNode>> values, SourceLocation loc) {
    auto n = makeNode(AstNodeKind::MapLit, loc);
    n->nameParts = std::move(keys);
    n->children = std::move(values);
    return n;
}

std::unique_ptr<AstNode> makeName(std::string name, SourceLocation loc) {
    auto n = makeNode(AstNodeKind::Name, loc);
    n->stringValue = std::move(name);
    return n;
}

std::unique_ptr<AstNode> makeUnary(std::string op, std::unique_ptr<AstNode> operand, SourceLocation loc) {
    auto n = makeNode(AstNodeKind::Unary, loc);
    n->op = std::move(op);
    n->children.push_back(std::move(operand));
    return n;
}

std::unique_ptr<AstNode> makeBinary(std::string op, std::unique_ptr<AstNode> left, std::unique_ptr<AstNode> right, SourceLocation loc) {
    auto n = makeNode(AstNodeKind::Binary, loc);
    n->op = std::move(op);
    n->children.push_back(std::move(left));
    n->children.push_back(std::move(right));
    return n;
}

std::unique_ptr<AstNode> makeLogical(AstNodeKind kind, std::unique_ptr<AstNode> left, std::unique_ptr<AstNode> right, SourceLocation loc) {
    auto n = makeNode(kind, loc);
    n->children.push_back(std::move(left));
    n->children.push_back(std::move(right));
    return n;
}

std::unique_ptr<AstNode> makeRange(bool inclusive, std::unique_ptr<AstNode> from, std::unique_ptr<AstNode> to, SourceLocation loc) {
    auto n = makeNode(AstNodeKind::Range, loc);
    n->boolValue = inclusive;
    n->children.push_back(std::move(from));
    n->children.push_back(std::move(to));
    return n;
}

std::unique_ptr<AstNode> makeAssign(std::string op, std::unique_ptr<AstNode> target, std::unique_ptr<AstNode> value, SourceLocation loc) {
    auto n = makeNode(AstNodeKind::Assign, loc);
    n->op = std::move(op);
    n->children.push_back(std::move(target));
    n->children.push_back(std::move(value));
    return n;
}

std::unique_ptr<AstNode> makeIndex(std::unique_ptr<AstNode> target, std::unique_ptr<AstNode> index, SourceLocation loc) {
    auto n = makeNode(AstNodeKind::Index, loc);
    n->children.push_back(std::move(target));
    n->children.push_back(std::move(index));
    return n;
}

std::unique_ptr<AstNode> makeProperty(std::unique_ptr<AstNode> target, std::string field, SourceLocation loc) {
    auto n = makeNode(AstNodeKind::Property, loc);
    n->stringValue = std::move(field);
    n->children.push_back(std::move(target));
    return n;
}

std::unique_ptr<AstNode> makeCall(std::string name, std::vector<std::unique_ptr<AstNode>> args, SourceLocation loc) {
    auto n = makeNode(AstNodeKind::Call, loc);
    n->stringValue = std::move(name);
    n->children = std::move(args);
    return n;
}

std::unique_ptr<AstNode> makeMethodCall(std::unique_ptr<AstNode> receiver, std::string name, std::vector<std::unique_ptr<AstNode>> args, SourceLocation loc) {
    auto n = makeNode(AstNodeKind::MethodCall, loc);
    n->stringValue = std::move(name);
    n->children.push_back(std::move(receiver));
    for (auto& arg : args) {
        n->children.push_back(std::move(arg));
    }
    return n;
}

std::unique_ptr<AstNode> makeClosure(std::shared_ptr<ScriptFunction> fn, SourceLocation loc) {
    auto n = makeNode(AstNodeKind::Closure, loc);
    n->function = std::move(fn);
    return n;
}

std::unique_ptr<AstNode> makeBlock(std::vector<std::unique_ptr<AstNode>> stmts, SourceLocation loc) {
    auto n = makeNode(AstNodeKind::Block, loc);
    n->children = std::move(stmts);
    return n;
}

std::unique_ptr<AstNode> makeIf(std::unique_ptr<AstNode> cond, std::unique_ptr<AstNode> thenBranch, std::unique_ptr<AstNode> elseBranch, SourceLocation loc) {
    auto n = makeNode(AstNodeKind::If, loc);
    n->children.push_back(std::move(cond));
    n->children.push_back(std::move(thenBranch));
    if (elseBranch) {
        n->children.push_back(std::move(elseBranch));
        n->hasElse = true;
    }
    return n;
}

std::unique_ptr<AstNode> makeWhile(std::unique_ptr<AstNode> cond, std::unique_ptr<AstNode> body, SourceLocation loc) {
    auto n = makeNode(AstNodeKind::While, loc);
    n->children.push_back(std::move(cond));
    n->children.push_back(std::move(body));
    return n;
}

std::unique_ptr<AstNode> makeDoWhile(std::unique_ptr<AstNode> body, std::unique_ptr<AstNode> cond, bool isUntil, SourceLocation loc) {
    auto n = makeNode(AstNodeKind::DoWhile, loc);
    n->boolValue = isUntil;
    n->children.push_back(std::move(body));
    n->children.push_back(std::move(cond));
    return n;
}

std::unique_ptr<AstNode> makeLoop(std::unique_ptr<AstNode> body, SourceLocation loc) {
    auto n = makeNode(AstNodeKind::Loop, loc);
    n->children.push_back(std::move(body));
    return n;
}

std::unique_ptr<AstNode> makeFor(std::vector<std::string> vars, std::unique_ptr<AstNode> iterable, std::unique_ptr<AstNode> body, SourceLocation loc) {
    auto n = makeNode(AstNodeKind::For, loc);
    n->nameParts = std::move(vars);
    n->children.push_back(std::move(iterable));
    n->children.push_back(std::move(body));
    return n;
}

std::unique_ptr<AstNode> makeLet(std::string name, bool isConst, std::unique_ptr<AstNode> init, SourceLocation loc) {
    auto n = makeNode(AstNodeKind::Let, loc);
    n->nameParts.push_back(std::move(name));
    n->boolValue = isConst;
    if (init) n->children.push_back(std::move(init));
    return n;
}

std::unique_ptr<AstNode> makeFnDef(std::shared_ptr<ScriptFunction> fn, SourceLocation loc) {
    auto n = makeNode(AstNodeKind::FnDef, loc);
    n->stringValue = fn->name;
    n->function = std::move(fn);
    return n;
}

std::unique_ptr<AstNode> makeReturn(std::unique_ptr<AstNode> value, SourceLocation loc) {
    auto n = makeNode(AstNodeKind::Return, loc);
    if (value) n->children.push_back(std::move(value));
    return n;
}

std::unique_ptr<AstNode> makeBreak(SourceLocation loc) {
    return makeNode(AstNodeKind::Break, loc);
}

std::unique_ptr<AstNode> makeContinue(SourceLocation loc) {
    return makeNode(AstNodeKind::Continue, loc);
}

// -- AST helpers --

const char* astNodeKindName(AstNodeKind kind) {
    switch (kind) {
        case AstNodeKind::IntLit: return "IntLit";
        case AstNodeKind::FloatLit: return "FloatLit";
        case AstNodeKind::StringLit: return "StringLit";
        case AstNodeKind::CharLit: return "CharLit";
        case AstNodeKind::BoolLit: return "BoolLit";
        case AstNodeKind::UnitLit: return "UnitLit";
        case AstNodeKind::ArrayLit: return "ArrayLit";
        case AstNodeKind::MapLit: return "MapLit";
        case AstNodeKind::Name: return "Name";
        case AstNodeKind::Unary: return "Unary";
        case AstNodeKind::Binary: return "Binary";
        case AstNodeKind::And: return "And";
        case AstNodeKind::Or: return "Or";
        case AstNodeKind::Coalesce: return "Coalesce";
        case AstNodeKind::Range: return "Range";
        case AstNodeKind::Assign: return "Assign";
        case AstNodeKind::Index: return "Index";
        case AstNodeKind::Property: return "Property";
        case AstNodeKind::Call: return "Call";
        case AstNodeKind::MethodCall: return "MethodCall";
        case AstNodeKind::Closure: return "Closure";
        case AstNodeKind::Block: return "Block";
        case AstNodeKind::If: return "If";
        case AstNodeKind::Switch: return "Switch";
        case AstNodeKind::While: return "While";
        case AstNodeKind::DoWhile: return "DoWhile";
        case AstNodeKind::Loop: return "Loop";
        case AstNodeKind::For: return "For";
        case AstNodeKind::Let: return "Let";
        case AstNodeKind::FnDef: return "FnDef";
        case AstNodeKind::Return: return "Return";
        case AstNodeKind::Break: return "Break";
        case AstNodeKind::Continue: return "Continue";
    }
    return "Unknown";
}

bool AstNode::isLiteral() const {
    switch (kind) {
        case AstNodeKind::IntLit:
        case AstNodeKind::FloatLit:
        case AstNodeKind::StringLit:
        case AstNodeKind::CharLit:
        case AstNodeKind::BoolLit:
        case AstNodeKind::UnitLit:
            return true;
        default:
            return false;
    }
}

std::unique_ptr<AstNode> cloneNode(const AstNode& node) {
    auto n = std::make_unique<AstNode>();
    n->kind = node.kind;
    n->loc = node.loc;
    n->intValue = node.intValue;
    n->floatValue = node.floatValue;
    n->stringValue = node.stringValue;
    n->charValue = node.charValue;
    n->boolValue = node.boolValue;
    n->hasElse = node.hasElse;
    n->op = node.op;
    n->nameParts = node.nameParts;
    n->function = node.function;
    n->children.reserve(node.children.size());
    for (auto& child : node.children) {
        n->children.push_back(cloneNode(*child));
    }
    return n;
}

Value literalValue(const AstNode& node) {
    switch (node.kind) {
        case AstNodeKind::IntLit: return Value::integer(node.intValue);
        case AstNodeKind::FloatLit: return Value::number(node.floatValue);
        case AstNodeKind::StringLit: return Value::string(node.stringValue);
        case AstNodeKind::CharLit: return Value::character(static_cast<char32_t>(node.charValue));
        case AstNodeKind::BoolLit: return Value::boolean(node.boolValue);
        case AstNodeKind::UnitLit: return Value::unit();
        default:
            throw InternalError(std::string("literalValue on ") + astNodeKindName(node.kind));
    }
}

std::unique_ptr<AstNode> makeLiteral(const Value& value, SourceLocation loc) {
    switch (value.type()) {
        case Value::Type::Unit: return makeUnitLit(loc);
        case Value::Type::Bool: return makeBoolLit(value.asBool(), loc);
        case Value::Type::Int: return makeIntLit(value.asInt(), loc);
        case Value::Type::Float: return makeFloatLit(value.asFloat(), loc);
        case Value::Type::Char: return makeCharLit(static_cast<uint32_t>(value.asChar()), loc);
        case Value::Type::String: return makeStringLit(value.asString(), loc);
        default: return nullptr;
    }
}

// -- Parser implementation --

namespace {

class ParserImpl {
    Lexer lexer_;
    DialectConfig dialect_;

    size_t exprDepth_ = 0;
    size_t blockDepth_ = 0;
    size_t loopDepth_ = 0;
    size_t fnDepth_ = 0;

    // Declared names per lexical block, innermost last: (name, is-const)
    std::vector<std::vector<std::pair<std::string, bool>>> decls_;

    std::vector<std::shared_ptr<ScriptFunction>> functions_;

    // Bumps a depth counter for the lifetime of one nested construct.
    class DepthGuard {
    public:
        explicit DepthGuard(size_t& counter) : counter_(counter) { counter_++; }
        ~DepthGuard() { counter_--; }
    private:
        size_t& counter_;
    };

public:
    ParserImpl(std::string_view source, const DialectConfig& dialect)
        : lexer_(source, dialect), dialect_(dialect) {
        decls_.emplace_back();
    }

    std::shared_ptr<Ast> parseProgram() {
        auto stmts = parseStatementsUntil(TokenType::Eof);
        expect(TokenType::Eof, "Expected end of input");
        auto ast = std::make_shared<Ast>(std::move(stmts), dialect_);
        for (auto& fn : functions_) {
            ast->library().registerScript(fn);
        }
        return ast;
    }

    std::unique_ptr<AstNode> parseSingleExpression() {
        auto expr = parseExpression();
        expect(TokenType::Eof, "Expected end of input");
        return expr;
    }

private:
    // ---- Statement parsing ----

    std::vector<std::unique_ptr<AstNode>> parseStatementsUntil(TokenType terminator) {
        std::vector<std::unique_ptr<AstNode>> stmts;
        while (true) {
            while (lexer_.peek().type == TokenType::Semicolon) {
                lexer_.next();
            }
            if (lexer_.peek().type == terminator || lexer_.peek().type == TokenType::Eof) {
                break;
            }
            stmts.push_back(parseStatement());

            auto next = lexer_.peek().type;
            if (next == TokenType::Semicolon || next == terminator) continue;
            if (!endsWithBlock(*stmts.back())) {
                throw ParseError(ParseErrorKind::MissingToken,
                                 std::string("Expected ';' before ") + tokenTypeName(next),
                                 peekLoc());
            }
        }
        return stmts;
    }

    static bool endsWithBlock(const AstNode& stmt) {
        switch (stmt.kind) {
            case AstNodeKind::Block:
            case AstNodeKind::If:
            case AstNodeKind::Switch:
            case AstNodeKind::While:
            case AstNodeKind::Loop:
            case AstNodeKind::For:
            case AstNodeKind::FnDef:
                return true;
            default:
                return false;
        }
    }

    std::unique_ptr<AstNode> parseStatement() {
        switch (lexer_.peek().type) {
            case TokenType::Let:
            case TokenType::Const:     return parseLet();
            case TokenType::Fn:        return parseFnDef();
            case TokenType::If:        return parseIf();
            case TokenType::Switch:    return parseSwitch();
            case TokenType::While:     return parseWhile();
            case TokenType::Loop:      return parseLoop();
            case TokenType::Do:        return parseDoWhile();
            case TokenType::For:       return parseFor();
            case TokenType::Return:    return parseReturn();
            case TokenType::Break:
            case TokenType::Continue:  return parseLoopControl();
            case TokenType::LeftBrace: return parseBlock();
            default:                   return parseExpression();
        }
    }

    std::unique_ptr<AstNode> parseBlock() {
        DepthGuard depth(exprDepth_);
        checkDepth();
        auto loc = expect(TokenType::LeftBrace, "Expected '{'").location;
        DepthGuard blocks(blockDepth_);
        decls_.emplace_back();
        auto stmts = parseStatementsUntil(TokenType::RightBrace);
        decls_.pop_back();
        expect(TokenType::RightBrace, "Expected '}'");
        return makeBlock(std::move(stmts), loc);
    }

    std::unique_ptr<AstNode> parseLet() {
        auto kw = lexer_.next(); // consume 'let' or 'const'
        bool isConst = kw.type == TokenType::Const;
        auto nameTok = expect(TokenType::Name, isConst ? "Expected constant name after 'const'"
                                                       : "Expected variable name after 'let'");
        std::unique_ptr<AstNode> init;
        if (lexer_.peek().type == TokenType::Equal) {
            lexer_.next();
            init = parseExpression();
        } else if (isConst) {
            throw ParseError(ParseErrorKind::MissingToken,
                             "Expected '=' after constant '" + nameTok.text + "'", peekLoc());
        }
        declare(nameTok.text, isConst);
        return makeLet(nameTok.text, isConst, std::move(init), kw.location);
    }

    std::unique_ptr<AstNode> parseFnDef() {
        auto loc = lexer_.next().location; // consume 'fn'
        if (blockDepth_ > 0 || fnDepth_ > 0) {
            throw ParseError(ParseErrorKind::WrongFnDefinition,
                             "Functions can only be defined at global level", loc);
        }
        auto nameTok = expect(TokenType::Name, "Expected function name after 'fn'");
        auto params = parseParamList(TokenType::LeftParen, TokenType::RightParen);

        for (auto& existing : functions_) {
            if (existing->name == nameTok.text && existing->params.size() == params.size()) {
                throw ParseError(ParseErrorKind::DuplicateFunction,
                                 "Function '" + nameTok.text + "' with " +
                                 std::to_string(params.size()) +
                                 " parameter(s) is already defined", nameTok.location);
            }
        }

        auto fn = std::make_shared<ScriptFunction>();
        fn->name = nameTok.text;
        fn->loc = loc;
        fn->body = parseFunctionBody(params, [this]() { return parseBlock(); });
        fn->params = std::move(params);
        functions_.push_back(fn);
        return makeFnDef(std::move(fn), loc);
    }

    // Parses a function or closure body with loop and declaration state reset:
    // a body never sees the enclosing loops or locals.
    template <typename ParseBody>
    std::unique_ptr<AstNode> parseFunctionBody(const std::vector<std::string>& params,
                                               ParseBody parseBody) {
        auto savedDecls = std::move(decls_);
        size_t savedLoops = loopDepth_;
        decls_.clear();
        decls_.emplace_back();
        for (auto& p : params) declare(p, false);
        loopDepth_ = 0;
        DepthGuard fnDepth(fnDepth_);

        auto body = parseBody();
        decls_ = std::move(savedDecls);
        loopDepth_ = savedLoops;
        return body;
    }

    std::vector<std::string> parseParamList(TokenType open, TokenType close) {
        expect(open, open == TokenType::LeftParen ? "Expected '(' for parameter list"
                                                  : "Expected '|' for parameter list");
        std::vector<std::string> params;
        while (lexer_.peek().type != close) {
            auto p = expect(TokenType::Name, "Expected parameter name");
            if (std::find(params.begin(), params.end(), p.text) != params.end()) {
                throw ParseError(ParseErrorKind::DuplicateParameter,
                                 "Duplicate parameter '" + p.text + "'", p.location);
            }
            params.push_back(p.text);
            if (lexer_.peek().type != TokenType::Comma) break;
            lexer_.next();
        }
        expect(close, close == TokenType::RightParen ? "Expected ')' after parameters"
                                                     : "Expected '|' after parameters");
        return params;
    }

    std::unique_ptr<AstNode> parseIf() {
        auto loc = lexer_.next().location; // consume 'if'
        auto cond = parseExpression();
        auto thenBranch = parseBlock();
        std::unique_ptr<AstNode> elseBranch;
        if (lexer_.peek().type == TokenType::Else) {
            lexer_.next();
            if (lexer_.peek().type == TokenType::If) {
                DepthGuard depth(exprDepth_);
                checkDepth();
                elseBranch = parseIf();
            } else {
                elseBranch = parseBlock();
            }
        }
        return makeIf(std::move(cond), std::move(thenBranch), std::move(elseBranch), loc);
    }

    std::unique_ptr<AstNode> parseSwitch() {
        auto kw = lexer_.next(); // consume 'switch'
        if (!dialect_.allow_switch) {
            throw ParseError(ParseErrorKind::FeatureDisabled,
                             "'switch' is not allowed in this dialect", kw.location);
        }
        auto n = makeNode(AstNodeKind::Switch, kw.location);
        n->children.push_back(parseExpression());
        expect(TokenType::LeftBrace, "Expected '{' after switch expression");

        std::vector<Value> seen;
        std::unique_ptr<AstNode> defaultBody;

        while (lexer_.peek().type != TokenType::RightBrace) {
            auto tok = lexer_.peek();
            std::unique_ptr<AstNode> patterns;

            if (tok.type == TokenType::Name && tok.text == "_") {
                lexer_.next();
                if (defaultBody) {
                    throw ParseError(ParseErrorKind::DuplicateSwitchCase,
                                     "Duplicate default case in switch", tok.location);
                }
            } else {
                if (defaultBody) {
                    throw ParseError(ParseErrorKind::InvalidSwitchCase,
                                     "Default case must be the last case", tok.location);
                }
                std::vector<std::unique_ptr<AstNode>> lits;
                while (true) {
                    auto lit = parseSwitchPattern();
                    auto value = literalValue(*lit);
                    if (std::find(seen.begin(), seen.end(), value) != seen.end()) {
                        throw ParseError(ParseErrorKind::DuplicateSwitchCase,
                                         "Duplicate switch case " + value.debugString(),
                                         lit->loc);
                    }
                    seen.push_back(std::move(value));
                    lits.push_back(std::move(lit));
                    if (lexer_.peek().type != TokenType::Pipe) break;
                    lexer_.next();
                }
                patterns = makeArrayLit(std::move(lits), tok.location);
            }

            expect(TokenType::FatArrow, "Expected '=>' after switch case");
            auto body = parseExpression();
            bool blockBody = body->kind == AstNodeKind::Block;

            if (patterns) {
                n->children.push_back(std::move(patterns));
                n->children.push_back(std::move(body));
            } else {
                defaultBody = std::move(body);
            }

            if (lexer_.peek().type == TokenType::Comma) {
                lexer_.next();
            } else if (lexer_.peek().type != TokenType::RightBrace && !blockBody) {
                throw ParseError(ParseErrorKind::MissingToken,
                                 "Expected ',' between switch cases", peekLoc());
            }
        }
        expect(TokenType::RightBrace, "Expected '}' after switch cases");

        if (defaultBody) {
            n->children.push_back(std::move(defaultBody));
            n->hasElse = true;
        }
        return n;
    }

    std::unique_ptr<AstNode> parseSwitchPattern() {
        auto tok = lexer_.next();
        switch (tok.type) {
            case TokenType::IntLiteral: return makeIntLit(tok.intValue, tok.location);
            case TokenType::FloatLiteral: return makeFloatLit(tok.floatValue, tok.location);
            case TokenType::StringLiteral: return makeStringLit(tok.text, tok.location);
            case TokenType::CharLiteral: return makeCharLit(tok.charValue, tok.location);
            case TokenType::BoolTrue: return makeBoolLit(true, tok.location);
            case TokenType::BoolFalse: return makeBoolLit(false, tok.location);
            case TokenType::Minus: {
                auto num = lexer_.next();
                if (num.type == TokenType::IntLiteral) {
                    return makeIntLit(-num.intValue, tok.location);
                }
                if (num.type == TokenType::FloatLiteral) {
                    return makeFloatLit(-num.floatValue, tok.location);
                }
                break;
            }
            default:
                break;
        }
        throw ParseError(ParseErrorKind::InvalidSwitchCase,
                         "Switch cases must be literals", tok.location);
    }

    std::unique_ptr<AstNode> parseWhile() {
        auto loc = lexer_.next().location; // consume 'while'
        auto cond = parseExpression();
        return makeWhile(std::move(cond), parseLoopBody(), loc);
    }

    std::unique_ptr<AstNode> parseLoop() {
        auto loc = lexer_.next().location; // consume 'loop'
        return makeLoop(parseLoopBody(), loc);
    }

    std::unique_ptr<AstNode> parseDoWhile() {
        auto loc = lexer_.next().location; // consume 'do'
        auto body = parseLoopBody();
        auto tok = lexer_.next();
        if (tok.type != TokenType::While && tok.type != TokenType::Until) {
            throw ParseError(ParseErrorKind::MissingToken,
                             std::string("Expected 'while' or 'until' after do block (got ") +
                             tokenTypeName(tok.type) + ")", tok.location);
        }
        auto cond = parseExpression();
        return makeDoWhile(std::move(body), std::move(cond), tok.type == TokenType::Until, loc);
    }

    std::unique_ptr<AstNode> parseFor() {
        auto loc = lexer_.next().location; // consume 'for'
        std::vector<std::string> vars;
        if (lexer_.peek().type == TokenType::LeftParen) {
            lexer_.next();
            vars.push_back(expect(TokenType::Name, "Expected loop variable").text);
            expect(TokenType::Comma, "Expected ',' after loop variable");
            auto counter = expect(TokenType::Name, "Expected counter variable");
            if (counter.text == vars[0]) {
                throw ParseError(ParseErrorKind::DuplicateParameter,
                                 "Duplicate loop variable '" + counter.text + "'",
                                 counter.location);
            }
            vars.push_back(counter.text);
            expect(TokenType::RightParen, "Expected ')' after loop variables");
        } else {
            vars.push_back(expect(TokenType::Name, "Expected loop variable").text);
        }
        expect(TokenType::In, "Expected 'in'");
        auto iterable = parseExpression();

        decls_.emplace_back();
        for (auto& v : vars) declare(v, false);
        auto body = parseLoopBody();
        decls_.pop_back();

        return makeFor(std::move(vars), std::move(iterable), std::move(body), loc);
    }

    std::unique_ptr<AstNode> parseLoopBody() {
        DepthGuard loops(loopDepth_);
        return parseBlock();
    }

    std::unique_ptr<AstNode> parseReturn() {
        auto loc = lexer_.next().location; // consume 'return'
        if (isStatementEnd()) {
            return makeReturn(nullptr, loc);
        }
        return makeReturn(parseExpression(), loc);
    }

    std::unique_ptr<AstNode> parseLoopControl() {
        auto tok = lexer_.next();
        if (dialect_.strict_loop_control && loopDepth_ == 0) {
            throw ParseError(ParseErrorKind::LoopControlOutsideLoop,
                             std::string(tok.type == TokenType::Break ? "'break'" : "'continue'") +
                             " outside of a loop", tok.location);
        }
        return tok.type == TokenType::Break ? makeBreak(tok.location) : makeContinue(tok.location);
    }

    // ---- Expression parsing (precedence climbing) ----

    std::unique_ptr<AstNode> parseExpression() {
        auto left = parseBinary(0);

        if (isAssignmentOp(lexer_.peek().type)) {
            auto opTok = lexer_.next();
            checkAssignable(*left, opTok.location);
            DepthGuard depth(exprDepth_);
            checkDepth();
            auto value = parseExpression(); // right-associative
            return makeAssign(opTok.text, std::move(left), std::move(value), opTok.location);
        }
        return left;
    }

    std::unique_ptr<AstNode> parseBinary(int minPrec) {
        auto left = parseUnary();

        while (true) {
            auto type = lexer_.peek().type;
            int prec = infixPrecedence(type);
            if (prec < 0 || prec < minPrec) break;

            auto opTok = lexer_.next();
            bool rightAssoc = type == TokenType::StarStar;
            auto right = parseBinary(rightAssoc ? prec : prec + 1);

            switch (type) {
                case TokenType::AndAnd:
                    left = makeLogical(AstNodeKind::And, std::move(left), std::move(right), opTok.location);
                    break;
                case TokenType::OrOr:
                    left = makeLogical(AstNodeKind::Or, std::move(left), std::move(right), opTok.location);
                    break;
                case TokenType::QuestionQuestion:
                    left = makeLogical(AstNodeKind::Coalesce, std::move(left), std::move(right), opTok.location);
                    break;
                case TokenType::DotDot:
                case TokenType::DotDotEqual:
                    left = makeRange(type == TokenType::DotDotEqual, std::move(left), std::move(right), opTok.location);
                    break;
                default:
                    left = makeBinary(opTok.text, std::move(left), std::move(right), opTok.location);
                    break;
            }
        }

        return left;
    }

    std::unique_ptr<AstNode> parseUnary() {
        DepthGuard depth(exprDepth_);
        checkDepth();

        auto tok = lexer_.peek();
        if (tok.type == TokenType::Minus || tok.type == TokenType::Plus ||
            tok.type == TokenType::Bang) {
            lexer_.next();
            auto operand = parseUnary();
            return makeUnary(tok.text, std::move(operand), tok.location);
        }
        return parsePostfix(parsePrimary());
    }

    std::unique_ptr<AstNode> parsePrimary() {
        auto tok = lexer_.peek();

        switch (tok.type) {
            case TokenType::IntLiteral:
                lexer_.next();
                return makeIntLit(tok.intValue, tok.location);
            case TokenType::FloatLiteral:
                lexer_.next();
                return makeFloatLit(tok.floatValue, tok.location);
            case TokenType::StringLiteral:
                lexer_.next();
                return makeStringLit(tok.text, tok.location);
            case TokenType::CharLiteral:
                lexer_.next();
                return makeCharLit(tok.charValue, tok.location);
            case TokenType::BoolTrue:
                lexer_.next();
                return makeBoolLit(true, tok.location);
            case TokenType::BoolFalse:
                lexer_.next();
                return makeBoolLit(false, tok.location);
            case TokenType::Name:
                lexer_.next();
                if (lexer_.peek().type == TokenType::LeftParen) {
                    return makeCall(tok.text, parseArgs(), tok.location);
                }
                return makeName(tok.text, tok.location);
            case TokenType::LeftParen: {
                lexer_.next();
                if (lexer_.peek().type == TokenType::RightParen) {
                    lexer_.next();
                    return makeUnitLit(tok.location);
                }
                auto expr = parseExpression();
                expect(TokenType::RightParen, "Expected ')'");
                return expr;
            }
            case TokenType::LeftBracket:
                return parseArrayLiteral();
            case TokenType::MapStart:
                return parseMapLiteral();
            case TokenType::LeftBrace:
                return parseBlock();
            case TokenType::If:
                return parseIf();
            case TokenType::Switch:
                return parseSwitch();
            case TokenType::While:
                return parseWhile();
            case TokenType::Loop:
                return parseLoop();
            case TokenType::Do:
                return parseDoWhile();
            case TokenType::For:
                return parseFor();
            case TokenType::Pipe:
            case TokenType::OrOr:
                return parseClosure();
            case TokenType::Fn:
                throw ParseError(ParseErrorKind::WrongFnDefinition,
                                 "Functions cannot be defined inside an expression",
                                 tok.location);
            case TokenType::Eof:
                throw ParseError(ParseErrorKind::MissingToken,
                                 "Expected an expression before end of input", tok.location);
            default:
                throw ParseError(ParseErrorKind::UnexpectedToken,
                                 std::string("Unexpected token: ") + tokenTypeName(tok.type),
                                 tok.location);
        }
    }

    std::unique_ptr<AstNode> parsePostfix(std::unique_ptr<AstNode> base) {
        while (true) {
            auto tok = lexer_.peek();
            if (tok.type == TokenType::LeftBracket) {
                lexer_.next(); // consume '['
                auto index = parseExpression();
                expect(TokenType::RightBracket, "Expected ']'");
                base = makeIndex(std::move(base), std::move(index), tok.location);
            } else if (tok.type == TokenType::Dot) {
                lexer_.next(); // consume '.'
                auto field = expect(TokenType::Name, "Expected property or method name after '.'");
                if (lexer_.peek().type == TokenType::LeftParen) {
                    base = makeMethodCall(std::move(base), field.text, parseArgs(), field.location);
                } else {
                    base = makeProperty(std::move(base), field.text, field.location);
                }
            } else {
                break;
            }
        }
        return base;
    }

    std::vector<std::unique_ptr<AstNode>> parseArgs() {
        expect(TokenType::LeftParen, "Expected '('");
        std::vector<std::unique_ptr<AstNode>> args;
        while (lexer_.peek().type != TokenType::RightParen) {
            args.push_back(parseExpression());
            if (lexer_.peek().type != TokenType::Comma) break;
            lexer_.next();
        }
        expect(TokenType::RightParen, "Expected ')' after arguments");
        return args;
    }

    std::unique_ptr<AstNode> parseArrayLiteral() {
        auto loc = lexer_.next().location; // consume '['
        std::vector<std::unique_ptr<AstNode>> elems;
        while (lexer_.peek().type != TokenType::RightBracket) {
            elems.push_back(parseExpression());
            if (lexer_.peek().type != TokenType::Comma) break;
            lexer_.next();
        }
        expect(TokenType::RightBracket, "Expected ']'");
        return makeArrayLit(std::move(elems), loc);
    }

    std::unique_ptr<AstNode> parseMapLiteral() {
        auto loc = lexer_.next().location; // consume '#{'
        std::vector<std::string> keys;
        std::vector<std::unique_ptr<AstNode>> values;
        while (lexer_.peek().type != TokenType::RightBrace) {
            auto keyTok = lexer_.next();
            if (keyTok.type != TokenType::Name && keyTok.type != TokenType::StringLiteral) {
                throw ParseError(ParseErrorKind::UnexpectedToken,
                                 std::string("Expected map key, got ") + tokenTypeName(keyTok.type),
                                 keyTok.location);
            }
            if (std::find(keys.begin(), keys.end(), keyTok.text) != keys.end()) {
                throw ParseError(ParseErrorKind::DuplicateProperty,
                                 "Duplicate key '" + keyTok.text + "' in map literal",
                                 keyTok.location);
            }
            expect(TokenType::Colon, "Expected ':' after map key");
            keys.push_back(keyTok.text);
            values.push_back(parseExpression());
            if (lexer_.peek().type != TokenType::Comma) break;
            lexer_.next();
        }
        expect(TokenType::RightBrace, "Expected '}' to close map literal");
        return makeMapLit(std::move(keys), std::move(values), loc);
    }

    std::unique_ptr<AstNode> parseClosure() {
        auto tok = lexer_.peek();
        if (!dialect_.allow_closures) {
            throw ParseError(ParseErrorKind::FeatureDisabled,
                             "Anonymous functions are not allowed in this dialect", tok.location);
        }

        std::vector<std::string> params;
        if (tok.type == TokenType::OrOr) {
            lexer_.next();
        } else {
            params = parseParamList(TokenType::Pipe, TokenType::Pipe);
        }

        auto fn = std::make_shared<ScriptFunction>();
        fn->name = "anonymous";
        fn->loc = tok.location;
        fn->body = parseFunctionBody(params, [this]() { return parseExpression(); });
        fn->params = std::move(params);
        fn->captures = freeNames(*fn->body, fn->params);
        return makeClosure(std::move(fn), tok.location);
    }

    // Names a closure body reads or calls that it does not bind as parameters.
    static std::vector<std::string> freeNames(const AstNode& body,
                                              const std::vector<std::string>& params) {
        std::vector<std::string> names;
        collectNames(body, names);
        std::vector<std::string> result;
        for (auto& n : names) {
            if (std::find(params.begin(), params.end(), n) != params.end()) continue;
            if (std::find(result.begin(), result.end(), n) != result.end()) continue;
            result.push_back(n);
        }
        return result;
    }

    static void collectNames(const AstNode& node, std::vector<std::string>& out) {
        if (node.kind == AstNodeKind::Name || node.kind == AstNodeKind::Call) {
            out.push_back(node.stringValue);
        }
        if (node.kind == AstNodeKind::Closure) {
            for (auto& c : node.function->captures) out.push_back(c);
            return;
        }
        for (auto& child : node.children) {
            collectNames(*child, out);
        }
    }

    // ---- Helpers ----

    void checkAssignable(const AstNode& target, SourceLocation opLoc) {
        const AstNode* root = &target;
        while (root->kind == AstNodeKind::Index || root->kind == AstNodeKind::Property) {
            root = root->children[0].get();
        }
        if (root->kind != AstNodeKind::Name) {
            throw ParseError(ParseErrorKind::InvalidAssignmentTarget,
                             std::string("Cannot assign to ") + astNodeKindName(target.kind) +
                             " expression", target.loc.isNone() ? opLoc : target.loc);
        }
        if (isDeclaredConst(root->stringValue)) {
            throw ParseError(ParseErrorKind::AssignmentToConstant,
                             "Cannot assign to constant '" + root->stringValue + "'", root->loc);
        }
    }

    void declare(const std::string& name, bool isConst) {
        decls_.back().emplace_back(name, isConst);
    }

    bool isDeclaredConst(const std::string& name) const {
        for (auto scope = decls_.rbegin(); scope != decls_.rend(); ++scope) {
            for (auto d = scope->rbegin(); d != scope->rend(); ++d) {
                if (d->first == name) return d->second;
            }
        }
        return false;
    }

    void checkDepth() {
        if (dialect_.max_expr_depth > 0 && exprDepth_ > dialect_.max_expr_depth) {
            throw ParseError(ParseErrorKind::ExprTooDeep,
                             "Expression nesting exceeds " +
                             std::to_string(dialect_.max_expr_depth) + " levels", peekLoc());
        }
    }

    Token expect(TokenType type, const char* msg) {
        auto tok = lexer_.peek();
        if (tok.type != type) {
            auto kind = tok.type == TokenType::Eof || type == TokenType::RightParen ||
                        type == TokenType::RightBracket || type == TokenType::RightBrace ||
                        type == TokenType::Semicolon
                ? ParseErrorKind::MissingToken
                : ParseErrorKind::UnexpectedToken;
            throw ParseError(kind, std::string(msg) + " (got " + tokenTypeName(tok.type) + ")",
                             tok.location);
        }
        return lexer_.next();
    }

    SourceLocation peekLoc() {
        return lexer_.peek().location;
    }

    bool isStatementEnd() {
        auto type = lexer_.peek().type;
        return type == TokenType::Semicolon ||
               type == TokenType::RightBrace ||
               type == TokenType::Eof;
    }

    static bool isAssignmentOp(TokenType type) {
        switch (type) {
            case TokenType::Equal:
            case TokenType::PlusEqual:
            case TokenType::MinusEqual:
            case TokenType::StarEqual:
            case TokenType::SlashEqual:
            case TokenType::PercentEqual:
            case TokenType::StarStarEqual:
            case TokenType::ShiftLeftEqual:
            case TokenType::ShiftRightEqual:
            case TokenType::AmpersandEqual:
            case TokenType::PipeEqual:
            case TokenType::CaretEqual:
                return true;
            default:
                return false;
        }
    }

    static int infixPrecedence(TokenType type) {
        switch (type) {
            case TokenType::OrOr:
            case TokenType::Pipe:
            case TokenType::Caret: return 30;
            case TokenType::AndAnd:
            case TokenType::Ampersand: return 60;
            case TokenType::EqualEqual:
            case TokenType::BangEqual: return 90;
            case TokenType::Less:
            case TokenType::Greater:
            case TokenType::LessEqual:
            case TokenType::GreaterEqual: return 130;
            case TokenType::QuestionQuestion: return 135;
            case TokenType::DotDot:
            case TokenType::DotDotEqual: return 140;
            case TokenType::Plus:
            case TokenType::Minus: return 150;
            case TokenType::Star:
            case TokenType::Slash:
            case TokenType::Percent: return 180;
            case TokenType::StarStar: return 190;
            case TokenType::ShiftLeft:
            case TokenType::ShiftRight: return 210;
            default: return -1;
        }
    }
};

} // anonymous namespace

std::shared_ptr<Ast> Parser::parse(std::string_view source, const DialectConfig& dialect) {
    ParserImpl parser(source, dialect);
    return parser.parseProgram();
}

std::unique_ptr<AstNode> Parser::parseExpression(std::string_view source,
                                                 const DialectConfig& dialect) {
    ParserImpl parser(source, dialect);
    return parser.parseSingleExpression();
}

} // namespace kestrel
