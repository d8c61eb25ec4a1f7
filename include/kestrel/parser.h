#pragma once

#include "ast.h"
#include "dialect.h"
#include <memory>
#include <string_view>

namespace kestrel {

class Parser {
public:
    /// Parse a full program. Script functions defined with `fn` are hoisted
    /// into the returned Ast's library. Throws LexError or ParseError.
    static std::shared_ptr<Ast> parse(std::string_view source, const DialectConfig& dialect = {});

    /// Parse a single expression; anything after it is an error.
    static std::unique_ptr<AstNode> parseExpression(std::string_view source,
                                                    const DialectConfig& dialect = {});
};

} // namespace kestrel
