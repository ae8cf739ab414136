#ifndef BANG_PARSER_H
#define BANG_PARSER_H

#include <memory>

#include "bang/ast.h"
#include "bang/grammar.h"
#include "bang/token.h"

namespace bang {

// Builds one statement node per line. A line is parsed only when its token
// kinds match one of the grammar shapes; anything else is not a statement.
class Parser {
public:
    /// parseLine - Returns nullptr for a line that matches no shape.
    std::unique_ptr<StmtAST> parseLine(const Line &line) const;

private:
    std::unique_ptr<StmtAST> parseVarDecl(const Line &line, const Shape &shape) const;
    std::unique_ptr<StmtAST> parsePrint(const Line &line, const Shape &shape) const;
};

} // end namespace bang

#endif // BANG_PARSER_H
