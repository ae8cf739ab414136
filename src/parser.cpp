#include "bang/parser.h"

#include <string>
#include <vector>

using namespace bang;

std::unique_ptr<StmtAST> Parser::parseLine(const Line &line) const {
    const Shape *shape = findShape(line);
    if (!shape)
        return nullptr;

    switch (shape->kind) {
    case ShapeKind::VarString:
    case ShapeKind::VarNumber:
        return parseVarDecl(line, *shape);
    case ShapeKind::PrintLiteral:
    case ShapeKind::PrintVariable:
        return parsePrint(line, *shape);
    }
    return nullptr;
}

/// vardecl ::= 'var' identifier '=' quote identifier quote
///         ::= 'var' identifier '=' integer
std::unique_ptr<StmtAST> Parser::parseVarDecl(const Line &line, const Shape &shape) const {
    auto cur = line.begin() + 1;  // eat var
    llvm::StringRef name = cur->getText();
    cur += 2;                     // eat identifier and '='

    if (shape.kind == ShapeKind::VarNumber)
        return std::make_unique<VarDeclStmtAST>(name, ValueType::Number, cur->getText());

    ++cur;  // eat the opening quote
    return std::make_unique<VarDeclStmtAST>(name, ValueType::String, cur->getText());
}

/// print ::= 'print' '(' quote identifier quote ')'
///       ::= 'print' '(' identifier ')'
std::unique_ptr<StmtAST> Parser::parsePrint(const Line &line, const Shape &shape) const {
    std::vector<std::string> literals;
    for (const Token &tok : line)
        literals.push_back(tok.getText().str());

    auto cur = line.begin() + 2;  // eat print and '('

    if (shape.kind == ShapeKind::PrintVariable)
        return std::make_unique<PrintStmtAST>(PrintStmtAST::Bare, cur->getText(),
                                              std::move(literals));

    ++cur;  // eat the opening quote
    return std::make_unique<PrintStmtAST>(PrintStmtAST::Quoted, cur->getText(),
                                          std::move(literals));
}
