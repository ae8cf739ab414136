#include "bang/grammar.h"

#include <algorithm>

using namespace bang;

namespace {

using K = TokenKind;

const TokenKind PrintSingleQuoted[] = {K::PrintKeyword, K::OpenParen, K::SingleQuote,
                                       K::Identifier, K::SingleQuote, K::CloseParen};
const TokenKind PrintDoubleQuoted[] = {K::PrintKeyword, K::OpenParen, K::DoubleQuote,
                                       K::Identifier, K::DoubleQuote, K::CloseParen};
const TokenKind PrintName[] = {K::PrintKeyword, K::OpenParen, K::Identifier, K::CloseParen};

const TokenKind VarSingleQuoted[] = {K::VarKeyword, K::Identifier, K::Assign,
                                     K::SingleQuote, K::Identifier, K::SingleQuote};
const TokenKind VarDoubleQuoted[] = {K::VarKeyword, K::Identifier, K::Assign,
                                     K::DoubleQuote, K::Identifier, K::DoubleQuote};
const TokenKind VarInteger[] = {K::VarKeyword, K::Identifier, K::Assign, K::Integer};

// Shapes of one statement are kept next to each other.
const Shape Shapes[] = {
    {"print", ShapeKind::PrintLiteral, PrintSingleQuoted},
    {"print", ShapeKind::PrintLiteral, PrintDoubleQuoted},
    {"print", ShapeKind::PrintVariable, PrintName},
    {"var", ShapeKind::VarString, VarSingleQuoted},
    {"var", ShapeKind::VarString, VarDoubleQuoted},
    {"var", ShapeKind::VarNumber, VarInteger},
};

bool matches(const Line &line, const Shape &shape) {
    if (line.size() != shape.kinds.size())
        return false;
    return std::equal(line.begin(), line.end(), shape.kinds.begin(),
                      [](const Token &tok, TokenKind kind) { return tok.is(kind); });
}

} // end anonymous namespace

llvm::ArrayRef<Shape> bang::getShapes(llvm::StringRef statement) {
    llvm::ArrayRef<Shape> all(Shapes);
    auto first = std::find_if(all.begin(), all.end(),
                              [&](const Shape &s) { return s.statement == statement; });
    auto last = std::find_if(first, all.end(),
                             [&](const Shape &s) { return s.statement != statement; });
    return llvm::ArrayRef<Shape>(first, last);
}

bool bang::matchesShape(const Line &line, llvm::StringRef statement) {
    for (const Shape &shape : getShapes(statement))
        if (matches(line, shape))
            return true;
    return false;
}

const Shape *bang::findShape(const Line &line) {
    for (const Shape &shape : Shapes)
        if (matches(line, shape))
            return &shape;
    return nullptr;
}
