#ifndef BANG_GRAMMAR_H
#define BANG_GRAMMAR_H

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringRef.h"

#include "bang/token.h"

namespace bang {

// Which statement form a shape describes.
enum class ShapeKind {
    PrintLiteral,   // print('text')
    PrintVariable,  // print(name)
    VarString,      // var name = 'text'
    VarNumber       // var name = 123
};

// A statement shape is the exact sequence of token kinds a line must have.
struct Shape {
    llvm::StringRef statement;  // "print" or "var"
    ShapeKind kind;
    llvm::ArrayRef<TokenKind> kinds;
};

/// getShapes - All shapes registered for a statement name, empty if the name
/// is unknown.
llvm::ArrayRef<Shape> getShapes(llvm::StringRef statement);

/// matchesShape - True if the line matches one of the statement's shapes
/// position by position.
bool matchesShape(const Line &line, llvm::StringRef statement);

/// findShape - The shape the line matches, or nullptr.
const Shape *findShape(const Line &line);

} // end namespace bang

#endif // BANG_GRAMMAR_H
