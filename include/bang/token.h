#ifndef BANG_TOKEN_H
#define BANG_TOKEN_H

#include <string>
#include <vector>

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/raw_ostream.h"

namespace bang {

// The closed set of token kinds the lexer can produce.
enum class TokenKind {
    Illegal,
    EndOfInput,
    Identifier,
    PrintKeyword,
    OpenParen,
    CloseParen,
    StatementEnd,   // '!', never stored in a line
    SingleQuote,
    DoubleQuote,
    VarKeyword,
    Assign,
    Integer
};

/// getTokenKindName - Printable name used by diagnostics and token dumps.
const char *getTokenKindName(TokenKind kind);

// Each token carries its kind and the exact source text that produced it.
class Token {
public:
    Token(TokenKind kind, llvm::StringRef literal) : kind(kind), literal(literal.str()) {}

    TokenKind getKind() const { return kind; }
    llvm::StringRef getText() const { return literal; }

    bool is(TokenKind k) const { return kind == k; }

    bool operator==(const Token &other) const {
        return kind == other.kind && literal == other.literal;
    }
    bool operator!=(const Token &other) const { return !(*this == other); }

private:
    TokenKind kind;
    std::string literal;
};

// Tokens between two statement terminators.
using Line = std::vector<Token>;

/// printLine - Writes the line as KIND(literal) pairs, e.g. PRINT(print) ((().
void printLine(llvm::raw_ostream &os, const Line &line);

} // end namespace bang

#endif // BANG_TOKEN_H
