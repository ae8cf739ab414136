#ifndef BANG_LEXER_H
#define BANG_LEXER_H

#include <vector>

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include "bang/token.h"

namespace bang {
//===----------------------------------------------------------------------===//
// Lexer
//===----------------------------------------------------------------------===//
// The lexer turns the script text into tokens and groups them into lines, one
// line per '!' terminated statement. The source buffer must outlive the lexer.
class Lexer {
    public:
    explicit Lexer(llvm::StringRef source);

    /// getNextToken - Scan one token. Keeps returning EndOfInput once the
    /// source is exhausted.
    Token getNextToken();

    /// tokenize - Drive getNextToken until EndOfInput and return the completed
    /// lines. Fails with a LexicalError on the first illegal character, in
    /// which case no line is returned.
    llvm::Expected<std::vector<Line>> tokenize();

    /// getTokens - Every non-terminator token seen by tokenize, in source order.
    const std::vector<Token> &getTokens() const { return tokens; }
    unsigned getLineCount() const { return lineCount; }

    private:
    llvm::StringRef source;
    size_t position = 0;      // index of ch
    size_t readPosition = 0;  // index of the character after ch
    char ch = '\0';
    TokenKind lastKind = TokenKind::Illegal;  // kind of the last emitted token
    unsigned lineCount = 0;
    std::vector<Token> tokens;

    void readChar();
    void skipWhitespace();
    llvm::StringRef readIdentifier();
    llvm::StringRef readInteger();
    Token emit(TokenKind kind, llvm::StringRef literal);
};

} // end namespace bang
#endif // BANG_LEXER_H
