#include "bang/token.h"

#include "llvm/Support/ErrorHandling.h"

namespace bang {

const char *getTokenKindName(TokenKind kind) {
    switch (kind) {
    case TokenKind::Illegal:      return "ILLEGAL";
    case TokenKind::EndOfInput:   return "EOF";
    case TokenKind::Identifier:   return "IDENT";
    case TokenKind::PrintKeyword: return "PRINT";
    case TokenKind::OpenParen:    return "(";
    case TokenKind::CloseParen:   return ")";
    case TokenKind::StatementEnd: return "!";
    case TokenKind::SingleQuote:  return "'";
    case TokenKind::DoubleQuote:  return "\"";
    case TokenKind::VarKeyword:   return "VAR";
    case TokenKind::Assign:       return "=";
    case TokenKind::Integer:      return "INT";
    }
    llvm_unreachable("unknown token kind");
}

void printLine(llvm::raw_ostream &os, const Line &line) {
    bool first = true;
    for (const Token &tok : line) {
        if (!first)
            os << ' ';
        first = false;
        os << getTokenKindName(tok.getKind()) << '(' << tok.getText() << ')';
    }
}

} // end namespace bang
