#include "bang/lexer.h"

#include "llvm/ADT/StringSwitch.h"

#include "bang/error.h"

using namespace bang;

static bool isLetter(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}

static bool isDigit(char c) { return c >= '0' && c <= '9'; }

static bool isWhitespace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

Lexer::Lexer(llvm::StringRef source) : source(source) {
    readChar();  // prime ch
}

void Lexer::readChar() {
    ch = readPosition < source.size() ? source[readPosition] : '\0';
    position = readPosition;
    if (readPosition <= source.size())
        ++readPosition;
}

void Lexer::skipWhitespace() {
    while (isWhitespace(ch))
        readChar();
}

llvm::StringRef Lexer::readIdentifier() {
    size_t start = position;
    while (isLetter(ch))
        readChar();
    return source.slice(start, position);
}

llvm::StringRef Lexer::readInteger() {
    size_t start = position;
    while (isDigit(ch))
        readChar();
    return source.slice(start, position);
}

Token Lexer::emit(TokenKind kind, llvm::StringRef literal) {
    lastKind = kind;
    return Token(kind, literal);
}

/// getNextToken - Return the next token from the source buffer.
Token Lexer::getNextToken() {
    skipWhitespace();

    if (isLetter(ch)) {  // identifier or keyword: [a-zA-Z_]+
        llvm::StringRef text = readIdentifier();
        TokenKind kind = llvm::StringSwitch<TokenKind>(text)
                             .Case("print", TokenKind::PrintKeyword)
                             .Case("var", TokenKind::VarKeyword)
                             .Default(TokenKind::Identifier);
        return emit(kind, text);
    }

    if (isDigit(ch)) {  // integer: [0-9]+
        // A digit run right after a quote is string data, not a number.
        bool quoted = lastKind == TokenKind::SingleQuote || lastKind == TokenKind::DoubleQuote;
        llvm::StringRef digits = readInteger();
        return emit(quoted ? TokenKind::Identifier : TokenKind::Integer, digits);
    }

    TokenKind kind;
    switch (ch) {
    case '\0': return emit(TokenKind::EndOfInput, "");
    case '(':  kind = TokenKind::OpenParen; break;
    case ')':  kind = TokenKind::CloseParen; break;
    case '!':  kind = TokenKind::StatementEnd; break;
    case '\'': kind = TokenKind::SingleQuote; break;
    case '"':  kind = TokenKind::DoubleQuote; break;
    case '=':  kind = TokenKind::Assign; break;
    default:
        // Don't eat the illegal character, the caller aborts on it.
        return emit(TokenKind::Illegal, source.substr(position, 1));
    }

    llvm::StringRef text = source.substr(position, 1);
    readChar();
    return emit(kind, text);
}

llvm::Expected<std::vector<Line>> Lexer::tokenize() {
    std::vector<Line> lines;
    Line pending;

    while (true) {
        Token tok = getNextToken();
        switch (tok.getKind()) {
        case TokenKind::StatementEnd:
            lines.push_back(std::move(pending));
            pending.clear();
            ++lineCount;
            continue;
        case TokenKind::Illegal:
            return llvm::make_error<LexicalError>(tok.getText().front(), lineCount);
        case TokenKind::EndOfInput:
            // Tokens after the last '!' never form a statement.
            return std::move(lines);
        default:
            tokens.push_back(tok);
            pending.push_back(std::move(tok));
            break;
        }
    }
}
