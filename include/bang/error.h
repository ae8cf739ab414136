#ifndef BANG_ERROR_H
#define BANG_ERROR_H

#include <string>

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

namespace bang {

// LexicalError - A character no token rule accepts. Always fatal.
class LexicalError : public llvm::ErrorInfo<LexicalError> {
public:
    static char ID;

    LexicalError(char character, unsigned line) : character(character), line(line) {}

    char getCharacter() const { return character; }
    unsigned getLine() const { return line; }

    void log(llvm::raw_ostream &os) const override;
    std::error_code convertToErrorCode() const override;

private:
    char character;
    unsigned line;   // 0-based count of terminated lines before the character
};

// LookupError - A print statement found a declared name on its line, but the
// name it prints is not in the table.
class LookupError : public llvm::ErrorInfo<LookupError> {
public:
    static char ID;

    explicit LookupError(llvm::StringRef name) : name(name.str()) {}

    llvm::StringRef getName() const { return name; }

    void log(llvm::raw_ostream &os) const override;
    std::error_code convertToErrorCode() const override;

private:
    std::string name;
};

} // end namespace bang

#endif // BANG_ERROR_H
