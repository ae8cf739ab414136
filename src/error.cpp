#include "bang/error.h"

#include "llvm/Support/Format.h"
#include "llvm/Support/raw_ostream.h"

using namespace bang;

char LexicalError::ID = 0;
char LookupError::ID = 0;

void LexicalError::log(llvm::raw_ostream &os) const {
    // Control bytes would garble the terminal, show them as hex instead.
    if (character >= 32 && character <= 126)
        os << "illegal character '" << character << "'";
    else
        os << "illegal byte " << llvm::format_hex(static_cast<unsigned char>(character), 4);
    os << " at line " << line;
}

std::error_code LexicalError::convertToErrorCode() const {
    return llvm::inconvertibleErrorCode();
}

void LookupError::log(llvm::raw_ostream &os) const {
    os << "undefined variable '" << name << "'";
}

std::error_code LookupError::convertToErrorCode() const {
    return llvm::inconvertibleErrorCode();
}
