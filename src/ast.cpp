#include "bang/ast.h"

#include "llvm/ADT/APInt.h"
#include "llvm/ADT/STLExtras.h"

#include "bang/error.h"

using namespace bang;

llvm::Error VarDeclStmtAST::execute(InterpContext &ctx) const {
    ctx.declare(name, type, literal);
    return llvm::Error::success();
}

// Numbers are printed as decimal integers of any length, without the leading
// zeros the script may have written.
static void printNumber(llvm::raw_ostream &os, llvm::StringRef digits) {
    llvm::APInt value;
    if (digits.getAsInteger(10, value)) {
        // The lexer only stores digit runs, keep the text if that ever changes.
        os << digits;
        return;
    }
    value.print(os, /*isSigned=*/false);
}

llvm::Error PrintStmtAST::execute(InterpContext &ctx) const {
    bool namesVariable = llvm::any_of(lineLiterals, [&](const std::string &literal) {
        return ctx.hasVariable(literal);
    });
    if (!namesVariable) {
        ctx.out << text << '\n';
        return llvm::Error::success();
    }

    // Some literal of the line is declared, but the argument may not be.
    const Variable *var = ctx.lookup(text);
    if (!var)
        return llvm::make_error<LookupError>(text);

    if (var->type == ValueType::Number)
        printNumber(ctx.out, var->rawValue);
    else
        ctx.out << var->rawValue;
    ctx.out << '\n';
    return llvm::Error::success();
}
