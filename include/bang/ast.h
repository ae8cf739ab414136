#ifndef BANG_AST_H
#define BANG_AST_H

#include <string>
#include <vector>

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include "bang/interp_ctx.h"

namespace bang {

// StmtAST - Base class for all statement nodes. One node per script line.
class StmtAST {
public:
    enum StmtKind { SK_VarDecl, SK_Print };

    explicit StmtAST(StmtKind kind) : kind(kind) {}
    virtual ~StmtAST() = default;

    StmtKind getKind() const { return kind; }

    virtual llvm::Error execute(InterpContext &ctx) const = 0;

private:
    const StmtKind kind;
};

// VarDeclStmtAST - var name = 'text' | var name = 123
class VarDeclStmtAST : public StmtAST {
    std::string name;
    ValueType type;
    std::string literal;

public:
    VarDeclStmtAST(llvm::StringRef name, ValueType type, llvm::StringRef literal)
        : StmtAST(SK_VarDecl), name(name.str()), type(type), literal(literal.str()) {}

    llvm::StringRef getName() const { return name; }
    ValueType getValueType() const { return type; }
    llvm::StringRef getLiteral() const { return literal; }

    llvm::Error execute(InterpContext &ctx) const override;

    static bool classof(const StmtAST *s) { return s->getKind() == SK_VarDecl; }
};

// PrintStmtAST - print('text') | print(text). When a literal of the line names
// a declared variable, the value of the variable named by the argument is
// written. Otherwise the argument text itself is written. Quoting does not
// change this.
class PrintStmtAST : public StmtAST {
public:
    enum ArgumentKind { Quoted, Bare };

    PrintStmtAST(ArgumentKind argKind, llvm::StringRef text, std::vector<std::string> lineLiterals)
        : StmtAST(SK_Print), argKind(argKind), text(text.str()),
          lineLiterals(std::move(lineLiterals)) {}

    ArgumentKind getArgumentKind() const { return argKind; }
    llvm::StringRef getText() const { return text; }
    const std::vector<std::string> &getLineLiterals() const { return lineLiterals; }

    llvm::Error execute(InterpContext &ctx) const override;

    static bool classof(const StmtAST *s) { return s->getKind() == SK_Print; }

private:
    ArgumentKind argKind;
    std::string text;
    std::vector<std::string> lineLiterals;  // every token literal of the line
};

} // end namespace bang

#endif // BANG_AST_H
