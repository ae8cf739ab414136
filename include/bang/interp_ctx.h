#ifndef BANG_INTERP_CTX_H
#define BANG_INTERP_CTX_H

#include <string>

#include "llvm/ADT/StringMap.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/raw_ostream.h"

namespace bang {

enum class ValueType { String, Number };

// A declared variable. The value is kept as written in the script; numbers
// are only parsed when printed.
struct Variable {
    ValueType type;
    std::string rawValue;
};

// State of one interpreter run. Created before the first line executes and
// dropped after the last one.
class InterpContext {
public:
    explicit InterpContext(llvm::raw_ostream &out) : out(out) {}

    llvm::raw_ostream &out;                 // where print statements write
    llvm::StringMap<Variable> variables;    // a.k.a. symbol table

    /// declare - Later declarations overwrite earlier ones.
    void declare(llvm::StringRef name, ValueType type, llvm::StringRef rawValue) {
        variables[name] = Variable{type, rawValue.str()};
    }

    const Variable *lookup(llvm::StringRef name) const {
        auto it = variables.find(name);
        return it == variables.end() ? nullptr : &it->second;
    }

    bool hasVariable(llvm::StringRef name) const { return variables.count(name) != 0; }
};

} // end namespace bang

#endif // BANG_INTERP_CTX_H
