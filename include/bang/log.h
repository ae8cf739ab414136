#ifndef BANG_LOG_H
#define BANG_LOG_H

#include "llvm/ADT/Twine.h"
#include "llvm/Support/Error.h"

// Diagnostics go to stderr, never to the program output stream.
namespace bang {

void setVerbose(bool enabled);
bool isVerbose();

void logError(const llvm::Twine &msg);
void logError(llvm::Error err);
void logWarning(const llvm::Twine &msg);

/// logTrace - Only printed when verbose output is enabled.
void logTrace(const llvm::Twine &msg);

} // end namespace bang
#endif // BANG_LOG_H
