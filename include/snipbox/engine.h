#ifndef INCLUDE_SNIPBOX_ENGINE_H_
#define INCLUDE_SNIPBOX_ENGINE_H_

#include "execution.h"

class ExecutionEngine {
 public:
  virtual ~ExecutionEngine() = default;
  // logging
  virtual const char* Name() const = 0;
  // Blocks until the snippet finishes or is killed. Snippet, resource and infrastructure
  // failures are reported through the outcome, never thrown.
  virtual ExecutionOutcome Execute(const ExecutionRequest&) = 0;
};

#endif  // INCLUDE_SNIPBOX_ENGINE_H_
