#ifndef INCLUDE_DOCBOX_RESULT_H_
#define INCLUDE_DOCBOX_RESULT_H_

#include <string>
#include <vector>

#define ENUM_OUTCOME_ \
  X(SUCCESS, "success") \
  X(ERROR, "error") \
  X(TIMEOUT, "timeout")
enum class Outcome {
#define X(name, str) name,
  ENUM_OUTCOME_
#undef X
};

// the prefix of every diagnostic; see MakeDiagnostic
#define ENUM_DIAGNOSTIC_KIND_ \
  X(IMPORT, "ImportError") \
  X(POLICY, "PolicyViolation") \
  X(SYNTAX, "SyntaxError") \
  X(RUNTIME, "RuntimeError") \
  X(MEMORY, "MemoryError") \
  X(INTERRUPTED, "Interrupted") \
  X(SETUP, "SetupError") \
  /* produced by the orchestrator, never by the script */ \
  X(WORKER, "WorkerError") \
  X(PROTOCOL, "ProtocolError") \
  X(TIMEOUT, "TimeoutError")
enum class DiagnosticKind {
#define X(name, str) name,
  ENUM_DIAGNOSTIC_KIND_
#undef X
};

class ExecutionResult {
 public:
  Outcome status;
  // absolute paths inside the job directory; only set on SUCCESS
  std::vector<std::string> files;
  // bounded diagnostic; only set on ERROR and TIMEOUT
  std::string message;

  ExecutionResult() : status(Outcome::ERROR) {}

  static ExecutionResult Success(std::vector<std::string> files);
  static ExecutionResult Error(std::string message);
  static ExecutionResult Timeout(std::string message);
};

#endif  // INCLUDE_DOCBOX_RESULT_H_
