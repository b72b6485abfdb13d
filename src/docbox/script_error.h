#ifndef DOCBOX_SCRIPT_ERROR_H_
#define DOCBOX_SCRIPT_ERROR_H_

#include <stdexcept>
#include <string>

#include <docbox/result.h>

// Raised by native capability code; converted into a Lua error at the C
// boundary and never allowed to cross a lua_call frame as a C++ exception.
class ScriptError : public std::runtime_error {
  DiagnosticKind kind_;
 public:
  ScriptError(DiagnosticKind kind, const std::string& msg) :
      std::runtime_error(msg), kind_(kind) {}
  DiagnosticKind kind() const { return kind_; }
};

class PolicyViolation : public ScriptError {
 public:
  explicit PolicyViolation(const std::string& msg) :
      ScriptError(DiagnosticKind::POLICY, msg) {}
};

class ImportDenied : public ScriptError {
 public:
  explicit ImportDenied(const std::string& module) :
      ScriptError(DiagnosticKind::IMPORT, "import of '" + module + "' is not allowed") {}
};

#endif  // DOCBOX_SCRIPT_ERROR_H_
