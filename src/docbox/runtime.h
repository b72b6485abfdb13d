#ifndef DOCBOX_RUNTIME_H_
#define DOCBOX_RUNTIME_H_

#include <csignal>
#include <map>
#include <string>
#include <optional>
#include <filesystem>

#include <docbox/policy.h>
#include <docbox/result.h>

#include "confine.h"

struct lua_State;

struct ScriptFailure {
  DiagnosticKind kind;
  std::string message;
  std::string trace; // "script:<line>: in ..." lines, native frames dropped
};

// One Lua interpreter with the import gate and the confined output
// capabilities installed. Not thread-safe; one per worker process.
class Runtime {
 public:
  // memory_limit in bytes; 0 means unlimited. interrupt is polled by the
  // instruction hook and may be null.
  Runtime(const Policy& policy, std::filesystem::path job_dir, size_t memory_limit,
          const volatile sig_atomic_t* interrupt = nullptr);
  ~Runtime();
  Runtime(const Runtime&) = delete;
  Runtime& operator=(const Runtime&) = delete;

  // Builds the namespace. Idempotent: the second call changes nothing.
  std::optional<ScriptFailure> Prepare();
  // Runs the source as the chunk "script"; calls Prepare() if needed.
  // A recorded violation wins over a later error or a normal return.
  std::optional<ScriptFailure> Execute(const std::string& source);

  // called from native code raising an import or policy error; may run
  // inside the instruction hook, so it must not throw
  void RecordViolation(DiagnosticKind kind, const char* message) noexcept;
  // throws PolicyViolation if the capability has no confiner
  const OutputConfiner& Confiner(const std::string& capability) const;
  // print() sink; bounded
  void Console(const char* str, size_t len);

  const Policy& policy() const { return policy_; }
  const std::filesystem::path& job_dir() const { return job_dir_; }
  bool interrupted() const { return interrupt_ && *interrupt_; }
  bool prepared() const { return prepared_; }
  size_t memory_used() const { return memory_used_; }
  size_t console_bytes() const { return console_bytes_; }
  lua_State* state() { return L_; }

 private:
  static void* Allocate(void* ud, void* ptr, size_t osize, size_t nsize);

  const Policy& policy_;
  std::filesystem::path job_dir_;
  size_t memory_limit_;
  size_t memory_used_;
  const volatile sig_atomic_t* interrupt_;
  lua_State* L_;
  bool prepared_;
  std::optional<ScriptFailure> setup_failure_;
  std::map<std::string, OutputConfiner> confiners_;
  std::optional<ScriptFailure> violation_;
  size_t console_bytes_;
};

#endif  // DOCBOX_RUNTIME_H_
