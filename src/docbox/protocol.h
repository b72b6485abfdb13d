#ifndef DOCBOX_PROTOCOL_H_
#define DOCBOX_PROTOCOL_H_

#include <string>
#include <vector>
#include <optional>

#include <nlohmann/json_fwd.hpp>
#include <docbox/result.h>

constexpr size_t kMaxDiagnosticLength = 3000;
constexpr size_t kMaxTraceLines = 5;
// result channel content beyond this is a protocol error
constexpr size_t kMaxChannelBytes = 1 << 20;

// UTF-8 safe; appends "..." when cut
std::string BoundedExcerpt(const std::string& str, size_t max_len);
// "<Kind>: <message>" plus at most kMaxTraceLines trace lines, bounded to
// kMaxDiagnosticLength
std::string MakeDiagnostic(DiagnosticKind kind, const std::string& message,
                           const std::string& trace = "");

nlohmann::json ResultToJson(const ExecutionResult&);
// Invalid UTF-8 is replaced rather than rejected
std::string EncodeResult(const ExecutionResult&);
// nullopt on anything that is not a well-formed result message; never throws
std::optional<ExecutionResult> DecodeResult(const std::string& data);

// The single-use write side of the worker's result channel
class ResultChannel {
  int fd_;
  bool reported_;
 public:
  explicit ResultChannel(int fd) : fd_(fd), reported_(false) {}
  ResultChannel(const ResultChannel&) = delete;
  ResultChannel& operator=(const ResultChannel&) = delete;

  // Writes the result once; later calls are ignored and return false.
  // Falls back to a constant marker if encoding fails.
  bool Report(const ExecutionResult&);
  // Allocation-free; safe from a terminate handler
  bool ReportFallback();
  bool reported() const { return reported_; }
};

#endif  // DOCBOX_PROTOCOL_H_
