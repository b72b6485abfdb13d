#include "protocol.h"

#include <unistd.h>
#include <cerrno>
#include <cstring>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <docbox/utils.h>

#include "utils.h"

namespace {

const char kFallbackMessage[] =
    "{\"status\":\"error\",\"message\":\"WorkerError: failed to encode result\"}\n";

bool WriteAll(int fd, const char* buf, size_t len) {
  while (len) {
    ssize_t n = write(fd, buf, len);
    if (n < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    buf += n;
    len -= n;
  }
  return true;
}

} // namespace

std::string BoundedExcerpt(const std::string& str, size_t max_len) {
  if (str.size() <= max_len) return str;
  if (max_len < 3) return Utf8Prefix(str, max_len);
  return Utf8Prefix(str, max_len - 3) + "...";
}

std::string MakeDiagnostic(DiagnosticKind kind, const std::string& message,
                           const std::string& trace) {
  std::string ret = DiagnosticKindName(kind);
  ret += ": ";
  ret += message;
  if (trace.size()) {
    size_t lines = 0, pos = 0;
    std::string excerpt;
    while (pos < trace.size() && lines < kMaxTraceLines) {
      size_t end = trace.find('\n', pos);
      if (end == std::string::npos) end = trace.size();
      if (end > pos) {
        excerpt += '\n';
        excerpt += trace.substr(pos, end - pos);
        lines++;
      }
      pos = end + 1;
    }
    ret += excerpt;
  }
  return BoundedExcerpt(ret, kMaxDiagnosticLength);
}

nlohmann::json ResultToJson(const ExecutionResult& result) {
  nlohmann::json ret = {{"status", OutcomeName(result.status)}};
  if (result.status == Outcome::SUCCESS) {
    ret["files"] = result.files;
  } else {
    ret["message"] = BoundedExcerpt(result.message, kMaxDiagnosticLength);
  }
  return ret;
}

std::string EncodeResult(const ExecutionResult& result) {
  return ResultToJson(result).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::optional<ExecutionResult> DecodeResult(const std::string& data) {
  if (data.size() > kMaxChannelBytes) return std::nullopt;
  nlohmann::json obj = nlohmann::json::parse(data, nullptr, false);
  if (obj.is_discarded() || !obj.is_object()) return std::nullopt;
  auto status_it = obj.find("status");
  if (status_it == obj.end() || !status_it->is_string()) return std::nullopt;
  auto status = ParseOutcome(status_it->get<std::string>());
  if (!status) return std::nullopt;

  ExecutionResult ret;
  ret.status = *status;
  if (ret.status == Outcome::SUCCESS) {
    auto files_it = obj.find("files");
    if (files_it == obj.end() || !files_it->is_array()) return std::nullopt;
    for (auto& i : *files_it) {
      if (!i.is_string()) return std::nullopt;
      ret.files.push_back(i.get<std::string>());
    }
  } else {
    auto msg_it = obj.find("message");
    if (msg_it == obj.end() || !msg_it->is_string()) return std::nullopt;
    ret.message = BoundedExcerpt(msg_it->get<std::string>(), kMaxDiagnosticLength);
  }
  return ret;
}

bool ResultChannel::Report(const ExecutionResult& result) {
  if (reported_) {
    spdlog::warn("Result already reported; dropping {}", OutcomeName(result.status));
    return false;
  }
  std::string data;
  try {
    data = EncodeResult(result);
    data.push_back('\n');
  } catch (std::exception& e) {
    spdlog::error("Failed to encode result: {}", e.what());
    return ReportFallback();
  }
  reported_ = true;
  if (!WriteAll(fd_, data.data(), data.size())) {
    spdlog::error("Failed to write result: {}", strerror(errno));
    return false;
  }
  return true;
}

bool ResultChannel::ReportFallback() {
  if (reported_) return false;
  reported_ = true;
  return WriteAll(fd_, kFallbackMessage, sizeof(kFallbackMessage) - 1);
}
