#include "confine.h"

#include <unistd.h>
#include <cerrno>
#include <cstring>

#include <spdlog/spdlog.h>

#include "utils.h"
#include "script_error.h"

std::optional<std::string> SafeBaseName(const std::string& requested) {
  if (requested.find('\0') != std::string::npos) return std::nullopt;
  size_t sep = requested.find_last_of("/\\");
  std::string base = sep == std::string::npos ? requested : requested.substr(sep + 1);
  if (base.empty() || base == "." || base == "..") return std::nullopt;
  return base;
}

std::filesystem::path OutputConfiner::Confine(const std::string& requested) const {
  auto base = SafeBaseName(requested);
  if (!base) {
    throw PolicyViolation(capability_ + ": invalid output file name");
  }
  if (!policy_.IsOutputExtensionAllowed(capability_, *base)) {
    std::string allowed;
    for (auto& i : policy_.AllowedExtensions(capability_)) {
      if (allowed.size()) allowed += ", ";
      allowed += i;
    }
    throw PolicyViolation(capability_ + ": cannot save '" + *base +
        "'; allowed extensions: " + (allowed.empty() ? "none" : allowed));
  }
  if (*base != requested) {
    spdlog::info("Confined output {} -> {}", Utf8Prefix(requested, 256), *base);
  }
  return job_dir_ / *base;
}

std::filesystem::path OutputConfiner::Save(const std::string& requested, const Renderer& render) const {
  std::filesystem::path target = Confine(requested);
  std::string data = render(LowerExtension(target.filename()));
  if (!WriteOutputFile(target, data)) {
    // a partial write must not be collected as an output
    if (unlink(target.c_str()) < 0 && errno != ENOENT) {
      spdlog::warn("Cannot remove partial output {}: {}", target.c_str(), strerror(errno));
    }
    throw ScriptError(DiagnosticKind::RUNTIME,
        capability_ + ": failed to write '" + target.filename().string() + "'");
  }
  return target;
}
