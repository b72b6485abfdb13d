#ifndef DOCBOX_CONFINE_H_
#define DOCBOX_CONFINE_H_

#include <string>
#include <optional>
#include <functional>
#include <filesystem>

#include <docbox/policy.h>

// Final path segment of an untrusted name, '/' and '\' both counting as
// separators. nullopt for empty, ".", ".." and names containing NUL.
std::optional<std::string> SafeBaseName(const std::string& requested);

// Rewrites save destinations of one output capability into the job directory
class OutputConfiner {
  const Policy& policy_;
  std::string capability_;
  std::filesystem::path job_dir_;
 public:
  using Renderer = std::function<std::string(const std::string& extension)>;

  OutputConfiner(const Policy& policy, std::string capability, std::filesystem::path job_dir) :
      policy_(policy), capability_(std::move(capability)), job_dir_(std::move(job_dir)) {}

  // throws PolicyViolation
  std::filesystem::path Confine(const std::string& requested) const;
  // Confines, renders for the lower-cased extension and writes the bytes.
  // Returns the written path; throws PolicyViolation or ScriptError(RUNTIME).
  // A failed write leaves no file under the name.
  std::filesystem::path Save(const std::string& requested, const Renderer& render) const;

  const std::string& capability() const { return capability_; }
  const std::filesystem::path& job_dir() const { return job_dir_; }
};

#endif  // DOCBOX_CONFINE_H_
