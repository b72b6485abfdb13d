#ifndef INCLUDE_DOCBOX_POLICY_H_
#define INCLUDE_DOCBOX_POLICY_H_

#include <map>
#include <set>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

// The file-system-path helper; only its path sub-capability is ever exposed
extern const char kPathCapability[];

// "alpha.beta.gamma" -> "alpha"
std::string TopLevelName(const std::string& name);

// Lower-cased extension including the dot ("Report.PDF" -> ".pdf"); empty if none
std::string LowerExtension(const std::string& filename);

// Immutable after construction. Built once at startup and handed explicitly to
// the orchestrator and (serialized) to every worker.
class Policy {
 public:
  using ExtensionMap = std::map<std::string, std::vector<std::string>>;

  Policy(std::set<std::string> modules, ExtensionMap extensions);

  // docx, pptx, canvas, os and the utility modules
  static Policy Default();
  // throws std::invalid_argument on malformed input
  static Policy FromJson(const nlohmann::json&);
  nlohmann::json ToJson() const;

  // Returns a copy with the extension set of one output capability replaced
  Policy WithExtensions(const std::string& capability, std::vector<std::string> extensions) const;
  Policy WithModules(std::set<std::string> modules) const;

  // None of these throw; absence is the normal false path
  bool IsImportAllowed(const std::string& name) const;
  bool IsOutputExtensionAllowed(const std::string& capability, const std::string& filename) const;
  // extension is permitted for at least one output capability
  bool IsPermittedOutput(const std::string& filename) const;
  bool IsOutputCapability(const std::string& capability) const;

  std::vector<std::string> OutputCapabilities() const;
  // empty for unknown capabilities
  const std::vector<std::string>& AllowedExtensions(const std::string& capability) const;
  const std::set<std::string>& Modules() const { return modules_; }

 private:
  std::set<std::string> modules_;
  ExtensionMap extensions_; // lower-case, leading dot
};

#endif  // INCLUDE_DOCBOX_POLICY_H_
