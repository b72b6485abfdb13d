#include <docbox/policy.h>

#include <cctype>
#include <algorithm>
#include <stdexcept>

#include <nlohmann/json.hpp>

const char kPathCapability[] = "os";

std::string TopLevelName(const std::string& name) {
  return name.substr(0, name.find('.'));
}

std::string LowerExtension(const std::string& filename) {
  size_t sep = filename.find_last_of("/\\");
  std::string base = sep == std::string::npos ? filename : filename.substr(sep + 1);
  size_t dot = base.rfind('.');
  // ".pdf" alone has no stem and therefore no extension
  if (dot == std::string::npos || dot == 0) return "";
  std::string ret = base.substr(dot);
  for (auto& c : ret) c = std::tolower((unsigned char)c);
  return ret;
}

namespace {

std::string NormalizeExtension(std::string ext) {
  for (auto& c : ext) c = std::tolower((unsigned char)c);
  if (ext.empty() || ext[0] != '.') ext = "." + ext;
  return ext;
}

std::vector<std::string> NormalizeExtensions(std::vector<std::string> exts) {
  std::vector<std::string> ret;
  for (auto& i : exts) {
    if (i.empty() || i == ".") continue;
    std::string ext = NormalizeExtension(std::move(i));
    if (std::find(ret.begin(), ret.end(), ext) == ret.end()) ret.push_back(ext);
  }
  return ret;
}

const std::vector<std::string> kEmptyExtensions;

} // namespace

Policy::Policy(std::set<std::string> modules, ExtensionMap extensions) :
    modules_(std::move(modules)) {
  for (auto& [cap, exts] : extensions) {
    extensions_[cap] = NormalizeExtensions(std::move(exts));
  }
}

Policy Policy::Default() {
  return Policy({
    "docx", "pptx", "canvas", kPathCapability,
    "random", "datetime", "re", "json", "math", "textwrap", "base64", "buffer",
    "string", "table", "utf8",
  }, {
    {"docx", {".docx", ".pdf"}},
    {"pptx", {".pptx", ".pdf"}},
    {"canvas", {".pdf"}},
  });
}

Policy Policy::FromJson(const nlohmann::json& obj) {
  try {
    std::set<std::string> modules = obj.at("modules").get<std::set<std::string>>();
    ExtensionMap extensions = obj.at("extensions").get<ExtensionMap>();
    return Policy(std::move(modules), std::move(extensions));
  } catch (nlohmann::json::exception& e) {
    throw std::invalid_argument(std::string("malformed policy: ") + e.what());
  }
}

nlohmann::json Policy::ToJson() const {
  return {{"modules", modules_}, {"extensions", extensions_}};
}

Policy Policy::WithExtensions(const std::string& capability, std::vector<std::string> extensions) const {
  Policy ret = *this;
  ret.extensions_[capability] = NormalizeExtensions(std::move(extensions));
  return ret;
}

Policy Policy::WithModules(std::set<std::string> modules) const {
  Policy ret = *this;
  ret.modules_ = std::move(modules);
  return ret;
}

bool Policy::IsImportAllowed(const std::string& name) const {
  if (name.empty()) return false;
  return modules_.count(TopLevelName(name));
}

bool Policy::IsOutputExtensionAllowed(const std::string& capability, const std::string& filename) const {
  auto it = extensions_.find(capability);
  if (it == extensions_.end()) return false;
  std::string ext = LowerExtension(filename);
  if (ext.empty()) return false;
  return std::find(it->second.begin(), it->second.end(), ext) != it->second.end();
}

bool Policy::IsPermittedOutput(const std::string& filename) const {
  for (auto& i : extensions_) {
    if (IsOutputExtensionAllowed(i.first, filename)) return true;
  }
  return false;
}

bool Policy::IsOutputCapability(const std::string& capability) const {
  return extensions_.count(capability);
}

std::vector<std::string> Policy::OutputCapabilities() const {
  std::vector<std::string> ret;
  for (auto& i : extensions_) ret.push_back(i.first);
  return ret;
}

const std::vector<std::string>& Policy::AllowedExtensions(const std::string& capability) const {
  auto it = extensions_.find(capability);
  if (it == extensions_.end()) return kEmptyExtensions;
  return it->second;
}
