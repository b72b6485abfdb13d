#include "server.h"

#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>
#include <cctype>
#include <cerrno>
#include <mutex>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <docbox/job.h>
#include <docbox/paths.h>
#include <docbox/config.h>

#include "docbox/confine.h"
#include "docbox/protocol.h"

namespace {

std::mutex running_mtx;
int running_jobs = 0;

// Holds one of the kMaxParallel slots for the lifetime of a request
class JobSlot {
  bool acquired_;
 public:
  JobSlot() : acquired_(false) {
    std::lock_guard lck(running_mtx);
    if (running_jobs < kMaxParallel) {
      running_jobs++;
      acquired_ = true;
    }
  }
  ~JobSlot() {
    if (!acquired_) return;
    std::lock_guard lck(running_mtx);
    running_jobs--;
  }
  JobSlot(const JobSlot&) = delete;
  JobSlot& operator=(const JobSlot&) = delete;

  bool acquired() const { return acquired_; }
};

void SetError(httplib::Response& res, int status, const std::string& message) {
  res.status = status;
  res.set_content(nlohmann::json{{"error", message}}.dump(), "application/json");
}

bool IsJobId(const std::string& id) {
  if (id.empty() || id.size() > 64 || id[0] == '.') return false;
  for (char c : id) {
    if (!isalnum((unsigned char)c) && c != '_' && c != '-') return false;
  }
  return true;
}

const char* ContentType(const std::string& name) {
  std::string ext = LowerExtension(name);
  if (ext == ".pdf") return "application/pdf";
  if (ext == ".docx") return "application/vnd.openxmlformats-officedocument.wordprocessingml.document";
  if (ext == ".pptx") return "application/vnd.openxmlformats-officedocument.presentationml.presentation";
  return "application/octet-stream";
}

// Regular files only; a symlink at the final component is refused
bool ReadOutputFile(const fs::path& path, std::string& data) {
  int fd = open(path.c_str(), O_RDONLY | O_NOFOLLOW | O_CLOEXEC);
  if (fd < 0) return false;
  struct stat st;
  if (fstat(fd, &st) < 0 || !S_ISREG(st.st_mode) || st.st_size > (kMaxOutputMiB << 20)) {
    close(fd);
    return false;
  }
  data.resize(st.st_size);
  size_t done = 0;
  while (done < data.size()) {
    ssize_t n = read(fd, data.data() + done, data.size() - done);
    if (n < 0 && errno == EINTR) continue;
    if (n <= 0) break;
    done += n;
  }
  close(fd);
  data.resize(done);
  return true;
}

nlohmann::json JobResponse(const Job& job) {
  nlohmann::json ret = ResultToJson(job.result);
  ret["job"] = job.id;
  // callers fetch files by name through this server
  if (job.result.status == Outcome::SUCCESS) {
    nlohmann::json names = nlohmann::json::array();
    for (auto& i : job.result.files) names.push_back(fs::path(i).filename().string());
    ret["files"] = std::move(names);
  }
  return ret;
}

void PostJob(const Policy& policy, const httplib::Request& req, httplib::Response& res) {
  auto body = nlohmann::json::parse(req.body, nullptr, false);
  if (body.is_discarded() || !body.is_object()) return SetError(res, 400, "body must be a JSON object");
  auto source = body.find("source");
  if (source == body.end() || !source->is_string() || source->get_ref<const std::string&>().empty()) {
    return SetError(res, 400, "source must be a non-empty string");
  }
  std::string caller_id;
  if (auto it = body.find("caller_id"); it != body.end()) {
    if (!it->is_string()) return SetError(res, 400, "caller_id must be a string");
    caller_id = it->get<std::string>();
  }
  if (source->get_ref<const std::string&>().size() > (size_t)kMaxSourceKiB << 10) {
    return SetError(res, 413, "source exceeds " + std::to_string(kMaxSourceKiB) + " KiB");
  }
  JobSlot slot;
  if (!slot.acquired()) return SetError(res, 503, "too many running jobs");

  Job job;
  job.source = source->get<std::string>();
  job.caller_id = std::move(caller_id);
  RunJob(policy, job);
  res.status = 200;
  res.set_content(JobResponse(job).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace),
                  "application/json");
}

void GetFile(const httplib::Request& req, httplib::Response& res) {
  std::string job_id = req.matches[1];
  std::string name = req.matches[2];
  if (!IsJobId(job_id) || SafeBaseName(name) != name) return SetError(res, 404, "not found");
  std::string data;
  if (!ReadOutputFile(JobPath(job_id) / name, data)) return SetError(res, 404, "not found");
  res.status = 200;
  res.set_content(std::move(data), ContentType(name));
}

} // namespace

int RunningJobs() {
  std::lock_guard lck(running_mtx);
  return running_jobs;
}

void SetupRoutes(httplib::Server& svr, const Policy& policy) {
  svr.set_payload_max_length(((size_t)kMaxSourceKiB << 10) + (64 << 10));
  svr.set_logger([](const httplib::Request& req, const httplib::Response& res) {
    spdlog::info("{} {} {} {}", req.remote_addr, req.method, req.path, res.status);
  });
  svr.Post("/jobs", [&policy](const httplib::Request& req, httplib::Response& res) {
    PostJob(policy, req, res);
  });
  svr.Get(R"(/jobs/([^/]+)/files/([^/]+))", GetFile);
  svr.Get("/health", [](const httplib::Request&, httplib::Response& res) {
    res.set_content("ok", "text/plain");
  });
}
