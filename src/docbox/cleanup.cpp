#include <map>
#include <mutex>
#include <thread>
#include <condition_variable>

#include <spdlog/spdlog.h>
#include <docbox/job.h>
#include <docbox/paths.h>

namespace {

std::mutex cleanup_mtx;
std::condition_variable cleanup_cv;
std::multimap<std::chrono::steady_clock::time_point, fs::path> cleanup_queue;
bool cleanup_started = false;

void CleanupLoop() {
  std::unique_lock lck(cleanup_mtx);
  while (true) {
    if (cleanup_queue.empty()) {
      cleanup_cv.wait(lck);
      continue;
    }
    auto it = cleanup_queue.begin();
    if (std::chrono::steady_clock::now() < it->first) {
      cleanup_cv.wait_until(lck, it->first);
      continue;
    }
    fs::path dir = std::move(it->second);
    cleanup_queue.erase(it);
    lck.unlock();
    CleanupJobDir(dir);
    lck.lock();
  }
}

bool IsJobDir(const fs::path& dir) {
  std::error_code ec;
  fs::path root = fs::absolute(kJobRoot, ec).lexically_normal();
  if (ec) return false;
  fs::path path = fs::absolute(dir, ec).lexically_normal();
  if (ec || path.filename().empty()) return false;
  return path.parent_path() == root && path.filename().string()[0] != '.';
}

} // namespace

void CleanupJobDir(const fs::path& dir) {
  if (!IsJobDir(dir)) {
    spdlog::warn("Refusing to clean {}: not a job directory", dir.c_str());
    return;
  }
  std::error_code ec;
  auto status = fs::symlink_status(dir, ec);
  if (ec || !fs::is_directory(status)) return;
  size_t removed = 0;
  fs::directory_iterator it(dir, ec), end;
  for (; !ec && it != end; it.increment(ec)) {
    std::error_code rm_ec;
    // remove_all never follows symlinks
    if (fs::remove_all(it->path(), rm_ec) > 0) removed++;
    if (rm_ec) spdlog::debug("Cannot remove {}: {}", it->path().c_str(), rm_ec.message());
  }
  if (!fs::remove(dir, ec) && ec) {
    spdlog::debug("Cannot remove {}: {}", dir.c_str(), ec.message());
  }
  spdlog::info("Cleaned job directory {} ({} entries)", dir.c_str(), removed);
}

void ScheduleCleanup(const fs::path& dir, std::chrono::seconds delay) {
  std::lock_guard lck(cleanup_mtx);
  if (!cleanup_started) {
    std::thread(CleanupLoop).detach();
    cleanup_started = true;
  }
  cleanup_queue.emplace(std::chrono::steady_clock::now() + delay, dir);
  cleanup_cv.notify_one();
}

size_t PendingCleanupCount() {
  std::lock_guard lck(cleanup_mtx);
  return cleanup_queue.size();
}

void FlushCleanup() {
  std::vector<fs::path> dirs;
  {
    std::lock_guard lck(cleanup_mtx);
    for (auto& i : cleanup_queue) dirs.push_back(std::move(i.second));
    cleanup_queue.clear();
  }
  for (auto& i : dirs) CleanupJobDir(i);
}
