#include <docbox/logger.h>

#include <pthread.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/ansicolor_sink.h>

namespace {

using ansicolor_sink = spdlog::sinks::ansicolor_sink<spdlog::details::console_mutex>;

// The orchestrator forks workers while HTTP threads may be logging; a child
// must never inherit a locked console mutex.
template <bool kLock> void ForEachConsoleSink() {
  for (auto& i : spdlog::default_logger()->sinks()) {
    if (auto ptr = dynamic_cast<ansicolor_sink*>(i.get())) {
      if constexpr (kLock) {
        ptr->mutex_.lock();
      } else {
        ptr->mutex_.unlock();
      }
    }
  }
}

void Prepare() { ForEachConsoleSink<true>(); }
void Release() { ForEachConsoleSink<false>(); }

} // namespace

void InitLogger() {
  spdlog::debug("Setup logger pthread_atfork");
  pthread_atfork(Prepare, Release, Release);
}
