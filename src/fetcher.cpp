#include "fetcher.hpp"

#include <string_view>

#include "errors.hpp"
#include "file_utils.hpp"
#include "logger.hpp"

namespace meshlink {

std::string FileTopologyFetcher::path_of(const std::string &url) {
  constexpr std::string_view kFileScheme = "file://";
  if (url.rfind(kFileScheme, 0) == 0) {
    return url.substr(kFileScheme.size());
  }
  return url;
}

arrow::Result<std::string> FileTopologyFetcher::fetch(
    const TopologySource &source) const {
  const std::string path = path_of(source.url);
  if (path.empty()) {
    return fetch_error("Topology " + std::to_string(source.id) +
                       " has no url");
  }
  auto content = read_from_file(path);
  if (!content.ok()) {
    return fetch_error("Cannot read " + path + ": " +
                       content.status().message());
  }
  log_debug("Fetched {} bytes from {}", content->size(), path);
  return content;
}

namespace {

bool is_done(const std::shared_future<arrow::Result<std::string>> &result) {
  return result.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

}  // namespace

TimedFetcher::~TimedFetcher() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!workers_.empty()) {
    log_debug("Waiting for {} topology fetches to finish", workers_.size());
  }
  for (auto &worker : workers_) {
    if (worker.thread.joinable()) {
      worker.thread.join();
    }
  }
  workers_.clear();
}

void TimedFetcher::reap() const {
  for (auto it = workers_.begin(); it != workers_.end();) {
    if (!is_done(it->result)) {
      ++it;
      continue;
    }
    if (it->thread.joinable()) {
      it->thread.join();
    }
    it = workers_.erase(it);
  }
}

size_t TimedFetcher::pending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  size_t count = 0;
  for (const auto &worker : workers_) {
    if (!is_done(worker.result)) {
      ++count;
    }
  }
  return count;
}

arrow::Result<std::string> TimedFetcher::fetch(
    const TopologySource &source) const {
  std::shared_future<arrow::Result<std::string>> future;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    reap();
    for (const auto &worker : workers_) {
      if (worker.topology_id == source.id) {
        return fetch_error("Previous fetch of topology " +
                           std::to_string(source.id) + " is still running");
      }
    }
    std::packaged_task<arrow::Result<std::string>()> task(
        [inner = inner_, source]() { return inner->fetch(source); });
    future = task.get_future().share();
    workers_.push_back(Worker{source.id, future, std::thread(std::move(task))});
  }

  if (future.wait_for(timeout_) != std::future_status::ready) {
    return fetch_error("Fetching topology " + std::to_string(source.id) +
                       " timed out after " + std::to_string(timeout_.count()) +
                       "ms");
  }
  auto result = future.get();
  if (!result.ok() && !is_error(result.status(), ErrorKind::FETCH_ERROR)) {
    return fetch_error(result.status().ToString());
  }
  return result;
}

}  // namespace meshlink
