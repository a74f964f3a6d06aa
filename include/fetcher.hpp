#ifndef FETCHER_HPP
#define FETCHER_HPP

#include <arrow/result.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <future>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "topology_graph.hpp"

namespace meshlink {

// Retrieves the raw topology document of a source.
class TopologyFetcher {
 public:
  virtual ~TopologyFetcher() = default;

  // FetchError when the document cannot be retrieved.
  virtual arrow::Result<std::string> fetch(
      const TopologySource &source) const = 0;
};

// Reads source.url from the local filesystem; "file://" is optional.
class FileTopologyFetcher : public TopologyFetcher {
 public:
  arrow::Result<std::string> fetch(const TopologySource &source) const override;

  static std::string path_of(const std::string &url);
};

/**
 * @brief Bounds another fetcher with a timeout
 *
 * The wrapped fetch runs on a worker thread owned by this object. When it
 * does not finish in time the call returns FetchError and the result is
 * discarded once it arrives. While a source's worker is still running, new
 * fetches of that source fail with FetchError instead of starting another
 * one. The destructor waits for every worker.
 */
class TimedFetcher : public TopologyFetcher {
 public:
  TimedFetcher(std::shared_ptr<const TopologyFetcher> inner,
               std::chrono::milliseconds timeout)
      : inner_(std::move(inner)), timeout_(timeout) {}

  ~TimedFetcher() override;

  TimedFetcher(const TimedFetcher &) = delete;
  TimedFetcher &operator=(const TimedFetcher &) = delete;

  arrow::Result<std::string> fetch(const TopologySource &source) const override;

  std::chrono::milliseconds get_timeout() const { return timeout_; }

  // Workers whose fetch has not returned yet.
  size_t pending() const;

 private:
  struct Worker {
    int64_t topology_id;
    std::shared_future<arrow::Result<std::string>> result;
    std::thread thread;
  };

  // Joins the workers that are done. Caller holds mutex_.
  void reap() const;

  std::shared_ptr<const TopologyFetcher> inner_;
  std::chrono::milliseconds timeout_;

  mutable std::mutex mutex_;
  mutable std::list<Worker> workers_;
};

}  // namespace meshlink

#endif  // FETCHER_HPP
