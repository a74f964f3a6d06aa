#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <arrow/result.h>

#include <chrono>
#include <cstddef>
#include <string>

#include "logger.hpp"

namespace meshlink {

namespace defaults {
constexpr bool PUBLISHED = true;
constexpr bool REVERSION_ENABLED = true;
constexpr size_t MAX_REVISIONS = 16;
constexpr std::chrono::milliseconds FETCH_TIMEOUT{10000};
constexpr size_t CHUNK_SIZE = 1000;
constexpr const char *METRIC_TYPE = "etx";
}  // namespace defaults

// Settings shared by the link store, the resolver and the reconciler.
class MeshlinkConfig {
 private:
  // Whether links created by the reconciler start out published
  bool published_default = defaults::PUBLISHED;

  // Keep the previous version of a link every time a save changes it
  bool reversion_enabled = defaults::REVERSION_ENABLED;

  // Oldest revisions are dropped beyond this many per link
  size_t max_revisions = defaults::MAX_REVISIONS;

  // Upper bound for fetching one topology document
  std::chrono::milliseconds fetch_timeout = defaults::FETCH_TIMEOUT;

  // Rows per chunk when building the links table
  size_t chunk_size = defaults::CHUNK_SIZE;

  // Used when a topology source does not declare its metric
  std::string default_metric_type = defaults::METRIC_TYPE;

  LogLevel log_level = LogLevel::INFO;

  friend class MeshlinkConfigBuilder;

 public:
  bool is_published_default() const { return published_default; }
  bool is_reversion_enabled() const { return reversion_enabled; }
  size_t get_max_revisions() const { return max_revisions; }
  std::chrono::milliseconds get_fetch_timeout() const { return fetch_timeout; }
  size_t get_chunk_size() const { return chunk_size; }
  const std::string &get_default_metric_type() const {
    return default_metric_type;
  }
  LogLevel get_log_level() const { return log_level; }
};

class MeshlinkConfigBuilder {
 private:
  MeshlinkConfig config;

 public:
  MeshlinkConfigBuilder() = default;

  MeshlinkConfigBuilder &with_published_default(bool published) {
    config.published_default = published;
    return *this;
  }

  MeshlinkConfigBuilder &with_reversion_enabled(bool enabled) {
    config.reversion_enabled = enabled;
    return *this;
  }

  MeshlinkConfigBuilder &with_max_revisions(size_t count) {
    config.max_revisions = count;
    return *this;
  }

  MeshlinkConfigBuilder &with_fetch_timeout(std::chrono::milliseconds timeout) {
    config.fetch_timeout = timeout;
    return *this;
  }

  MeshlinkConfigBuilder &with_chunk_size(size_t size) {
    config.chunk_size = size;
    return *this;
  }

  MeshlinkConfigBuilder &with_default_metric_type(const std::string &metric) {
    config.default_metric_type = metric;
    return *this;
  }

  MeshlinkConfigBuilder &with_log_level(LogLevel level) {
    config.log_level = level;
    return *this;
  }

  [[nodiscard]] MeshlinkConfig build() const { return config; }
};

inline MeshlinkConfigBuilder make_config() { return {}; }

/**
 * @brief Load a config from a JSON file
 *
 * Every member is optional, missing ones keep their defaults:
 * {"published_default": true, "reversion_enabled": false,
 *  "max_revisions": 16, "fetch_timeout_ms": 5000, "chunk_size": 500,
 *  "default_metric_type": "etx", "log_level": "debug"}
 */
arrow::Result<MeshlinkConfig> load_config(const std::string &path);

}  // namespace meshlink

#endif  // CONFIG_HPP
