#include "config.hpp"

#include "file_utils.hpp"

namespace meshlink {

arrow::Result<MeshlinkConfig> load_config(const std::string &path) {
  log_info("Loading config from: " + path);
  ARROW_ASSIGN_OR_RAISE(auto j, read_json_file<nlohmann::json>(path));
  if (!j.is_object()) {
    return arrow::Status::Invalid("Config must be a JSON object: ", path);
  }

  auto builder = make_config();
  try {
    if (j.contains("published_default")) {
      builder.with_published_default(j.at("published_default").get<bool>());
    }
    if (j.contains("reversion_enabled")) {
      builder.with_reversion_enabled(j.at("reversion_enabled").get<bool>());
    }
    if (j.contains("max_revisions")) {
      builder.with_max_revisions(j.at("max_revisions").get<size_t>());
    }
    if (j.contains("fetch_timeout_ms")) {
      builder.with_fetch_timeout(std::chrono::milliseconds(
          j.at("fetch_timeout_ms").get<int64_t>()));
    }
    if (j.contains("chunk_size")) {
      builder.with_chunk_size(j.at("chunk_size").get<size_t>());
    }
    if (j.contains("default_metric_type")) {
      builder.with_default_metric_type(
          j.at("default_metric_type").get<std::string>());
    }
    if (j.contains("log_level")) {
      const auto name = j.at("log_level").get<std::string>();
      auto level = parse_log_level(name);
      if (!level) {
        return arrow::Status::Invalid("Unknown log level: ", name);
      }
      builder.with_log_level(*level);
    }
  } catch (const nlohmann::json::exception &e) {
    return arrow::Status::Invalid("Invalid config ", path, ": ", e.what());
  }
  return builder.build();
}

}  // namespace meshlink
