#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "../include/address_index.hpp"
#include "../include/config.hpp"
#include "../include/fetcher.hpp"
#include "../include/file_utils.hpp"
#include "../include/link_store.hpp"
#include "../include/logger.hpp"
#include "../include/reconciler.hpp"

using namespace meshlink;

namespace {

void print_usage() {
  std::cout
      << "Usage: meshlink_sync --inventory FILE --sources FILE [OPTIONS]\n"
      << "Options:\n"
      << "  -i, --inventory FILE   Layers, nodes and endpoints (JSON)\n"
      << "  -s, --sources FILE     Topology sources to reconcile (JSON)\n"
      << "  -c, --config FILE      meshlink settings (JSON)\n"
      << "  -n, --interval SEC     Repeat every SEC seconds (default: run "
         "once)\n"
      << "  -o, --output DIR       Write topology-<id>.json files to DIR "
         "instead of stdout\n"
      << "  -l, --log-level LEVEL  debug, info, warn or error\n"
      << "      --log-file FILE    Write logs to FILE instead of stderr\n"
      << "  -h, --help             Show this help message\n";
}

// Returns the number of sources that failed.
int run_pass(TopologyReconciler &reconciler,
             const std::vector<TopologySource> &sources,
             const std::string &output_dir) {
  int failures = 0;
  auto results = reconciler.update_all(sources);
  for (size_t i = 0; i < sources.size(); ++i) {
    const auto &source = sources[i];
    if (!results[i].ok()) {
      std::cerr << "Topology " << source.id
                << " failed: " << results[i].status().ToString() << "\n";
      ++failures;
      continue;
    }
    auto graph = reconciler.export_graph(source);
    if (output_dir.empty()) {
      std::cout << graph.dump(2) << std::endl;
      continue;
    }
    const auto path = std::filesystem::path(output_dir) /
                      ("topology-" + std::to_string(source.id) + ".json");
    auto written = write_json_file(graph, path.string());
    if (!written.ok()) {
      std::cerr << "Topology " << source.id
                << " export failed: " << written.status().ToString() << "\n";
      ++failures;
    }
  }
  return failures;
}

}  // namespace

int main(int argc, char *argv[]) {
  std::string inventory_file;
  std::string sources_file;
  std::string config_file;
  std::string log_level;
  std::string log_file;
  std::string output_dir;
  int64_t interval_seconds = 0;

  for (int i = 1; i < argc; i++) {
    std::string arg = argv[i];
    auto next = [&](const char *what) -> const char * {
      if (i + 1 < argc) {
        return argv[++i];
      }
      std::cerr << "Error: " << arg << " requires " << what << "\n";
      return nullptr;
    };

    const char *value = nullptr;
    if (arg == "--inventory" || arg == "-i") {
      if (!(value = next("a file path"))) return 1;
      inventory_file = value;
    } else if (arg == "--sources" || arg == "-s") {
      if (!(value = next("a file path"))) return 1;
      sources_file = value;
    } else if (arg == "--config" || arg == "-c") {
      if (!(value = next("a file path"))) return 1;
      config_file = value;
    } else if (arg == "--interval" || arg == "-n") {
      if (!(value = next("a number of seconds"))) return 1;
      try {
        interval_seconds = std::stoll(value);
      } catch (const std::exception &) {
        std::cerr << "Error: invalid interval '" << value << "'\n";
        return 1;
      }
      if (interval_seconds < 0) {
        std::cerr << "Error: interval must not be negative\n";
        return 1;
      }
    } else if (arg == "--output" || arg == "-o") {
      if (!(value = next("a directory"))) return 1;
      output_dir = value;
    } else if (arg == "--log-level" || arg == "-l") {
      if (!(value = next("a level"))) return 1;
      log_level = value;
    } else if (arg == "--log-file") {
      if (!(value = next("a file path"))) return 1;
      log_file = value;
    } else if (arg == "--help" || arg == "-h") {
      print_usage();
      return 0;
    } else {
      std::cerr << "Unknown option: " << arg << "\n";
      std::cerr << "Use --help for usage information\n";
      return 1;
    }
  }

  if (inventory_file.empty() || sources_file.empty()) {
    std::cerr << "Error: --inventory and --sources are required\n";
    print_usage();
    return 1;
  }

  MeshlinkConfig config;
  if (!config_file.empty()) {
    auto loaded = load_config(config_file);
    if (!loaded.ok()) {
      std::cerr << "Error: " << loaded.status().ToString() << "\n";
      return 1;
    }
    config = *loaded;
  }

  auto &logger = Logger::getInstance();
  if (!log_file.empty()) {
    logger.setLogToFile(log_file);
  }
  logger.setLevel(config.get_log_level());
  if (!log_level.empty()) {
    auto level = parse_log_level(log_level);
    if (!level) {
      std::cerr << "Error: unknown log level '" << log_level << "'\n";
      return 1;
    }
    logger.setLevel(*level);
  }

  auto index = std::make_shared<AddressIndex>();
  if (auto status = index->load_file(inventory_file); !status.ok()) {
    std::cerr << "Error: " << status.ToString() << "\n";
    return 1;
  }
  auto sources = read_json_file<SourcesDocument>(sources_file);
  if (!sources.ok()) {
    std::cerr << "Error: " << sources.status().ToString() << "\n";
    return 1;
  }
  log_info("Loaded {} endpoints and {} topology sources",
           index->endpoint_count(), sources->sources.size());

  auto store = std::make_shared<LinkStore>(index, config);
  TopologyReconciler reconciler(index, store,
                                std::make_shared<FileTopologyFetcher>(), config);

  int failures = run_pass(reconciler, sources->sources, output_dir);
  while (interval_seconds > 0) {
    std::this_thread::sleep_for(std::chrono::seconds(interval_seconds));
    failures = run_pass(reconciler, sources->sources, output_dir);
  }
  return failures == 0 ? 0 : 2;
}
