#include "reconciler.hpp"

#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>

#include <mutex>

#include "clock.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "utils.hpp"

namespace meshlink {

std::string UpdateReport::to_string() const {
  return "run " + run_id + " topology=" + std::to_string(topology_id) +
         " created=" + std::to_string(created) +
         " updated=" + std::to_string(updated) +
         " disconnected=" + std::to_string(disconnected) +
         " failed=" + std::to_string(failed);
}

TopologyReconciler::TopologyReconciler(
    std::shared_ptr<const AddressIndex> index, std::shared_ptr<LinkStore> store,
    std::shared_ptr<const TopologyFetcher> fetcher, MeshlinkConfig config)
    : index_(std::move(index)),
      store_(std::move(store)),
      fetcher_(std::make_shared<TimedFetcher>(std::move(fetcher),
                                              config.get_fetch_timeout())),
      config_(std::move(config)),
      resolver_(index_, store_) {}

arrow::Result<UpdateReport> TopologyReconciler::update(
    const TopologySource &source) {
  auto lock = source_locks_.get(source.id);
  std::lock_guard<std::mutex> guard(*lock);

  std::string run_id = generate_uuid();
  ContextLogger log("reconciler[source=" + std::to_string(source.id) + "]");
  log.debug("run {} fetching {}", run_id, source.url);

  auto document = fetcher_->fetch(source);
  if (!document.ok()) {
    log.error("run {} aborted: {}", run_id, document.status().ToString());
    return document.status();
  }
  auto graph = TopologyGraph::decode(*document);
  if (!graph.ok()) {
    log.error("run {} aborted: {}", run_id, graph.status().ToString());
    return graph.status();
  }
  return apply(source, *graph, std::move(run_id));
}

arrow::Result<UpdateReport> TopologyReconciler::update(
    const TopologySource &source, const TopologyGraph &graph) {
  auto lock = source_locks_.get(source.id);
  std::lock_guard<std::mutex> guard(*lock);
  return apply(source, graph, generate_uuid());
}

arrow::Result<UpdateReport> TopologyReconciler::apply(
    const TopologySource &source, const TopologyGraph &graph,
    std::string run_id) {
  ContextLogger log("reconciler[source=" + std::to_string(source.id) + "]");
  UpdateReport report;
  report.run_id = std::move(run_id);
  report.topology_id = source.id;

  const std::string metric_type =
      source.metric.empty() ? config_.get_default_metric_type() : source.metric;
  ConcurrentSet<int64_t> touched;

  for (const auto &edge : graph.links()) {
    bool created = false;
    auto found = resolver_.find_in_source(edge.source, edge.target, source.id);
    if (!found.ok() && is_error(found.status(), ErrorKind::LINK_NOT_FOUND)) {
      found = resolver_.find_or_create(edge.source, edge.target, source.id);
      created = found.ok();
    }
    if (!found.ok()) {
      log.warn("skipping edge {} <> {}: {}", edge.source, edge.target,
               found.status().ToString());
      ++report.failed;
      continue;
    }

    Link link = found.MoveValueUnsafe();
    const int64_t now = now_millis();
    link.status = LinkStatus::ACTIVE;
    link.metric_type = metric_type;
    link.metric_value = edge.weight;
    if (!link.first_seen.has_value()) {
      link.first_seen = now;
    }
    link.last_seen = now;

    auto saved = store_->save(std::move(link));
    if (!saved.ok()) {
      log.warn("cannot save edge {} <> {}: {}", edge.source, edge.target,
               saved.status().ToString());
      ++report.failed;
      continue;
    }
    touched.insert(saved->id);
    if (created) {
      ++report.created;
    } else {
      ++report.updated;
    }
  }

  // only once every edge has been applied
  for (auto &link : store_->by_source(source.id, LinkStatus::ACTIVE)) {
    if (touched.contains(link.id)) {
      continue;
    }
    const int64_t id = link.id;
    link.status = LinkStatus::DISCONNECTED;
    auto saved = store_->save(std::move(link));
    if (!saved.ok()) {
      log.error("cannot disconnect link {}: {}", id, saved.status().ToString());
      ++report.failed;
      continue;
    }
    log.debug("link {} disconnected", id);
    ++report.disconnected;
  }

  log.info("{}", report.to_string());
  return report;
}

std::vector<arrow::Result<UpdateReport>> TopologyReconciler::update_all(
    const std::vector<TopologySource> &sources) {
  std::vector<arrow::Result<UpdateReport>> results(sources.size());
  tbb::parallel_for(tbb::blocked_range<size_t>(0, sources.size()),
                    [&](const tbb::blocked_range<size_t> &range) {
                      for (size_t i = range.begin(); i != range.end(); ++i) {
                        results[i] = update(sources[i]);
                      }
                    });
  return results;
}

TopologyGraph TopologyReconciler::current_graph(
    const TopologySource &source) const {
  TopologyGraph graph;
  for (const auto &link : store_->by_source(source.id, LinkStatus::ACTIVE)) {
    if (!link.endpoint_a || !link.endpoint_b) {
      log_warn("Active link {} has no endpoints, not exported", link.id);
      continue;
    }
    const std::string &a = link.endpoint_a->graph_id();
    const std::string &b = link.endpoint_b->graph_id();
    graph.add_node(a);
    graph.add_node(b);
    graph.add_link(a, b, link.metric_value);
  }
  return graph;
}

nlohmann::json TopologyReconciler::export_graph(
    const TopologySource &source) const {
  return current_graph(source).encode(source);
}

}  // namespace meshlink
