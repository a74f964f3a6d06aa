#ifndef RECONCILER_HPP
#define RECONCILER_HPP

#include <arrow/result.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "address_index.hpp"
#include "concurrency.hpp"
#include "config.hpp"
#include "fetcher.hpp"
#include "link_resolver.hpp"
#include "link_store.hpp"
#include "topology_graph.hpp"

namespace meshlink {

// Outcome of one reconciliation pass over a topology source.
struct UpdateReport {
  std::string run_id;
  int64_t topology_id = 0;
  size_t created = 0;
  size_t updated = 0;
  size_t disconnected = 0;
  size_t failed = 0;

  std::string to_string() const;
};

/**
 * @brief Brings the links of a topology source in line with its graph
 *
 * A pass fetches and decodes the source document, marks every edge's link
 * active (creating it on first sighting) and then disconnects the active
 * links of the source that the graph no longer mentions. Links are never
 * deleted.
 *
 * Passes over the same source are serialized; different sources run
 * concurrently.
 */
class TopologyReconciler {
 public:
  TopologyReconciler(std::shared_ptr<const AddressIndex> index,
                     std::shared_ptr<LinkStore> store,
                     std::shared_ptr<const TopologyFetcher> fetcher,
                     MeshlinkConfig config = MeshlinkConfig());

  /**
   * @brief Fetch, decode and apply the source's graph
   *
   * FetchError and DecodeError abort the pass before any link is written.
   * Edges that fail to resolve or validate are logged and counted in
   * UpdateReport::failed.
   */
  arrow::Result<UpdateReport> update(const TopologySource &source);

  // Applies an already decoded graph.
  arrow::Result<UpdateReport> update(const TopologySource &source,
                                     const TopologyGraph &graph);

  // One result per source, in the order given.
  std::vector<arrow::Result<UpdateReport>> update_all(
      const std::vector<TopologySource> &sources);

  // Active links of the source as a graph.
  TopologyGraph current_graph(const TopologySource &source) const;

  // NetJSON NetworkGraph document of current_graph().
  nlohmann::json export_graph(const TopologySource &source) const;

  const LinkResolver &get_resolver() const { return resolver_; }

 private:
  arrow::Result<UpdateReport> apply(const TopologySource &source,
                                    const TopologyGraph &graph,
                                    std::string run_id);

  std::shared_ptr<const AddressIndex> index_;
  std::shared_ptr<LinkStore> store_;
  std::shared_ptr<const TopologyFetcher> fetcher_;
  MeshlinkConfig config_;
  LinkResolver resolver_;
  LockRegistry<int64_t> source_locks_;
};

}  // namespace meshlink

#endif  // RECONCILER_HPP
