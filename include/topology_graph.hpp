#ifndef TOPOLOGY_GRAPH_HPP
#define TOPOLOGY_GRAPH_HPP

#include <arrow/result.h>

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace meshlink {

// External feed describing a network graph, e.g. an OLSR topology dump.
struct TopologySource {
  int64_t id = 0;
  std::string url;  // path or file:// url of the NetJSON document
  std::string protocol;
  std::string version;
  std::string metric;

  NLOHMANN_DEFINE_TYPE_INTRUSIVE(TopologySource, id, url, protocol, version,
                                 metric)
};

struct SourcesDocument {
  std::vector<TopologySource> sources;

  NLOHMANN_DEFINE_TYPE_INTRUSIVE(SourcesDocument, sources)
};

struct GraphEdge {
  std::string source;
  std::string target;
  std::optional<double> weight;
};

/**
 * @brief Nodes and weighted edges of a NetJSON NetworkGraph
 *
 * Node ids and edge endpoints are address strings (IP or MAC); they are not
 * resolved here.
 */
class TopologyGraph {
 public:
  TopologyGraph() = default;

  /**
   * @brief Parse a NetJSON document
   *
   * Expects {"nodes": [{"id": ...}], "links": [{"source", "target",
   * "weight"}]}. "cost" is accepted when "weight" is missing. Anything else
   * malformed fails with DecodeError.
   */
  static arrow::Result<TopologyGraph> decode(const std::string &text);

  // Same, for a document that is already parsed.
  static arrow::Result<TopologyGraph> decode_json(
      const nlohmann::json &document);

  // NetworkGraph document carrying the source's protocol, version and metric.
  nlohmann::json encode(const TopologySource &source) const;

  // Ignores ids that are already present.
  void add_node(const std::string &id);

  void add_link(std::string source, std::string target,
                std::optional<double> weight);

  const std::vector<std::string> &nodes() const { return nodes_; }
  const std::vector<GraphEdge> &links() const { return links_; }

  bool empty() const { return nodes_.empty() && links_.empty(); }

 private:
  std::vector<std::string> nodes_;
  std::set<std::string> node_set_;
  std::vector<GraphEdge> links_;
};

}  // namespace meshlink

#endif  // TOPOLOGY_GRAPH_HPP
