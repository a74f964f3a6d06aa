#include "topology_graph.hpp"

#include "errors.hpp"

namespace meshlink {

namespace {

arrow::Result<std::string> string_member(const nlohmann::json &object,
                                         const char *key, size_t index,
                                         const char *where) {
  auto it = object.find(key);
  if (it == object.end() || !it->is_string()) {
    return decode_error(std::string(where) + "[" + std::to_string(index) +
                        "]." + key + " must be a string");
  }
  return it->get<std::string>();
}

}  // namespace

arrow::Result<TopologyGraph> TopologyGraph::decode(const std::string &text) {
  nlohmann::json document;
  try {
    document = nlohmann::json::parse(text);
  } catch (const nlohmann::json::parse_error &e) {
    return decode_error(std::string("Topology document is not JSON: ") +
                        e.what());
  }
  return decode_json(document);
}

arrow::Result<TopologyGraph> TopologyGraph::decode_json(
    const nlohmann::json &document) {
  if (!document.is_object()) {
    return decode_error("Topology document must be a JSON object");
  }
  if (auto type = document.find("type");
      type != document.end() && *type != "NetworkGraph") {
    return decode_error("Unsupported NetJSON type " + type->dump());
  }

  auto nodes = document.find("nodes");
  if (nodes == document.end() || !nodes->is_array()) {
    return decode_error("Topology document has no \"nodes\" array");
  }
  auto links = document.find("links");
  if (links == document.end() || !links->is_array()) {
    return decode_error("Topology document has no \"links\" array");
  }

  TopologyGraph graph;
  for (size_t i = 0; i < nodes->size(); ++i) {
    const auto &node = (*nodes)[i];
    if (!node.is_object()) {
      return decode_error("nodes[" + std::to_string(i) +
                          "] must be an object");
    }
    ARROW_ASSIGN_OR_RAISE(auto id, string_member(node, "id", i, "nodes"));
    graph.add_node(id);
  }

  for (size_t i = 0; i < links->size(); ++i) {
    const auto &link = (*links)[i];
    if (!link.is_object()) {
      return decode_error("links[" + std::to_string(i) +
                          "] must be an object");
    }
    ARROW_ASSIGN_OR_RAISE(auto source, string_member(link, "source", i, "links"));
    ARROW_ASSIGN_OR_RAISE(auto target, string_member(link, "target", i, "links"));

    std::optional<double> weight;
    auto value = link.find("weight");
    if (value == link.end()) {
      value = link.find("cost");
    }
    if (value != link.end() && !value->is_null()) {
      if (!value->is_number()) {
        return decode_error("links[" + std::to_string(i) +
                            "].weight must be a number");
      }
      weight = value->get<double>();
    }
    graph.add_link(std::move(source), std::move(target), weight);
  }
  return graph;
}

nlohmann::json TopologyGraph::encode(const TopologySource &source) const {
  nlohmann::json document;
  document["type"] = "NetworkGraph";
  document["protocol"] = source.protocol;
  document["version"] = source.version;
  document["metric"] = source.metric;

  auto nodes = nlohmann::json::array();
  for (const auto &id : nodes_) {
    nodes.push_back({{"id", id}});
  }
  document["nodes"] = nodes;

  auto links = nlohmann::json::array();
  for (const auto &edge : links_) {
    nlohmann::json link;
    link["source"] = edge.source;
    link["target"] = edge.target;
    link["weight"] = edge.weight ? nlohmann::json(*edge.weight)
                                 : nlohmann::json(nullptr);
    links.push_back(link);
  }
  document["links"] = links;
  return document;
}

void TopologyGraph::add_node(const std::string &id) {
  if (node_set_.insert(id).second) {
    nodes_.push_back(id);
  }
}

void TopologyGraph::add_link(std::string source, std::string target,
                             std::optional<double> weight) {
  links_.push_back(GraphEdge{std::move(source), std::move(target), weight});
}

}  // namespace meshlink
