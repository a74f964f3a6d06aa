#include "address_index.hpp"

#include <limits>
#include <mutex>

#include "address.hpp"
#include "errors.hpp"
#include "file_utils.hpp"
#include "logger.hpp"

namespace meshlink {

namespace {

// 0 means "no endpoint" on a Link; INT64_MAX and INT64_MIN are reserved keys
// of llvm::DenseMap.
arrow::Status check_id(const char *what, int64_t id) {
  if (id <= 0 || id == std::numeric_limits<int64_t>::max()) {
    return arrow::Status::Invalid(what, " id must be a positive integer below ",
                                  std::numeric_limits<int64_t>::max(),
                                  ", got ", id);
  }
  return arrow::Status::OK();
}

}  // namespace

arrow::Result<LayerPtr> AddressIndex::add_layer(int64_t id, std::string slug,
                                                std::string name) {
  ARROW_RETURN_NOT_OK(check_id("Layer", id));
  std::unique_lock<std::shared_mutex> lock(mutex_);
  if (layers_.count(id) > 0) {
    return arrow::Status::KeyError("Layer already exists with id=", id);
  }
  auto layer = std::make_shared<Layer>(
      Layer{id, std::move(slug), std::move(name)});
  layers_[id] = layer;
  return layer;
}

arrow::Result<NodePtr> AddressIndex::add_node(int64_t id, std::string slug,
                                              std::string name, GeoPoint point,
                                              int64_t layer_id) {
  ARROW_RETURN_NOT_OK(check_id("Node", id));
  std::unique_lock<std::shared_mutex> lock(mutex_);
  if (nodes_.count(id) > 0) {
    return arrow::Status::KeyError("Node already exists with id=", id);
  }
  auto layer_it = layers_.find(layer_id);
  if (layer_it == layers_.end()) {
    return arrow::Status::KeyError("Node ", slug, " refers to unknown layer ",
                                   layer_id);
  }
  auto node = std::make_shared<Node>(
      Node{id, std::move(slug), std::move(name), point, layer_it->second});
  nodes_[id] = node;
  return node;
}

arrow::Result<EndpointPtr> AddressIndex::add_endpoint(
    int64_t id, int64_t node_id, const std::string &mac, InterfaceType type,
    const std::vector<std::string> &addresses) {
  ARROW_RETURN_NOT_OK(check_id("Endpoint", id));
  std::string normalized_mac;
  if (!mac.empty()) {
    if (!is_mac(mac)) {
      return invalid_address("Endpoint " + std::to_string(id) +
                             " has an invalid mac '" + mac + "'");
    }
    ARROW_ASSIGN_OR_RAISE(normalized_mac, normalize_address(mac));
  }

  std::vector<std::string> normalized;
  normalized.reserve(addresses.size());
  for (const auto &address : addresses) {
    ARROW_ASSIGN_OR_RAISE(auto kind, classify_address(address));
    if (kind == AddressKind::MAC) {
      return invalid_address("Endpoint " + std::to_string(id) +
                             " lists mac " + address + " as ip address");
    }
    ARROW_ASSIGN_OR_RAISE(auto key, normalize_address(address));
    normalized.push_back(std::move(key));
  }

  std::unique_lock<std::shared_mutex> lock(mutex_);
  if (endpoints_.count(id) > 0) {
    return arrow::Status::KeyError("Endpoint already exists with id=", id);
  }
  auto node_it = nodes_.find(node_id);
  if (node_it == nodes_.end()) {
    return arrow::Status::KeyError("Endpoint ", id, " refers to unknown node ",
                                   node_id);
  }
  if (!normalized_mac.empty() && mac_index_.count(normalized_mac) > 0) {
    return arrow::Status::KeyError("Mac ", normalized_mac,
                                   " already belongs to endpoint ",
                                   mac_index_.lookup(normalized_mac));
  }
  for (const auto &key : normalized) {
    if (ip_index_.count(key) > 0) {
      return arrow::Status::KeyError("Address ", key,
                                     " already belongs to endpoint ",
                                     ip_index_.lookup(key));
    }
  }

  auto endpoint = std::make_shared<Endpoint>(
      Endpoint{id, normalized_mac, type, normalized, node_it->second});
  endpoints_[id] = endpoint;
  if (!normalized_mac.empty()) {
    mac_index_[normalized_mac] = id;
  }
  for (const auto &key : normalized) {
    ip_index_[key] = id;
  }
  return endpoint;
}

arrow::Status AddressIndex::load(const InventoryDocument &document) {
  for (const auto &layer : document.layers) {
    ARROW_RETURN_NOT_OK(add_layer(layer.id, layer.slug, layer.name).status());
  }
  for (const auto &node : document.nodes) {
    ARROW_RETURN_NOT_OK(add_node(node.id, node.slug, node.name,
                                 GeoPoint{node.lat, node.lon}, node.layer)
                            .status());
  }
  for (const auto &endpoint : document.endpoints) {
    ARROW_ASSIGN_OR_RAISE(auto type, parse_interface_type(endpoint.type));
    ARROW_RETURN_NOT_OK(add_endpoint(endpoint.id, endpoint.node, endpoint.mac,
                                     type, endpoint.addresses)
                            .status());
  }
  log_info("Inventory loaded: {} layers, {} nodes, {} endpoints",
           document.layers.size(), document.nodes.size(),
           document.endpoints.size());
  return arrow::Status::OK();
}

arrow::Status AddressIndex::load_file(const std::string &path) {
  ARROW_ASSIGN_OR_RAISE(auto document, read_json_file<InventoryDocument>(path));
  return load(document);
}

arrow::Result<EndpointPtr> AddressIndex::resolve(
    const std::string &address) const {
  ARROW_ASSIGN_OR_RAISE(auto kind, classify_address(address));
  ARROW_ASSIGN_OR_RAISE(auto key, normalize_address(address));

  std::shared_lock<std::shared_mutex> lock(mutex_);
  const auto &index = kind == AddressKind::MAC ? mac_index_ : ip_index_;
  auto it = index.find(key);
  if (it == index.end()) {
    return address_not_found(address);
  }
  auto endpoint_it = endpoints_.find(it->second);
  if (endpoint_it == endpoints_.end()) {
    return address_not_found(address);
  }
  return endpoint_it->second;
}

arrow::Result<std::pair<EndpointPtr, EndpointPtr>> AddressIndex::resolve_pair(
    const std::string &a, const std::string &b) const {
  auto kind_a = classify_address(a);
  auto kind_b = classify_address(b);
  if (!kind_a.ok() || !kind_b.ok() || *kind_a != *kind_b) {
    return invalid_address("Expecting two valid ipv4, ipv6 or mac addresses "
                           "of the same kind, got '" +
                           a + "' and '" + b + "'");
  }
  ARROW_ASSIGN_OR_RAISE(auto endpoint_a, resolve(a));
  ARROW_ASSIGN_OR_RAISE(auto endpoint_b, resolve(b));
  return std::make_pair(std::move(endpoint_a), std::move(endpoint_b));
}

arrow::Result<EndpointPtr> AddressIndex::get_endpoint(int64_t id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto it = endpoints_.find(id);
  if (it == endpoints_.end()) {
    return arrow::Status::KeyError("Endpoint not found with id=", id);
  }
  return it->second;
}

arrow::Result<NodePtr> AddressIndex::get_node(int64_t id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto it = nodes_.find(id);
  if (it == nodes_.end()) {
    return arrow::Status::KeyError("Node not found with id=", id);
  }
  return it->second;
}

arrow::Result<LayerPtr> AddressIndex::get_layer(int64_t id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto it = layers_.find(id);
  if (it == layers_.end()) {
    return arrow::Status::KeyError("Layer not found with id=", id);
  }
  return it->second;
}

size_t AddressIndex::endpoint_count() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return endpoints_.size();
}

size_t AddressIndex::node_count() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return nodes_.size();
}

}  // namespace meshlink
