#ifndef INVENTORY_HPP
#define INVENTORY_HPP

#include <cstdint>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "types.hpp"

namespace meshlink {

struct GeoPoint {
  double lat = 0.0;
  double lon = 0.0;

  bool operator==(const GeoPoint& other) const {
    return lat == other.lat && lon == other.lon;
  }
};

struct Layer {
  int64_t id = 0;
  std::string slug;
  std::string name;
};

struct Node {
  int64_t id = 0;
  std::string slug;
  std::string name;
  GeoPoint point;
  std::shared_ptr<const Layer> layer;
};

// A network interface; owned by exactly one node.
struct Endpoint {
  int64_t id = 0;
  std::string mac;
  InterfaceType type = InterfaceType::OTHER;
  std::vector<std::string> addresses;  // IPv4/IPv6, normalized
  std::shared_ptr<const Node> node;

  // Identifier used in exported graphs: first IP address, MAC otherwise.
  const std::string& graph_id() const {
    return addresses.empty() ? mac : addresses.front();
  }
};

// Records of the inventory JSON document, see AddressIndex::load.
struct LayerRecord {
  int64_t id = 0;
  std::string slug;
  std::string name;

  NLOHMANN_DEFINE_TYPE_INTRUSIVE(LayerRecord, id, slug, name)
};

struct NodeRecord {
  int64_t id = 0;
  std::string slug;
  std::string name;
  int64_t layer = 0;
  double lat = 0.0;
  double lon = 0.0;

  NLOHMANN_DEFINE_TYPE_INTRUSIVE(NodeRecord, id, slug, name, layer, lat, lon)
};

struct EndpointRecord {
  int64_t id = 0;
  int64_t node = 0;
  std::string mac;
  std::string type;
  std::vector<std::string> addresses;

  NLOHMANN_DEFINE_TYPE_INTRUSIVE(EndpointRecord, id, node, mac, type,
                                 addresses)
};

struct InventoryDocument {
  std::vector<LayerRecord> layers;
  std::vector<NodeRecord> nodes;
  std::vector<EndpointRecord> endpoints;

  NLOHMANN_DEFINE_TYPE_INTRUSIVE(InventoryDocument, layers, nodes, endpoints)
};

}  // namespace meshlink

#endif  // INVENTORY_HPP
