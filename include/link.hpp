#ifndef LINK_HPP
#define LINK_HPP

#include <arrow/status.h>

#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

#include "address_index.hpp"
#include "inventory.hpp"
#include "types.hpp"

namespace meshlink {

// Straight two point path between the nodes of a link.
struct LineString {
  GeoPoint start;
  GeoPoint end;

  bool operator==(const LineString &other) const {
    return start == other.start && end == other.end;
  }
};

/**
 * @brief Display strings cached on a link at save time
 *
 * Filled once and kept afterwards, except layer_slug which always follows the
 * current layer. Keys unknown to this version live in extra.
 */
struct LinkData {
  std::optional<std::string> node_a_name;
  std::optional<std::string> node_b_name;
  std::optional<std::string> node_a_slug;
  std::optional<std::string> node_b_slug;
  std::optional<std::string> endpoint_a_mac;
  std::optional<std::string> endpoint_b_mac;
  std::optional<std::string> layer_slug;
  std::map<std::string, std::string> extra;

  bool operator==(const LinkData &other) const {
    return node_a_name == other.node_a_name &&
           node_b_name == other.node_b_name &&
           node_a_slug == other.node_a_slug &&
           node_b_slug == other.node_b_slug &&
           endpoint_a_mac == other.endpoint_a_mac &&
           endpoint_b_mac == other.endpoint_b_mac &&
           layer_slug == other.layer_slug && extra == other.extra;
  }
};

class Link {
 public:
  int64_t id = 0;  // 0 until the link store assigns one

  std::optional<LinkType> type;
  LinkStatus status = LinkStatus::PLANNED;

  // Endpoint ids are authoritative, the pointers are caches refreshed from
  // the address index on every save.
  int64_t endpoint_a_id = 0;
  int64_t endpoint_b_id = 0;
  EndpointPtr endpoint_a;
  EndpointPtr endpoint_b;

  // Shortcuts derived on save; only planned links set the nodes directly.
  NodePtr node_a;
  NodePtr node_b;
  LayerPtr layer;

  std::optional<LineString> line;

  // Topology source that produced the link, empty for manual links.
  std::optional<int64_t> topology_id;

  std::optional<std::string> metric_type;
  std::optional<double> metric_value;
  std::optional<int64_t> max_rate;
  std::optional<int64_t> min_rate;

  // Radio links only.
  std::optional<int64_t> dbm;
  std::optional<int64_t> noise;

  std::optional<int64_t> first_seen;  // millis since epoch
  std::optional<int64_t> last_seen;

  // Unset until stored, then the configured default applies.
  std::optional<bool> published;

  LinkData data;

  Link() = default;

  void set_endpoint_a(EndpointPtr endpoint);
  void set_endpoint_b(EndpointPtr endpoint);

  bool has_endpoint_a() const { return endpoint_a != nullptr || endpoint_a_id != 0; }
  bool has_endpoint_b() const { return endpoint_b != nullptr || endpoint_b_id != 0; }

  /**
   * @brief Replace cached endpoints with the index's records for their ids
   *
   * An id that the index does not know fails with ValidationFailed.
   */
  arrow::Status load_endpoints(const AddressIndex &index);

  /**
   * @brief Check the link rules, ValidationFailed on the first violation
   *
   * 1. non planned links need two distinct endpoints
   * 2. planned links need node_a and node_b
   * 3. only radio links carry dbm and noise
   * 4. both endpoints have the same physical type
   */
  arrow::Status validate() const;

  /**
   * @brief Fill the derived fields, run after validate() and before storing
   *
   * Each step only fills a field that is still empty, except layer_slug.
   */
  arrow::Status derive(const AddressIndex &index);

  // 0 when there is no metric yet; any measured link scores 6 for now.
  int quality() const { return metric_value.has_value() ? 6 : 0; }

  /**
   * @brief Whether other records a different version of this link
   *
   * last_seen and metric_value are refreshed by every sighting and do not
   * count as a change.
   */
  bool differs_from(const Link &other) const;

  std::string to_string() const;
};

nlohmann::json to_json(const Link &link);

}  // namespace meshlink

#endif  // LINK_HPP
