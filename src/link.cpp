#include "link.hpp"

#include <sstream>

#include "errors.hpp"

namespace meshlink {

void Link::set_endpoint_a(EndpointPtr endpoint) {
  endpoint_a_id = endpoint ? endpoint->id : 0;
  endpoint_a = std::move(endpoint);
}

void Link::set_endpoint_b(EndpointPtr endpoint) {
  endpoint_b_id = endpoint ? endpoint->id : 0;
  endpoint_b = std::move(endpoint);
}

arrow::Status Link::load_endpoints(const AddressIndex &index) {
  if (endpoint_a_id != 0) {
    auto res = index.get_endpoint(endpoint_a_id);
    if (!res.ok()) {
      return validation_failed("\"from endpoint\" refers to unknown endpoint " +
                               std::to_string(endpoint_a_id));
    }
    endpoint_a = res.ValueOrDie();
  } else if (endpoint_a != nullptr) {
    endpoint_a_id = endpoint_a->id;
  }

  if (endpoint_b_id != 0) {
    auto res = index.get_endpoint(endpoint_b_id);
    if (!res.ok()) {
      return validation_failed("\"to endpoint\" refers to unknown endpoint " +
                               std::to_string(endpoint_b_id));
    }
    endpoint_b = res.ValueOrDie();
  } else if (endpoint_b != nullptr) {
    endpoint_b_id = endpoint_b->id;
  }
  return arrow::Status::OK();
}

arrow::Status Link::validate() const {
  if (status != LinkStatus::PLANNED) {
    if (!has_endpoint_a() || !has_endpoint_b()) {
      return validation_failed(
          "fields \"from endpoint\" and \"to endpoint\" are mandatory unless "
          "the link is planned");
    }
    const bool same_id = endpoint_a_id != 0 && endpoint_a_id == endpoint_b_id;
    const bool same_object =
        endpoint_a != nullptr && endpoint_a == endpoint_b;
    if (same_id || same_object) {
      return validation_failed(
          "link cannot have the same \"from endpoint\" and \"to endpoint\"");
    }
  }

  if (status == LinkStatus::PLANNED && (node_a == nullptr || node_b == nullptr)) {
    return validation_failed(
        "fields \"from node\" and \"to node\" are mandatory for planned links");
  }

  if (type != LinkType::RADIO && (dbm.has_value() || noise.has_value())) {
    return validation_failed(
        "only links of type \"radio\" can contain \"dbm\" and \"noise\" "
        "information");
  }

  if (endpoint_a != nullptr && endpoint_b != nullptr &&
      endpoint_a->type != endpoint_b->type) {
    return validation_failed(
        "link cannot be between endpoints of different types: endpoint a is \"" +
        meshlink::to_string(endpoint_a->type) + "\" while b is \"" +
        meshlink::to_string(endpoint_b->type) + "\"");
  }
  return arrow::Status::OK();
}

arrow::Status Link::derive(const AddressIndex &index) {
  if (!type.has_value() && endpoint_a != nullptr) {
    type = link_type_for(endpoint_a->type);
  }

  ARROW_RETURN_NOT_OK(load_endpoints(index));

  if (node_a == nullptr && endpoint_a != nullptr) {
    node_a = endpoint_a->node;
  }
  if (node_b == nullptr && endpoint_b != nullptr) {
    node_b = endpoint_b->node;
  }
  if (node_a == nullptr || node_b == nullptr) {
    return validation_failed("cannot derive \"from node\" and \"to node\"");
  }

  if (layer == nullptr) {
    layer = node_a->layer;
  }

  if (!line.has_value()) {
    line = LineString{node_a->point, node_b->point};
  }

  // node_b_name is only looked at through node_a_name
  if (!data.node_a_name.has_value()) {
    data.node_a_name = node_a->name;
    data.node_b_name = node_b->name;
  }

  if (!data.node_a_slug.has_value() || !data.node_b_slug.has_value()) {
    data.node_a_slug = node_a->slug;
    data.node_b_slug = node_b->slug;
  }

  if (endpoint_a != nullptr && !data.endpoint_a_mac.has_value()) {
    data.endpoint_a_mac = endpoint_a->mac;
  }
  if (endpoint_b != nullptr && !data.endpoint_b_mac.has_value()) {
    data.endpoint_b_mac = endpoint_b->mac;
  }

  if (layer != nullptr) {
    data.layer_slug = layer->slug;
  } else {
    data.layer_slug.reset();
  }
  return arrow::Status::OK();
}

namespace {

template <typename T>
int64_t id_of(const std::shared_ptr<const T> &record) {
  return record ? record->id : 0;
}

}  // namespace

bool Link::differs_from(const Link &other) const {
  return type != other.type || status != other.status ||
         endpoint_a_id != other.endpoint_a_id ||
         endpoint_b_id != other.endpoint_b_id ||
         id_of(node_a) != id_of(other.node_a) ||
         id_of(node_b) != id_of(other.node_b) ||
         id_of(layer) != id_of(other.layer) || !(line == other.line) ||
         topology_id != other.topology_id ||
         metric_type != other.metric_type || max_rate != other.max_rate ||
         min_rate != other.min_rate || dbm != other.dbm ||
         noise != other.noise || first_seen != other.first_seen ||
         published != other.published || !(data == other.data);
}

std::string Link::to_string() const {
  std::stringstream ss;
  ss << data.node_a_name.value_or("?") << " <> "
     << data.node_b_name.value_or("?");
  return ss.str();
}

namespace {

template <typename T>
nlohmann::json optional_json(const std::optional<T> &value) {
  return value.has_value() ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

}  // namespace

nlohmann::json to_json(const Link &link) {
  nlohmann::json j;
  j["id"] = link.id;
  j["status"] = to_string(link.status);
  j["type"] = link.type ? nlohmann::json(to_string(*link.type))
                        : nlohmann::json(nullptr);
  j["topology"] = optional_json(link.topology_id);
  j["endpoint_a"] = link.endpoint_a_id != 0 ? nlohmann::json(link.endpoint_a_id)
                                            : nlohmann::json(nullptr);
  j["endpoint_b"] = link.endpoint_b_id != 0 ? nlohmann::json(link.endpoint_b_id)
                                            : nlohmann::json(nullptr);
  j["node_a"] = link.node_a ? nlohmann::json(link.node_a->id)
                            : nlohmann::json(nullptr);
  j["node_b"] = link.node_b ? nlohmann::json(link.node_b->id)
                            : nlohmann::json(nullptr);
  j["layer"] = link.layer ? nlohmann::json(link.layer->id)
                          : nlohmann::json(nullptr);
  j["metric_type"] = optional_json(link.metric_type);
  j["metric_value"] = optional_json(link.metric_value);
  j["max_rate"] = optional_json(link.max_rate);
  j["min_rate"] = optional_json(link.min_rate);
  j["dbm"] = optional_json(link.dbm);
  j["noise"] = optional_json(link.noise);
  j["first_seen"] = optional_json(link.first_seen);
  j["last_seen"] = optional_json(link.last_seen);
  j["quality"] = link.quality();
  if (link.line) {
    j["line"] = {{link.line->start.lon, link.line->start.lat},
                 {link.line->end.lon, link.line->end.lat}};
  } else {
    j["line"] = nullptr;
  }

  nlohmann::json data = link.data.extra;
  auto put = [&data](const char *key, const std::optional<std::string> &value) {
    if (value) data[key] = *value;
  };
  put("node_a_name", link.data.node_a_name);
  put("node_b_name", link.data.node_b_name);
  put("node_a_slug", link.data.node_a_slug);
  put("node_b_slug", link.data.node_b_slug);
  put("endpoint_a_mac", link.data.endpoint_a_mac);
  put("endpoint_b_mac", link.data.endpoint_b_mac);
  put("layer_slug", link.data.layer_slug);
  j["data"] = data;
  return j;
}

}  // namespace meshlink
