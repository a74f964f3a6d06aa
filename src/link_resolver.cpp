#include "link_resolver.hpp"

#include "errors.hpp"
#include "logger.hpp"

namespace meshlink {

arrow::Result<Link> LinkResolver::find_from_address_pair(
    const std::string &a, const std::string &b) const {
  ARROW_ASSIGN_OR_RAISE(auto endpoints, index_->resolve_pair(a, b));
  const auto &[endpoint_a, endpoint_b] = endpoints;
  auto link = store_->find_by_endpoint_pair(endpoint_a->id, endpoint_b->id);
  if (!link) {
    return link_not_found(endpoint_a->id, endpoint_b->id);
  }
  return *link;
}

arrow::Result<Link> LinkResolver::find_from_tuple(
    const std::vector<std::string> &addresses) const {
  if (addresses.size() < 2) {
    return invalid_address("Expecting source and destination addresses, got " +
                           std::to_string(addresses.size()));
  }
  return find_from_address_pair(addresses[0], addresses[1]);
}

arrow::Result<Link> LinkResolver::find_in_source(
    const std::string &a, const std::string &b,
    std::optional<int64_t> topology_id) const {
  ARROW_ASSIGN_OR_RAISE(auto endpoints, index_->resolve_pair(a, b));
  const auto &[endpoint_a, endpoint_b] = endpoints;
  auto link = store_->find_by_endpoint_pair(endpoint_a->id, endpoint_b->id,
                                            topology_id);
  if (!link) {
    return link_not_found(endpoint_a->id, endpoint_b->id);
  }
  return *link;
}

arrow::Result<Link> LinkResolver::find_or_create(
    const std::string &a, const std::string &b,
    std::optional<int64_t> topology_id) const {
  auto lookup = [&]() {
    return topology_id.has_value() ? find_in_source(a, b, topology_id)
                                   : find_from_address_pair(a, b);
  };

  auto found = lookup();
  if (found.ok() || !is_error(found.status(), ErrorKind::LINK_NOT_FOUND)) {
    return found;
  }

  auto detail = link_error_detail(found.status());
  Link link;
  link.endpoint_a_id = detail->endpoint_a_id();
  link.endpoint_b_id = detail->endpoint_b_id();
  link.status = LinkStatus::ACTIVE;
  link.topology_id = topology_id;

  auto created = store_->create(std::move(link));
  if (created.ok()) {
    log_debug("Created link {} for {} <> {}", created->id, a, b);
    return created;
  }
  if (created.status().IsAlreadyExists()) {
    // lost the race against a concurrent create of the same pair
    return lookup();
  }
  return created.status();
}

}  // namespace meshlink
