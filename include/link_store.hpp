#ifndef LINK_STORE_HPP
#define LINK_STORE_HPP

#include <arrow/api.h>
#include <llvm/ADT/DenseMap.h>

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <shared_mutex>
#include <utility>
#include <vector>

#include "address_index.hpp"
#include "config.hpp"
#include "link.hpp"

namespace meshlink {

struct LinkFilter {
  std::optional<int64_t> topology_id;
  std::optional<LinkStatus> status;

  bool matches(const Link &link) const {
    if (topology_id.has_value() && link.topology_id != topology_id) {
      return false;
    }
    return !status.has_value() || link.status == *status;
  }
};

/**
 * @brief Owns every Link record
 *
 * Links are stored by value: callers get copies, change them and hand them
 * back to save(). Ids increase monotonically, so id order is creation order.
 *
 * Within one topology source (manual links count as a source of their own)
 * an unordered endpoint pair identifies at most one link. The check and the
 * insert happen under the same write lock.
 */
class LinkStore {
 public:
  explicit LinkStore(std::shared_ptr<const AddressIndex> index,
                     MeshlinkConfig config = MeshlinkConfig(),
                     int64_t init_link_id_counter = 1)
      : index_(std::move(index)),
        config_(std::move(config)),
        link_id_counter_(init_link_id_counter) {}

  // Saves a link that has no id yet.
  arrow::Result<Link> create(Link fields);

  /**
   * @brief Validate, derive and persist a link
   *
   * Links with id 0 are inserted and get an id. Fails with ValidationFailed,
   * with AlreadyExists when another link of the same source already joins
   * the two endpoints, and with KeyError for an unknown id.
   */
  arrow::Result<Link> save(Link link);

  arrow::Result<Link> get(int64_t id) const;

  // Oldest link joining two endpoints, in either orientation.
  std::optional<Link> find_by_endpoint_pair(int64_t endpoint_a_id,
                                            int64_t endpoint_b_id) const;

  // Same, restricted to one source; nullopt selects manual links.
  std::optional<Link> find_by_endpoint_pair(
      int64_t endpoint_a_id, int64_t endpoint_b_id,
      std::optional<int64_t> topology_id) const;

  // Matching links in creation order.
  std::vector<Link> find(const LinkFilter &filter = {}) const;

  std::vector<Link> by_source(int64_t topology_id,
                              std::optional<LinkStatus> status = {}) const {
    return find(LinkFilter{topology_id, status});
  }

  std::vector<Link> all() const { return find(); }

  // Links with node_id on either side.
  std::vector<Link> by_node(int64_t node_id) const;

  size_t count(const LinkFilter &filter = {}) const;

  // Previous versions of a link, oldest first, at most max_revisions of
  // them. Saves that only refresh last_seen or metric_value add none.
  std::vector<Link> revisions(int64_t id) const;

  void delete_all();

  // Columnar snapshot of all links, rebuilt only after a change.
  arrow::Result<std::shared_ptr<arrow::Table>> get_table();

  int64_t get_version() const {
    return version_.load(std::memory_order_acquire);
  }

  const MeshlinkConfig &get_config() const { return config_; }

  const std::shared_ptr<const AddressIndex> &get_index() const {
    return index_;
  }

 private:
  using EndpointPair = std::pair<int64_t, int64_t>;  // lower id first

  static EndpointPair make_pair_key(int64_t a, int64_t b) {
    return a < b ? EndpointPair{a, b} : EndpointPair{b, a};
  }

  static bool has_pair(const Link &link) {
    return link.endpoint_a_id != 0 && link.endpoint_b_id != 0;
  }

  // Id of a link of the same source joining the same endpoints, or 0.
  int64_t find_conflict(const Link &link) const;

  // Caller holds the write lock.
  void record_revision(const Link &previous);

  void index_link(const Link &link);
  void unindex_link(const Link &link);

  arrow::Result<std::shared_ptr<arrow::Table>> generate_table() const;

  std::shared_ptr<const AddressIndex> index_;
  MeshlinkConfig config_;

  mutable std::shared_mutex mutex_;
  std::map<int64_t, Link> links_;
  std::map<EndpointPair, std::set<int64_t>> by_pair_;
  llvm::DenseMap<int64_t, std::set<int64_t>> by_node_;
  llvm::DenseMap<int64_t, std::vector<Link>> revisions_;

  std::atomic<int64_t> link_id_counter_;
  std::atomic<int64_t> version_{0};

  std::mutex table_lock_;
  std::shared_ptr<arrow::Table> table_;
  int64_t table_version_ = -1;
};

}  // namespace meshlink

#endif  // LINK_STORE_HPP
