#ifndef LINK_RESOLVER_HPP
#define LINK_RESOLVER_HPP

#include <arrow/result.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "address_index.hpp"
#include "link.hpp"
#include "link_store.hpp"

namespace meshlink {

class LinkResolver {
 public:
  LinkResolver(std::shared_ptr<const AddressIndex> index,
               std::shared_ptr<LinkStore> store)
      : index_(std::move(index)), store_(std::move(store)) {}

  /**
   * @brief Link between the endpoints owning two addresses
   *
   * Both addresses must be IPv4, IPv6 or MAC of the same kind. The pair is
   * matched in either orientation.
   *
   * @return InvalidAddress, AddressNotFound (with the address that did not
   * resolve) or LinkNotFound (with the resolved endpoint ids) on failure
   */
  arrow::Result<Link> find_from_address_pair(const std::string &a,
                                             const std::string &b) const;

  // Same, for a sequence that must hold at least two addresses.
  arrow::Result<Link> find_from_tuple(
      const std::vector<std::string> &addresses) const;

  // Lookup restricted to one topology source (nullopt = manual links).
  arrow::Result<Link> find_in_source(const std::string &a,
                                     const std::string &b,
                                     std::optional<int64_t> topology_id) const;

  /**
   * @brief Find a link, creating an active one when none exists
   *
   * With a topology id the lookup is find_in_source and the new link belongs
   * to that source; without one it is find_from_address_pair and the new
   * link is a manual one. Returns the same link on every call for the same
   * pair. If another thread creates the link first, its link is returned.
   */
  arrow::Result<Link> find_or_create(
      const std::string &a, const std::string &b,
      std::optional<int64_t> topology_id = std::nullopt) const;

 private:
  std::shared_ptr<const AddressIndex> index_;
  std::shared_ptr<LinkStore> store_;
};

}  // namespace meshlink

#endif  // LINK_RESOLVER_HPP
