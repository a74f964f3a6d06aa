#ifndef ADDRESS_INDEX_HPP
#define ADDRESS_INDEX_HPP

#include <arrow/result.h>
#include <llvm/ADT/DenseMap.h>
#include <llvm/ADT/StringMap.h>

#include <memory>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

#include "address.hpp"
#include "inventory.hpp"

namespace meshlink {

using EndpointPtr = std::shared_ptr<const Endpoint>;
using NodePtr = std::shared_ptr<const Node>;
using LayerPtr = std::shared_ptr<const Layer>;

/**
 * @brief Read-mostly inventory of layers, nodes and endpoints
 *
 * Resolves IPv4/IPv6/MAC addresses to the owning endpoint. Records are
 * immutable once registered and handed out as shared pointers, so a resolved
 * endpoint stays valid even if the index is reloaded.
 *
 * Ids are positive and below INT64_MAX; add_* rejects anything else with
 * Invalid.
 */
class AddressIndex {
 public:
  AddressIndex() = default;

  static arrow::Result<AddressKind> classify(const std::string &address) {
    return classify_address(address);
  }

  arrow::Result<LayerPtr> add_layer(int64_t id, std::string slug,
                                    std::string name);

  arrow::Result<NodePtr> add_node(int64_t id, std::string slug,
                                  std::string name, GeoPoint point,
                                  int64_t layer_id);

  // Addresses must be IPv4 or IPv6 and not owned by another endpoint.
  arrow::Result<EndpointPtr> add_endpoint(int64_t id, int64_t node_id,
                                          const std::string &mac,
                                          InterfaceType type,
                                          const std::vector<std::string> &addresses);

  // Registers layers first, then nodes, then endpoints.
  arrow::Status load(const InventoryDocument &document);

  arrow::Status load_file(const std::string &path);

  /**
   * @brief Find the endpoint owning an address
   *
   * InvalidAddress when the string is not an address, AddressNotFound
   * (carrying the address) when nothing owns it.
   */
  arrow::Result<EndpointPtr> resolve(const std::string &address) const;

  /**
   * @brief Resolve two addresses of the same kind
   *
   * Both must be IPv4, both IPv6 or both MAC; mixed pairs are rejected with
   * InvalidAddress before any lookup.
   */
  arrow::Result<std::pair<EndpointPtr, EndpointPtr>> resolve_pair(
      const std::string &a, const std::string &b) const;

  arrow::Result<EndpointPtr> get_endpoint(int64_t id) const;
  arrow::Result<NodePtr> get_node(int64_t id) const;
  arrow::Result<LayerPtr> get_layer(int64_t id) const;

  size_t endpoint_count() const;
  size_t node_count() const;

 private:
  mutable std::shared_mutex mutex_;
  llvm::DenseMap<int64_t, LayerPtr> layers_;
  llvm::DenseMap<int64_t, NodePtr> nodes_;
  llvm::DenseMap<int64_t, EndpointPtr> endpoints_;
  llvm::StringMap<int64_t> ip_index_;   // normalized ip -> endpoint id
  llvm::StringMap<int64_t> mac_index_;  // normalized mac -> endpoint id
};

}  // namespace meshlink

#endif  // ADDRESS_INDEX_HPP
