#include "types.hpp"

namespace meshlink {

std::string to_string(InterfaceType type) {
  switch (type) {
    case InterfaceType::WIRELESS:
      return "wireless";
    case InterfaceType::ETHERNET:
      return "ethernet";
    case InterfaceType::OTHER:
      return "other";
  }
  return "unknown";
}

std::string to_string(LinkType type) {
  switch (type) {
    case LinkType::RADIO:
      return "radio";
    case LinkType::ETHERNET:
      return "ethernet";
    case LinkType::VIRTUAL:
      return "virtual";
  }
  return "unknown";
}

std::string to_string(LinkStatus status) {
  switch (status) {
    case LinkStatus::PLANNED:
      return "planned";
    case LinkStatus::ACTIVE:
      return "active";
    case LinkStatus::DISCONNECTED:
      return "disconnected";
    case LinkStatus::DOWN:
      return "down";
  }
  return "unknown";
}

std::string to_string(AddressKind kind) {
  switch (kind) {
    case AddressKind::IPV4:
      return "ipv4";
    case AddressKind::IPV6:
      return "ipv6";
    case AddressKind::MAC:
      return "mac";
  }
  return "unknown";
}

arrow::Result<InterfaceType> parse_interface_type(std::string_view name) {
  if (name == "wireless") return InterfaceType::WIRELESS;
  if (name == "ethernet") return InterfaceType::ETHERNET;
  if (name == "other" || name == "virtual") return InterfaceType::OTHER;
  return arrow::Status::Invalid("Unknown interface type: ", name);
}

LinkType link_type_for(InterfaceType interface_type) {
  switch (interface_type) {
    case InterfaceType::WIRELESS:
      return LinkType::RADIO;
    case InterfaceType::ETHERNET:
      return LinkType::ETHERNET;
    default:
      return LinkType::VIRTUAL;
  }
}

}  // namespace meshlink
