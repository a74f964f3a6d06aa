#ifndef TYPES_HPP
#define TYPES_HPP

#include <arrow/result.h>

#include <cstdint>
#include <iostream>
#include <string>
#include <string_view>

namespace meshlink {

// Physical type of a network interface.
enum class InterfaceType : int8_t { WIRELESS = 1, ETHERNET = 2, OTHER = 3 };

enum class LinkType : int8_t { RADIO = 1, ETHERNET = 2, VIRTUAL = 3 };

// Monitoring states may be appended; only PLANNED has special rules.
enum class LinkStatus : int8_t {
  PLANNED = 0,
  ACTIVE = 1,
  DISCONNECTED = 2,
  DOWN = 3,
};

enum class AddressKind : int8_t { IPV4, IPV6, MAC };

std::string to_string(InterfaceType type);
std::string to_string(LinkType type);
std::string to_string(LinkStatus status);
std::string to_string(AddressKind kind);

arrow::Result<InterfaceType> parse_interface_type(std::string_view name);

// wireless -> radio, ethernet -> ethernet, anything else -> virtual
LinkType link_type_for(InterfaceType interface_type);

inline std::ostream& operator<<(std::ostream& os, LinkStatus status) {
  return os << to_string(status);
}

inline std::ostream& operator<<(std::ostream& os, LinkType type) {
  return os << to_string(type);
}

}  // namespace meshlink

#endif  // TYPES_HPP
