#include "address.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>

#include <array>
#include <cctype>

#include "errors.hpp"

namespace meshlink {

namespace {

bool is_hex(char c) { return std::isxdigit(static_cast<unsigned char>(c)); }

// Collects the 12 hex digits of a MAC address, "" when malformed.
std::string mac_digits(std::string_view address) {
  std::string digits;
  if (address.size() == 17) {
    const char sep = address[2];
    if (sep != ':' && sep != '-') {
      return "";
    }
    for (size_t i = 0; i < address.size(); ++i) {
      if (i % 3 == 2) {
        if (address[i] != sep) return "";
      } else {
        if (!is_hex(address[i])) return "";
        digits.push_back(address[i]);
      }
    }
    return digits;
  }
  if (address.size() == 14) {
    for (size_t i = 0; i < address.size(); ++i) {
      if (i % 5 == 4) {
        if (address[i] != '.') return "";
      } else {
        if (!is_hex(address[i])) return "";
        digits.push_back(address[i]);
      }
    }
    return digits;
  }
  return "";
}

}  // namespace

bool is_ipv4(const std::string& address) {
  in_addr addr{};
  return inet_pton(AF_INET, address.c_str(), &addr) == 1;
}

bool is_ipv6(const std::string& address) {
  in6_addr addr{};
  return inet_pton(AF_INET6, address.c_str(), &addr) == 1;
}

bool is_mac(std::string_view address) {
  return !mac_digits(address).empty();
}

arrow::Result<AddressKind> classify_address(const std::string& address) {
  if (is_ipv4(address)) return AddressKind::IPV4;
  if (is_ipv6(address)) return AddressKind::IPV6;
  if (is_mac(address)) return AddressKind::MAC;
  return invalid_address("Expecting valid ipv4, ipv6 or mac address, got '" +
                         address + "'");
}

arrow::Result<std::string> normalize_address(const std::string& address) {
  ARROW_ASSIGN_OR_RAISE(auto kind, classify_address(address));
  switch (kind) {
    case AddressKind::IPV4: {
      in_addr addr{};
      std::array<char, INET_ADDRSTRLEN> buf{};
      inet_pton(AF_INET, address.c_str(), &addr);
      if (inet_ntop(AF_INET, &addr, buf.data(), buf.size()) == nullptr) {
        return invalid_address("Cannot format ipv4 address " + address);
      }
      return std::string(buf.data());
    }
    case AddressKind::IPV6: {
      in6_addr addr{};
      std::array<char, INET6_ADDRSTRLEN> buf{};
      inet_pton(AF_INET6, address.c_str(), &addr);
      if (inet_ntop(AF_INET6, &addr, buf.data(), buf.size()) == nullptr) {
        return invalid_address("Cannot format ipv6 address " + address);
      }
      return std::string(buf.data());
    }
    case AddressKind::MAC: {
      const std::string digits = mac_digits(address);
      std::string result;
      result.reserve(17);
      for (size_t i = 0; i < digits.size(); ++i) {
        if (i > 0 && i % 2 == 0) result.push_back(':');
        result.push_back(static_cast<char>(
            std::toupper(static_cast<unsigned char>(digits[i]))));
      }
      return result;
    }
  }
  return invalid_address("Unsupported address " + address);
}

}  // namespace meshlink
