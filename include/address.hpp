#ifndef ADDRESS_HPP
#define ADDRESS_HPP

#include <arrow/result.h>

#include <string>
#include <string_view>

#include "types.hpp"

namespace meshlink {

bool is_ipv4(const std::string& address);
bool is_ipv6(const std::string& address);

// Accepts "00:27:22:00:50:71", "00-27-22-00-50-71" and "0027.2200.5071".
bool is_mac(std::string_view address);

/**
 * @brief Detect the kind of an address string
 *
 * Fails with InvalidAddress when the string is neither IPv4, IPv6 nor MAC.
 */
arrow::Result<AddressKind> classify_address(const std::string& address);

/**
 * @brief Canonical form used as lookup key
 *
 * IPv4 and IPv6 go through inet_pton/inet_ntop (so "fd00::0:1" and "fd00::1"
 * are the same key), MAC addresses become upper case and colon separated.
 */
arrow::Result<std::string> normalize_address(const std::string& address);

}  // namespace meshlink

#endif  // ADDRESS_HPP
