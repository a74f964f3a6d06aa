#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <arrow/status.h>

#include <cstdint>
#include <memory>
#include <string>
#include <utility>

namespace meshlink {

enum class ErrorKind {
  NONE,
  INVALID_ADDRESS,
  ADDRESS_NOT_FOUND,
  LINK_NOT_FOUND,
  VALIDATION_FAILED,
  FETCH_ERROR,
  DECODE_ERROR,
  OTHER,
};

std::string to_string(ErrorKind kind);

/**
 * @brief Payload attached to the statuses raised by address and link lookup
 *
 * address is set for ADDRESS_NOT_FOUND, the endpoint pair for LINK_NOT_FOUND
 * so that find-or-create can build the missing link without resolving the
 * addresses again.
 */
class LinkErrorDetail : public arrow::StatusDetail {
 public:
  static constexpr const char* kTypeId = "meshlink::LinkErrorDetail";

  explicit LinkErrorDetail(ErrorKind kind, std::string address = "",
                           int64_t endpoint_a_id = 0, int64_t endpoint_b_id = 0)
      : kind_(kind),
        address_(std::move(address)),
        endpoint_a_id_(endpoint_a_id),
        endpoint_b_id_(endpoint_b_id) {}

  const char* type_id() const override { return kTypeId; }
  std::string ToString() const override;

  ErrorKind kind() const { return kind_; }
  const std::string& address() const { return address_; }
  int64_t endpoint_a_id() const { return endpoint_a_id_; }
  int64_t endpoint_b_id() const { return endpoint_b_id_; }

 private:
  ErrorKind kind_;
  std::string address_;
  int64_t endpoint_a_id_;
  int64_t endpoint_b_id_;
};

arrow::Status invalid_address(const std::string& message);
arrow::Status address_not_found(const std::string& address);
arrow::Status link_not_found(int64_t endpoint_a_id, int64_t endpoint_b_id);
arrow::Status validation_failed(const std::string& message);
arrow::Status fetch_error(const std::string& message);
arrow::Status decode_error(const std::string& message);

// nullptr when the status was not raised by one of the helpers above.
std::shared_ptr<LinkErrorDetail> link_error_detail(const arrow::Status& status);

// NONE for OK, OTHER for statuses without a LinkErrorDetail.
ErrorKind error_kind(const arrow::Status& status);

inline bool is_error(const arrow::Status& status, ErrorKind kind) {
  return error_kind(status) == kind;
}

}  // namespace meshlink

#endif  // ERRORS_HPP
