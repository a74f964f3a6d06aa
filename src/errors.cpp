#include "errors.hpp"

namespace meshlink {

namespace {

arrow::Status make_status(arrow::StatusCode code, std::string message,
                          std::shared_ptr<LinkErrorDetail> detail) {
  return arrow::Status(code, std::move(message), std::move(detail));
}

}  // namespace

std::string to_string(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::NONE:
      return "None";
    case ErrorKind::INVALID_ADDRESS:
      return "InvalidAddress";
    case ErrorKind::ADDRESS_NOT_FOUND:
      return "AddressNotFound";
    case ErrorKind::LINK_NOT_FOUND:
      return "LinkNotFound";
    case ErrorKind::VALIDATION_FAILED:
      return "ValidationFailed";
    case ErrorKind::FETCH_ERROR:
      return "FetchError";
    case ErrorKind::DECODE_ERROR:
      return "DecodeError";
    case ErrorKind::OTHER:
      return "Other";
  }
  return "Other";
}

std::string LinkErrorDetail::ToString() const {
  std::string result = to_string(kind_);
  if (!address_.empty()) {
    result += " address=" + address_;
  }
  if (kind_ == ErrorKind::LINK_NOT_FOUND) {
    result += " endpoints=(" + std::to_string(endpoint_a_id_) + ", " +
              std::to_string(endpoint_b_id_) + ")";
  }
  return result;
}

arrow::Status invalid_address(const std::string& message) {
  return make_status(
      arrow::StatusCode::Invalid, message,
      std::make_shared<LinkErrorDetail>(ErrorKind::INVALID_ADDRESS));
}

arrow::Status address_not_found(const std::string& address) {
  return make_status(arrow::StatusCode::KeyError,
                     "No endpoint owns address " + address,
                     std::make_shared<LinkErrorDetail>(
                         ErrorKind::ADDRESS_NOT_FOUND, address));
}

arrow::Status link_not_found(int64_t endpoint_a_id, int64_t endpoint_b_id) {
  return make_status(
      arrow::StatusCode::KeyError,
      "Link matching endpoints " + std::to_string(endpoint_a_id) + " <> " +
          std::to_string(endpoint_b_id) + " does not exist",
      std::make_shared<LinkErrorDetail>(ErrorKind::LINK_NOT_FOUND, "",
                                        endpoint_a_id, endpoint_b_id));
}

arrow::Status validation_failed(const std::string& message) {
  return make_status(
      arrow::StatusCode::Invalid, message,
      std::make_shared<LinkErrorDetail>(ErrorKind::VALIDATION_FAILED));
}

arrow::Status fetch_error(const std::string& message) {
  return make_status(arrow::StatusCode::IOError, message,
                     std::make_shared<LinkErrorDetail>(ErrorKind::FETCH_ERROR));
}

arrow::Status decode_error(const std::string& message) {
  return make_status(
      arrow::StatusCode::Invalid, message,
      std::make_shared<LinkErrorDetail>(ErrorKind::DECODE_ERROR));
}

std::shared_ptr<LinkErrorDetail> link_error_detail(
    const arrow::Status& status) {
  const auto& detail = status.detail();
  if (detail == nullptr ||
      std::string(detail->type_id()) != LinkErrorDetail::kTypeId) {
    return nullptr;
  }
  return std::static_pointer_cast<LinkErrorDetail>(detail);
}

ErrorKind error_kind(const arrow::Status& status) {
  if (status.ok()) {
    return ErrorKind::NONE;
  }
  auto detail = link_error_detail(status);
  return detail ? detail->kind() : ErrorKind::OTHER;
}

}  // namespace meshlink
