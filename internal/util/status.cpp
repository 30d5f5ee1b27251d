#include "status.hpp"

#include <cstring>
#include <utility>

namespace entitlement::util {

ErrorKindDetail::ErrorKindDetail(ErrorKind kind, arrow::Status cause) : kind_(kind), cause_(std::move(cause)) {
}

const char* ErrorKindDetail::type_id() const {
  return kTypeId;
}

std::string ErrorKindDetail::ToString() const {
  std::string out = util::ToString(kind_);
  if (!cause_.ok()) {
    out += " (cause: " + cause_.ToString() + ")";
  }
  return out;
}

arrow::Status MakeError(ErrorKind kind, arrow::StatusCode code, const std::string& message, arrow::Status cause) {
  return arrow::Status(code, message, std::make_shared<ErrorKindDetail>(kind, std::move(cause)));
}

namespace {

const ErrorKindDetail* DetailOf(const arrow::Status& status) {
  if (status.ok() || !status.detail()) {
    return nullptr;
  }
  if (std::strcmp(status.detail()->type_id(), ErrorKindDetail::kTypeId) != 0) {
    return nullptr;
  }
  return static_cast<const ErrorKindDetail*>(status.detail().get());
}

} // namespace

ErrorKind KindOf(const arrow::Status& status) {
  const auto* detail = DetailOf(status);
  return detail ? detail->kind() : ErrorKind::kUnknown;
}

arrow::Status CauseOf(const arrow::Status& status) {
  const auto* detail = DetailOf(status);
  return detail ? detail->cause() : arrow::Status::OK();
}

const char* ToString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kUnknown:
      return "Unknown";
    case ErrorKind::kInvalidCode:
      return "InvalidCode";
    case ErrorKind::kTransientUnavailable:
      return "TransientUnavailable";
    case ErrorKind::kRetryExhausted:
      return "RetryExhausted";
    case ErrorKind::kCancelled:
      return "Cancelled";
    case ErrorKind::kStateInconsistent:
      return "StateInconsistent";
  }
  return "Unknown";
}

} // namespace entitlement::util
