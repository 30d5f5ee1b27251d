#pragma once

#include <arrow/status.h>

#include <memory>
#include <string>

namespace entitlement::util {

/*
  Client-side error taxonomy.

  Attached to arrow::Status as a StatusDetail so callers can branch on the
  kind without parsing messages. cause() keeps the underlying error for
  kinds that wrap one (retry exhaustion, cancellation).
*/
enum class ErrorKind {
  kUnknown,
  kInvalidCode,
  kTransientUnavailable,
  kRetryExhausted,
  kCancelled,
  kStateInconsistent,
};

class ErrorKindDetail final : public arrow::StatusDetail {
 public:
  static constexpr char kTypeId[] = "entitlement::util::ErrorKindDetail";

  explicit ErrorKindDetail(ErrorKind kind, arrow::Status cause = arrow::Status::OK());

  const char* type_id() const override;
  std::string ToString() const override;

  ErrorKind            kind() const { return kind_; }
  const arrow::Status& cause() const { return cause_; }

 private:
  ErrorKind     kind_;
  arrow::Status cause_;
};

arrow::Status MakeError(ErrorKind kind, arrow::StatusCode code, const std::string& message, arrow::Status cause = arrow::Status::OK());

// kUnknown for OK statuses and statuses without an ErrorKindDetail.
ErrorKind KindOf(const arrow::Status& status);

// The wrapped error of a kRetryExhausted / kCancelled status, OK otherwise.
arrow::Status CauseOf(const arrow::Status& status);

const char* ToString(ErrorKind kind);

} // namespace entitlement::util
