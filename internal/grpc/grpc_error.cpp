#include "grpc_error.hpp"

#include "internal/util/errors.hpp"

namespace entitlement::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace entitlement::util;

  if (dynamic_cast<const InvalidCode*>(&e) || dynamic_cast<const InvalidArgument*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const StateInconsistent*>(&e)) {
    return {::grpc::StatusCode::DATA_LOSS, std::string("entitlement state inconsistent: ") + e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace entitlement::grpc
