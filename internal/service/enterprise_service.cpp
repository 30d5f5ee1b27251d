#include "enterprise_service.hpp"

#include <chrono>
#include <optional>
#include <stdexcept>
#include <type_traits>

#include "entitlement/manager/v1.hpp"
#include "internal/enterprise/entitlement_state_machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace entitlement::service {

using namespace entitlement::manager::v1;
using entitlement::enterprise::LicenseState;

namespace {

template <typename Fn>
auto ObserveRpc(std::string_view route, Fn&& fn) {
  entitlement::observability::SpanScope span(route);

  const auto started_at = std::chrono::steady_clock::now();
  const auto finish     = [&](bool success) {
    entitlement::observability::Metrics::Instance().RecordRequest(route, success);
    entitlement::observability::Metrics::Instance().ObserveRequestLatencyMs(
        route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      finish(true);
      return;
    } else {
      auto result = fn();
      finish(true);
      return result;
    }
  } catch (const entitlement::util::InvalidCode& ex) {
    span.RecordException(ex.what());
    ENTITLEMENT_LOG_WARN("Activation code rejected",
                         {entitlement::observability::StringField("route", route), entitlement::observability::StringField("error", ex.what())});
    finish(false);
    throw;
  } catch (const entitlement::util::InvalidArgument& ex) {
    span.RecordException(ex.what());
    ENTITLEMENT_LOG_WARN("Request rejected",
                         {entitlement::observability::StringField("route", route), entitlement::observability::StringField("error", ex.what())});
    finish(false);
    throw;
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    ENTITLEMENT_LOG_ERROR("RPC failed",
                          {entitlement::observability::StringField("route", route), entitlement::observability::StringField("error", ex.what())});
    finish(false);
    throw;
  }
}

State ToProto(LicenseState state) {
  switch (state) {
    case LicenseState::kNone:
      return STATE_NONE;
    case LicenseState::kActive:
      return STATE_ACTIVE;
    case LicenseState::kExpired:
      return STATE_EXPIRED;
  }
  throw entitlement::util::StateInconsistent("unmappable license state " + std::to_string(static_cast<int>(state)));
}

TokenInfo ToTokenInfo(const std::optional<entitlement::util::TimePoint>& expires) {
  TokenInfo info;
  if (expires) {
    *info.mutable_expires() = entitlement::util::ToProto(*expires);
  }
  return info;
}

} // namespace

EnterpriseService::EnterpriseService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.entitlements) {
    throw std::invalid_argument("EnterpriseService requires an entitlement state machine");
  }
}

ActivateResponse EnterpriseService::Activate(const ActivateRequest& req) {
  return ObserveRpc("EnterpriseService.Activate", [&] {
    std::optional<entitlement::util::TimePoint> expires;
    if (req.has_expires()) {
      if (!entitlement::util::IsValidTimestamp(req.expires())) {
        throw entitlement::util::InvalidArgument("requested expiry is outside the valid timestamp range");
      }
      expires = entitlement::util::FromProto(req.expires());
    }

    const auto record = ctx_.entitlements->Activate(req.activation_code(), expires);

    ActivateResponse resp;
    *resp.mutable_info() = ToTokenInfo(record.expires_at);
    return resp;
  });
}

DeactivateResponse EnterpriseService::Deactivate(const DeactivateRequest&) {
  return ObserveRpc("EnterpriseService.Deactivate", [&] {
    ctx_.entitlements->Deactivate();
    return DeactivateResponse{};
  });
}

GetStateResponse EnterpriseService::GetState(const GetStateRequest&) {
  return ObserveRpc("EnterpriseService.GetState", [&] {
    const auto snapshot = ctx_.entitlements->GetState();

    GetStateResponse resp;
    resp.set_state(ToProto(snapshot.state));
    if (snapshot.state != LicenseState::kNone) {
      resp.set_activation_code(*snapshot.record.activation_code);
      *resp.mutable_info() = ToTokenInfo(snapshot.record.expires_at);
    }
    return resp;
  });
}

} // namespace entitlement::service
