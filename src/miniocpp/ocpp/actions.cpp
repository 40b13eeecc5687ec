#include "actions.hpp"

#include "schema-validator.hpp"

#include "miniocpp/rpc/envelope.hpp"

namespace miniocpp::ocpp {

std::optional<Action> parse_action(std::string_view name) {
  for (auto action : {Action::BOOT_NOTIFICATION, Action::HEARTBEAT, Action::GET_CONFIGURATION,
                      Action::CHANGE_CONFIGURATION})
    if (str(action) == name)
      return action;
  return std::nullopt;
}

namespace {
  CallFailure make_failure(std::string_view error_code, string description) {
    return CallFailure{string{error_code}, std::move(description)};
  }

  template <typename RequestType, typename Variant>
  expected<Variant, CallFailure> parse_as(Action action, const Json& payload,
                                          SchemaValidator& validator) {
    if (!validator.validate(str(action), payload))
      return make_unexpected(
          make_failure(rpc::call_error::k_formation_violation,
                       fmt::format("{} payload failed validation", str(action))));

    auto request = from_payload<RequestType>(payload);
    if (!request)
      return make_unexpected(
          make_failure(rpc::call_error::k_formation_violation,
                       fmt::format("{} payload: {}", str(action), request.error())));

    return Variant{std::move(*request)};
  }

  expected<Action, CallFailure> lookup_action(std::string_view action_name) {
    const auto action = parse_action(action_name);
    if (!action.has_value()) {
      WARN("call to unknown action '{}'", action_name);
      return make_unexpected(
          make_failure(rpc::call_error::k_not_implemented,
                       fmt::format("action '{}' is not implemented", action_name)));
    }
    return *action;
  }

  CallFailure not_supported(Action action, std::string_view role) {
    WARN("call to action '{}', which the {} does not serve", str(action), role);
    return make_failure(rpc::call_error::k_not_supported,
                        fmt::format("action '{}' is not supported by the {}", str(action), role));
  }
} // namespace

expected<CentralRequest, CallFailure>
parse_central_request(std::string_view action_name, const Json& payload,
                      SchemaValidator& validator) {
  const auto action = lookup_action(action_name);
  if (!action)
    return make_unexpected(action.error());

  switch (*action) {
  case Action::BOOT_NOTIFICATION:
    return parse_as<BootNotificationRequest, CentralRequest>(*action, payload, validator);
  case Action::HEARTBEAT:
    return parse_as<HeartbeatRequest, CentralRequest>(*action, payload, validator);
  case Action::GET_CONFIGURATION:
  case Action::CHANGE_CONFIGURATION:
    break;
  }
  return make_unexpected(not_supported(*action, "central system"));
}

expected<PointRequest, CallFailure> parse_point_request(std::string_view action_name,
                                                        const Json& payload,
                                                        SchemaValidator& validator) {
  const auto action = lookup_action(action_name);
  if (!action)
    return make_unexpected(action.error());

  switch (*action) {
  case Action::GET_CONFIGURATION:
    return parse_as<GetConfigurationRequest, PointRequest>(*action, payload, validator);
  case Action::CHANGE_CONFIGURATION:
    return parse_as<ChangeConfigurationRequest, PointRequest>(*action, payload, validator);
  case Action::BOOT_NOTIFICATION:
  case Action::HEARTBEAT:
    break;
  }
  return make_unexpected(not_supported(*action, "charge point"));
}

} // namespace miniocpp::ocpp
