#pragma once

#include "messages.hpp"

#include <optional>
#include <variant>

namespace miniocpp::ocpp {

class SchemaValidator;

enum class Action : int {
  BOOT_NOTIFICATION,   // point -> central
  HEARTBEAT,           // point -> central
  GET_CONFIGURATION,   // central -> point
  CHANGE_CONFIGURATION // central -> point
};

/**
 * @brief The action name as it appears on the wire, e.g., "BootNotification"
 */
constexpr std::string_view str(Action action) {
  switch (action) {
  case Action::BOOT_NOTIFICATION:
    return "BootNotification";
  case Action::HEARTBEAT:
    return "Heartbeat";
  case Action::GET_CONFIGURATION:
    return "GetConfiguration";
  case Action::CHANGE_CONFIGURATION:
    return "ChangeConfiguration";
  }
  return "<unknown case>";
}

std::optional<Action> parse_action(std::string_view name);

// ------------------------------------------------------------------------------------------ Roles

/**
 * @brief Inbound calls served by the central system.
 */
using CentralRequest = std::variant<BootNotificationRequest, HeartbeatRequest>;

/**
 * @brief Inbound calls served by a charge point.
 */
using PointRequest = std::variant<GetConfigurationRequest, ChangeConfigurationRequest>;

/**
 * @brief Why an inbound call cannot be served; becomes a CallError.
 */
struct CallFailure {
  string error_code;
  string description;
};

/**
 * @brief Resolves an inbound call into a request that the central system serves.
 *
 * + Unknown action name: `NotImplemented`
 * + Known action that the central system does not serve: `NotSupported`
 * + Payload fails schema validation or cannot be parsed: `FormationViolation`
 */
expected<CentralRequest, CallFailure>
parse_central_request(std::string_view action_name, const Json& payload,
                      SchemaValidator& validator);

/**
 * @brief As `parse_central_request`, for the requests that a charge point serves.
 */
expected<PointRequest, CallFailure> parse_point_request(std::string_view action_name,
                                                        const Json& payload,
                                                        SchemaValidator& validator);

/**
 * @brief Helper for `std::visit` over a role's requests.
 */
template <class... Ts> struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

} // namespace miniocpp::ocpp
