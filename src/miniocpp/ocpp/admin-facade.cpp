#include "admin-facade.hpp"

#include "actions.hpp"

namespace miniocpp::ocpp {

namespace {
  // Identities and keys are url-decoded, so they need not be utf-8
  string to_body(const Json& json) {
    return json.dump(-1, ' ', false, Json::error_handler_t::replace);
  }
} // namespace

unsigned http_status(AdminErrorKind kind) {
  switch (kind) {
  case AdminErrorKind::INVALID_REQUEST:
    return 400;
  case AdminErrorKind::NOT_FOUND:
  case AdminErrorKind::NOT_CONNECTED:
    return 404;
  case AdminErrorKind::CALL_ERROR:
    return 502;
  case AdminErrorKind::CONNECTION_CLOSED:
    return 503;
  case AdminErrorKind::TIMEOUT:
    return 504;
  case AdminErrorKind::INTERNAL:
    return 500;
  }
  return 500;
}

namespace {
  unexpected<AdminError> admin_error(AdminErrorKind kind, string message) {
    return make_unexpected(AdminError{kind, std::move(message)});
  }

  AdminError to_admin_error(const rpc::Status& status) {
    switch (status.error_code()) {
    case rpc::StatusCode::ABORTED:
      return AdminError{AdminErrorKind::CALL_ERROR,
                        fmt::format("{}: {}", status.error_message(), status.error_details())};
    case rpc::StatusCode::DEADLINE_EXCEEDED:
      return AdminError{AdminErrorKind::TIMEOUT, "the device did not reply in time"};
    case rpc::StatusCode::UNAVAILABLE:
      return AdminError{AdminErrorKind::CONNECTION_CLOSED, "the device disconnected"};
    default:
      break;
    }
    return AdminError{AdminErrorKind::INTERNAL,
                      fmt::format("{}: {}", str(status.error_code()), status.error_message())};
  }

  rpc::RpcAgent::CompletionHandler to_call_completion(AdminFacade::Completion completion) {
    return [completion = std::move(completion)](rpc::Status status, Json payload) {
      if (status.ok())
        completion(std::move(payload));
      else
        completion(make_unexpected(to_admin_error(status)));
    };
  }

  expected<vector<string>, AdminError> parse_keys(std::string_view query) {
    vector<string> keys;
    for (const auto param : explode(query, '&')) {
      if (param.empty())
        continue;
      const auto pos = param.find('=');
      const auto name = url_decode(param.substr(0, pos));
      const auto value =
          url_decode(pos == std::string_view::npos ? std::string_view{} : param.substr(pos + 1));
      if (!name.has_value() || !value.has_value())
        return admin_error(AdminErrorKind::INVALID_REQUEST,
                           fmt::format("invalid query parameter '{}'", param));
      if (*name == "key" && !value->empty())
        keys.push_back(*value);
    }
    return keys;
  }

  expected<ChangeDeviceConfiguration, AdminError> parse_change(string identity,
                                                               std::string_view body) {
    const auto json = Json::parse(body, nullptr, false);
    if (json.is_discarded() || !json.is_object())
      return admin_error(AdminErrorKind::INVALID_REQUEST, "body must be a json object");

    const auto key = json.find("key");
    const auto value = json.find("value");
    if (key == json.end() || !key->is_string() || key->get_ref<const string&>().empty())
      return admin_error(AdminErrorKind::INVALID_REQUEST, "'key' must be a non-empty string");
    if (value == json.end() || !(value->is_string() || value->is_number_integer()))
      return admin_error(AdminErrorKind::INVALID_REQUEST,
                         "'value' must be a string or an integer");

    return ChangeDeviceConfiguration{std::move(identity), key->get<string>(), *value};
  }
} // namespace

// ---------------------------------------------------------------------------- parse admin request

expected<AdminRequest, AdminError> parse_admin_request(std::string_view method,
                                                       std::string_view target,
                                                       std::string_view body) {
  const auto query_pos = target.find('?');
  auto path = target.substr(0, query_pos);
  const auto query =
      (query_pos == std::string_view::npos) ? std::string_view{} : target.substr(query_pos + 1);

  while (path.size() > 1 && path.back() == '/')
    path.remove_suffix(1);

  const auto parts = explode(path, '/'); // parts[0] is empty, for the leading '/'
  const auto not_found = [&]() {
    return admin_error(AdminErrorKind::NOT_FOUND, fmt::format("no route for {} {}", method, path));
  };

  if (parts.size() < 2 || !parts[0].empty() || parts[1] != "devices")
    return not_found();

  if (parts.size() == 2) {
    if (method != "GET")
      return not_found();
    return ListDevices{};
  }

  if (parts.size() != 4 || parts[3] != "configuration")
    return not_found();

  auto identity = url_decode(parts[2]);
  if (!identity.has_value() || identity->empty())
    return admin_error(AdminErrorKind::INVALID_REQUEST, "invalid device identity");

  if (method == "GET") {
    auto keys = parse_keys(query);
    if (!keys)
      return make_unexpected(std::move(keys.error()));
    return GetDeviceConfiguration{std::move(*identity), std::move(*keys)};
  }

  if (method == "POST") {
    auto change = parse_change(std::move(*identity), body);
    if (!change)
      return make_unexpected(std::move(change.error()));
    return std::move(*change);
  }

  return not_found();
}

// ------------------------------------------------------------------------------------ AdminFacade

vector<string> AdminFacade::devices() const { return registry_->identities(); }

void AdminFacade::get_configuration(const string& identity, vector<string> keys,
                                    Completion completion) {
  auto session = registry_->lookup(identity);
  if (session == nullptr) {
    completion(admin_error(AdminErrorKind::NOT_CONNECTED,
                           fmt::format("device '{}' not connected", identity)));
    return;
  }
  INFO("admin: GetConfiguration on '{}'", identity);
  session->perform_call(str(Action::GET_CONFIGURATION),
                        Json(GetConfigurationRequest{std::move(keys)}),
                        to_call_completion(std::move(completion)));
}

void AdminFacade::change_configuration(const string& identity, string key, Json value,
                                       Completion completion) {
  auto session = registry_->lookup(identity);
  if (session == nullptr) {
    completion(admin_error(AdminErrorKind::NOT_CONNECTED,
                           fmt::format("device '{}' not connected", identity)));
    return;
  }
  INFO("admin: ChangeConfiguration on '{}', {} = {}", identity, key, to_body(value));
  session->perform_call(str(Action::CHANGE_CONFIGURATION),
                        Json(ChangeConfigurationRequest{std::move(key), std::move(value)}),
                        to_call_completion(std::move(completion)));
}

void AdminFacade::execute(const AdminRequest& request, Completion completion) {
  std::visit(overloaded{[&](const ListDevices&) {
                          completion(Json{{"devices", devices()}});
                        },
                        [&](const GetDeviceConfiguration& x) {
                          get_configuration(x.identity, x.keys, std::move(completion));
                        },
                        [&](const ChangeDeviceConfiguration& x) {
                          change_configuration(x.identity, x.key, x.value, std::move(completion));
                        }},
             request);
}

void AdminFacade::serve(net::HttpRequest request, net::HttpResponder respond) {
  const auto error_response = [](const AdminError& error) {
    return net::HttpResponse{http_status(error.kind), to_body(Json{{"error", error.message}})};
  };

  auto admin_request = parse_admin_request(request.method, request.target, request.body);
  if (!admin_request) {
    WARN("admin: {} {}: {}", request.method, request.target, admin_request.error().message);
    respond(error_response(admin_request.error()));
    return;
  }

  execute(*admin_request, [respond, error_response](expected<Json, AdminError> result) {
    if (result)
      respond(net::HttpResponse{200, to_body(*result)});
    else
      respond(error_response(result.error()));
  });
}

} // namespace miniocpp::ocpp
