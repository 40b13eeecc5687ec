#include "envelope.hpp"

namespace miniocpp::rpc {

namespace {
  net::BufferType to_buffer(const Json& frame) {
    // Replace invalid utf-8 rather than throw
    return net::make_send_buffer(frame.dump(-1, ' ', false, Json::error_handler_t::replace));
  }

  expected<MessageType, string> decode_message_type(const Json& value) {
    if (!value.is_number_integer())
      return make_unexpected(string{"message type is not an integer"});
    switch (value.get<int64_t>()) {
    case 2:
      return MessageType::CALL;
    case 3:
      return MessageType::CALL_RESULT;
    case 4:
      return MessageType::CALL_ERROR;
    default:
      return make_unexpected(fmt::format("unrecognized message type {}", value.dump()));
    }
  }
} // namespace

// ---------------------------------------------------------------------------------------- Encoders

net::BufferType encode_call(std::string_view id, std::string_view action, const Json& payload) {
  return to_buffer(
      Json::array({static_cast<int>(MessageType::CALL), string{id}, string{action}, payload}));
}

net::BufferType encode_result(std::string_view id, const Json& payload) {
  return to_buffer(
      Json::array({static_cast<int>(MessageType::CALL_RESULT), string{id}, payload}));
}

net::BufferType encode_error(std::string_view id, const Json& payload) {
  return to_buffer(
      Json::array({static_cast<int>(MessageType::CALL_ERROR), string{id}, payload}));
}

net::BufferType encode_error(std::string_view id, std::string_view error_code,
                             std::string_view description) {
  return encode_error(
      id, Json{{"errorCode", string{error_code}}, {"errorDescription", string{description}}});
}

// ------------------------------------------------------------------------------------------ Decode

expected<Envelope, string> decode_envelope(std::string_view frame) {
  const auto value = Json::parse(frame, nullptr, false);
  if (value.is_discarded())
    return make_unexpected(string{"frame is not valid json"});

  if (!value.is_array())
    return make_unexpected(string{"frame is not a json array"});

  if (value.empty())
    return make_unexpected(string{"frame is empty"});

  auto type = decode_message_type(value[0]);
  if (!type)
    return make_unexpected(std::move(type.error()));

  const std::size_t min_size = (*type == MessageType::CALL) ? 4 : 3;
  if (value.size() < min_size)
    return make_unexpected(
        fmt::format("{} frame has {} elements, expected {}", str(*type), value.size(), min_size));

  if (!value[1].is_string())
    return make_unexpected(string{"message id is not a string"});

  Envelope envelope;
  envelope.type = *type;
  envelope.id = value[1].get<string>();

  switch (envelope.type) {
  case MessageType::CALL:
    if (!value[2].is_string())
      return make_unexpected(string{"call action is not a string"});
    envelope.action = value[2].get<string>();
    envelope.payload = value[3];
    break;

  case MessageType::CALL_RESULT:
    envelope.payload = value[2];
    break;

  case MessageType::CALL_ERROR:
    if (value[2].is_string()) { // [4, id, errorCode, errorDescription, details]
      envelope.payload = Json{{"errorCode", value[2]},
                              {"errorDescription", value.size() > 3 && value[3].is_string()
                                                       ? value[3]
                                                       : Json(string{})}};
    } else {
      envelope.payload = value[2];
    }
    break;
  }

  return envelope;
}

expected<Envelope, string> decode_envelope(std::span<const std::byte> frame) {
  return decode_envelope(net::to_string_view(frame));
}

} // namespace miniocpp::rpc
