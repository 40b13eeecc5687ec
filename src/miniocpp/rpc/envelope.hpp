#pragma once

#include "miniocpp/utils.hpp"

#include "miniocpp/net/buffer.hpp"

#include <nlohmann/json.hpp>

namespace miniocpp::rpc {

/**
 * @defgroup miniocpp-rpc RPC
 *
 * Frames are json arrays, sent as websocket text messages:
 *
 * ~~~~~~~~~~~~~~~~~~~~~~
 * Call       [2, "<id>", "<action>", {payload}]
 * CallResult [3, "<id>", {payload}]
 * CallError  [4, "<id>", {"errorCode": "...", "errorDescription": "..."}]
 * ~~~~~~~~~~~~~~~~~~~~~~
 */

using Json = nlohmann::json;

enum class MessageType : int { CALL = 2, CALL_RESULT = 3, CALL_ERROR = 4 };

constexpr std::string_view str(MessageType type) {
  switch (type) {
  case MessageType::CALL:
    return "Call";
  case MessageType::CALL_RESULT:
    return "CallResult";
  case MessageType::CALL_ERROR:
    return "CallError";
  }
  return "<unknown case>";
}

/**
 * @brief Values for `errorCode` in a CallError payload.
 */
namespace call_error {
constexpr std::string_view k_not_implemented = "NotImplemented";
constexpr std::string_view k_not_supported = "NotSupported";
constexpr std::string_view k_internal_error = "InternalError";
constexpr std::string_view k_protocol_error = "ProtocolError";
constexpr std::string_view k_formation_violation = "FormationViolation";
constexpr std::string_view k_generic_error = "GenericError";
} // namespace call_error

/**
 * @ingroup miniocpp-rpc
 * @brief A decoded frame.
 */
struct Envelope {
  MessageType type{MessageType::CALL};
  string id{};     //!< Unique among the sender's outstanding calls
  string action{}; //!< Only set for CALL
  Json payload{};  //!< For CALL_ERROR, the `{errorCode, errorDescription}` object
};

net::BufferType encode_call(std::string_view id, std::string_view action, const Json& payload);
net::BufferType encode_result(std::string_view id, const Json& payload);
net::BufferType encode_error(std::string_view id, const Json& payload);

/**
 * @brief Encodes a CallError with payload `{errorCode, errorDescription}`
 */
net::BufferType encode_error(std::string_view id, std::string_view error_code,
                             std::string_view description);

/**
 * @brief Decode a frame. Never throws.
 * @return The envelope, or a description of why the frame is malformed.
 *
 * A frame is malformed if it is not a json array, if the first element is not
 * a known message type, if the id is not a string, or if it is too short:
 * a Call needs four elements, a CallResult or CallError three.
 */
expected<Envelope, string> decode_envelope(std::string_view frame);
expected<Envelope, string> decode_envelope(std::span<const std::byte> frame);

} // namespace miniocpp::rpc
