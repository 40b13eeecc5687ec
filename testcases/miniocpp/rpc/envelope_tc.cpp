#include "miniocpp/rpc/envelope.hpp"
#include "miniocpp/rpc/status.hpp"

#include <catch2/catch.hpp>

namespace miniocpp::rpc::tests {

static string as_string(const net::BufferType& buffer) {
  return string{net::to_string_view(net::to_span_bytes(buffer))};
}

// ---------------------------------------------------------------------------------------- envelope

CATCH_TEST_CASE("envelope", "[envelope]") {
  CATCH_SECTION("encode") {
    CATCH_REQUIRE(as_string(encode_call("19223201", "Heartbeat", Json::object())) ==
                  R"([2,"19223201","Heartbeat",{}])");
    CATCH_REQUIRE(as_string(encode_result("7", Json{{"status", "Accepted"}})) ==
                  R"([3,"7",{"status":"Accepted"}])");
    CATCH_REQUIRE(as_string(encode_error("7", call_error::k_not_implemented, "no such action")) ==
                  R"([4,"7",{"errorCode":"NotImplemented","errorDescription":"no such action"}])");
  }

  CATCH_SECTION("decode a call") {
    const auto payload = Json{{"chargePointModel", "M"},
                              {"chargePointVendor", "V"},
                              {"chargePointSerialNumber", "CP-1"}};
    const auto frame = encode_call("42", "BootNotification", payload);
    const auto envelope = decode_envelope(net::to_span_bytes(frame));
    CATCH_REQUIRE(envelope.has_value());
    CATCH_REQUIRE(envelope->type == MessageType::CALL);
    CATCH_REQUIRE(envelope->id == "42");
    CATCH_REQUIRE(envelope->action == "BootNotification");
    CATCH_REQUIRE(envelope->payload == payload);
  }

  CATCH_SECTION("decode a result") {
    const auto envelope = decode_envelope(R"([3, "abc", {"currentTime": "2024-01-01T00:00:00Z"}])");
    CATCH_REQUIRE(envelope.has_value());
    CATCH_REQUIRE(envelope->type == MessageType::CALL_RESULT);
    CATCH_REQUIRE(envelope->id == "abc");
    CATCH_REQUIRE(envelope->action.empty());
    CATCH_REQUIRE(envelope->payload["currentTime"] == "2024-01-01T00:00:00Z");
  }

  CATCH_SECTION("decode an error") {
    {
      const auto envelope =
          decode_envelope(R"([4, "1", {"errorCode": "NotSupported", "errorDescription": "x"}])");
      CATCH_REQUIRE(envelope.has_value());
      CATCH_REQUIRE(envelope->type == MessageType::CALL_ERROR);
      CATCH_REQUIRE(envelope->payload["errorCode"] == "NotSupported");
      CATCH_REQUIRE(envelope->payload["errorDescription"] == "x");
    }

    { // OCPP-J layout: [4, id, errorCode, errorDescription, errorDetails]
      const auto envelope = decode_envelope(R"([4, "1", "GenericError", "oops", {}])");
      CATCH_REQUIRE(envelope.has_value());
      CATCH_REQUIRE(envelope->payload["errorCode"] == "GenericError");
      CATCH_REQUIRE(envelope->payload["errorDescription"] == "oops");
    }
  }

  CATCH_SECTION("malformed frames") {
    CATCH_REQUIRE_FALSE(decode_envelope("").has_value());
    CATCH_REQUIRE_FALSE(decode_envelope("not json").has_value());
    CATCH_REQUIRE_FALSE(decode_envelope(R"({"id": "1"})").has_value());
    CATCH_REQUIRE_FALSE(decode_envelope("[]").has_value());
    CATCH_REQUIRE_FALSE(decode_envelope(R"([5, "1", {}])").has_value());
    CATCH_REQUIRE_FALSE(decode_envelope(R"(["2", "1", "Heartbeat", {}])").has_value());
    CATCH_REQUIRE_FALSE(decode_envelope(R"([2, "1", "Heartbeat"])").has_value());
    CATCH_REQUIRE_FALSE(decode_envelope(R"([2, 1, "Heartbeat", {}])").has_value());
    CATCH_REQUIRE_FALSE(decode_envelope(R"([2, "1", 7, {}])").has_value());
    CATCH_REQUIRE_FALSE(decode_envelope(R"([3, "1"])").has_value());

    const auto error = decode_envelope(R"([2, "1", "Heartbeat"])");
    CATCH_REQUIRE(error.error() == "Call frame has 3 elements, expected 4");
  }

  CATCH_SECTION("message type names") {
    CATCH_REQUIRE(str(MessageType::CALL) == "Call");
    CATCH_REQUIRE(str(MessageType::CALL_RESULT) == "CallResult");
    CATCH_REQUIRE(str(MessageType::CALL_ERROR) == "CallError");
  }
}

// ------------------------------------------------------------------------------------------ status

CATCH_TEST_CASE("status", "[status]") {
  CATCH_REQUIRE(Status{}.ok());
  CATCH_REQUIRE(Status{}.error_code() == StatusCode::OK);
  CATCH_REQUIRE_FALSE(Status{StatusCode::UNAVAILABLE}.ok());

  const auto status = Status{StatusCode::ABORTED, "NotSupported", "action not supported"};
  CATCH_REQUIRE(status.error_message() == "NotSupported");
  CATCH_REQUIRE(status.error_details() == "action not supported");
  CATCH_REQUIRE(status == Status{StatusCode::ABORTED, "NotSupported", "action not supported"});
  CATCH_REQUIRE(status != Status{StatusCode::ABORTED, "NotSupported"});

  CATCH_REQUIRE(str(StatusCode::DEADLINE_EXCEEDED) == "DEADLINE_EXCEEDED");
  CATCH_REQUIRE(str(StatusCode::UNAVAILABLE) == "UNAVAILABLE");
}

} // namespace miniocpp::rpc::tests
