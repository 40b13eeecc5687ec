#include "miniocpp/ocpp/peer-registry.hpp"

#include <boost/asio/io_context.hpp>

#include <catch2/catch.hpp>

namespace miniocpp::ocpp::tests {

class IdleAgent : public rpc::RpcAgent {
public:
  explicit IdleAgent(boost::asio::io_context& io_context)
      : RpcAgent{io_context, std::chrono::milliseconds{1000}} {}

protected:
  void handle_call(std::shared_ptr<rpc::CallContext>, const rpc::Json&) override {}
};

CATCH_TEST_CASE("peer-registry", "[peer-registry]") {
  boost::asio::io_context io_context;
  auto a = std::make_shared<IdleAgent>(io_context);
  auto b = std::make_shared<IdleAgent>(io_context);
  PeerRegistry registry;

  CATCH_SECTION("upsert and lookup") {
    registry.upsert("CP-2", a);
    registry.upsert("CP-1", b);
    CATCH_REQUIRE(registry.size() == 2);
    CATCH_REQUIRE(registry.lookup("CP-2") == a);
    CATCH_REQUIRE(registry.lookup("CP-1") == b);
    CATCH_REQUIRE(registry.lookup("CP-3") == nullptr);
    const auto sorted = vector<string>{"CP-1", "CP-2"};
    CATCH_REQUIRE(registry.identities() == sorted);
  }

  CATCH_SECTION("the last session to claim an identity gets it") {
    registry.upsert("CP-1", a);
    registry.upsert("CP-1", b);
    CATCH_REQUIRE(registry.size() == 1);
    CATCH_REQUIRE(registry.lookup("CP-1") == b);

    // The old session going away does not remove the new registration
    CATCH_REQUIRE(registry.remove_session(a.get()) == 0);
    CATCH_REQUIRE(registry.lookup("CP-1") == b);
  }

  CATCH_SECTION("a session has at most one identity") {
    registry.upsert("CP-1", a);
    registry.upsert("CP-9", a);
    CATCH_REQUIRE(registry.size() == 1);
    CATCH_REQUIRE(registry.lookup("CP-1") == nullptr);
    CATCH_REQUIRE(registry.lookup("CP-9") == a);
  }

  CATCH_SECTION("remove") {
    registry.upsert("CP-1", a);
    registry.upsert("CP-2", b);
    CATCH_REQUIRE(registry.remove("CP-1"));
    CATCH_REQUIRE_FALSE(registry.remove("CP-1"));
    CATCH_REQUIRE(registry.remove_session(b.get()) == 1);
    CATCH_REQUIRE(registry.size() == 0);
    CATCH_REQUIRE(registry.identities().empty());
  }
}

} // namespace miniocpp::ocpp::tests
