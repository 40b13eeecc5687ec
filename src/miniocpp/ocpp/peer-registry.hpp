#pragma once

#include "miniocpp/rpc/rpc-agent.hpp"

#include <mutex>

namespace miniocpp::ocpp {

/**
 * @ingroup miniocpp-ocpp
 * @brief Device identity -> live session, on the central system.
 *
 * Identities are self-reported: the last session to claim an identity gets it.
 * A session is registered under at most one identity.
 */
class PeerRegistry {
public:
  using SessionPtr = std::shared_ptr<rpc::RpcAgent>;

private:
  mutable std::mutex padlock_;
  unordered_map<string, SessionPtr> sessions_;

public:
  /**
   * @brief Register `session` as `identity`, replacing any previous session for that identity.
   *        Any other identity held by `session` is dropped.
   */
  void upsert(const string& identity, SessionPtr session);

  /**
   * @return true iff `identity` was registered.
   */
  bool remove(const string& identity);

  /**
   * @brief Remove every identity registered to `session`.
   * @return The number of identities removed.
   */
  std::size_t remove_session(const rpc::RpcAgent* session);

  SessionPtr lookup(const string& identity) const;

  /** @brief Sorted */
  vector<string> identities() const;

  std::size_t size() const;
};

} // namespace miniocpp::ocpp
