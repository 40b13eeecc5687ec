#include "peer-registry.hpp"

namespace miniocpp::ocpp {

void PeerRegistry::upsert(const string& identity, SessionPtr session) {
  std::lock_guard lock{padlock_};
  std::erase_if(sessions_, [&](const auto& item) {
    return item.second == session && item.first != identity;
  });
  sessions_.insert_or_assign(identity, std::move(session));
}

bool PeerRegistry::remove(const string& identity) {
  std::lock_guard lock{padlock_};
  return sessions_.erase(identity) > 0;
}

std::size_t PeerRegistry::remove_session(const rpc::RpcAgent* session) {
  std::lock_guard lock{padlock_};
  return std::erase_if(sessions_,
                       [session](const auto& item) { return item.second.get() == session; });
}

PeerRegistry::SessionPtr PeerRegistry::lookup(const string& identity) const {
  std::lock_guard lock{padlock_};
  auto ii = sessions_.find(identity);
  return (ii == cend(sessions_)) ? nullptr : ii->second;
}

vector<string> PeerRegistry::identities() const {
  vector<string> out;
  {
    std::lock_guard lock{padlock_};
    out.reserve(sessions_.size());
    for (const auto& item : sessions_)
      out.push_back(item.first);
  }
  std::sort(begin(out), end(out));
  return out;
}

std::size_t PeerRegistry::size() const {
  std::lock_guard lock{padlock_};
  return sessions_.size();
}

} // namespace miniocpp::ocpp
