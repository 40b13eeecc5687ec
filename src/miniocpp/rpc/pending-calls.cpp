#include "pending-calls.hpp"

namespace miniocpp::rpc {

// -------------------------------------------------------------------------------------- CallWaiter

bool CallWaiter::complete(Status status, Json payload) {
  CompletionHandler completion;
  {
    std::lock_guard lock{padlock_};
    if (reply_.has_value())
      return false;
    reply_ = Reply{std::move(status), std::move(payload)};
    completion = std::move(completion_);
  }
  cv_.notify_all();

  // The reply is never modified after this point
  if (completion)
    completion(reply_->status, reply_->payload);
  return true;
}

void CallWaiter::set_completion(CompletionHandler completion) {
  {
    std::lock_guard lock{padlock_};
    if (!reply_.has_value()) {
      completion_ = std::move(completion);
      return;
    }
  }
  if (completion)
    completion(reply_->status, reply_->payload);
}

bool CallWaiter::is_complete() const {
  std::lock_guard lock{padlock_};
  return reply_.has_value();
}

Reply CallWaiter::wait() {
  std::unique_lock lock{padlock_};
  cv_.wait(lock, [this]() { return reply_.has_value(); });
  return *reply_;
}

std::optional<Reply> CallWaiter::wait_for(std::chrono::milliseconds timeout) {
  std::unique_lock lock{padlock_};
  if (!cv_.wait_for(lock, timeout, [this]() { return reply_.has_value(); }))
    return std::nullopt;
  return *reply_;
}

// ------------------------------------------------------------------------------------ PendingCalls

expected<std::shared_ptr<CallWaiter>, error_code> PendingCalls::register_call(string id,
                                                                              string action) {
  auto waiter = std::make_shared<CallWaiter>();
  std::lock_guard lock{padlock_};
  const auto [ii, inserted] = calls_.try_emplace(
      std::move(id), PendingCall{std::move(action), std::chrono::steady_clock::now(), waiter});
  if (!inserted)
    return make_unexpected(make_error_code(ecode::already_registered));
  return waiter;
}

bool PendingCalls::resolve(const string& id, Status status, Json payload) {
  std::optional<PendingCall> call;
  { // Grab the call, if it still exists
    std::lock_guard lock{padlock_};
    auto ii = calls_.find(id);
    if (ii != cend(calls_)) {
      call = std::move(ii->second);
      calls_.erase(ii);
    }
  }

  if (!call.has_value()) {
    WARN("dropping reply to unknown call id '{}' (status {})", id, str(status.error_code()));
    return false;
  }

  TRACE("call '{}' ({}) resolved with {} after {}ms", id, call->action, str(status.error_code()),
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                              call->created_at)
            .count());
  call->waiter->complete(std::move(status), std::move(payload));
  return true;
}

std::size_t PendingCalls::close_all(const Status& status) {
  decltype(calls_) calls;
  {
    std::lock_guard lock{padlock_};
    using std::swap;
    swap(calls, calls_);
  }
  for (auto& [id, call] : calls) {
    TRACE("call '{}' ({}) closed with {}", id, call.action, str(status.error_code()));
    call.waiter->complete(status, Json{});
  }
  return calls.size();
}

std::size_t PendingCalls::size() const {
  std::lock_guard lock{padlock_};
  return calls_.size();
}

} // namespace miniocpp::rpc
