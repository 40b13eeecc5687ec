#include "liveness-scheduler.hpp"

#include <boost/asio/post.hpp>

namespace miniocpp::ocpp {

namespace asio = boost::asio;

namespace {
  // Keeps `now() + unit * interval` inside the steady clock's range
  int64_t longest_interval(std::chrono::milliseconds unit) {
    using Duration = asio::steady_timer::clock_type::duration;
    const auto step = std::chrono::duration_cast<Duration>(unit);
    return (Duration::max() / step) / 4;
  }
} // namespace

LivenessScheduler::LivenessScheduler(asio::io_context& io_context, IntervalFunction interval,
                                     thunk_type emit, std::chrono::milliseconds unit)
    : strand_{asio::make_strand(io_context)}, timer_{strand_}, interval_{std::move(interval)},
      emit_{std::move(emit)}, unit_{std::max(unit, std::chrono::milliseconds{1})},
      max_interval_{longest_interval(unit_)} {}

void LivenessScheduler::start() {
  if (is_running_.exchange(true, std::memory_order_acq_rel))
    return;
  asio::post(strand_, [ptr = shared_from_this()]() {
    ptr->timer_.cancel();
    ptr->cycle_(++ptr->generation_);
  });
}

void LivenessScheduler::stop() {
  if (!is_running_.exchange(false, std::memory_order_acq_rel))
    return;
  asio::post(strand_, [ptr = shared_from_this()]() { ptr->timer_.cancel(); });
}

void LivenessScheduler::cycle_(uint64_t generation) {
  if (!is_running() || generation != generation_)
    return; // Stopped, or restarted

  emit_count_.fetch_add(1, std::memory_order_acq_rel);
  try {
    emit_();
  } catch (std::exception& e) {
    LOG_ERR("liveness emit failed: {}", e.what());
  }

  const auto interval = std::clamp<int64_t>(interval_(), 1, max_interval_);
  TRACE("next liveness call in {} x {}ms", interval, unit_.count());
  timer_.expires_after(unit_ * interval);
  timer_.async_wait([ptr = shared_from_this(), generation](const boost::system::error_code& ec) {
    if (ec)
      return; // Cancelled
    ptr->cycle_(generation);
  });
}

} // namespace miniocpp::ocpp
