#pragma once

#include "miniocpp/net/buffer.hpp"

#include <cstdint>
#include <string_view>

namespace miniocpp::net::detail {

/**
 * @private
 * @brief What carries a `WebsocketSession`'s messages: a beast websocket stream,
 *        or an in-process loopback.
 *
 * Implementations serialize writes: `async_write` may be called from any thread,
 * and buffers go to the wire one at a time, in call order.
 */
class Transport {
public:
  virtual ~Transport() = default;
  virtual void async_write(BufferType&& buffer) = 0;
  virtual void close(uint16_t close_code, std::string_view reason) = 0;
  virtual bool is_open() const = 0;
};

} // namespace miniocpp::net::detail
