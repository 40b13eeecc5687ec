#pragma once

#include "messages.hpp"

#include <limits>
#include <mutex>
#include <optional>

namespace miniocpp::ocpp {

struct ConfigEntry {
  string key;
  ConfigValue value;
  bool readonly{false};
  int64_t max_value{std::numeric_limits<int64_t>::max()}; ///< Integer entries only
};

/**
 * @brief Coerce `value` to the type of `like`. Integers accept decimal strings.
 */
expected<ConfigValue, string> coerce_config_value(const ConfigValue& like, const Json& value);

// ------------------------------------------------------------------------------ ConfigurationStore

/**
 * @ingroup miniocpp-ocpp
 * @brief A charge point's configuration. The set of keys is fixed at construction;
 *        values change, but keys are never added or removed.
 */
class ConfigurationStore {
public:
  enum class ChangeResult { ACCEPTED, UNKNOWN_KEY, READONLY, INVALID_VALUE };

private:
  mutable std::mutex padlock_;
  vector<ConfigEntry> entries_;

  ConfigEntry* find_locked_(std::string_view key);

public:
  explicit ConfigurationStore(vector<ConfigEntry> entries);

  static constexpr std::string_view k_heartbeat_interval = "HeartbeatInterval";
  static constexpr int64_t k_max_heartbeat_interval = 24 * 60 * 60;

  /**
   * @brief The standard charge point keys, with `HeartbeatInterval` set to `heartbeat_interval`
   */
  static vector<ConfigEntry> default_entries(std::string_view vendor, std::string_view model,
                                             std::string_view serial_number,
                                             int64_t heartbeat_interval);

  std::optional<ConfigEntry> get(std::string_view key) const;

  /**
   * @brief The integer value of `key`, or `fallback` if it is absent or not an integer.
   */
  int64_t get_int(std::string_view key, int64_t fallback) const;

  vector<ConfigEntry> entries() const;

  /**
   * @brief The remote change: readonly keys are not changed, and `value` is coerced
   *        to the entry's type. Integers above the entry's `max_value` are invalid.
   */
  ChangeResult change(std::string_view key, const Json& value);

  /**
   * @brief A local update, which may change readonly keys; the type must match.
   * @return false iff the key is unknown, the type is wrong, or the integer is above
   *         `max_value`.
   */
  bool set(std::string_view key, ConfigValue value);
};

constexpr std::string_view str(ConfigurationStore::ChangeResult result) {
  switch (result) {
  case ConfigurationStore::ChangeResult::ACCEPTED:
    return "accepted";
  case ConfigurationStore::ChangeResult::UNKNOWN_KEY:
    return "unknown key";
  case ConfigurationStore::ChangeResult::READONLY:
    return "readonly key";
  case ConfigurationStore::ChangeResult::INVALID_VALUE:
    return "invalid value";
  }
  return "<unknown case>";
}

} // namespace miniocpp::ocpp
