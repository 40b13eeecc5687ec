#include "configuration-store.hpp"

#include <charconv>

namespace miniocpp::ocpp {

expected<ConfigValue, string> coerce_config_value(const ConfigValue& like, const Json& value) {
  if (std::holds_alternative<string>(like)) {
    if (!value.is_string())
      return make_unexpected(fmt::format("expected a string, got {}", value.dump()));
    return ConfigValue{value.get<string>()};
  }

  int64_t out = 0;
  if (value.is_number_integer()) {
    out = value.get<int64_t>();
  } else if (value.is_string()) {
    const auto s = trim_copy(value.get_ref<const string&>());
    const auto [end, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    if (s.empty() || ec != std::errc{} || end != s.data() + s.size())
      return make_unexpected(fmt::format("'{}' is not an integer", s));
  } else {
    return make_unexpected(fmt::format("expected an integer, got {}", value.dump()));
  }

  if (out < 0)
    return make_unexpected(fmt::format("{} is negative", out));
  return ConfigValue{out};
}

// ------------------------------------------------------------------------------ ConfigurationStore

ConfigurationStore::ConfigurationStore(vector<ConfigEntry> entries)
    : entries_{std::move(entries)} {}

vector<ConfigEntry> ConfigurationStore::default_entries(std::string_view vendor,
                                                        std::string_view model,
                                                        std::string_view serial_number,
                                                        int64_t heartbeat_interval) {
  return {{string{k_heartbeat_interval}, heartbeat_interval, false, k_max_heartbeat_interval},
          {"ConnectionTimeOut", int64_t{60}, false},
          {"MeterValueSampleInterval", int64_t{60}, false},
          {"NumberOfConnectors", int64_t{1}, true},
          {"ChargePointVendor", string{vendor}, true},
          {"ChargePointModel", string{model}, true},
          {"ChargePointSerialNumber", string{serial_number}, true}};
}

ConfigEntry* ConfigurationStore::find_locked_(std::string_view key) {
  auto ii = std::find_if(begin(entries_), end(entries_),
                         [key](const ConfigEntry& entry) { return entry.key == key; });
  return (ii == end(entries_)) ? nullptr : &*ii;
}

std::optional<ConfigEntry> ConfigurationStore::get(std::string_view key) const {
  std::lock_guard lock{padlock_};
  auto ii = std::find_if(cbegin(entries_), cend(entries_),
                         [key](const ConfigEntry& entry) { return entry.key == key; });
  if (ii == cend(entries_))
    return std::nullopt;
  return *ii;
}

int64_t ConfigurationStore::get_int(std::string_view key, int64_t fallback) const {
  const auto entry = get(key);
  if (!entry.has_value() || !std::holds_alternative<int64_t>(entry->value))
    return fallback;
  return std::get<int64_t>(entry->value);
}

vector<ConfigEntry> ConfigurationStore::entries() const {
  std::lock_guard lock{padlock_};
  return entries_;
}

ConfigurationStore::ChangeResult ConfigurationStore::change(std::string_view key,
                                                            const Json& value) {
  std::lock_guard lock{padlock_};
  auto entry = find_locked_(key);
  if (entry == nullptr)
    return ChangeResult::UNKNOWN_KEY;
  if (entry->readonly)
    return ChangeResult::READONLY;

  auto coerced = coerce_config_value(entry->value, value);
  if (!coerced) {
    WARN("cannot change '{}': {}", key, coerced.error());
    return ChangeResult::INVALID_VALUE;
  }
  const auto* number = std::get_if<int64_t>(&*coerced);
  if (number != nullptr && *number > entry->max_value) {
    WARN("cannot change '{}': {} is above {}", key, *number, entry->max_value);
    return ChangeResult::INVALID_VALUE;
  }

  entry->value = std::move(*coerced);
  return ChangeResult::ACCEPTED;
}

bool ConfigurationStore::set(std::string_view key, ConfigValue value) {
  std::lock_guard lock{padlock_};
  auto entry = find_locked_(key);
  if (entry == nullptr || entry->value.index() != value.index())
    return false;
  if (std::holds_alternative<int64_t>(value) && std::get<int64_t>(value) > entry->max_value)
    return false;
  entry->value = std::move(value);
  return true;
}

} // namespace miniocpp::ocpp
