#include "schema-validator.hpp"

#include <algorithm>

namespace miniocpp::ocpp {

// ----------------------------------------------------------------------------------- check schema

namespace {
  bool has_type(const Json& value, std::string_view type) {
    if (type == "object")
      return value.is_object();
    if (type == "array")
      return value.is_array();
    if (type == "string")
      return value.is_string();
    if (type == "integer")
      return value.is_number_integer();
    if (type == "number")
      return value.is_number();
    if (type == "boolean")
      return value.is_boolean();
    if (type == "null")
      return value.is_null();
    return false;
  }

  // Code points, not bytes
  std::size_t utf8_length(const string& s) {
    return std::size_t(std::count_if(cbegin(s), cend(s), [](char c) {
      return (static_cast<unsigned char>(c) & 0xC0) != 0x80;
    }));
  }

  const Json* find_keyword(const Json& schema, const char* keyword) {
    const auto ii = schema.find(keyword);
    return (ii == schema.end()) ? nullptr : &*ii;
  }

  string location(const string& path) { return path.empty() ? string{"/"} : path; }

  expected<void, string> check(const Json& schema, const Json& value, const string& path) {
    if (!schema.is_object())
      return {}; // e.g., `true`: anything goes

    if (const auto type = find_keyword(schema, "type")) {
      bool is_match = false;
      if (type->is_string()) {
        is_match = has_type(value, type->get_ref<const string&>());
      } else if (type->is_array()) {
        is_match = std::any_of(type->begin(), type->end(), [&value](const Json& t) {
          return t.is_string() && has_type(value, t.get_ref<const string&>());
        });
      }
      if (!is_match)
        return make_unexpected(fmt::format("{}: expected type {}", location(path), type->dump()));
    }

    if (const auto values = find_keyword(schema, "enum"); values && values->is_array()) {
      if (std::find(values->begin(), values->end(), value) == values->end())
        return make_unexpected(fmt::format("{}: not one of {}", location(path), values->dump()));
    }

    if (const auto max_length = find_keyword(schema, "maxLength");
        max_length && max_length->is_number_integer() && value.is_string()) {
      if (utf8_length(value.get_ref<const string&>()) > max_length->get<std::size_t>())
        return make_unexpected(
            fmt::format("{}: exceeds maxLength {}", location(path), max_length->dump()));
    }

    if (const auto minimum = find_keyword(schema, "minimum");
        minimum && minimum->is_number() && value.is_number()) {
      if (value.get<double>() < minimum->get<double>())
        return make_unexpected(
            fmt::format("{}: less than minimum {}", location(path), minimum->dump()));
    }

    if (value.is_object()) {
      const auto properties = find_keyword(schema, "properties");
      const auto additional = find_keyword(schema, "additionalProperties");

      const auto required = find_keyword(schema, "required");
      if (required && required->is_array()) {
        for (const auto& name : *required)
          if (name.is_string() && !value.contains(name.get_ref<const string&>()))
            return make_unexpected(fmt::format("{}: missing required property '{}'", location(path),
                                          name.get_ref<const string&>()));
      }

      for (const auto& element : value.items()) {
        const auto& key = element.key();
        const auto& item = element.value();
        const auto child_path = path + "/" + key;
        if (properties && properties->is_object() && properties->contains(key)) {
          auto result = check(properties->at(key), item, child_path);
          if (!result)
            return result;
        } else if (additional && additional->is_boolean() && !additional->get<bool>()) {
          return make_unexpected(fmt::format("{}: unexpected property '{}'", location(path), key));
        } else if (additional && additional->is_object()) {
          auto result = check(*additional, item, child_path);
          if (!result)
            return result;
        }
      }
    }

    if (value.is_array()) {
      if (const auto min_items = find_keyword(schema, "minItems");
          min_items && min_items->is_number_integer() &&
          value.size() < min_items->get<std::size_t>())
        return make_unexpected(
            fmt::format("{}: fewer than minItems {}", location(path), min_items->dump()));

      if (const auto items = find_keyword(schema, "items")) {
        for (std::size_t i = 0; i < value.size(); ++i) {
          auto result = check(*items, value[i], fmt::format("{}/{}", path, i));
          if (!result)
            return result;
        }
      }
    }

    return {};
  }
} // namespace

expected<void, string> check_against_schema(const Json& schema, const Json& value) {
  return check(schema, value, string{});
}

// ----------------------------------------------------------------------------- JsonSchemaValidator

void JsonSchemaValidator::add_schema(std::string_view action, Json schema) {
  std::lock_guard lock{padlock_};
  schemas_.insert_or_assign(string{action}, std::make_shared<const Json>(std::move(schema)));
}

std::shared_ptr<const Json> JsonSchemaValidator::find_schema_(std::string_view action) {
  std::lock_guard lock{padlock_};

  auto ii = schemas_.find(string{action});
  if (ii != cend(schemas_))
    return ii->second;

  const auto filename = join_path(schema_dir_, fmt::format("{}.json", action));
  string contents;
  if (auto ec = file_get_contents(filename, contents); ec) {
    LOG_ERR("schema file not found: '{}' ({})", filename, ec.message());
    return nullptr;
  }

  auto schema = Json::parse(contents, nullptr, false);
  if (schema.is_discarded()) {
    LOG_ERR("schema file '{}' is not valid json", filename);
    return nullptr;
  }

  auto ptr = std::make_shared<const Json>(std::move(schema));
  schemas_.insert({string{action}, ptr});
  return ptr;
}

bool JsonSchemaValidator::validate(std::string_view action, const Json& payload) {
  const auto schema = find_schema_(action);
  if (schema == nullptr) {
    if (allow_missing_schemas_) {
      WARN("no schema for '{}'; allowing the payload", action);
      return true;
    }
    return false;
  }

  const auto result = check_against_schema(*schema, payload);
  if (!result) {
    WARN("validation error for {}: {}", action, result.error());
    return false;
  }

  TRACE("validation successful: {}", action);
  return true;
}

} // namespace miniocpp::ocpp
