#pragma once

#include "messages.hpp"

#include <mutex>

namespace miniocpp::ocpp {

/**
 * @ingroup miniocpp-ocpp
 * @brief Pass/fail of a payload for an action.
 */
class SchemaValidator {
public:
  virtual ~SchemaValidator() = default;

  /**
   * @return true iff `payload` is valid for `action`.
   */
  virtual bool validate(std::string_view action, const Json& payload) = 0;
};

// ----------------------------------------------------------------------------- JsonSchemaValidator

/**
 * @ingroup miniocpp-ocpp
 * @brief Validates payloads against json schema documents, `<schema_dir>/<action>.json`.
 *
 * Schemas are loaded on first use and kept. The supported keywords are `type`,
 * `enum`, `properties`, `required`, `additionalProperties` (as a boolean), `items`,
 * `minItems`, `maxLength` and `minimum`; other keywords are ignored.
 *
 * A schema that cannot be found (or parsed) fails validation, unless
 * `allow_missing_schemas` is set, in which case the payload passes.
 */
class JsonSchemaValidator : public SchemaValidator {
private:
  string schema_dir_;
  bool allow_missing_schemas_{false};

  mutable std::mutex padlock_;
  unordered_map<string, std::shared_ptr<const Json>> schemas_;

  std::shared_ptr<const Json> find_schema_(std::string_view action);

public:
  explicit JsonSchemaValidator(string schema_dir, bool allow_missing_schemas = false)
      : schema_dir_{std::move(schema_dir)}, allow_missing_schemas_{allow_missing_schemas} {}

  /**
   * @brief Use `schema` for `action`, instead of looking in the schema directory.
   */
  void add_schema(std::string_view action, Json schema);

  bool validate(std::string_view action, const Json& payload) override;

  const string& schema_dir() const { return schema_dir_; }
};

/**
 * @brief Checks `value` against `schema`.
 * @return A description of the first violation found, e.g., "/key: exceeds maxLength 50".
 */
expected<void, string> check_against_schema(const Json& schema, const Json& value);

} // namespace miniocpp::ocpp
