#pragma once

#include <htmlframe/core/Error.hpp>
#include <htmlframe/template/ParameterSchema.hpp>
#include <htmlframe/template/VariableContext.hpp>

#include <nlohmann/json.hpp>

#include <string>

namespace HF::Template {

[[nodiscard]] auto ValueToJson(Value const& value) -> nlohmann::ordered_json;

// Objects and arrays are rejected; everything else maps onto a Value.
[[nodiscard]] auto ValueFromJson(nlohmann::ordered_json const& json) -> Expected<Value>;

// {"name": {"type": "number", "default": 3.5, "label": "name"}, ...} in
// first-occurrence order.
[[nodiscard]] auto ParameterSchemaToJson(ParameterSchema const& schema) -> nlohmann::ordered_json;

[[nodiscard]] auto SerializeParameterSchema(ParameterSchema const& schema, int indent = 2) -> std::string;

[[nodiscard]] auto VariableContextFromJson(nlohmann::ordered_json const& json) -> Expected<VariableContext>;

} // namespace HF::Template
