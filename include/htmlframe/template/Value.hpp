#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace HF::Template {

enum class ParamType {
    Text,
    Number,
    Color,
    Boolean,
};

// A runtime value. std::monostate is the null value.
using Value = std::variant<std::monostate, std::string, std::int64_t, double, bool>;

// Wire spelling of a type token: "text", "number", "color", "bool".
[[nodiscard]] auto ParamTypeName(ParamType type) -> std::string_view;

// Maps a type token to its ParamType. Returns nullopt for unsupported tokens.
[[nodiscard]] auto ParseParamType(std::string_view token) -> std::optional<ParamType>;

// Converts a placeholder's inline default literal into its declared type.
// A missing literal yields the type's zero value; an unparsable number warns
// on stderr and yields 0.
[[nodiscard]] auto CoerceDefault(ParamType type, std::optional<std::string_view> literal) -> Value;

// Case-insensitive membership in {true, 1, yes, on}.
[[nodiscard]] auto ParseBoolLiteral(std::string_view literal) -> bool;

// Text emitted into markup for a value. Booleans print as true/false and
// null prints as the empty string.
[[nodiscard]] auto StringifyValue(Value const& value) -> std::string;

} // namespace HF::Template
