#include <htmlframe/template/TemplateJson.hpp>

#include <cstdint>

namespace HF::Template {

auto ValueToJson(Value const& value) -> nlohmann::ordered_json {
    struct Visitor {
        auto operator()(std::monostate) const -> nlohmann::ordered_json { return nullptr; }
        auto operator()(std::string const& text) const -> nlohmann::ordered_json { return text; }
        auto operator()(std::int64_t number) const -> nlohmann::ordered_json { return number; }
        auto operator()(double number) const -> nlohmann::ordered_json { return number; }
        auto operator()(bool flag) const -> nlohmann::ordered_json { return flag; }
    };
    return std::visit(Visitor{}, value);
}

auto ValueFromJson(nlohmann::ordered_json const& json) -> Expected<Value> {
    if (json.is_null()) {
        return Value{};
    }
    if (json.is_boolean()) {
        return Value{json.get<bool>()};
    }
    if (json.is_number_unsigned()) {
        auto raw = json.get<std::uint64_t>();
        if (raw > static_cast<std::uint64_t>(INT64_MAX)) {
            return Value{static_cast<double>(raw)};
        }
        return Value{static_cast<std::int64_t>(raw)};
    }
    if (json.is_number_integer()) {
        return Value{json.get<std::int64_t>()};
    }
    if (json.is_number_float()) {
        return Value{json.get<double>()};
    }
    if (json.is_string()) {
        return Value{json.get<std::string>()};
    }
    return std::unexpected(Error{Error::Code::InvalidType,
                                 std::string{"unsupported context value type: "} + json.type_name()});
}

auto ParameterSchemaToJson(ParameterSchema const& schema) -> nlohmann::ordered_json {
    auto json = nlohmann::ordered_json::object();
    for (auto const& declaration : schema) {
        nlohmann::ordered_json entry;
        entry["type"]    = std::string{ParamTypeName(declaration.type)};
        entry["default"] = ValueToJson(declaration.default_value);
        entry["label"]   = declaration.label;
        json[declaration.name] = std::move(entry);
    }
    return json;
}

auto SerializeParameterSchema(ParameterSchema const& schema, int indent) -> std::string {
    return ParameterSchemaToJson(schema).dump(indent, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
}

auto VariableContextFromJson(nlohmann::ordered_json const& json) -> Expected<VariableContext> {
    if (!json.is_object()) {
        return std::unexpected(Error{Error::Code::MalformedInput, "variable context must be a JSON object"});
    }
    VariableContext context;
    for (auto const& [name, raw] : json.items()) {
        auto value = ValueFromJson(raw);
        if (!value) {
            return std::unexpected(Error{value.error().code,
                                         "'" + name + "': " + value.error().message.value_or("")});
        }
        context.set(name, std::move(*value));
    }
    return context;
}

} // namespace HF::Template
